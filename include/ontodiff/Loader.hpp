/**
 * @file Loader.hpp
 * @brief Reading model and settings documents from disk
 *
 * Supported formats, chosen by extension (case insensitive):
 * - .json (nlohmann::json)
 * - .toml (toml++), converted to the same Value tree
 *
 * TOML dates and times become ISO strings; TOML has no null.
 */

#ifndef ONTODIFF_LOADER_HPP
#define ONTODIFF_LOADER_HPP

#include "ontodiff/Model.hpp"
#include "ontodiff/Value.hpp"

#include <map>
#include <string>

namespace ontodiff {

/**
 * @brief Load a JSON document
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ModelParseError if the JSON syntax is invalid
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a TOML document
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ModelParseError if the TOML syntax is invalid (with line:column)
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Load a JSON or TOML document by extension
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws UnsupportedFormatError for any other extension
 * @throws ModelParseError on syntax errors
 */
Value load_document(const std::string& path);

/**
 * @brief Get file extension (lowercase)
 * @return Extension including the dot (e.g. ".json"), or empty if none
 */
std::string get_file_extension(const std::string& path);

/**
 * @brief Load a model file
 *
 * load_document() followed by model_from_value(). The model's source is
 * set to the path when the document names none.
 *
 * @throws ModelValidationError if a record lacks its identity field
 */
Model load_model_file(const std::string& path);

/**
 * @brief Load every model file with the given extension in a directory
 *
 * Keyed by file name (without directory). Every model goes through
 * validate_model; files that fail to load or validate are logged and
 * skipped. Not recursive.
 *
 * @param dir Directory to scan
 * @param extension Extension to match, with or without the dot
 * @param reject_duplicates Passed to validate_model
 * @throws FileNotFoundError if dir is not a directory
 */
std::map<std::string, Model> load_model_directory(const std::string& dir,
                                                  const std::string& extension = ".json",
                                                  bool reject_duplicates = false);

/**
 * @brief Write a Value as indented JSON
 * @throws Error if the file cannot be opened for writing
 */
void write_json_file(const std::string& path, const Value& data, int indent = 2);

} // namespace ontodiff

#endif // ONTODIFF_LOADER_HPP
