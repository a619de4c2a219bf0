/**
 * @file DotPath.hpp
 * @brief Dot-notation access to nested settings
 *
 * Settings are addressed by dot-separated paths such as
 * "analysis.similarity_threshold" or "merge.strategy".
 *
 * Behaviour:
 * - get_by_dot() without default throws KeyError if the path doesn't exist
 * - get_by_dot() with default returns the default for missing keys, but
 *   still throws TypeError when traversal hits a scalar
 * - set_by_dot() creates intermediate objects unless create_missing=false
 * - contains_dot() returns false for missing keys, throws TypeError when
 *   traversal hits a scalar before the final segment
 */

#ifndef ONTODIFF_DOTPATH_HPP
#define ONTODIFF_DOTPATH_HPP

#include "ontodiff/Value.hpp"
#include "ontodiff/Errors.hpp"

#include <string>
#include <vector>

namespace ontodiff {

/**
 * @brief Split a dot-path into segments
 *
 * Empty segments are dropped: "a..b" → ["a", "b"], "" → [].
 */
std::vector<std::string> split_dot_path(const std::string& path);

/**
 * @brief Join path segments with dots
 */
std::string join_dot_path(const std::vector<std::string>& segments);

/**
 * @brief Get value from nested structure using dot-path (strict)
 *
 * @return Pointer to value at path (the root for an empty path)
 * @throws KeyError if any segment not found
 * @throws TypeError if traversal hits a non-container before the end
 */
const Value* get_by_dot(const Value& data, const std::string& path);

/**
 * @brief Get value from nested structure using dot-path (with default)
 *
 * @return Pointer to value at path, or &default_val if not found
 * @throws TypeError if traversal hits a non-container before the end
 */
const Value* get_by_dot(const Value& data, const std::string& path,
                        const Value& default_val);

/**
 * @brief Set value in nested structure using dot-path
 *
 * @param create_missing If true, create (or overwrite with) intermediate
 *                       objects as needed; if false, missing or scalar
 *                       intermediates are errors
 * @throws KeyError if create_missing=false and a segment is missing
 * @throws TypeError if create_missing=false and an intermediate is not an
 *                   object
 */
void set_by_dot(Value& data, const std::string& path,
                const Value& value, bool create_missing = true);

/**
 * @brief Check if dot-path exists in nested structure
 *
 * @throws TypeError if traversal hits a non-container before the end
 */
bool contains_dot(const Value& data, const std::string& path);

} // namespace ontodiff

#endif // ONTODIFF_DOTPATH_HPP
