/**
 * @file Errors.hpp
 * @brief Exception types for ontodiff
 *
 * Error taxonomy:
 * - Error: Base class
 * - InsufficientInputError: Cross-model analysis needs at least two models
 * - ModelValidationError: Malformed or ambiguous model at the source boundary
 * - FileNotFoundError: Model or config file not found
 * - ModelParseError: JSON/TOML syntax errors
 * - UnsupportedFormatError: File extension is neither .json nor .toml
 * - KeyError: Dot-path segment not found
 * - TypeError: Traversal into non-container
 * - MissingMandatoryConfig: Mandatory configuration keys absent
 */

#ifndef ONTODIFF_ERRORS_HPP
#define ONTODIFF_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include <sstream>
#include <cstddef>

namespace ontodiff {

/**
 * @brief Base class for all ontodiff exceptions
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Cross-model analysis was given fewer than two models
 */
class InsufficientInputError : public Error {
public:
    /**
     * @brief Construct with the number of models that were supplied
     * @param supplied Number of models handed to the analyzer
     * @param required Minimum number of models needed
     */
    InsufficientInputError(std::size_t supplied, std::size_t required = 2)
        : Error("Need at least " + std::to_string(required) +
                " models for comparison, got " + std::to_string(supplied))
        , supplied_(supplied)
        , required_(required)
    {}

    std::size_t supplied() const noexcept { return supplied_; }
    std::size_t required() const noexcept { return required_; }

private:
    std::size_t supplied_;
    std::size_t required_;
};

/**
 * @brief A model failed validation at the model-source boundary
 *
 * The location is a dot-path into the model, e.g.
 * "entities.Customer.properties" or "business_rules.2.name".
 */
class ModelValidationError : public Error {
public:
    /**
     * @brief Construct with location and reason
     * @param location Dot-path of the offending record
     * @param reason What is wrong with it
     */
    ModelValidationError(std::string location, std::string reason)
        : Error("Invalid model at '" + location + "': " + reason)
        , location_(std::move(location))
        , reason_(std::move(reason))
    {}

    const std::string& location() const noexcept {
        return location_;
    }

    const std::string& reason() const noexcept {
        return reason_;
    }

private:
    std::string location_;
    std::string reason_;
};

/**
 * @brief Model or configuration file not found
 */
class FileNotFoundError : public Error {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : Error("File not found: " + path)
        , path_(std::move(path))
    {}

    /**
     * @brief Get the file path that was not found
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief File parse error (JSON/TOML syntax)
 */
class ModelParseError : public Error {
public:
    /**
     * @brief Construct with file path and error details
     * @param file Path to the file with parse error
     * @param details Detailed error message from parser
     */
    ModelParseError(std::string file, std::string details)
        : Error("Parse error in '" + file + "': " + details)
        , file_(std::move(file))
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    std::string details_;
};

/**
 * @brief File extension not recognised as JSON or TOML
 */
class UnsupportedFormatError : public Error {
public:
    explicit UnsupportedFormatError(std::string extension)
        : Error("Unsupported file type: '" + extension + "' (expected .json or .toml)")
        , extension_(std::move(extension))
    {}

    const std::string& extension() const noexcept {
        return extension_;
    }

private:
    std::string extension_;
};

/**
 * @brief Key not found during dot-path traversal
 */
class KeyError : public Error {
public:
    /**
     * @brief Construct with full path and failing segment
     * @param path Full dot-path being accessed (e.g., "merge.strategy")
     * @param segment The specific segment that doesn't exist
     */
    KeyError(std::string path, std::string segment)
        : Error("Key not found: '" + segment + "' in path '" + path + "'")
        , path_(std::move(path))
        , segment_(std::move(segment))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& segment() const noexcept {
        return segment_;
    }

private:
    std::string path_;
    std::string segment_;
};

/**
 * @brief Type mismatch during dot-path traversal
 *
 * Raised when attempting to traverse into a non-container type
 * (e.g., trying to access "scalar_value.sub_key").
 */
class TypeError : public Error {
public:
    /**
     * @brief Construct with path, expected type, and actual type
     * @param path Full dot-path being accessed
     * @param expected Expected type (e.g., "object")
     * @param actual Actual type encountered (e.g., "integer")
     */
    TypeError(std::string path, std::string expected, std::string actual)
        : Error("Cannot traverse into " + actual +
                " (expected " + expected + ") at path '" + path + "'")
        , path_(std::move(path))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& expected() const noexcept {
        return expected_;
    }

    const std::string& actual() const noexcept {
        return actual_;
    }

private:
    std::string path_;
    std::string expected_;
    std::string actual_;
};

/**
 * @brief Mandatory configuration keys are missing after layering
 *
 * Contains the list of all missing mandatory keys.
 */
class MissingMandatoryConfig : public Error {
public:
    /**
     * @brief Construct with list of missing keys
     * @param keys Dot-paths of missing mandatory keys
     */
    explicit MissingMandatoryConfig(std::vector<std::string> keys)
        : Error(format_message(keys))
        , missing_keys_(std::move(keys))
    {}

    /**
     * @brief Get the list of missing keys
     * @return Vector of dot-path strings
     */
    const std::vector<std::string>& missing_keys() const noexcept {
        return missing_keys_;
    }

private:
    std::vector<std::string> missing_keys_;

    static std::string format_message(const std::vector<std::string>& keys) {
        std::ostringstream oss;
        oss << "Missing mandatory configuration keys: [";
        for (size_t i = 0; i < keys.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << "'" << keys[i] << "'";
        }
        oss << "]";
        return oss.str();
    }
};

} // namespace ontodiff

#endif // ONTODIFF_ERRORS_HPP
