/**
 * @file Value.hpp
 * @brief JSON-like value type shared by configuration and model interchange
 *
 * Uses nlohmann::json as the underlying value model. TOML documents are
 * converted into the same representation on load.
 */

#ifndef ONTODIFF_VALUE_HPP
#define ONTODIFF_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace ontodiff {

/**
 * @brief JSON-like value type
 *
 * Alias for nlohmann::json. See the nlohmann::json documentation for the
 * complete API.
 */
using Value = nlohmann::json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "array", "object")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

} // namespace ontodiff

#endif // ONTODIFF_VALUE_HPP
