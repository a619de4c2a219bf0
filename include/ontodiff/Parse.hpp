/**
 * @file Parse.hpp
 * @brief String-to-Value parsing for environment and CLI overrides
 *
 * Settings arriving as text (ONTODIFF_* environment variables, the
 * --overrides option) are typed by the first matching rule:
 * - Boolean ("true", "false", case insensitive)
 * - Null ("null", case insensitive)
 * - Integer (^-?[0-9]+$)
 * - Float (^-?[0-9]+\.[0-9]+([eE][+-]?[0-9]+)?$)
 * - JSON compound ({...} or [...])
 * - Quoted string ("...")
 * - Raw string (fallback)
 */

#ifndef ONTODIFF_PARSE_HPP
#define ONTODIFF_PARSE_HPP

#include "ontodiff/Value.hpp"
#include <string>

namespace ontodiff {

/**
 * @brief Parse string value to appropriate type
 *
 * Examples:
 * ```cpp
 * parse_value("0.75")      // → 0.75 (float), e.g. a similarity threshold
 * parse_value("TRUE")      // → true
 * parse_value("theirs")    // → "theirs" (string)
 * parse_value("\"ours\"")  // → "ours" (string, unquoted)
 * parse_value("[1,2]")     // → [1, 2] (array)
 * parse_value("")          // → "" (empty string)
 * ```
 */
Value parse_value(const std::string& str);

} // namespace ontodiff

#endif // ONTODIFF_PARSE_HPP
