/**
 * @file Parse.cpp
 * @brief Implementation of override value parsing
 */

#include "ontodiff/Parse.hpp"
#include "ontodiff/Util.hpp"

#include <cstdint>
#include <regex>
#include <stdexcept>

namespace ontodiff {

namespace {
    const std::regex& integer_pattern() {
        static const std::regex re("^-?[0-9]+$");
        return re;
    }

    const std::regex& float_pattern() {
        static const std::regex re("^-?[0-9]+\\.[0-9]+([eE][+-]?[0-9]+)?$");
        return re;
    }

    bool is_compound(const std::string& str) {
        return (str.front() == '{' && str.back() == '}') ||
               (str.front() == '[' && str.back() == ']');
    }
}

Value parse_value(const std::string& str) {
    if (str.empty()) {
        return "";
    }

    const std::string lower = to_lower(str);
    if (lower == "true") return true;
    if (lower == "false") return false;
    if (lower == "null") return nullptr;

    if (std::regex_match(str, integer_pattern())) {
        try {
            size_t pos = 0;
            long long val = std::stoll(str, &pos);
            if (pos == str.size()) {
                return static_cast<int64_t>(val);
            }
        } catch (const std::out_of_range&) {
            // too large for int64: treated as text below
        }
    }

    if (std::regex_match(str, float_pattern())) {
        try {
            size_t pos = 0;
            double val = std::stod(str, &pos);
            if (pos == str.size()) {
                return val;
            }
        } catch (const std::out_of_range&) {
            // falls through to string
        }
    }

    if (is_compound(str)) {
        Value parsed = Value::parse(str, nullptr, false);
        if (!parsed.is_discarded()) {
            return parsed;
        }
    }

    if (str.size() >= 2 && str.front() == '"' && str.back() == '"') {
        Value parsed = Value::parse(str, nullptr, false);
        if (!parsed.is_discarded() && parsed.is_string()) {
            return parsed;
        }
    }

    return str;
}

} // namespace ontodiff
