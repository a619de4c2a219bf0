#ifndef ONTODIFF_UTIL_HPP
#define ONTODIFF_UTIL_HPP

#include "ontodiff/Value.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace ontodiff {

// Merge b into a (recursively). Values in b take precedence; a null in b
// never replaces a value in a.
void deep_merge(Value& a, const Value& b);

// Helpers
std::string to_lower(std::string s);
std::string trim(const std::string& s);
std::vector<std::string> split(const std::string& s, char delim);
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Parse an --overrides string: "k1:json, k2:json, ..."
std::map<std::string, Value> parse_overrides(const std::string& s);

// Environment iteration: returns pairs (NAME, VALUE)
std::vector<std::pair<std::string, std::string>> enumerate_environment();

} // namespace ontodiff

#endif // ONTODIFF_UTIL_HPP
