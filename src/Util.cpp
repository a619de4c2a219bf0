/**
 * @file Util.cpp
 * @brief Implementation of string, merge and environment helpers
 */

#include "ontodiff/Util.hpp"
#include "ontodiff/Parse.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#if defined(_WIN32)
  #include <windows.h>
  #include <cstring>
#else
  #include <unistd.h>
  extern char **environ;
#endif

namespace ontodiff {

void deep_merge(Value& a, const Value& b) {
    if (b.is_null()) return;
    if (!(a.is_object() && b.is_object())) {
        a = b;
        return;
    }
    for (const auto& item : b.items()) {
        const Value& incoming = item.value();
        if (incoming.is_null()) continue;
        const std::string& key = item.key();
        auto existing = a.find(key);
        if (existing != a.end() && existing->is_object() && incoming.is_object()) {
            deep_merge(*existing, incoming);
        } else {
            a[key] = incoming;
        }
    }
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string tok;
    std::istringstream iss(s);
    while (std::getline(iss, tok, delim)) {
        tok = trim(tok);
        if (!tok.empty()) parts.push_back(tok);
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::ostringstream oss;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) oss << sep;
        oss << parts[i];
    }
    return oss.str();
}

namespace {

/**
 * @brief Split on commas outside quotes, brackets and braces
 */
std::vector<std::string> split_top_level(const std::string& s) {
    std::vector<std::string> pieces(1);
    int depth = 0;
    char quote = '\0';
    char prev = '\0';

    for (char c : s) {
        if (quote != '\0') {
            if (c == quote && prev != '\\') quote = '\0';
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '{' || c == '[') {
            ++depth;
        } else if (c == '}' || c == ']') {
            --depth;
        } else if (c == ',' && depth == 0) {
            pieces.emplace_back();
            prev = c;
            continue;
        }
        pieces.back() += c;
        prev = c;
    }
    return pieces;
}

} // anonymous namespace

std::map<std::string, Value> parse_overrides(const std::string& s) {
    std::map<std::string, Value> out;
    for (const auto& piece : split_top_level(s)) {
        const auto colon = piece.find(':');
        if (colon == std::string::npos) continue;
        const std::string key = trim(piece.substr(0, colon));
        if (key.empty()) continue;
        out[key] = parse_value(trim(piece.substr(colon + 1)));
    }
    return out;
}

std::vector<std::pair<std::string, std::string>> enumerate_environment() {
    std::vector<std::pair<std::string, std::string>> envs;
#if defined(_WIN32)
    LPCH env = GetEnvironmentStringsA();
    if (!env) return envs;
    for (LPSTR var = (LPSTR)env; *var != '\0'; var += strlen(var) + 1) {
        std::string entry(var);
        auto pos = entry.find('=');
        if (pos == std::string::npos || pos == 0) continue;
        envs.emplace_back(entry.substr(0,pos), entry.substr(pos+1));
    }
    FreeEnvironmentStringsA(env);
#else
    if (environ) {
        for (char **env = environ; *env; ++env) {
            std::string entry(*env);
            auto pos = entry.find('=');
            if (pos == std::string::npos) continue;
            envs.emplace_back(entry.substr(0,pos), entry.substr(pos+1));
        }
    }
#endif
    return envs;
}

} // namespace ontodiff
