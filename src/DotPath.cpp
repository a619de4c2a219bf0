/**
 * @file DotPath.cpp
 * @brief Implementation of dot-path utilities
 */

#include "ontodiff/DotPath.hpp"
#include "ontodiff/Util.hpp"

#include <algorithm>
#include <cctype>

namespace ontodiff {

std::vector<std::string> split_dot_path(const std::string& path) {
    std::vector<std::string> segments;
    std::string current;

    for (char c : path) {
        if (c == '.') {
            if (!current.empty()) {
                segments.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        segments.push_back(current);
    }
    return segments;
}

std::string join_dot_path(const std::vector<std::string>& segments) {
    return join(segments, ".");
}

namespace {

bool is_array_index(const std::string& segment) {
    if (segment.empty()) return false;
    if (segment[0] == '0' && segment.size() > 1) return false;
    return std::all_of(segment.begin(), segment.end(),
                       [](unsigned char c) { return std::isdigit(c); });
}

/**
 * @brief Walk a path, returning nullptr at the first missing segment
 *
 * Missing segments report their name through `missing`. Traversal into a
 * scalar is always a TypeError.
 */
const Value* walk(const Value& data, const std::string& path, std::string* missing) {
    const Value* current = &data;

    for (const auto& seg : split_dot_path(path)) {
        if (current->is_object()) {
            auto it = current->find(seg);
            if (it == current->end()) {
                if (missing) *missing = seg;
                return nullptr;
            }
            current = &(*it);
        } else if (current->is_array()) {
            if (!is_array_index(seg)) {
                if (missing) *missing = seg + " (not a valid array index)";
                return nullptr;
            }
            const size_t idx = std::stoull(seg);
            if (idx >= current->size()) {
                if (missing) *missing = seg + " (index out of range)";
                return nullptr;
            }
            current = &(*current)[idx];
        } else {
            throw TypeError(path, "object or array", type_name(*current));
        }
    }
    return current;
}

} // anonymous namespace

const Value* get_by_dot(const Value& data, const std::string& path) {
    std::string missing;
    const Value* found = walk(data, path, &missing);
    if (!found) {
        throw KeyError(path, missing);
    }
    return found;
}

const Value* get_by_dot(const Value& data, const std::string& path,
                        const Value& default_val) {
    const Value* found = walk(data, path, nullptr);
    return found ? found : &default_val;
}

bool contains_dot(const Value& data, const std::string& path) {
    return walk(data, path, nullptr) != nullptr;
}

void set_by_dot(Value& data, const std::string& path,
                const Value& value, bool create_missing) {
    const auto segments = split_dot_path(path);
    if (segments.empty()) {
        data = value;
        return;
    }

    Value* current = &data;
    for (size_t i = 0; i < segments.size(); ++i) {
        const auto& seg = segments[i];

        if (!current->is_object()) {
            if (!create_missing) {
                throw TypeError(path, "object", type_name(*current));
            }
            *current = Value::object();
        }

        if (i + 1 == segments.size()) {
            (*current)[seg] = value;
            return;
        }

        if (!current->contains(seg)) {
            if (!create_missing) {
                throw KeyError(path, seg);
            }
            (*current)[seg] = Value::object();
        }
        current = &(*current)[seg];
    }
}

} // namespace ontodiff
