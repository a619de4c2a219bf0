/**
 * @file Comparator.hpp
 * @brief Identity-keyed comparison of two named collections
 *
 * The primitive every engine builds on. Two collections are indexed by an
 * identity key and compared:
 * - added:    keys present only in the target
 * - removed:  keys present only in the source
 * - common:   keys present in both
 * - modified: common keys whose items differ on at least one compared field
 *
 * Keys in each group are in ascending order, so results are deterministic.
 * Comparing a collection with itself yields an empty result.
 *
 * Example:
 * ```cpp
 * auto src = index_by(a.entities, [](const Entity& e) { return e.name; });
 * auto dst = index_by(b.entities, [](const Entity& e) { return e.name; });
 * auto cmp = compare_keyed(src, dst, {
 *     {"entity_type", [](const Entity& e) { return e.entity_type; }},
 *     {"description", [](const Entity& e) { return e.description; }},
 * });
 * ```
 */

#ifndef ONTODIFF_COMPARATOR_HPP
#define ONTODIFF_COMPARATOR_HPP

#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace ontodiff {

/**
 * @brief Identity map from key to a borrowed item
 *
 * Items are not copied; the map is only valid while the indexed collection
 * is alive and unchanged.
 */
template <typename T>
using KeyedMap = std::map<std::string, const T*>;

/**
 * @brief Named projection of an item onto a comparable string
 */
template <typename T>
struct FieldAccessor {
    std::string name;
    std::function<std::string(const T&)> get;
};

/**
 * @brief One differing field of a common item
 */
struct FieldDifference {
    std::string field;
    std::string old_value;
    std::string new_value;
};

/**
 * @brief Field differences for one common key
 */
struct Modification {
    std::string key;
    std::vector<FieldDifference> fields;
};

/**
 * @brief Result of comparing two keyed collections
 */
template <typename T>
struct Comparison {
    std::vector<std::string> added;
    std::vector<std::string> removed;
    std::vector<std::string> common;
    std::vector<Modification> modified;

    bool empty() const noexcept {
        return added.empty() && removed.empty() && modified.empty();
    }
};

/**
 * @brief Index a sequence by identity key
 *
 * Duplicate keys collapse: the later item wins.
 */
template <typename T, typename KeyFn>
KeyedMap<T> index_by(const std::vector<T>& items, KeyFn key_fn) {
    KeyedMap<T> out;
    for (const auto& item : items) {
        out[key_fn(item)] = &item;
    }
    return out;
}

/**
 * @brief Index an already keyed map (e.g. metadata)
 */
template <typename V>
KeyedMap<V> index_map(const std::map<std::string, V>& items) {
    KeyedMap<V> out;
    for (const auto& [key, value] : items) {
        out[key] = &value;
    }
    return out;
}

/**
 * @brief Compare two items field by field
 * @return One FieldDifference per field whose projections differ, in the
 *         order the accessors are given
 */
template <typename T>
std::vector<FieldDifference> compare_fields(const T& source, const T& target,
                                            const std::vector<FieldAccessor<T>>& fields) {
    std::vector<FieldDifference> out;
    for (const auto& field : fields) {
        std::string old_value = field.get(source);
        std::string new_value = field.get(target);
        if (old_value != new_value) {
            out.push_back({field.name, std::move(old_value), std::move(new_value)});
        }
    }
    return out;
}

/**
 * @brief Compare two keyed collections
 *
 * @param source Identity map of the old collection
 * @param target Identity map of the new collection
 * @param fields Scalar fields compared for common keys; may be empty when
 *               the caller only needs the key partition
 */
template <typename T>
Comparison<T> compare_keyed(const KeyedMap<T>& source, const KeyedMap<T>& target,
                            const std::vector<FieldAccessor<T>>& fields = {}) {
    Comparison<T> out;

    for (const auto& [key, item] : target) {
        if (source.find(key) == source.end()) {
            out.added.push_back(key);
        }
    }

    for (const auto& [key, item] : source) {
        auto it = target.find(key);
        if (it == target.end()) {
            out.removed.push_back(key);
            continue;
        }
        out.common.push_back(key);
        if (!fields.empty()) {
            auto diffs = compare_fields(*item, *it->second, fields);
            if (!diffs.empty()) {
                out.modified.push_back({key, std::move(diffs)});
            }
        }
    }

    return out;
}

} // namespace ontodiff

#endif // ONTODIFF_COMPARATOR_HPP
