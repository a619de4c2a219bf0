/**
 * @file Merge.cpp
 * @brief Implementation of the three-way merge
 */

#include "ontodiff/Merge.hpp"
#include "ontodiff/Errors.hpp"
#include "ontodiff/Log.hpp"
#include "ontodiff/Util.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <set>
#include <stdexcept>
#include <utility>

namespace ontodiff {

std::string to_string(MergeStrategy strategy) {
    switch (strategy) {
        case MergeStrategy::Ours: return "ours";
        case MergeStrategy::Theirs: return "theirs";
        case MergeStrategy::Union: return "union";
    }
    return "unknown";
}

MergeStrategy parse_merge_strategy(const std::string& name) {
    const std::string lower = to_lower(trim(name));
    if (lower == "ours") return MergeStrategy::Ours;
    if (lower == "theirs") return MergeStrategy::Theirs;
    if (lower == "union") return MergeStrategy::Union;
    throw Error("Unknown merge strategy: '" + name + "' (expected ours, theirs or union)");
}

std::string increment_version(const std::string& version) {
    const auto pos = version.rfind('.');
    const std::string head = pos == std::string::npos ? "" : version.substr(0, pos + 1);
    const std::string last = pos == std::string::npos ? version : version.substr(pos + 1);

    const bool numeric = !last.empty() &&
        std::all_of(last.begin(), last.end(), [](unsigned char c) { return std::isdigit(c); });
    if (numeric) {
        try {
            return head + std::to_string(std::stoull(last) + 1);
        } catch (const std::out_of_range&) {
            // falls back to appending a component
        }
    }
    return version + ".1";
}

namespace {

template <typename T, typename KeyFn>
void upsert(std::vector<T>& items, const T& item, KeyFn key) {
    const std::string k = key(item);
    for (auto it = items.rbegin(); it != items.rend(); ++it) {
        if (key(*it) == k) {
            *it = item;
            return;
        }
    }
    items.push_back(item);
}

template <typename T, typename KeyFn>
void erase_key(std::vector<T>& items, const std::string& k, KeyFn key) {
    items.erase(std::remove_if(items.begin(), items.end(),
                               [&](const T& item) { return key(item) == k; }),
                items.end());
}

const auto entity_name = [](const Entity& e) { return e.name; };
const auto property_name = [](const Property& p) { return p.name; };
const auto rel_key = [](const Relationship& r) { return relationship_key(r); };
const auto rule_name = [](const BusinessRule& r) { return r.name; };

/**
 * @brief Copies an element theirs added into the merged model
 */
void apply_addition(Model& merged, const Model& theirs, const Change& change) {
    switch (change.element_type) {
        case ElementType::Entity:
            if (const Entity* e = find_entity(theirs, change.element_name)) {
                upsert(merged.entities, *e, entity_name);
            }
            break;

        case ElementType::Property: {
            const Entity* source = find_entity(theirs, change.owner);
            Entity* target = find_entity(merged, change.owner);
            const Property* p = source ? find_property(*source, change.element_name) : nullptr;
            if (target && p) {
                upsert(target->properties, *p, property_name);
            } else {
                logger()->debug("merge: dropping property {} (entity {} not in merged model)",
                                change.path, change.owner);
            }
            break;
        }

        case ElementType::Relationship:
            if (const Relationship* r = find_relationship(theirs, change.element_name)) {
                upsert(merged.relationships, *r, rel_key);
            }
            break;

        case ElementType::Rule:
            if (const BusinessRule* r = find_rule(theirs, change.element_name)) {
                upsert(merged.business_rules, *r, rule_name);
            }
            break;

        case ElementType::Metadata:
            // Metadata is merged as a whole, see merge()
            break;
    }
}

void take_theirs_entity(Model& merged, const Model& theirs, const Change& change) {
    const Entity* src = find_entity(theirs, change.element_name);
    if (change.field.empty()) {
        if (src) upsert(merged.entities, *src, entity_name);
        else erase_key(merged.entities, change.element_name, entity_name);
        return;
    }
    Entity* dst = find_entity(merged, change.element_name);
    if (!src || !dst) return;
    if (change.field == "entity_type") dst->entity_type = src->entity_type;
    else if (change.field == "description") dst->description = src->description;
}

void take_theirs_property(Model& merged, const Model& theirs, const Change& change) {
    Entity* owner = find_entity(merged, change.owner);
    if (!owner) return;
    const Entity* src_owner = find_entity(theirs, change.owner);
    const Property* src = src_owner ? find_property(*src_owner, change.element_name) : nullptr;

    if (change.field.empty()) {
        if (src) upsert(owner->properties, *src, property_name);
        else erase_key(owner->properties, change.element_name, property_name);
        return;
    }
    Property* dst = find_property(*owner, change.element_name);
    if (!src || !dst) return;
    if (change.field == "data_type") dst->data_type = src->data_type;
    else if (change.field == "required") dst->required = src->required;
    else if (change.field == "unique") dst->unique = src->unique;
}

void take_theirs_relationship(Model& merged, const Model& theirs, const Change& change) {
    const Relationship* src = find_relationship(theirs, change.element_name);
    if (change.field.empty()) {
        if (src) upsert(merged.relationships, *src, rel_key);
        else erase_key(merged.relationships, change.element_name, rel_key);
        return;
    }
    Relationship* dst = find_relationship(merged, change.element_name);
    if (!src || !dst) return;
    if (change.field == "type") dst->relationship_type = src->relationship_type;
    else if (change.field == "cardinality") dst->cardinality = src->cardinality;
}

void take_theirs_rule(Model& merged, const Model& theirs, const Change& change) {
    const BusinessRule* src = find_rule(theirs, change.element_name);
    if (change.field.empty()) {
        if (src) upsert(merged.business_rules, *src, rule_name);
        else erase_key(merged.business_rules, change.element_name, rule_name);
        return;
    }
    BusinessRule* dst = find_rule(merged, change.element_name);
    if (!src || !dst) return;
    if (change.field == "condition") dst->condition = src->condition;
    else if (change.field == "action") dst->action = src->action;
    else if (change.field == "classification") dst->classification = src->classification;
}

void take_theirs_metadata(Model& merged, const Model& theirs, const Change& change) {
    auto it = theirs.metadata.find(change.element_name);
    if (it != theirs.metadata.end()) {
        merged.metadata[change.element_name] = it->second;
    } else {
        merged.metadata.erase(change.element_name);
    }
}

/**
 * @brief Union of an entity both sides added: ours plus theirs-only properties
 */
void union_entity(Model& merged, const Model& theirs, const Change& change) {
    if (change.element_type != ElementType::Entity || change.change_type != ChangeType::Added) {
        return;
    }
    Entity* dst = find_entity(merged, change.element_name);
    const Entity* src = find_entity(theirs, change.element_name);
    if (!dst || !src) return;
    for (const auto& p : src->properties) {
        if (!find_property(*dst, p.name)) {
            dst->properties.push_back(p);
        }
    }
}

void resolve_conflict(Model& merged, const Model& theirs, const Change& change,
                      MergeStrategy strategy) {
    switch (strategy) {
        case MergeStrategy::Ours:
            break;

        case MergeStrategy::Theirs:
            switch (change.element_type) {
                case ElementType::Entity: take_theirs_entity(merged, theirs, change); break;
                case ElementType::Property: take_theirs_property(merged, theirs, change); break;
                case ElementType::Relationship: take_theirs_relationship(merged, theirs, change); break;
                case ElementType::Rule: take_theirs_rule(merged, theirs, change); break;
                case ElementType::Metadata: take_theirs_metadata(merged, theirs, change); break;
            }
            break;

        case MergeStrategy::Union:
            union_entity(merged, theirs, change);
            break;
    }
}

using ChangeKey = std::pair<ElementType, std::string>;

ChangeKey key_of(const Change& change) {
    return {change.element_type, change.path};
}

} // anonymous namespace

MergeResult MergeEngine::merge(const Model& base, const Model& ours, const Model& theirs) const {
    const DiffReport our_diff = differ_.diff(base, ours);
    const DiffReport their_diff = differ_.diff(base, theirs);

    // Entity fields and properties can share a path string, so the element
    // type is part of the key.
    std::map<ChangeKey, const Change*> our_changes;
    for (const auto& c : our_diff.changes()) {
        our_changes[key_of(c)] = &c;
    }

    MergeResult result;
    Model& merged = result.model;
    merged.name = ours.name;
    merged.version = increment_version(ours.version);
    merged.source = ours.source;
    merged.entities = ours.entities;
    merged.relationships = ours.relationships;
    merged.business_rules = ours.business_rules;

    merged.metadata = base.metadata;
    for (const auto& [k, v] : theirs.metadata) merged.metadata[k] = v;
    for (const auto& [k, v] : ours.metadata) merged.metadata[k] = v;

    // Independent additions first, so a conflict resolution that touches an
    // entity sees every property theirs contributed to it.
    for (const auto& change : their_diff.changes()) {
        if (change.change_type == ChangeType::Added && our_changes.count(key_of(change)) == 0) {
            apply_addition(merged, theirs, change);
        }
    }

    std::set<ChangeKey> recorded;
    for (const auto& change : their_diff.changes()) {
        auto ours_it = our_changes.find(key_of(change));
        if (ours_it == our_changes.end() || !recorded.insert(key_of(change)).second) {
            continue;
        }

        MergeConflict conflict;
        conflict.path = change.path;
        conflict.element_type = change.element_type;
        conflict.resolution = strategy_;
        conflict.ours_value = ours_it->second->new_value;
        conflict.theirs_value = change.new_value;
        result.conflicts.push_back(std::move(conflict));

        resolve_conflict(merged, theirs, change, strategy_);
    }

    merged.metadata["merged_from"] = ours.name + ", " + theirs.name;

    logger()->debug("merge {} + {} (strategy {}): {} conflict(s)",
                    ours.name, theirs.name, to_string(strategy_), result.conflicts.size());
    return result;
}

MergeResult merge_models(const Model& base, const Model& ours, const Model& theirs,
                         MergeStrategy strategy) {
    return MergeEngine(strategy).merge(base, ours, theirs);
}

} // namespace ontodiff
