/**
 * @file Model.cpp
 * @brief Model record helpers and boundary validation
 */

#include "ontodiff/Model.hpp"
#include "ontodiff/Errors.hpp"

#include <set>

namespace ontodiff {

bool operator==(const Constraint& a, const Constraint& b) {
    return a.type == b.type && a.value == b.value && a.message == b.message;
}

bool operator==(const Property& a, const Property& b) {
    return a.name == b.name
        && a.data_type == b.data_type
        && a.required == b.required
        && a.unique == b.unique
        && a.description == b.description
        && a.constraints == b.constraints;
}

bool operator==(const Entity& a, const Entity& b) {
    return a.name == b.name
        && a.description == b.description
        && a.entity_type == b.entity_type
        && a.properties == b.properties
        && a.constraints == b.constraints;
}

bool operator==(const Relationship& a, const Relationship& b) {
    return a.from_entity == b.from_entity
        && a.to_entity == b.to_entity
        && a.from_property == b.from_property
        && a.to_property == b.to_property
        && a.relationship_type == b.relationship_type
        && a.cardinality == b.cardinality
        && a.description == b.description;
}

bool operator==(const BusinessRule& a, const BusinessRule& b) {
    return a.name == b.name
        && a.entity == b.entity
        && a.condition == b.condition
        && a.action == b.action
        && a.classification == b.classification
        && a.description == b.description
        && a.priority == b.priority;
}

bool operator==(const Model& a, const Model& b) {
    return a.name == b.name
        && a.version == b.version
        && a.source == b.source
        && a.entities == b.entities
        && a.relationships == b.relationships
        && a.business_rules == b.business_rules
        && a.metadata == b.metadata;
}

std::string relationship_key(const std::string& from_entity, const std::string& to_entity) {
    return from_entity + "→" + to_entity;
}

std::string relationship_key(const Relationship& rel) {
    return relationship_key(rel.from_entity, rel.to_entity);
}

namespace {
    // Reverse scan so the lookups agree with "last wins" identity maps.
    template <typename Container, typename Pred>
    auto find_last(Container& items, Pred pred) -> decltype(&items.front()) {
        for (auto it = items.rbegin(); it != items.rend(); ++it) {
            if (pred(*it)) return &(*it);
        }
        return nullptr;
    }
}

const Entity* find_entity(const Model& model, const std::string& name) {
    return find_last(model.entities, [&](const Entity& e) { return e.name == name; });
}

Entity* find_entity(Model& model, const std::string& name) {
    return find_last(model.entities, [&](const Entity& e) { return e.name == name; });
}

const Property* find_property(const Entity& entity, const std::string& name) {
    return find_last(entity.properties, [&](const Property& p) { return p.name == name; });
}

Property* find_property(Entity& entity, const std::string& name) {
    return find_last(entity.properties, [&](const Property& p) { return p.name == name; });
}

const Relationship* find_relationship(const Model& model, const std::string& key) {
    return find_last(model.relationships,
                     [&](const Relationship& r) { return relationship_key(r) == key; });
}

Relationship* find_relationship(Model& model, const std::string& key) {
    return find_last(model.relationships,
                     [&](const Relationship& r) { return relationship_key(r) == key; });
}

const BusinessRule* find_rule(const Model& model, const std::string& name) {
    return find_last(model.business_rules, [&](const BusinessRule& r) { return r.name == name; });
}

BusinessRule* find_rule(Model& model, const std::string& name) {
    return find_last(model.business_rules, [&](const BusinessRule& r) { return r.name == name; });
}

void validate_model(const Model& model, bool reject_duplicates) {
    if (model.name.empty()) {
        throw ModelValidationError("name", "model name is empty");
    }

    std::set<std::string> entity_names;
    for (size_t i = 0; i < model.entities.size(); ++i) {
        const auto& entity = model.entities[i];
        if (entity.name.empty()) {
            throw ModelValidationError("entities." + std::to_string(i), "entity name is empty");
        }
        if (!entity_names.insert(entity.name).second && reject_duplicates) {
            throw ModelValidationError("entities." + entity.name, "duplicate entity name");
        }

        std::set<std::string> property_names;
        for (size_t j = 0; j < entity.properties.size(); ++j) {
            const auto& prop = entity.properties[j];
            const std::string location = "entities." + entity.name + ".properties";
            if (prop.name.empty()) {
                throw ModelValidationError(location + "." + std::to_string(j),
                                           "property name is empty");
            }
            if (!property_names.insert(prop.name).second && reject_duplicates) {
                throw ModelValidationError(location + "." + prop.name, "duplicate property name");
            }
        }
    }

    std::set<std::string> rel_keys;
    for (size_t i = 0; i < model.relationships.size(); ++i) {
        const auto& rel = model.relationships[i];
        if (rel.from_entity.empty() || rel.to_entity.empty()) {
            throw ModelValidationError("relationships." + std::to_string(i),
                                       "relationship endpoint is empty");
        }
        if (!rel_keys.insert(relationship_key(rel)).second && reject_duplicates) {
            throw ModelValidationError("relationships." + relationship_key(rel),
                                       "duplicate relationship between the same entities");
        }
    }

    std::set<std::string> rule_names;
    for (size_t i = 0; i < model.business_rules.size(); ++i) {
        const auto& rule = model.business_rules[i];
        if (rule.name.empty()) {
            throw ModelValidationError("business_rules." + std::to_string(i),
                                       "rule name is empty");
        }
        if (!rule_names.insert(rule.name).second && reject_duplicates) {
            throw ModelValidationError("business_rules." + rule.name, "duplicate rule name");
        }
    }
}

} // namespace ontodiff
