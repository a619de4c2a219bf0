/**
 * @file Model.hpp
 * @brief Value records describing a semantic model ("ontology")
 *
 * A Model owns its entities, relationships and business rules by value.
 * The engines only ever read a Model and build new ones; nothing in the
 * comparison, merge or analysis paths mutates an input.
 *
 * Identity keys:
 * - Entity: name (unique within a Model)
 * - Property: name (unique within an Entity)
 * - Relationship: (from_entity, to_entity), rendered "From→To"
 * - BusinessRule: name (unique within a Model)
 * - Metadata: map key
 *
 * Uniqueness is assumed, not enforced. When an identity map is built from
 * a collection with duplicate names the later record wins. Callers that
 * want a hard failure run validate_model() with reject_duplicates = true at
 * the point where the model enters the system.
 */

#ifndef ONTODIFF_MODEL_HPP
#define ONTODIFF_MODEL_HPP

#include <map>
#include <string>
#include <vector>

namespace ontodiff {

/**
 * @brief Validation constraint attached to a property or entity
 *
 * Never diffed on its own; only compared as part of its owner's equality.
 */
struct Constraint {
    std::string type;     ///< e.g. "range", "regex", "enum"
    std::string value;    ///< Constraint payload rendered as text
    std::string message;
};

struct Property {
    std::string name;
    std::string data_type = "String";
    bool required = false;
    bool unique = false;
    std::string description;
    std::vector<Constraint> constraints;
};

struct Entity {
    std::string name;
    std::string description;
    std::string entity_type = "standard";
    std::vector<Property> properties;
    std::vector<Constraint> constraints;
};

struct Relationship {
    std::string from_entity;
    std::string to_entity;
    std::string from_property;
    std::string to_property;
    std::string relationship_type = "related_to";
    std::string cardinality = "one-to-many";
    std::string description;
};

struct BusinessRule {
    std::string name;
    std::string entity;
    std::string condition;
    std::string action;
    std::string classification;
    std::string description;
    int priority = 1;
};

struct Model {
    std::string name;
    std::string version = "1.0";
    std::string source;
    std::vector<Entity> entities;
    std::vector<Relationship> relationships;
    std::vector<BusinessRule> business_rules;
    std::map<std::string, std::string> metadata;
};

bool operator==(const Constraint& a, const Constraint& b);
bool operator==(const Property& a, const Property& b);
bool operator==(const Entity& a, const Entity& b);
bool operator==(const Relationship& a, const Relationship& b);
bool operator==(const BusinessRule& a, const BusinessRule& b);
bool operator==(const Model& a, const Model& b);

inline bool operator!=(const Constraint& a, const Constraint& b) { return !(a == b); }
inline bool operator!=(const Property& a, const Property& b) { return !(a == b); }
inline bool operator!=(const Entity& a, const Entity& b) { return !(a == b); }
inline bool operator!=(const Relationship& a, const Relationship& b) { return !(a == b); }
inline bool operator!=(const BusinessRule& a, const BusinessRule& b) { return !(a == b); }
inline bool operator!=(const Model& a, const Model& b) { return !(a == b); }

/**
 * @brief Identity key of a relationship
 * @return "From→To"
 */
std::string relationship_key(const Relationship& rel);

/**
 * @brief Identity key of a relationship from its endpoints
 */
std::string relationship_key(const std::string& from_entity, const std::string& to_entity);

const Entity* find_entity(const Model& model, const std::string& name);
Entity* find_entity(Model& model, const std::string& name);
const Property* find_property(const Entity& entity, const std::string& name);
Property* find_property(Entity& entity, const std::string& name);

/**
 * @brief Find a relationship by its "From→To" key (last match wins)
 */
const Relationship* find_relationship(const Model& model, const std::string& key);
Relationship* find_relationship(Model& model, const std::string& key);

const BusinessRule* find_rule(const Model& model, const std::string& name);
BusinessRule* find_rule(Model& model, const std::string& name);

/**
 * @brief Check a model at the model-source boundary
 *
 * Rejects records with empty identity fields: model name, entity names,
 * property names, relationship endpoints and rule names. With
 * reject_duplicates set, also rejects duplicate identity keys within a
 * scope instead of letting the last record win downstream.
 *
 * @param model Model to check
 * @param reject_duplicates Treat duplicate names within a scope as errors
 * @throws ModelValidationError on the first problem found
 */
void validate_model(const Model& model, bool reject_duplicates = false);

} // namespace ontodiff

#endif // ONTODIFF_MODEL_HPP
