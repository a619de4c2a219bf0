/**
 * @file Serialize.cpp
 * @brief Model and report (de)serialization
 */

#include "ontodiff/Serialize.hpp"
#include "ontodiff/Errors.hpp"

#include <string>

namespace ontodiff {

namespace {

/**
 * @brief Text of an optional field, the fallback when absent or null
 */
std::string text_field(const Value& obj, const char* key, const std::string& fallback = "") {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return fallback;
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

bool bool_field(const Value& obj, const char* key, const std::string& location) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return false;
    if (!it->is_boolean()) {
        throw ModelValidationError(location + "." + key,
                                   "expected boolean, got " + type_name(*it));
    }
    return it->get<bool>();
}

std::string required_text(const Value& obj, const char* key, const std::string& location) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw ModelValidationError(location, std::string("missing required field '") + key + "'");
    }
    return it->get<std::string>();
}

/**
 * @brief The array under key, an empty array when absent
 */
const Value& array_field(const Value& obj, const char* key, const std::string& location) {
    static const Value empty = Value::array();
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return empty;
    if (!it->is_array()) {
        const std::string where = location.empty() ? key : location + "." + key;
        throw ModelValidationError(where, "expected array, got " + type_name(*it));
    }
    return *it;
}

void require_object(const Value& v, const std::string& location) {
    if (!v.is_object()) {
        throw ModelValidationError(location, "expected object, got " + type_name(v));
    }
}

std::vector<Constraint> constraints_from(const Value& obj, const std::string& location) {
    std::vector<Constraint> out;
    const Value& items = array_field(obj, "constraints", location);
    for (std::size_t i = 0; i < items.size(); ++i) {
        const std::string where = location + ".constraints." + std::to_string(i);
        require_object(items[i], where);
        Constraint c;
        c.type = required_text(items[i], "type", where);
        c.value = text_field(items[i], "value");
        c.message = text_field(items[i], "message");
        out.push_back(std::move(c));
    }
    return out;
}

Value constraints_to(const std::vector<Constraint>& constraints) {
    Value arr = Value::array();
    for (const auto& c : constraints) {
        arr.push_back({{"type", c.type}, {"value", c.value}, {"message", c.message}});
    }
    return arr;
}

Value text_or_null(const std::string& s) {
    return s.empty() ? Value(nullptr) : Value(s);
}

} // anonymous namespace

Model model_from_value(const Value& data) {
    require_object(data, "<root>");

    Model model;
    model.name = text_field(data, "name", "Unnamed");
    model.version = text_field(data, "version", "1.0");
    model.source = text_field(data, "source");

    const Value& entities = array_field(data, "entities", "");
    for (std::size_t i = 0; i < entities.size(); ++i) {
        const std::string where = "entities." + std::to_string(i);
        const Value& e_data = entities[i];
        require_object(e_data, where);

        Entity entity;
        entity.name = required_text(e_data, "name", where);
        entity.description = text_field(e_data, "description");
        entity.entity_type = text_field(e_data, "entity_type", "standard");
        entity.constraints = constraints_from(e_data, where);

        const Value& props = array_field(e_data, "properties", where);
        for (std::size_t j = 0; j < props.size(); ++j) {
            const std::string pwhere = "entities." + entity.name + ".properties." + std::to_string(j);
            const Value& p_data = props[j];
            require_object(p_data, pwhere);

            Property prop;
            prop.name = required_text(p_data, "name", pwhere);
            prop.data_type = text_field(p_data, "data_type", "String");
            prop.required = bool_field(p_data, "required", pwhere);
            prop.unique = bool_field(p_data, "unique", pwhere);
            prop.description = text_field(p_data, "description");
            prop.constraints = constraints_from(p_data, pwhere);
            entity.properties.push_back(std::move(prop));
        }
        model.entities.push_back(std::move(entity));
    }

    const Value& rels = array_field(data, "relationships", "");
    for (std::size_t i = 0; i < rels.size(); ++i) {
        const std::string where = "relationships." + std::to_string(i);
        const Value& r_data = rels[i];
        require_object(r_data, where);

        Relationship rel;
        rel.from_entity = required_text(r_data, "from_entity", where);
        rel.to_entity = required_text(r_data, "to_entity", where);
        rel.from_property = text_field(r_data, "from_property");
        rel.to_property = text_field(r_data, "to_property");
        rel.relationship_type = text_field(r_data, "relationship_type", "related_to");
        rel.cardinality = text_field(r_data, "cardinality", "one-to-many");
        rel.description = text_field(r_data, "description");
        model.relationships.push_back(std::move(rel));
    }

    const Value& rules = array_field(data, "business_rules", "");
    for (std::size_t i = 0; i < rules.size(); ++i) {
        const std::string where = "business_rules." + std::to_string(i);
        const Value& b_data = rules[i];
        require_object(b_data, where);

        BusinessRule rule;
        rule.name = required_text(b_data, "name", where);
        rule.entity = text_field(b_data, "entity");
        rule.condition = text_field(b_data, "condition");
        rule.action = text_field(b_data, "action");
        rule.classification = text_field(b_data, "classification");
        rule.description = text_field(b_data, "description");

        auto prio = b_data.find("priority");
        if (prio != b_data.end() && !prio->is_null()) {
            if (!prio->is_number_integer()) {
                throw ModelValidationError(where + ".priority",
                                           "expected integer, got " + type_name(*prio));
            }
            rule.priority = prio->get<int>();
        }
        model.business_rules.push_back(std::move(rule));
    }

    auto meta = data.find("metadata");
    if (meta != data.end() && !meta->is_null()) {
        require_object(*meta, "metadata");
        for (auto it = meta->begin(); it != meta->end(); ++it) {
            model.metadata[it.key()] = it->is_string() ? it->get<std::string>() : it->dump();
        }
    }

    return model;
}

Value model_to_value(const Model& model) {
    Value entities = Value::array();
    for (const auto& e : model.entities) {
        Value props = Value::array();
        for (const auto& p : e.properties) {
            props.push_back({
                {"name", p.name},
                {"data_type", p.data_type},
                {"required", p.required},
                {"unique", p.unique},
                {"description", p.description},
                {"constraints", constraints_to(p.constraints)},
            });
        }
        entities.push_back({
            {"name", e.name},
            {"description", e.description},
            {"entity_type", e.entity_type},
            {"properties", props},
            {"constraints", constraints_to(e.constraints)},
        });
    }

    Value rels = Value::array();
    for (const auto& r : model.relationships) {
        rels.push_back({
            {"from_entity", r.from_entity},
            {"to_entity", r.to_entity},
            {"from_property", r.from_property},
            {"to_property", r.to_property},
            {"relationship_type", r.relationship_type},
            {"cardinality", r.cardinality},
            {"description", r.description},
        });
    }

    Value rules = Value::array();
    for (const auto& b : model.business_rules) {
        rules.push_back({
            {"name", b.name},
            {"entity", b.entity},
            {"condition", b.condition},
            {"action", b.action},
            {"classification", b.classification},
            {"description", b.description},
            {"priority", b.priority},
        });
    }

    Value metadata = Value::object();
    for (const auto& [k, v] : model.metadata) metadata[k] = v;

    return {
        {"name", model.name},
        {"version", model.version},
        {"source", model.source},
        {"entities", entities},
        {"relationships", rels},
        {"business_rules", rules},
        {"metadata", metadata},
    };
}

Value to_value(const Change& change) {
    return {
        {"change_type", to_string(change.change_type)},
        {"element_type", to_string(change.element_type)},
        {"element_name", change.element_name},
        {"path", change.path},
        {"old_value", text_or_null(change.old_value)},
        {"new_value", text_or_null(change.new_value)},
        {"details", change.details},
    };
}

Value to_value(const DiffReport& report) {
    const DiffSummary s = report.summary();

    Value by_element = Value::object();
    for (const auto& [element, count] : s.by_element) by_element[to_string(element)] = count;

    Value changes = Value::array();
    for (const auto& c : report.changes()) changes.push_back(to_value(c));

    return {
        {"source", {{"name", report.source_name()}, {"version", report.source_version()}}},
        {"target", {{"name", report.target_name()}, {"version", report.target_version()}}},
        {"summary", {
            {"total_changes", s.total_changes},
            {"added", s.added},
            {"removed", s.removed},
            {"modified", s.modified},
            {"by_element", by_element},
        }},
        {"changes", changes},
    };
}

Value to_value(const MergeResult& result) {
    Value conflicts = Value::array();
    for (const auto& c : result.conflicts) {
        conflicts.push_back({
            {"path", c.path},
            {"element_type", to_string(c.element_type)},
            {"resolution", to_string(c.resolution)},
            {"ours_value", text_or_null(c.ours_value)},
            {"theirs_value", text_or_null(c.theirs_value)},
        });
    }
    return {
        {"model", model_to_value(result.model)},
        {"conflicts", conflicts},
    };
}

Value to_value(const SemanticConflict& conflict) {
    Value details = Value::object();
    for (const auto& [source, detail] : conflict.details) details[source] = detail;

    return {
        {"conflict_type", to_string(conflict.kind)},
        {"severity", to_string(conflict.severity)},
        {"name", conflict.name},
        {"sources", conflict.sources},
        {"details", details},
        {"description", conflict.description},
        {"recommendation", conflict.recommendation},
    };
}

Value to_value(const SemanticDebtReport& report) {
    const DebtSummary s = report.summary();

    Value by_type = Value::object();
    for (const auto& [kind, count] : s.by_kind) by_type[to_string(kind)] = count;

    Value conflicts = Value::array();
    for (const auto& c : report.conflicts()) conflicts.push_back(to_value(c));

    return {
        {"models_analyzed", report.models_analyzed()},
        {"summary", {
            {"total_conflicts", s.total_conflicts},
            {"critical", s.critical},
            {"warning", s.warning},
            {"info", s.info},
            {"by_type", by_type},
        }},
        {"conflicts", conflicts},
        {"recommendations", report.recommendations()},
    };
}

} // namespace ontodiff
