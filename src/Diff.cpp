/**
 * @file Diff.cpp
 * @brief Implementation of the structural diff
 */

#include "ontodiff/Diff.hpp"
#include "ontodiff/Comparator.hpp"
#include "ontodiff/Log.hpp"

#include <utility>

namespace ontodiff {

std::string to_string(ChangeType type) {
    switch (type) {
        case ChangeType::Added: return "added";
        case ChangeType::Removed: return "removed";
        case ChangeType::Modified: return "modified";
    }
    return "unknown";
}

std::string to_string(ElementType type) {
    switch (type) {
        case ElementType::Entity: return "entity";
        case ElementType::Property: return "property";
        case ElementType::Relationship: return "relationship";
        case ElementType::Rule: return "rule";
        case ElementType::Metadata: return "metadata";
    }
    return "unknown";
}

// ============================================================================
// DiffReport
// ============================================================================

DiffReport::DiffReport(std::string source_name, std::string source_version,
                       std::string target_name, std::string target_version)
    : source_name_(std::move(source_name))
    , source_version_(std::move(source_version))
    , target_name_(std::move(target_name))
    , target_version_(std::move(target_version))
{}

void DiffReport::add_change(Change change) {
    changes_.push_back(std::move(change));
}

DiffSummary DiffReport::summary() const {
    DiffSummary s;
    s.total_changes = changes_.size();
    for (const auto& c : changes_) {
        switch (c.change_type) {
            case ChangeType::Added: ++s.added; break;
            case ChangeType::Removed: ++s.removed; break;
            case ChangeType::Modified: ++s.modified; break;
        }
        ++s.by_element[c.element_type];
    }
    return s;
}

std::vector<Change> DiffReport::changes_of(ChangeType type) const {
    std::vector<Change> out;
    for (const auto& c : changes_) {
        if (c.change_type == type) out.push_back(c);
    }
    return out;
}

std::vector<std::string> DiffReport::paths() const {
    std::vector<std::string> out;
    out.reserve(changes_.size());
    for (const auto& c : changes_) out.push_back(c.path);
    return out;
}

// ============================================================================
// StructuralDiffEngine
// ============================================================================

namespace {

std::string bool_text(bool b) {
    return b ? "true" : "false";
}

std::string entity_summary(const Entity& e) {
    return "type=" + e.entity_type + ", properties=" + std::to_string(e.properties.size());
}

std::string property_summary(const Property& p) {
    return "type=" + p.data_type + ", required=" + bool_text(p.required);
}

std::string relationship_summary(const Relationship& r) {
    return "type=" + r.relationship_type + ", cardinality=" + r.cardinality;
}

std::string rule_summary(const BusinessRule& r) {
    return "condition=" + r.condition + ", action=" + r.action;
}

std::string rule_path(const std::string& name) {
    return "rule:" + name;
}

std::string metadata_path(const std::string& key) {
    return "metadata:" + key;
}

Change added(ElementType type, std::string name, std::string path,
             std::string value, std::string details) {
    Change c;
    c.change_type = ChangeType::Added;
    c.element_type = type;
    c.element_name = std::move(name);
    c.path = std::move(path);
    c.new_value = std::move(value);
    c.details = std::move(details);
    return c;
}

Change removed(ElementType type, std::string name, std::string path,
               std::string value, std::string details) {
    Change c;
    c.change_type = ChangeType::Removed;
    c.element_type = type;
    c.element_name = std::move(name);
    c.path = std::move(path);
    c.old_value = std::move(value);
    c.details = std::move(details);
    return c;
}

Change modified(ElementType type, std::string name, const std::string& base_path,
                const FieldDifference& diff, std::string details) {
    Change c;
    c.change_type = ChangeType::Modified;
    c.element_type = type;
    c.element_name = std::move(name);
    c.path = base_path + "." + diff.field;
    c.old_value = diff.old_value;
    c.new_value = diff.new_value;
    c.details = std::move(details);
    c.field = diff.field;
    return c;
}

const std::vector<FieldAccessor<Entity>>& entity_fields() {
    static const std::vector<FieldAccessor<Entity>> fields = {
        {"entity_type", [](const Entity& e) { return e.entity_type; }},
        {"description", [](const Entity& e) { return e.description; }},
    };
    return fields;
}

const std::vector<FieldAccessor<Property>>& property_fields() {
    static const std::vector<FieldAccessor<Property>> fields = {
        {"data_type", [](const Property& p) { return p.data_type; }},
        {"required", [](const Property& p) { return bool_text(p.required); }},
        {"unique", [](const Property& p) { return bool_text(p.unique); }},
    };
    return fields;
}

const std::vector<FieldAccessor<Relationship>>& relationship_fields() {
    static const std::vector<FieldAccessor<Relationship>> fields = {
        {"type", [](const Relationship& r) { return r.relationship_type; }},
        {"cardinality", [](const Relationship& r) { return r.cardinality; }},
    };
    return fields;
}

const std::vector<FieldAccessor<BusinessRule>>& rule_fields() {
    static const std::vector<FieldAccessor<BusinessRule>> fields = {
        {"condition", [](const BusinessRule& r) { return r.condition; }},
        {"action", [](const BusinessRule& r) { return r.action; }},
        {"classification", [](const BusinessRule& r) { return r.classification; }},
    };
    return fields;
}

std::string entity_field_detail(const std::string& field) {
    if (field == "entity_type") return "Entity type changed";
    return "Description updated";
}

std::string property_field_detail(const std::string& field) {
    if (field == "data_type") return "Data type changed";
    if (field == "required") return "Required flag changed";
    return "Unique flag changed";
}

std::string relationship_field_detail(const std::string& field) {
    if (field == "type") return "Relationship type changed";
    return "Cardinality changed";
}

std::string rule_field_detail(const std::string& field) {
    if (field == "condition") return "Condition changed";
    if (field == "action") return "Action changed";
    return "Classification changed";
}

} // anonymous namespace

DiffReport StructuralDiffEngine::diff(const Model& source, const Model& target) const {
    DiffReport report(source.name, source.version, target.name, target.version);

    diff_entities(source, target, report);
    diff_relationships(source, target, report);
    diff_rules(source, target, report);
    diff_metadata(source, target, report);

    logger()->debug("diff {} v{} -> {} v{}: {} change(s)",
                    source.name, source.version, target.name, target.version,
                    report.changes().size());
    return report;
}

void StructuralDiffEngine::diff_entities(const Model& source, const Model& target,
                                         DiffReport& report) const {
    auto by_name = [](const Entity& e) { return e.name; };
    const auto src = index_by(source.entities, by_name);
    const auto dst = index_by(target.entities, by_name);
    const auto cmp = compare_keyed(src, dst);

    for (const auto& name : cmp.added) {
        const Entity& e = *dst.at(name);
        report.add_change(added(ElementType::Entity, name, name, entity_summary(e), e.description));
    }

    for (const auto& name : cmp.removed) {
        const Entity& e = *src.at(name);
        report.add_change(removed(ElementType::Entity, name, name, entity_summary(e), e.description));
    }

    for (const auto& name : cmp.common) {
        const Entity& old_entity = *src.at(name);
        const Entity& new_entity = *dst.at(name);
        for (const auto& d : compare_fields(old_entity, new_entity, entity_fields())) {
            report.add_change(modified(ElementType::Entity, name, name, d,
                                       entity_field_detail(d.field)));
        }
        diff_properties(old_entity, new_entity, report);
    }
}

void StructuralDiffEngine::diff_properties(const Entity& source, const Entity& target,
                                           DiffReport& report) const {
    auto by_name = [](const Property& p) { return p.name; };
    const auto src = index_by(source.properties, by_name);
    const auto dst = index_by(target.properties, by_name);
    const auto cmp = compare_keyed(src, dst, property_fields());
    const std::string& entity = source.name;

    for (const auto& name : cmp.added) {
        const Property& p = *dst.at(name);
        Change c = added(ElementType::Property, name, entity + "." + name,
                         property_summary(p), p.description);
        c.owner = entity;
        report.add_change(std::move(c));
    }

    for (const auto& name : cmp.removed) {
        const Property& p = *src.at(name);
        Change c = removed(ElementType::Property, name, entity + "." + name,
                           property_summary(p), p.description);
        c.owner = entity;
        report.add_change(std::move(c));
    }

    for (const auto& mod : cmp.modified) {
        for (const auto& d : mod.fields) {
            Change c = modified(ElementType::Property, mod.key, entity + "." + mod.key, d,
                                property_field_detail(d.field));
            c.owner = entity;
            report.add_change(std::move(c));
        }
    }
}

void StructuralDiffEngine::diff_relationships(const Model& source, const Model& target,
                                              DiffReport& report) const {
    auto by_key = [](const Relationship& r) { return relationship_key(r); };
    const auto src = index_by(source.relationships, by_key);
    const auto dst = index_by(target.relationships, by_key);
    const auto cmp = compare_keyed(src, dst, relationship_fields());

    for (const auto& key : cmp.added) {
        const Relationship& r = *dst.at(key);
        report.add_change(added(ElementType::Relationship, key, key,
                                relationship_summary(r), r.description));
    }

    for (const auto& key : cmp.removed) {
        const Relationship& r = *src.at(key);
        report.add_change(removed(ElementType::Relationship, key, key,
                                  relationship_summary(r), r.description));
    }

    for (const auto& mod : cmp.modified) {
        for (const auto& d : mod.fields) {
            report.add_change(modified(ElementType::Relationship, mod.key, mod.key, d,
                                       relationship_field_detail(d.field)));
        }
    }
}

void StructuralDiffEngine::diff_rules(const Model& source, const Model& target,
                                      DiffReport& report) const {
    auto by_name = [](const BusinessRule& r) { return r.name; };
    const auto src = index_by(source.business_rules, by_name);
    const auto dst = index_by(target.business_rules, by_name);
    const auto cmp = compare_keyed(src, dst, rule_fields());

    for (const auto& name : cmp.added) {
        const BusinessRule& r = *dst.at(name);
        report.add_change(added(ElementType::Rule, name, rule_path(name),
                                rule_summary(r), r.description));
    }

    for (const auto& name : cmp.removed) {
        const BusinessRule& r = *src.at(name);
        report.add_change(removed(ElementType::Rule, name, rule_path(name),
                                  rule_summary(r), r.description));
    }

    for (const auto& mod : cmp.modified) {
        for (const auto& d : mod.fields) {
            report.add_change(modified(ElementType::Rule, mod.key, rule_path(mod.key), d,
                                       rule_field_detail(d.field)));
        }
    }
}

void StructuralDiffEngine::diff_metadata(const Model& source, const Model& target,
                                         DiffReport& report) const {
    const auto src = index_map(source.metadata);
    const auto dst = index_map(target.metadata);
    const auto cmp = compare_keyed(src, dst);

    for (const auto& key : cmp.added) {
        report.add_change(added(ElementType::Metadata, key, metadata_path(key), *dst.at(key), ""));
    }

    for (const auto& key : cmp.removed) {
        report.add_change(removed(ElementType::Metadata, key, metadata_path(key), *src.at(key), ""));
    }

    // Metadata entries are flat values, so the "field" is the key itself.
    for (const auto& key : cmp.common) {
        const std::string& old_value = *src.at(key);
        const std::string& new_value = *dst.at(key);
        if (old_value == new_value) continue;

        Change c;
        c.change_type = ChangeType::Modified;
        c.element_type = ElementType::Metadata;
        c.element_name = key;
        c.path = metadata_path(key);
        c.old_value = old_value;
        c.new_value = new_value;
        c.field = key;
        report.add_change(std::move(c));
    }
}

DiffReport diff_models(const Model& source, const Model& target) {
    return StructuralDiffEngine().diff(source, target);
}

} // namespace ontodiff
