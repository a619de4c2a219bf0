/**
 * @file SemanticDebt.cpp
 * @brief Implementation of the cross-model conflict analyzer
 */

#include "ontodiff/SemanticDebt.hpp"
#include "ontodiff/Comparator.hpp"
#include "ontodiff/Errors.hpp"
#include "ontodiff/Log.hpp"
#include "ontodiff/TextDiff.hpp"
#include "ontodiff/Util.hpp"

#include <algorithm>
#include <cstdio>
#include <set>

namespace ontodiff {

std::string to_string(Severity severity) {
    switch (severity) {
        case Severity::Critical: return "critical";
        case Severity::Warning: return "warning";
        case Severity::Info: return "info";
    }
    return "unknown";
}

std::string to_string(ConflictKind kind) {
    switch (kind) {
        case ConflictKind::EntityStructure: return "entity_conflict";
        case ConflictKind::PropertyType: return "type_conflict";
        case ConflictKind::Relationship: return "relationship_conflict";
        case ConflictKind::BusinessRule: return "rule_conflict";
    }
    return "unknown";
}

// ============================================================================
// SemanticDebtReport
// ============================================================================

DebtSummary SemanticDebtReport::summary() const {
    DebtSummary s;
    s.total_conflicts = conflicts_.size();
    for (const auto& c : conflicts_) {
        switch (c.severity) {
            case Severity::Critical: ++s.critical; break;
            case Severity::Warning: ++s.warning; break;
            case Severity::Info: ++s.info; break;
        }
        ++s.by_kind[c.kind];
    }
    return s;
}

std::vector<SemanticConflict> SemanticDebtReport::conflicts_of(Severity severity) const {
    std::vector<SemanticConflict> out;
    std::copy_if(conflicts_.begin(), conflicts_.end(), std::back_inserter(out),
                 [&](const SemanticConflict& c) { return c.severity == severity; });
    return out;
}

std::vector<SemanticConflict> SemanticDebtReport::conflicts_of(ConflictKind kind) const {
    std::vector<SemanticConflict> out;
    std::copy_if(conflicts_.begin(), conflicts_.end(), std::back_inserter(out),
                 [&](const SemanticConflict& c) { return c.kind == kind; });
    return out;
}

// ============================================================================
// Scoring
// ============================================================================

Severity overlap_severity(double overlap) {
    if (overlap < 0.5) return Severity::Critical;
    if (overlap < 0.8) return Severity::Warning;
    return Severity::Info;
}

namespace {

std::set<std::string> property_names(const Entity& e) {
    std::set<std::string> out;
    for (const auto& p : e.properties) out.insert(p.name);
    return out;
}

std::vector<std::string> sorted(const std::set<std::string>& s) {
    return std::vector<std::string>(s.begin(), s.end());
}

std::string percent(double ratio) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%.0f%%", ratio * 100.0);
    return buf;
}

/**
 * @brief Items of one identity key across models, in model order
 */
template <typename T>
using Occurrences = std::vector<std::pair<std::string, const T*>>;

/**
 * @brief Group every model's items by identity key
 *
 * Within one model duplicate keys collapse to the last item.
 */
template <typename T, typename Items, typename KeyFn>
std::map<std::string, Occurrences<T>> group_by_key(
        const std::vector<std::pair<std::string, const Model*>>& models,
        Items items, KeyFn key) {
    std::map<std::string, Occurrences<T>> out;
    for (const auto& [model_name, model] : models) {
        for (const auto& [k, item] : index_by(items(*model), key)) {
            out[k].emplace_back(model_name, item);
        }
    }
    return out;
}

template <typename T>
std::vector<std::string> source_names(const Occurrences<T>& occ) {
    std::vector<std::string> out;
    for (const auto& o : occ) out.push_back(o.first);
    return out;
}

} // anonymous namespace

double property_overlap(const Entity& a, const Entity& b) {
    const auto pa = property_names(a);
    const auto pb = property_names(b);

    std::set<std::string> all = pa;
    all.insert(pb.begin(), pb.end());
    if (all.empty()) return 1.0;

    std::size_t common = 0;
    for (const auto& name : pa) common += pb.count(name);
    return static_cast<double>(common) / static_cast<double>(all.size());
}

// ============================================================================
// CrossModelConflictAnalyzer
// ============================================================================

void CrossModelConflictAnalyzer::add_model(const std::string& name, Model model) {
    logger()->info("Added model '{}' with {} entities", name, model.entities.size());
    for (auto& entry : models_) {
        if (entry.first == name) {
            entry.second = std::move(model);
            return;
        }
    }
    models_.emplace_back(name, std::move(model));
}

SemanticDebtReport CrossModelConflictAnalyzer::analyze() const {
    std::vector<NamedModel> models;
    for (const auto& [name, model] : models_) models.emplace_back(name, &model);
    return run(models);
}

SemanticDebtReport CrossModelConflictAnalyzer::analyze(const std::map<std::string, Model>& models) const {
    std::vector<NamedModel> named;
    for (const auto& [name, model] : models) named.emplace_back(name, &model);
    return run(named);
}

SemanticDebtReport CrossModelConflictAnalyzer::run(const std::vector<NamedModel>& models) const {
    if (models.size() < 2) {
        throw InsufficientInputError(models.size());
    }

    std::vector<std::string> names;
    for (const auto& m : models) names.push_back(m.first);
    SemanticDebtReport report(std::move(names));

    analyze_entities(models, report);
    analyze_property_types(models, report);
    analyze_relationships(models, report);
    analyze_rules(models, report);
    add_recommendations(report);

    logger()->debug("semantic debt over {} models: {} conflict(s)",
                    models.size(), report.conflicts().size());
    return report;
}

void CrossModelConflictAnalyzer::analyze_entities(const std::vector<NamedModel>& models,
                                                  SemanticDebtReport& report) const {
    const auto groups = group_by_key<Entity>(
        models,
        [](const Model& m) -> const std::vector<Entity>& { return m.entities; },
        [](const Entity& e) { return e.name; });

    for (const auto& [entity_name, occ] : groups) {
        for (std::size_t i = 0; i < occ.size(); ++i) {
            for (std::size_t j = i + 1; j < occ.size(); ++j) {
                const auto& [src1, e1] = occ[i];
                const auto& [src2, e2] = occ[j];
                const auto props1 = property_names(*e1);
                const auto props2 = property_names(*e2);
                if (props1 == props2) continue;

                std::vector<std::string> only1, only2;
                std::set_difference(props1.begin(), props1.end(), props2.begin(), props2.end(),
                                    std::back_inserter(only1));
                std::set_difference(props2.begin(), props2.end(), props1.begin(), props1.end(),
                                    std::back_inserter(only2));

                std::vector<std::string> missing;
                if (!only1.empty()) missing.push_back("only in " + src1 + ": " + join(only1, ", "));
                if (!only2.empty()) missing.push_back("only in " + src2 + ": " + join(only2, ", "));

                const double overlap = property_overlap(*e1, *e2);

                SemanticConflict c;
                c.kind = ConflictKind::EntityStructure;
                c.severity = overlap_severity(overlap);
                c.name = entity_name;
                c.sources = {src1, src2};
                c.details[src1] = "Properties: " + join(sorted(props1), ", ");
                c.details[src2] = "Properties: " + join(sorted(props2), ", ");
                c.description = "Entity '" + entity_name + "' has different structures (" +
                                percent(overlap) + " property overlap): " + join(missing, "; ");
                c.recommendation = "Unify entity '" + entity_name +
                                   "' structure across models or rename to avoid confusion.";
                report.add_conflict(std::move(c));
            }
        }
    }
}

void CrossModelConflictAnalyzer::analyze_property_types(const std::vector<NamedModel>& models,
                                                        SemanticDebtReport& report) const {
    // (entity, property) → occurrences, keyed "Entity.Property"
    std::map<std::pair<std::string, std::string>, Occurrences<Property>> groups;
    for (const auto& [model_name, model] : models) {
        for (const auto& [entity_name, entity] :
                 index_by(model->entities, [](const Entity& e) { return e.name; })) {
            for (const auto& [prop_name, prop] :
                     index_by(entity->properties, [](const Property& p) { return p.name; })) {
                groups[{entity_name, prop_name}].emplace_back(model_name, prop);
            }
        }
    }

    for (const auto& [key, occ] : groups) {
        if (occ.size() < 2) continue;

        std::set<std::string> types;
        for (const auto& o : occ) types.insert(o.second->data_type);
        if (types.size() < 2) continue;

        const std::string name = key.first + "." + key.second;
        SemanticConflict c;
        c.kind = ConflictKind::PropertyType;
        c.severity = Severity::Critical;
        c.name = name;
        c.sources = source_names(occ);
        for (const auto& [src, prop] : occ) c.details[src] = "Type: " + prop->data_type;
        c.description = "Property '" + name + "' has different types: " + join(sorted(types), ", ");
        c.recommendation = "Standardize the data type for '" + key.second +
                           "' across all models using a shared data dictionary.";
        report.add_conflict(std::move(c));
    }
}

void CrossModelConflictAnalyzer::analyze_relationships(const std::vector<NamedModel>& models,
                                                       SemanticDebtReport& report) const {
    const auto groups = group_by_key<Relationship>(
        models,
        [](const Model& m) -> const std::vector<Relationship>& { return m.relationships; },
        [](const Relationship& r) { return relationship_key(r); });

    for (const auto& [key, occ] : groups) {
        if (occ.size() < 2) continue;

        std::set<std::string> cardinalities;
        for (const auto& o : occ) cardinalities.insert(o.second->cardinality);
        if (cardinalities.size() < 2) continue;

        SemanticConflict c;
        c.kind = ConflictKind::Relationship;
        c.severity = Severity::Warning;
        c.name = key;
        c.sources = source_names(occ);
        for (const auto& [src, rel] : occ) {
            c.details[src] = "Type: " + rel->relationship_type + ", Cardinality: " + rel->cardinality;
        }
        c.description = "Relationship '" + key + "' has different cardinalities: " +
                        join(sorted(cardinalities), ", ");
        c.recommendation = "Verify the correct cardinality with the model owners and update models accordingly.";
        report.add_conflict(std::move(c));
    }
}

void CrossModelConflictAnalyzer::analyze_rules(const std::vector<NamedModel>& models,
                                               SemanticDebtReport& report) const {
    const auto groups = group_by_key<BusinessRule>(
        models,
        [](const Model& m) -> const std::vector<BusinessRule>& { return m.business_rules; },
        [](const BusinessRule& r) { return r.name; });

    for (const auto& [rule_name, occ] : groups) {
        if (occ.size() < 2) continue;

        // Distinct conditions in first-seen order
        std::vector<std::string> conditions;
        for (const auto& o : occ) {
            if (std::find(conditions.begin(), conditions.end(), o.second->condition) == conditions.end()) {
                conditions.push_back(o.second->condition);
            }
        }
        if (conditions.size() < 2) continue;

        double lowest = 1.0;
        for (std::size_t i = 0; i < conditions.size(); ++i) {
            for (std::size_t j = i + 1; j < conditions.size(); ++j) {
                lowest = std::min(lowest, similarity_ratio(conditions[i], conditions[j]));
            }
        }

        SemanticConflict c;
        c.kind = ConflictKind::BusinessRule;
        c.severity = lowest < options_.similarity_threshold ? Severity::Critical : Severity::Warning;
        c.name = rule_name;
        c.sources = source_names(occ);
        for (const auto& [src, rule] : occ) {
            c.details[src] = "Condition: " + rule->condition + ", Action: " + rule->action;
        }
        c.description = "Business rule '" + rule_name + "' has " + std::to_string(conditions.size()) +
                        " different conditions across models (lowest similarity " +
                        percent(lowest) + ").";
        c.recommendation = "Consolidate rule '" + rule_name +
                           "' into a single source of truth and centralize business rules.";
        report.add_conflict(std::move(c));
    }
}

void CrossModelConflictAnalyzer::add_recommendations(SemanticDebtReport& report) const {
    if (report.conflicts().empty()) {
        report.add_recommendation("No semantic conflicts detected. Models are consistent.");
        return;
    }

    const DebtSummary s = report.summary();
    auto has = [&](ConflictKind kind) { return s.by_kind.count(kind) > 0; };

    if (s.critical > 0) {
        report.add_recommendation("Address " + std::to_string(s.critical) +
                                  " critical conflict(s) immediately - they may cause data inconsistencies.");
    }
    if (has(ConflictKind::PropertyType)) {
        report.add_recommendation("Create a shared data dictionary to standardize property types across models.");
    }
    if (has(ConflictKind::EntityStructure)) {
        report.add_recommendation("Consider creating a master schema that all models inherit from.");
    }
    if (has(ConflictKind::BusinessRule)) {
        report.add_recommendation("Centralize business rules in a single repository to ensure consistency.");
    }
    if (has(ConflictKind::Relationship)) {
        report.add_recommendation("Review relationship cardinalities with the owners of each model.");
    }
    if (s.warning > options_.review_warning_threshold) {
        report.add_recommendation("Schedule a semantic alignment review with stakeholders from the different model teams.");
    }
}

SemanticDebtReport analyze_models(const std::map<std::string, Model>& models, AnalyzerOptions options) {
    return CrossModelConflictAnalyzer(options).analyze(models);
}

} // namespace ontodiff
