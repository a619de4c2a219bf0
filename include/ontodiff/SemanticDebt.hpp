/**
 * @file SemanticDebt.hpp
 * @brief Cross-model conflict analysis ("semantic debt")
 *
 * Compares N independently authored models that share naming and reports
 * definitions that disagree:
 *
 * | Kind             | Key                    | Trigger                  | Severity                      |
 * |------------------|------------------------|--------------------------|-------------------------------|
 * | EntityStructure  | entity name, per pair  | property names differ    | by overlap |∩|/|∪|           |
 * | PropertyType     | (entity, property)     | data_type differs        | Critical                      |
 * | Relationship     | (from, to)             | cardinality differs      | Warning                       |
 * | BusinessRule     | rule name              | condition differs        | Critical below the similarity |
 * |                  |                        |                          | threshold, else Warning       |
 *
 * Entity overlap: < 0.5 Critical, [0.5, 0.8) Warning, >= 0.8 Info.
 *
 * Rule conditions are scored with similarity_ratio() over every pair of
 * distinct conditions; the least similar pair decides the severity.
 */

#ifndef ONTODIFF_SEMANTICDEBT_HPP
#define ONTODIFF_SEMANTICDEBT_HPP

#include "ontodiff/Model.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace ontodiff {

enum class Severity {
    Critical,
    Warning,
    Info
};

enum class ConflictKind {
    EntityStructure,
    PropertyType,
    Relationship,
    BusinessRule
};

/// "critical", "warning", "info"
std::string to_string(Severity severity);

/// "entity_conflict", "type_conflict", "relationship_conflict", "rule_conflict"
std::string to_string(ConflictKind kind);

struct SemanticConflict {
    ConflictKind kind = ConflictKind::EntityStructure;
    Severity severity = Severity::Info;
    std::string name;                            ///< Conflicting element
    std::vector<std::string> sources;            ///< Model names involved
    std::map<std::string, std::string> details;  ///< Per-source description
    std::string description;
    std::string recommendation;
};

struct DebtSummary {
    std::size_t total_conflicts = 0;
    std::size_t critical = 0;
    std::size_t warning = 0;
    std::size_t info = 0;
    std::map<ConflictKind, std::size_t> by_kind;  ///< Only non-zero counts
};

class SemanticDebtReport {
public:
    SemanticDebtReport() = default;
    explicit SemanticDebtReport(std::vector<std::string> models_analyzed)
        : models_analyzed_(std::move(models_analyzed)) {}

    const std::vector<std::string>& models_analyzed() const noexcept { return models_analyzed_; }
    const std::vector<SemanticConflict>& conflicts() const noexcept { return conflicts_; }
    const std::vector<std::string>& recommendations() const noexcept { return recommendations_; }

    void add_conflict(SemanticConflict conflict) { conflicts_.push_back(std::move(conflict)); }
    void add_recommendation(std::string text) { recommendations_.push_back(std::move(text)); }

    DebtSummary summary() const;

    std::vector<SemanticConflict> conflicts_of(Severity severity) const;
    std::vector<SemanticConflict> conflicts_of(ConflictKind kind) const;

private:
    std::vector<std::string> models_analyzed_;
    std::vector<SemanticConflict> conflicts_;
    std::vector<std::string> recommendations_;
};

struct AnalyzerOptions {
    /// Rule conditions less similar than this are Critical
    double similarity_threshold = 0.8;
    /// More warnings than this trigger the alignment-review recommendation
    std::size_t review_warning_threshold = 3;
};

/**
 * @brief Severity of an entity-structure conflict from its property overlap
 */
Severity overlap_severity(double overlap);

/**
 * @brief |common| / |all| of two entities' property names (1.0 when both empty)
 */
double property_overlap(const Entity& a, const Entity& b);

class CrossModelConflictAnalyzer {
public:
    explicit CrossModelConflictAnalyzer(AnalyzerOptions options = AnalyzerOptions())
        : options_(options) {}

    const AnalyzerOptions& options() const noexcept { return options_; }

    /**
     * @brief Register a model under a name (e.g. its file name)
     *
     * Registration order is the order sources are reported in. Registering
     * a name twice replaces the earlier model.
     */
    void add_model(const std::string& name, Model model);

    std::size_t model_count() const noexcept { return models_.size(); }

    /**
     * @brief Analyze the registered models
     * @throws InsufficientInputError if fewer than two models are registered
     */
    SemanticDebtReport analyze() const;

    /**
     * @brief Analyze a name→model mapping without registering it
     * @throws InsufficientInputError if fewer than two models are supplied
     */
    SemanticDebtReport analyze(const std::map<std::string, Model>& models) const;

private:
    using NamedModel = std::pair<std::string, const Model*>;

    SemanticDebtReport run(const std::vector<NamedModel>& models) const;

    void analyze_entities(const std::vector<NamedModel>& models, SemanticDebtReport& report) const;
    void analyze_property_types(const std::vector<NamedModel>& models, SemanticDebtReport& report) const;
    void analyze_relationships(const std::vector<NamedModel>& models, SemanticDebtReport& report) const;
    void analyze_rules(const std::vector<NamedModel>& models, SemanticDebtReport& report) const;
    void add_recommendations(SemanticDebtReport& report) const;

    AnalyzerOptions options_;
    std::vector<std::pair<std::string, Model>> models_;
};

/**
 * @brief Convenience wrapper: analyze a name→model mapping
 */
SemanticDebtReport analyze_models(const std::map<std::string, Model>& models,
                                  AnalyzerOptions options = AnalyzerOptions());

} // namespace ontodiff

#endif // ONTODIFF_SEMANTICDEBT_HPP
