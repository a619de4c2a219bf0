/**
 * @file Diff.hpp
 * @brief Structural diff between two versions of a model
 *
 * The diff runs the identity-keyed comparator over, in this order:
 * 1. Entities (by name), then the properties of common entities
 * 2. Relationships (by "From→To")
 * 3. Business rules (by name)
 * 4. Metadata (by key)
 *
 * Within each collection changes are grouped added, removed, modified.
 *
 * Paths:
 * - Entity:        "Customer", "Customer.description"
 * - Property:      "Customer.Email", "Customer.Email.data_type"
 * - Relationship:  "Order→Customer", "Order→Customer.cardinality"
 * - Business rule: "rule:HighValueOrder", "rule:HighValueOrder.condition"
 * - Metadata:      "metadata:owner"
 */

#ifndef ONTODIFF_DIFF_HPP
#define ONTODIFF_DIFF_HPP

#include "ontodiff/Model.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace ontodiff {

enum class ChangeType {
    Added,
    Removed,
    Modified
};

enum class ElementType {
    Entity,
    Property,
    Relationship,
    Rule,
    Metadata
};

/// "added", "removed", "modified"
std::string to_string(ChangeType type);

/// "entity", "property", "relationship", "rule", "metadata"
std::string to_string(ElementType type);

/**
 * @brief A single difference between two model versions
 *
 * old_value is empty for additions, new_value is empty for removals.
 * For added/removed elements the value is a one-line summary of the
 * element (e.g. "type=Integer, required=true"); for modifications it is
 * the field value itself.
 */
struct Change {
    ChangeType change_type = ChangeType::Modified;
    ElementType element_type = ElementType::Entity;
    std::string element_name;
    std::string path;
    std::string old_value;
    std::string new_value;
    std::string details;
    std::string owner;  ///< Owning entity for property changes, empty otherwise
    std::string field;  ///< Modified field name, empty for added/removed
};

/**
 * @brief Change counts of a report
 */
struct DiffSummary {
    std::size_t total_changes = 0;
    std::size_t added = 0;
    std::size_t removed = 0;
    std::size_t modified = 0;
    std::map<ElementType, std::size_t> by_element;  ///< Only non-zero counts
};

/**
 * @brief Ordered change list between a source and a target model
 */
class DiffReport {
public:
    DiffReport() = default;
    DiffReport(std::string source_name, std::string source_version,
               std::string target_name, std::string target_version);

    const std::string& source_name() const noexcept { return source_name_; }
    const std::string& source_version() const noexcept { return source_version_; }
    const std::string& target_name() const noexcept { return target_name_; }
    const std::string& target_version() const noexcept { return target_version_; }

    const std::vector<Change>& changes() const noexcept { return changes_; }

    void add_change(Change change);

    bool has_changes() const noexcept { return !changes_.empty(); }

    DiffSummary summary() const;

    /// Changes of one kind, in report order
    std::vector<Change> changes_of(ChangeType type) const;

    /// Paths of all changes, in report order
    std::vector<std::string> paths() const;

private:
    std::string source_name_;
    std::string source_version_;
    std::string target_name_;
    std::string target_version_;
    std::vector<Change> changes_;
};

/**
 * @brief Compares two model versions
 *
 * Stateless; a single engine may be shared between threads.
 */
class StructuralDiffEngine {
public:
    /**
     * @brief Diff source (old) against target (new)
     * @return Report with every detected change
     */
    DiffReport diff(const Model& source, const Model& target) const;

private:
    void diff_entities(const Model& source, const Model& target, DiffReport& report) const;
    void diff_properties(const Entity& source, const Entity& target, DiffReport& report) const;
    void diff_relationships(const Model& source, const Model& target, DiffReport& report) const;
    void diff_rules(const Model& source, const Model& target, DiffReport& report) const;
    void diff_metadata(const Model& source, const Model& target, DiffReport& report) const;
};

/**
 * @brief Convenience wrapper around StructuralDiffEngine::diff
 */
DiffReport diff_models(const Model& source, const Model& target);

} // namespace ontodiff

#endif // ONTODIFF_DIFF_HPP
