/**
 * @file Merge.hpp
 * @brief Three-way merge of model versions
 *
 * Reconciles two divergent edits ("ours", "theirs") of a common ancestor
 * ("base"):
 *
 * 1. Diff base→ours and base→theirs.
 * 2. Paths changed on both sides are conflicts.
 * 3. The merged entities, relationships and rules start as a copy of ours.
 * 4. Every element theirs added on a non-conflicting path is copied in
 *    (entities, relationships, rules, and properties into their entity).
 * 5. Each conflicting path is recorded once and resolved by the strategy.
 * 6. The version is ours.version with its last numeric component bumped.
 * 7. Metadata is base ∪ theirs ∪ ours (later wins) plus "merged_from".
 *
 * Strategies on a conflicting path:
 * - Ours:   keep what ours has.
 * - Theirs: take the element or field from theirs (removing it if theirs
 *           removed it).
 * - Union:  keep ours for scalar fields; for an entity added on both sides
 *           keep ours and append the properties only theirs has.
 *
 * Example:
 * ```cpp
 * MergeEngine engine(MergeStrategy::Union);
 * MergeResult result = engine.merge(base, ours, theirs);
 * for (const auto& c : result.conflicts) {
 *     std::cerr << c.path << " resolved with " << to_string(c.resolution) << "\n";
 * }
 * ```
 */

#ifndef ONTODIFF_MERGE_HPP
#define ONTODIFF_MERGE_HPP

#include "ontodiff/Diff.hpp"
#include "ontodiff/Model.hpp"

#include <string>
#include <vector>

namespace ontodiff {

enum class MergeStrategy {
    Ours,
    Theirs,
    Union
};

/// "ours", "theirs", "union"
std::string to_string(MergeStrategy strategy);

/**
 * @brief Parse a strategy name (case insensitive)
 * @throws Error for unknown names
 */
MergeStrategy parse_merge_strategy(const std::string& name);

/**
 * @brief A path changed by both sides
 *
 * ours_value / theirs_value are the values each side's change leads to
 * (empty when that side removed the element).
 */
struct MergeConflict {
    std::string path;
    ElementType element_type = ElementType::Entity;
    MergeStrategy resolution = MergeStrategy::Ours;
    std::string ours_value;
    std::string theirs_value;
};

struct MergeResult {
    Model model;
    std::vector<MergeConflict> conflicts;

    bool has_conflicts() const noexcept { return !conflicts.empty(); }
};

class MergeEngine {
public:
    explicit MergeEngine(MergeStrategy strategy = MergeStrategy::Ours)
        : strategy_(strategy) {}

    MergeStrategy strategy() const noexcept { return strategy_; }

    /**
     * @brief Merge ours and theirs against their common ancestor
     *
     * Inputs are not modified. merge(base, base, base) reproduces base
     * apart from the version bump and the "merged_from" metadata entry.
     */
    MergeResult merge(const Model& base, const Model& ours, const Model& theirs) const;

private:
    StructuralDiffEngine differ_;
    MergeStrategy strategy_;
};

/**
 * @brief Convenience wrapper around MergeEngine::merge
 */
MergeResult merge_models(const Model& base, const Model& ours, const Model& theirs,
                         MergeStrategy strategy = MergeStrategy::Ours);

/**
 * @brief Bump the last dot-separated component of a version
 *
 * - "1.2" → "1.3"
 * - "2" → "3"
 * - "1.0-beta" → "1.0-beta.1" (last component not numeric)
 */
std::string increment_version(const std::string& version);

} // namespace ontodiff

#endif // ONTODIFF_MERGE_HPP
