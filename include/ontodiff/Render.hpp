/**
 * @file Render.hpp
 * @brief Text views of diff and semantic-debt reports
 */

#ifndef ONTODIFF_RENDER_HPP
#define ONTODIFF_RENDER_HPP

#include "ontodiff/Diff.hpp"
#include "ontodiff/Merge.hpp"
#include "ontodiff/SemanticDebt.hpp"

#include <string>
#include <vector>

namespace ontodiff {

/**
 * @brief Markdown changelog of a diff report
 *
 * Title, from/to lines, summary counts, then "Added", "Removed" and
 * "Modified" sections (omitted when empty). Modified entries show the old
 * and new value, an empty side rendered as "(empty)".
 */
std::string to_changelog(const DiffReport& report);

/**
 * @brief Synthetic "before" or "after" lines of a diff report
 *
 * One "{element_type}: {path} = {value}" line per change that has an old
 * (before) or new (after) value, sorted.
 */
std::vector<std::string> change_lines(const DiffReport& report, bool after);

/**
 * @brief Unified-diff view of a diff report
 *
 * Approximation: diffs the textual projection built by change_lines(),
 * not any serialized form of the models. Headers read "<name> v<version>".
 * Empty for a report without changes.
 */
std::string to_unified_diff(const DiffReport& report);

/**
 * @brief Markdown report of a semantic-debt analysis
 *
 * Summary, conflicts by kind, critical / warning / info sections and the
 * numbered recommendations.
 */
std::string to_markdown(const SemanticDebtReport& report);

/**
 * @brief One line per merge conflict: "<path>: ours=<v>, theirs=<v> -> <strategy>"
 */
std::string conflict_summary(const MergeResult& result);

} // namespace ontodiff

#endif // ONTODIFF_RENDER_HPP
