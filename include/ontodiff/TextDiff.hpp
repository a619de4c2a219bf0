/**
 * @file TextDiff.hpp
 * @brief Longest-common-subsequence text utilities
 *
 * Two consumers:
 * - the unified-diff rendering of a DiffReport (line-based LCS)
 * - business-rule similarity scoring in the conflict analyzer
 *   (character-based LCS)
 */

#ifndef ONTODIFF_TEXTDIFF_HPP
#define ONTODIFF_TEXTDIFF_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace ontodiff {

/**
 * @brief One line of a line-based edit script
 *
 * tag is ' ' for a line common to both texts, '-' for a line only in the
 * old text and '+' for a line only in the new text.
 */
struct DiffLine {
    char tag;
    std::string text;
};

/**
 * @brief Length of the longest common subsequence of two strings
 */
std::size_t lcs_length(const std::string& a, const std::string& b);

/**
 * @brief Case-insensitive similarity ratio in [0, 1]
 *
 * 2 * LCS(a, b) / (|a| + |b|) over the lower-cased strings. Two empty
 * strings are identical (1.0).
 *
 * Examples:
 * - similarity_ratio("Amount > 100", "amount > 100") == 1.0
 * - similarity_ratio("abc", "xyz") == 0.0
 */
double similarity_ratio(const std::string& a, const std::string& b);

/**
 * @brief Line-based edit script between two texts
 *
 * Deletions are emitted before insertions where both apply.
 */
std::vector<DiffLine> diff_lines(const std::vector<std::string>& old_lines,
                                 const std::vector<std::string>& new_lines);

/**
 * @brief Render a unified diff
 *
 * Output has "---" / "+++" headers followed by "@@ -a,b +c,d @@" hunks,
 * each with up to `context` unchanged lines around the changes. Identical
 * inputs produce an empty string.
 *
 * @param old_lines Lines of the "before" text
 * @param new_lines Lines of the "after" text
 * @param from_file Label of the "before" text
 * @param to_file Label of the "after" text
 * @param context Number of context lines around each change
 */
std::string unified_diff(const std::vector<std::string>& old_lines,
                         const std::vector<std::string>& new_lines,
                         const std::string& from_file,
                         const std::string& to_file,
                         std::size_t context = 3);

} // namespace ontodiff

#endif // ONTODIFF_TEXTDIFF_HPP
