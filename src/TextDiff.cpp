/**
 * @file TextDiff.cpp
 * @brief LCS-based similarity and unified diff rendering
 */

#include "ontodiff/TextDiff.hpp"
#include "ontodiff/Util.hpp"

#include <algorithm>
#include <sstream>

namespace ontodiff {

std::size_t lcs_length(const std::string& a, const std::string& b) {
    if (a.empty() || b.empty()) return 0;

    // Two rolling rows of the DP table
    std::vector<std::size_t> prev(b.size() + 1, 0);
    std::vector<std::size_t> cur(b.size() + 1, 0);
    for (std::size_t i = 1; i <= a.size(); ++i) {
        for (std::size_t j = 1; j <= b.size(); ++j) {
            if (a[i - 1] == b[j - 1]) {
                cur[j] = prev[j - 1] + 1;
            } else {
                cur[j] = std::max(prev[j], cur[j - 1]);
            }
        }
        std::swap(prev, cur);
    }
    return prev[b.size()];
}

double similarity_ratio(const std::string& a, const std::string& b) {
    const std::size_t total = a.size() + b.size();
    if (total == 0) return 1.0;
    const std::size_t common = lcs_length(to_lower(a), to_lower(b));
    return (2.0 * static_cast<double>(common)) / static_cast<double>(total);
}

std::vector<DiffLine> diff_lines(const std::vector<std::string>& old_lines,
                                 const std::vector<std::string>& new_lines) {
    const std::size_t n = old_lines.size();
    const std::size_t m = new_lines.size();

    // table[i][j] = LCS length of old_lines[i..] and new_lines[j..]
    std::vector<std::vector<std::size_t>> table(n + 1, std::vector<std::size_t>(m + 1, 0));
    for (std::size_t i = n; i-- > 0;) {
        for (std::size_t j = m; j-- > 0;) {
            if (old_lines[i] == new_lines[j]) {
                table[i][j] = table[i + 1][j + 1] + 1;
            } else {
                table[i][j] = std::max(table[i + 1][j], table[i][j + 1]);
            }
        }
    }

    std::vector<DiffLine> out;
    std::size_t i = 0, j = 0;
    while (i < n && j < m) {
        if (old_lines[i] == new_lines[j]) {
            out.push_back({' ', old_lines[i]});
            ++i; ++j;
        } else if (table[i + 1][j] >= table[i][j + 1]) {
            out.push_back({'-', old_lines[i]});
            ++i;
        } else {
            out.push_back({'+', new_lines[j]});
            ++j;
        }
    }
    for (; i < n; ++i) out.push_back({'-', old_lines[i]});
    for (; j < m; ++j) out.push_back({'+', new_lines[j]});
    return out;
}

namespace {

// Range notation of a hunk header: "start,length" with 1-based start,
// "start" alone for a single line, and "start-1,0" for an empty range.
std::string format_range(std::size_t start, std::size_t length) {
    if (length == 1) return std::to_string(start + 1);
    if (length == 0) return std::to_string(start) + ",0";
    return std::to_string(start + 1) + "," + std::to_string(length);
}

struct Hunk {
    std::size_t first;  // index into the edit script, inclusive
    std::size_t last;   // inclusive
};

} // anonymous namespace

std::string unified_diff(const std::vector<std::string>& old_lines,
                         const std::vector<std::string>& new_lines,
                         const std::string& from_file,
                         const std::string& to_file,
                         std::size_t context) {
    const auto script = diff_lines(old_lines, new_lines);

    std::vector<Hunk> hunks;
    for (std::size_t k = 0; k < script.size(); ++k) {
        if (script[k].tag == ' ') continue;
        const std::size_t first = k >= context ? k - context : 0;
        const std::size_t last = std::min(script.size() - 1, k + context);
        if (!hunks.empty() && first <= hunks.back().last + 1) {
            hunks.back().last = std::max(hunks.back().last, last);
        } else {
            hunks.push_back({first, last});
        }
    }
    if (hunks.empty()) return "";

    // Line positions in the old and new texts at each script index
    std::vector<std::size_t> old_pos(script.size() + 1, 0);
    std::vector<std::size_t> new_pos(script.size() + 1, 0);
    for (std::size_t k = 0; k < script.size(); ++k) {
        old_pos[k + 1] = old_pos[k] + (script[k].tag != '+' ? 1 : 0);
        new_pos[k + 1] = new_pos[k] + (script[k].tag != '-' ? 1 : 0);
    }

    std::ostringstream oss;
    oss << "--- " << from_file << "\n";
    oss << "+++ " << to_file << "\n";
    for (const auto& h : hunks) {
        const std::size_t old_len = old_pos[h.last + 1] - old_pos[h.first];
        const std::size_t new_len = new_pos[h.last + 1] - new_pos[h.first];
        oss << "@@ -" << format_range(old_pos[h.first], old_len)
            << " +" << format_range(new_pos[h.first], new_len) << " @@\n";
        for (std::size_t k = h.first; k <= h.last; ++k) {
            oss << script[k].tag << script[k].text << "\n";
        }
    }

    std::string text = oss.str();
    if (!text.empty() && text.back() == '\n') text.pop_back();
    return text;
}

} // namespace ontodiff
