/**
 * @file Render.cpp
 * @brief Markdown and unified-diff rendering
 */

#include "ontodiff/Render.hpp"
#include "ontodiff/TextDiff.hpp"
#include "ontodiff/Util.hpp"

#include <algorithm>
#include <sstream>

namespace ontodiff {

namespace {

std::string shown(const std::string& value) {
    return value.empty() ? "(empty)" : value;
}

void render_section(std::ostringstream& out, const std::string& title,
                    const std::vector<Change>& changes, bool show_values) {
    if (changes.empty()) return;

    out << "## " << title << "\n\n";
    for (const auto& c : changes) {
        out << "- **" << to_string(c.element_type) << "**: `" << c.path << "`\n";
        if (show_values) {
            out << "  - Was: `" << shown(c.old_value) << "`\n";
            out << "  - Now: `" << shown(c.new_value) << "`\n";
        }
        if (!c.details.empty()) {
            out << "  - " << c.details << "\n";
        }
    }
    out << "\n";
}

void render_conflicts(std::ostringstream& out, const std::string& title,
                      const std::vector<SemanticConflict>& conflicts) {
    if (conflicts.empty()) return;

    out << "## " << title << "\n\n";
    for (const auto& c : conflicts) {
        out << "### " << c.name << "\n\n";
        out << "**Type:** " << to_string(c.kind) << "\n\n";
        out << "**Description:** " << c.description << "\n\n";
        out << "**Sources:**\n\n";
        for (const auto& source : c.sources) {
            auto it = c.details.find(source);
            out << "- `" << source << "`";
            if (it != c.details.end()) out << ": " << it->second;
            out << "\n";
        }
        out << "\n";
        if (!c.recommendation.empty()) {
            out << "**Recommendation:** " << c.recommendation << "\n\n";
        }
    }
}

} // anonymous namespace

std::string to_changelog(const DiffReport& report) {
    const DiffSummary s = report.summary();
    std::ostringstream out;

    out << "# Changelog: " << report.source_name() << " → " << report.target_name() << "\n\n";
    out << "**From**: " << report.source_name() << " v" << report.source_version() << "\n";
    out << "**To**: " << report.target_name() << " v" << report.target_version() << "\n\n";

    out << "## Summary\n\n";
    out << "- Total changes: " << s.total_changes << "\n";
    out << "- Added: " << s.added << "\n";
    out << "- Removed: " << s.removed << "\n";
    out << "- Modified: " << s.modified << "\n";
    for (const auto& [element, count] : s.by_element) {
        out << "  - " << to_string(element) << ": " << count << "\n";
    }
    out << "\n";

    render_section(out, "Added", report.changes_of(ChangeType::Added), false);
    render_section(out, "Removed", report.changes_of(ChangeType::Removed), false);
    render_section(out, "Modified", report.changes_of(ChangeType::Modified), true);

    std::string text = out.str();
    while (!text.empty() && text.back() == '\n') text.pop_back();
    return text;
}

std::vector<std::string> change_lines(const DiffReport& report, bool after) {
    std::vector<std::string> lines;
    for (const auto& c : report.changes()) {
        const std::string& value = after ? c.new_value : c.old_value;
        if (value.empty()) continue;
        lines.push_back(to_string(c.element_type) + ": " + c.path + " = " + value);
    }
    std::sort(lines.begin(), lines.end());
    return lines;
}

std::string to_unified_diff(const DiffReport& report) {
    return unified_diff(change_lines(report, false),
                        change_lines(report, true),
                        report.source_name() + " v" + report.source_version(),
                        report.target_name() + " v" + report.target_version());
}

std::string to_markdown(const SemanticDebtReport& report) {
    const DebtSummary s = report.summary();
    std::ostringstream out;

    out << "# Semantic Debt Analysis Report\n\n";
    out << "## Summary\n\n";
    out << "- **Models analyzed:** " << report.models_analyzed().size()
        << " (" << join(report.models_analyzed(), ", ") << ")\n";
    out << "- **Total conflicts:** " << s.total_conflicts << "\n";
    out << "  - Critical: " << s.critical << "\n";
    out << "  - Warning: " << s.warning << "\n";
    out << "  - Info: " << s.info << "\n\n";

    if (!s.by_kind.empty()) {
        out << "### Conflicts by Type\n\n";
        for (const auto& [kind, count] : s.by_kind) {
            out << "- " << to_string(kind) << ": " << count << "\n";
        }
        out << "\n";
    }

    render_conflicts(out, "Critical Conflicts", report.conflicts_of(Severity::Critical));
    render_conflicts(out, "Warnings", report.conflicts_of(Severity::Warning));
    render_conflicts(out, "Info", report.conflicts_of(Severity::Info));

    if (!report.recommendations().empty()) {
        out << "## Recommendations\n\n";
        std::size_t i = 1;
        for (const auto& rec : report.recommendations()) {
            out << i++ << ". " << rec << "\n";
        }
        out << "\n";
    }

    std::string text = out.str();
    while (!text.empty() && text.back() == '\n') text.pop_back();
    return text;
}

std::string conflict_summary(const MergeResult& result) {
    std::ostringstream out;
    for (const auto& c : result.conflicts) {
        out << c.path << ": ours=" << (c.ours_value.empty() ? "<none>" : c.ours_value)
            << ", theirs=" << (c.theirs_value.empty() ? "<none>" : c.theirs_value)
            << " -> " << to_string(c.resolution) << "\n";
    }
    return out.str();
}

} // namespace ontodiff
