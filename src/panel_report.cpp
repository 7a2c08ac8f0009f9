// panel_report.cpp
// Markdown / plain-text summaries of panel diffs

#include "panel_report.hpp"
#include "panel_text.hpp"

#include <sstream>

namespace genepanel {

const char* const NO_CHANGES_MESSAGE = "No gene changes detected.";

std::string render_diff_report(const std::map<std::string, DiffResult>& diffs) {
    std::ostringstream out;
    bool first = true;
    for (const auto& kv : diffs) {
        const DiffResult& d = kv.second;
        if (d.empty()) continue;

        if (!first) out << "\n";
        first = false;

        out << "## " << kv.first << "\n";
        if (!d.added.empty()) out << "Added: " << join(d.added, ", ") << "\n";
        if (!d.removed.empty()) out << "Removed: " << join(d.removed, ", ") << "\n";
    }
    if (first) return std::string(NO_CHANGES_MESSAGE) + "\n";
    return out.str();
}

std::string render_change_summary(const std::string& panel_name, const DiffResult& diff) {
    std::ostringstream out;
    out << "Automated update of panel `" << panel_name << "` via web editor.\n\n"
        << "Added genes: " << (diff.added.empty() ? "none" : join(diff.added, ", ")) << "\n"
        << "Removed genes: " << (diff.removed.empty() ? "none" : join(diff.removed, ", "));
    return out.str();
}

} // namespace genepanel
