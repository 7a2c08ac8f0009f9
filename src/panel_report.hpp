// panel_report.hpp
// Markdown / plain-text summaries of panel diffs

#pragma once

#include <map>
#include <string>

#include "panel_diff.hpp"

namespace genepanel {

extern const char* const NO_CHANGES_MESSAGE;

// One "## <file>" section per non-empty diff, files in ascending order,
// one blank line between sections.
std::string render_diff_report(const std::map<std::string, DiffResult>& diffs);

// Description attached to a change submitted from the editor.
std::string render_change_summary(const std::string& panel_name, const DiffResult& diff);

} // namespace genepanel
