// panel_edit.cpp

#include "panel_edit.hpp"
#include "panel_report.hpp"

namespace genepanel {

EditPreview preview_edit(const std::string& panel_name, const std::string& original,
    const std::string& edited) {
    EditPreview p;
    p.content = edited;
    if (!p.content.empty() && p.content.back() != '\n') p.content += '\n';

    ValidatorOptions options;
    options.case_duplicates_are_errors = true;
    p.validation = validate_panel(p.content, options);

    p.diff = diff_texts(original, p.content);
    p.summary = render_change_summary(panel_name, p.diff);
    return p;
}

} // namespace genepanel
