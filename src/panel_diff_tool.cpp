// panel_diff_tool.cpp
// Markdown summary of gene changes between two git refs, for CI comments
//
// Usage: panel_diff <base_ref> <head_ref>
// PANELS_REPO (default ".") is any directory inside the work tree; PANELS_DIR
// (default "panels") is taken relative to the top of that work tree.

#include <iostream>
#include <stdexcept>
#include <string>

#include "panel_config.hpp"
#include "panel_report.hpp"
#include "revision_source.hpp"

using namespace genepanel;

int main(int argc, char* argv[]) {
    if (argc != 3) {
        std::cerr << "Usage: " << argv[0] << " <base_ref> <head_ref>\n";
        return 1;
    }

    try {
        PanelConfig cfg = load_config_from_env();
        GitRevisionSource git(cfg.repo_dir);

        auto diffs = compare_revisions(git, argv[1], argv[2], cfg.panels_dir);
        std::cout << render_diff_report(diffs);
    }
    catch (const std::exception& ex) {
        std::cerr << "EXCEPTION: " << ex.what() << "\n";
        return 1;
    }

    return 0;
}
