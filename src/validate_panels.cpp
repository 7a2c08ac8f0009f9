// validate_panels.cpp
// Batch check of every panel file under a directory
//
// Usage: validate_panels [panels_dir] [advisory|strict]
//   advisory - case-only duplicates are warnings (default)
//   strict   - case-only duplicates are errors

#include <iostream>
#include <stdexcept>
#include <string>

#include "panel_catalog.hpp"
#include "panel_config.hpp"

using namespace genepanel;

int main(int argc, char* argv[]) {
    if (argc > 3) {
        std::cerr << "Usage: " << argv[0] << " [panels_dir] [advisory|strict]\n";
        return 1;
    }

    try {
        PanelConfig cfg = load_config_from_env();
        if (argc > 1) cfg.panels_dir = argv[1];
        if (argc > 2) {
            std::string mode = argv[2];
            if (mode == "strict") cfg.strict_case = true;
            else if (mode == "advisory") cfg.strict_case = false;
            else {
                std::cerr << "Unknown mode: " << mode << " (expected advisory or strict)\n";
                return 1;
            }
        }

        ValidatorOptions options;
        options.case_duplicates_are_errors = cfg.strict_case;

        auto reports = validate_panel_root(cfg.panels_dir, options);

        size_t n_errors = 0;
        for (const auto& rep : reports) {
            for (const auto& w : rep.result.warnings)
                std::cerr << "WARNING: " << format_issue(rep.path, w) << "\n";
        }
        for (const auto& rep : reports) {
            for (const auto& e : rep.result.errors) {
                std::cerr << "ERROR: " << format_issue(rep.path, e) << "\n";
                ++n_errors;
            }
        }

        if (n_errors) {
            std::cerr << n_errors << " error(s) in " << reports.size() << " panel file(s)\n";
            return 1;
        }
        std::cout << "All panels validated successfully.\n";
    }
    catch (const std::exception& ex) {
        std::cerr << "EXCEPTION: " << ex.what() << "\n";
        return 1;
    }

    return 0;
}
