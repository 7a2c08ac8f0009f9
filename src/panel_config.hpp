// panel_config.hpp
// Tool settings taken from the environment; command-line arguments override them

#pragma once

#include <string>

namespace genepanel {

struct PanelConfig {
    std::string panels_dir = "panels"; // PANELS_DIR
    std::string repo_dir = ".";        // PANELS_REPO
    bool strict_case = false;          // PANELS_STRICT_CASE
};

PanelConfig load_config_from_env();

bool parse_flag(const std::string& value);

} // namespace genepanel
