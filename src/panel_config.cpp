// panel_config.cpp

#include "panel_config.hpp"
#include "panel_text.hpp"

#include <cstdlib>

namespace genepanel {

static std::string env_or(const char* name, const std::string& fallback) {
    const char* v = std::getenv(name);
    if (!v || !*v) return fallback;
    return v;
}

bool parse_flag(const std::string& value) {
    std::string v = to_lower(trim(value));
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

PanelConfig load_config_from_env() {
    PanelConfig cfg;
    cfg.panels_dir = env_or("PANELS_DIR", cfg.panels_dir);
    cfg.repo_dir = env_or("PANELS_REPO", cfg.repo_dir);
    cfg.strict_case = parse_flag(env_or("PANELS_STRICT_CASE", "0"));
    return cfg;
}

} // namespace genepanel
