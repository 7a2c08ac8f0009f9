// panel_catalog.hpp
// All panels under one root directory: listing, lookup, search, batch validation

#pragma once

#include <string>
#include <vector>

#include "panel_parser.hpp"
#include "panel_validator.hpp"

namespace genepanel {

bool is_panel_file_name(const std::string& name);

// Panel files directly under root, sorted by file name.
std::vector<std::string> list_panel_files(const std::string& root);

std::vector<PanelSnapshot> load_catalog(const std::string& root);

struct SearchResult {
    std::vector<PanelSnapshot> gene_matches;
    std::vector<PanelSnapshot> name_matches;
};

SearchResult search_catalog(const std::vector<PanelSnapshot>& catalog, const std::string& query);

std::string resolve_panel_path(const std::string& root, const std::string& slug);

struct FileReport {
    std::string path;
    ValidationResult result;
};

std::vector<FileReport> validate_panel_root(const std::string& root,
    const ValidatorOptions& options = ValidatorOptions());

} // namespace genepanel
