// panel_catalog.cpp
// All panels under one root directory: listing, lookup, search, batch validation

#include "panel_catalog.hpp"
#include "panel_text.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace genepanel {

bool is_panel_file_name(const std::string& name) {
    return ends_with(name, ".txt") || ends_with(name, ".txt.gz");
}

std::vector<std::string> list_panel_files(const std::string& root) {
    std::error_code ec;
    if (!fs::is_directory(root, ec))
        throw std::runtime_error("Panels directory not found at " + root);

    std::vector<std::string> out;
    for (const auto& entry : fs::directory_iterator(root)) {
        if (!entry.is_regular_file()) continue;
        if (!is_panel_file_name(entry.path().filename().string())) continue;
        out.push_back(entry.path().string());
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<PanelSnapshot> load_catalog(const std::string& root) {
    std::vector<PanelSnapshot> out;
    for (const auto& path : list_panel_files(root)) {
        out.push_back(load_snapshot(slug_from_path(path), read_text_file(path)));
    }
    std::stable_sort(out.begin(), out.end(),
        [](const PanelSnapshot& a, const PanelSnapshot& b) { return a.slug < b.slug; });
    return out;
}

// ==================== SEARCH ====================

SearchResult search_catalog(const std::vector<PanelSnapshot>& catalog, const std::string& query) {
    SearchResult res;
    std::string q = to_lower(trim(query));
    if (q.empty()) return res;

    for (const auto& panel : catalog) {
        if (to_lower(panel.slug).find(q) != std::string::npos ||
            to_lower(panel.title()).find(q) != std::string::npos) {
            res.name_matches.push_back(panel);
        }
        bool has_gene = std::any_of(panel.genes.begin(), panel.genes.end(),
            [&](const std::string& g) { return to_lower(g) == q; });
        if (has_gene) res.gene_matches.push_back(panel);
    }
    return res;
}

std::string resolve_panel_path(const std::string& root, const std::string& slug) {
    if (!is_valid_slug(slug)) throw std::invalid_argument("Invalid panel slug: " + slug);

    for (const char* ext : { ".txt", ".txt.gz" }) {
        fs::path p = fs::path(root) / (slug + ext);
        std::error_code ec;
        if (fs::is_regular_file(p, ec)) return p.string();
    }
    throw std::runtime_error("Panel not found: " + slug);
}

// ==================== BATCH VALIDATION ====================

std::vector<FileReport> validate_panel_root(const std::string& root, const ValidatorOptions& options) {
    std::vector<FileReport> reports;
    for (const auto& path : list_panel_files(root)) {
        FileReport rep;
        rep.path = path;
        try {
            rep.result = validate_panel(read_text_file(path), options);
        }
        catch (const std::runtime_error& ex) {
            ValidationIssue issue;
            issue.kind = IssueKind::ReadError;
            issue.message = ex.what();
            rep.result.errors.push_back(issue);
        }
        reports.push_back(rep);
    }
    return reports;
}

} // namespace genepanel
