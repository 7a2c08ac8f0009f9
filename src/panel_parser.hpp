// panel_parser.hpp
// Panel text -> metadata + ordered gene list

#pragma once

#include <string>
#include <utility>
#include <vector>

namespace genepanel {

using Metadata = std::vector<std::pair<std::string, std::string>>;

struct PanelSnapshot {
    std::string slug;
    Metadata metadata;              // insertion order
    std::vector<std::string> genes; // file order, case preserved

    // Empty string when the key is absent.
    std::string metadata_value(const std::string& key) const;
    bool has_metadata(const std::string& key) const;

    // "title" metadata, or the slug spelled out ("lung_cancer" -> "Lung Cancer").
    std::string title() const;
};

// Leading "# key: value" lines are metadata. The section ends at the first
// comment without a colon or at the first gene line; blank lines never end it.
PanelSnapshot parse_panel(const std::string& text);
PanelSnapshot load_snapshot(const std::string& slug, const std::string& text);

std::string slug_from_path(const std::string& path);
bool is_valid_slug(const std::string& slug);

} // namespace genepanel
