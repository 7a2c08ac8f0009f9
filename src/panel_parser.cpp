// panel_parser.cpp
// Panel text -> metadata + ordered gene list

#include "panel_parser.hpp"
#include "panel_text.hpp"

#include <cctype>

namespace genepanel {

// ==================== PanelSnapshot ====================

std::string PanelSnapshot::metadata_value(const std::string& key) const {
    for (const auto& kv : metadata) {
        if (kv.first == key) return kv.second;
    }
    return "";
}

bool PanelSnapshot::has_metadata(const std::string& key) const {
    for (const auto& kv : metadata) {
        if (kv.first == key) return true;
    }
    return false;
}

std::string PanelSnapshot::title() const {
    if (has_metadata("title")) return metadata_value("title");

    std::string out = slug;
    bool word_start = true;
    for (auto& c : out) {
        if (c == '_') {
            c = ' ';
            word_start = true;
            continue;
        }
        unsigned char uc = (unsigned char)c;
        c = word_start ? (char)std::toupper(uc) : (char)std::tolower(uc);
        word_start = !std::isalpha(uc);
    }
    return out;
}

// ==================== PARSER ====================

static void set_metadata(Metadata& md, const std::string& key, const std::string& value) {
    for (auto& kv : md) {
        if (kv.first == key) {
            kv.second = value;
            return;
        }
    }
    md.emplace_back(key, value);
}

PanelSnapshot parse_panel(const std::string& text) {
    PanelSnapshot snap;
    bool metadata_section = true;

    for (const auto& raw : split_lines(strip_bom(text))) {
        std::string line = trim(raw);
        if (line.empty()) continue;

        if (line[0] == '#') {
            if (metadata_section) {
                size_t body = line.find_first_not_of('#');
                std::string content = body == std::string::npos ? "" : trim(line.substr(body));
                size_t colon = content.find(':');
                if (colon != std::string::npos) {
                    set_metadata(snap.metadata,
                        trim(content.substr(0, colon)),
                        trim(content.substr(colon + 1)));
                    continue;
                }
                metadata_section = false;
            }
            continue;
        }

        metadata_section = false;
        snap.genes.push_back(line);
    }
    return snap;
}

PanelSnapshot load_snapshot(const std::string& slug, const std::string& text) {
    PanelSnapshot snap = parse_panel(text);
    snap.slug = slug;
    return snap;
}

// ==================== SLUGS ====================

std::string slug_from_path(const std::string& path) {
    std::string name = path;
    size_t slash = name.find_last_of("/\\");
    if (slash != std::string::npos) name = name.substr(slash + 1);

    if (ends_with(name, ".txt.gz")) return name.substr(0, name.size() - 7);
    if (ends_with(name, ".txt")) return name.substr(0, name.size() - 4);
    return name;
}

bool is_valid_slug(const std::string& slug) {
    if (slug.empty()) return false;
    for (unsigned char c : slug) {
        if (!std::isalnum(c) && c != '_' && c != '-') return false;
    }
    return true;
}

} // namespace genepanel
