// panel_diff.hpp
// Gene-level differences between two revisions of a panel

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace genepanel {

struct DiffResult {
    std::vector<std::string> added;   // head only, sorted
    std::vector<std::string> removed; // base only, sorted

    bool empty() const { return added.empty() && removed.empty(); }
};

DiffResult diff_genes(const std::vector<std::string>& base,
    const std::vector<std::string>& head);

// Parses both texts first, so comment and whitespace edits never show up.
DiffResult diff_texts(const std::string& base_text, const std::string& head_text);

// nullopt = the panel does not exist on that side.
DiffResult diff_optional(const std::optional<std::string>& base_text,
    const std::optional<std::string>& head_text);

} // namespace genepanel
