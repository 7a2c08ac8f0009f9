// panel_diff.cpp
// Gene-level differences between two revisions of a panel

#include "panel_diff.hpp"
#include "panel_parser.hpp"

#include <algorithm>
#include <unordered_set>

namespace genepanel {

static std::vector<std::string> sorted_difference(const std::unordered_set<std::string>& from,
    const std::unordered_set<std::string>& minus) {
    std::vector<std::string> out;
    for (const auto& g : from) {
        if (!minus.count(g)) out.push_back(g);
    }
    std::sort(out.begin(), out.end());
    return out;
}

DiffResult diff_genes(const std::vector<std::string>& base,
    const std::vector<std::string>& head) {
    std::unordered_set<std::string> base_set(base.begin(), base.end());
    std::unordered_set<std::string> head_set(head.begin(), head.end());

    DiffResult d;
    d.added = sorted_difference(head_set, base_set);
    d.removed = sorted_difference(base_set, head_set);
    return d;
}

DiffResult diff_texts(const std::string& base_text, const std::string& head_text) {
    return diff_genes(parse_panel(base_text).genes, parse_panel(head_text).genes);
}

DiffResult diff_optional(const std::optional<std::string>& base_text,
    const std::optional<std::string>& head_text) {
    std::vector<std::string> base, head;
    if (base_text) base = parse_panel(*base_text).genes;
    if (head_text) head = parse_panel(*head_text).genes;
    return diff_genes(base, head);
}

} // namespace genepanel
