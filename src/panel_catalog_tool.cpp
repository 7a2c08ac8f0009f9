// panel_catalog_tool.cpp
// Browse the panels under a directory
//
// Usage:
//   panel_catalog list            [panels_dir]
//   panel_catalog search <query>  [panels_dir]
//   panel_catalog show   <slug>   [panels_dir]
//   panel_catalog preview <slug> <edited_file> [panels_dir]
//   panel_catalog history <slug>  [panels_dir]   (git repo from PANELS_REPO)

#include <iostream>
#include <stdexcept>
#include <string>

#include "panel_catalog.hpp"
#include "panel_config.hpp"
#include "panel_edit.hpp"
#include "revision_source.hpp"
#include "panel_text.hpp"

using namespace genepanel;

static void usage(const char* prog) {
    std::cerr
        << "Usage:\n"
        << "  " << prog << " list            [panels_dir]\n"
        << "  " << prog << " search <query>  [panels_dir]\n"
        << "  " << prog << " show   <slug>   [panels_dir]\n"
        << "  " << prog << " preview <slug> <edited_file> [panels_dir]\n"
        << "  " << prog << " history <slug>  [panels_dir]\n";
}

static void print_panel_line(const PanelSnapshot& p) {
    std::cout << p.slug << "\t" << p.title() << "\t" << p.genes.size() << "\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string mode = argv[1];
    int n_args = 0;
    if (mode == "search" || mode == "show" || mode == "history") n_args = 1;
    else if (mode == "preview") n_args = 2;
    else if (mode != "list") {
        usage(argv[0]);
        return 1;
    }
    if (argc < 2 + n_args || argc > 3 + n_args) {
        usage(argv[0]);
        return 1;
    }

    try {
        PanelConfig cfg = load_config_from_env();
        int dir_arg = 2 + n_args;
        if (argc > dir_arg) cfg.panels_dir = argv[dir_arg];

        if (mode == "list") {
            std::cout << "Slug\tTitle\tGenes\n";
            for (const auto& p : load_catalog(cfg.panels_dir)) print_panel_line(p);
        }
        else if (mode == "search") {
            auto res = search_catalog(load_catalog(cfg.panels_dir), argv[2]);

            std::cout << "# Panels containing the gene\n";
            if (res.gene_matches.empty()) std::cout << "No gene matches.\n";
            for (const auto& p : res.gene_matches) print_panel_line(p);

            std::cout << "# Panel name matches\n";
            if (res.name_matches.empty()) std::cout << "No panel name matches.\n";
            for (const auto& p : res.name_matches) print_panel_line(p);
        }
        else if (mode == "history") {
            std::string path = resolve_panel_path(cfg.panels_dir, argv[2]);
            GitRevisionSource git(cfg.repo_dir);
            auto entries = panel_history(git, git.repo_path(path));

            if (entries.empty()) std::cout << "No git history found for this panel.\n";
            for (const auto& e : entries) {
                std::cout << e.commit.id << " " << e.commit.date << " "
                    << e.commit.author << " " << e.commit.subject << "\n";
                if (!e.diff.added.empty()) std::cout << "  Added: " << join(e.diff.added, ", ") << "\n";
                if (!e.diff.removed.empty()) std::cout << "  Removed: " << join(e.diff.removed, ", ") << "\n";
            }
        }
        else if (mode == "preview") {
            std::string slug = argv[2];
            std::string original = read_text_file(resolve_panel_path(cfg.panels_dir, slug));
            EditPreview p = preview_edit(slug, original, read_text_file(argv[3]));

            for (const auto& e : p.validation.errors)
                std::cerr << "ERROR: " << format_issue(argv[3], e) << "\n";
            for (const auto& w : p.validation.warnings)
                std::cerr << "WARNING: " << format_issue(argv[3], w) << "\n";

            std::cout << p.summary << "\n";
            if (!p.submittable()) return 1;
        }
        else {
            std::string slug = argv[2];
            std::string path = resolve_panel_path(cfg.panels_dir, slug);
            PanelSnapshot p = load_snapshot(slug, read_text_file(path));

            std::cout << "# " << p.title() << "\n"
                << "Slug: " << p.slug << "\n";
            if (p.metadata.empty()) std::cout << "No metadata.\n";
            for (const auto& kv : p.metadata) std::cout << kv.first << ": " << kv.second << "\n";

            std::cout << "Genes (" << p.genes.size() << "):\n";
            if (p.genes.empty()) std::cout << "No genes listed.\n";
            for (const auto& g : p.genes) std::cout << g << "\n";
        }
    }
    catch (const std::exception& ex) {
        std::cerr << "EXCEPTION: " << ex.what() << "\n";
        return 1;
    }

    return 0;
}
