// revision_source.cpp
// Panel text at a given revision, and panel diffs between two revisions

#include "revision_source.hpp"
#include "panel_catalog.hpp"
#include "panel_text.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <set>
#include <stdexcept>

#include <sys/wait.h>

namespace fs = std::filesystem;

namespace genepanel {

// ==================== MemoryRevisionSource ====================

void MemoryRevisionSource::put(const std::string& ref, const std::string& path,
    const std::string& text) {
    if (std::find(refs_.begin(), refs_.end(), ref) == refs_.end()) refs_.push_back(ref);
    files_[ref][path] = text;
}

void MemoryRevisionSource::describe(const std::string& ref, const std::string& date,
    const std::string& author, const std::string& subject) {
    CommitInfo& c = info_[ref];
    c.id = ref;
    c.date = date;
    c.author = author;
    c.subject = subject;
}

std::optional<std::string> MemoryRevisionSource::fetch_text(const std::string& ref,
    const std::string& path) {
    if (ends_with(ref, "^")) {
        auto it = std::find(refs_.begin(), refs_.end(), ref.substr(0, ref.size() - 1));
        if (it == refs_.end() || it == refs_.begin()) return std::nullopt;
        return fetch_text(*(it - 1), path);
    }

    auto r = files_.find(ref);
    if (r == files_.end()) return std::nullopt;
    auto p = r->second.find(path);
    if (p == r->second.end()) return std::nullopt;
    return p->second;
}

static bool under_dir(const std::string& path, const std::string& dir) {
    if (dir.empty() || dir == ".") return true;
    std::string prefix = ends_with(dir, "/") ? dir : dir + "/";
    return path.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> MemoryRevisionSource::changed_paths(const std::string& base,
    const std::string& head, const std::string& dir) {
    std::set<std::string> paths;
    for (const auto& ref : { base, head }) {
        auto r = files_.find(ref);
        if (r == files_.end()) continue;
        for (const auto& kv : r->second) {
            if (under_dir(kv.first, dir)) paths.insert(kv.first);
        }
    }

    std::vector<std::string> out;
    for (const auto& p : paths) {
        if (fetch_text(base, p) != fetch_text(head, p)) out.push_back(p);
    }
    return out;
}

std::vector<CommitInfo> MemoryRevisionSource::history(const std::string& path) {
    std::vector<CommitInfo> out;
    std::optional<std::string> prev;
    for (const auto& ref : refs_) {
        auto cur = fetch_text(ref, path);
        if (cur != prev) {
            CommitInfo c;
            auto it = info_.find(ref);
            if (it != info_.end()) c = it->second;
            c.id = ref;
            c.status = !prev ? 'A' : (!cur ? 'D' : 'M');
            c.path = path;
            c.previous_path = path;
            out.push_back(c);
        }
        prev = cur;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

// ==================== GitRevisionSource ====================

std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

// Runs cmd through the shell and returns its exit code; stdout goes to out.
static int run_command(const std::string& cmd, std::string& out) {
    out.clear();
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) throw std::runtime_error("Failed to execute: " + cmd);

    char chunk[8192];
    size_t n;
    while ((n = fread(chunk, 1, sizeof(chunk), pipe)) > 0) {
        out.append(chunk, n);
    }
    int status = pclose(pipe);
    if (status == -1) throw std::runtime_error("Failed to wait for: " + cmd);
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

// git would read "-..." as an option
static void check_ref(const std::string& ref) {
    if (ref.empty() || ref[0] == '-')
        throw std::invalid_argument("Invalid revision: '" + ref + "'");
}

static std::vector<std::string> split_nul(const std::string& s) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start < s.size()) {
        size_t end = s.find('\0', start);
        if (end == std::string::npos) end = s.size();
        if (end > start) out.push_back(s.substr(start, end - start));
        start = end + 1;
    }
    return out;
}

static std::vector<std::string> split_on(const std::string& s, char sep) {
    std::vector<std::string> out;
    size_t start = 0;
    while (true) {
        size_t end = s.find(sep, start);
        if (end == std::string::npos) {
            out.push_back(s.substr(start));
            return out;
        }
        out.push_back(s.substr(start, end - start));
        start = end + 1;
    }
}

GitRevisionSource::GitRevisionSource(const std::string& repo_dir) {
    std::string out;
    int rc = run_command("git -C " + shell_quote(repo_dir) +
        " rev-parse --show-toplevel 2>/dev/null", out);
    if (rc != 0) throw std::runtime_error("Not a git work tree: " + repo_dir);
    top_ = trim(out);
}

std::string GitRevisionSource::git_command(const std::string& args) const {
    return "git -C " + shell_quote(top_) + " -c core.quotePath=false " + args;
}

std::string GitRevisionSource::repo_path(const std::string& file) const {
    fs::path abs = fs::weakly_canonical(fs::absolute(file));
    return fs::relative(abs, fs::weakly_canonical(top_)).generic_string();
}

std::optional<std::string> GitRevisionSource::fetch_text(const std::string& ref,
    const std::string& path) {
    check_ref(ref);
    std::string out;
    if (run_command(git_command("show " + shell_quote(ref + ":" + path) + " 2>/dev/null"), out) != 0)
        return std::nullopt;
    if (is_gzip(out)) return inflate_gzip(out);
    return out;
}

std::vector<std::string> GitRevisionSource::changed_paths(const std::string& base,
    const std::string& head, const std::string& dir) {
    check_ref(base);
    check_ref(head);
    // a rename must show up as a deletion plus an addition
    std::string out;
    int rc = run_command(git_command("diff --name-only --no-renames -z " +
        shell_quote(base) + " " + shell_quote(head) + " -- " + shell_quote(dir)), out);
    if (rc != 0)
        throw std::runtime_error("git diff failed with exit code " + std::to_string(rc));
    return split_nul(out);
}

std::vector<CommitInfo> GitRevisionSource::history(const std::string& path) {
    std::string out;
    int rc = run_command(git_command(
        "log --follow --date=iso --name-status "
        "--pretty=format:%x1e%h%x1f%ad%x1f%an%x1f%s -- " + shell_quote(path)), out);
    if (rc != 0)
        throw std::runtime_error("git log failed with exit code " + std::to_string(rc));

    std::vector<CommitInfo> commits;
    for (const auto& record : split_on(out, '\x1e')) {
        auto lines = split_lines(record);
        if (lines.empty() || trim(lines[0]).empty()) continue;

        auto head = split_on(lines[0], '\x1f');
        if (head.size() < 4) continue;

        CommitInfo c;
        c.id = head[0];
        c.date = head[1];
        c.author = head[2];
        c.subject = head[3];
        c.path = path;
        c.previous_path = path;

        for (size_t i = 1; i < lines.size(); ++i) {
            auto cols = split_on(lines[i], '\t');
            if (cols.size() < 2 || cols[0].empty()) continue;
            c.status = cols[0][0];
            if ((c.status == 'R' || c.status == 'C') && cols.size() >= 3) {
                c.previous_path = cols[1];
                c.path = cols[2];
            }
            else {
                c.path = cols[1];
                c.previous_path = cols[1];
            }
        }
        commits.push_back(c);
    }
    return commits;
}

// ==================== COMPARISON ====================

std::map<std::string, DiffResult> compare_revisions(RevisionSource& source,
    const std::string& base, const std::string& head, const std::string& dir) {
    std::map<std::string, DiffResult> out;
    for (const auto& path : source.changed_paths(base, head, dir)) {
        if (!is_panel_file_name(path)) continue;
        DiffResult d = diff_optional(source.fetch_text(base, path), source.fetch_text(head, path));
        if (!d.empty()) out[path] = d;
    }
    return out;
}

std::vector<HistoryEntry> panel_history(RevisionSource& source, const std::string& path) {
    std::vector<HistoryEntry> out;
    for (const auto& c : source.history(path)) {
        HistoryEntry e;
        e.commit = c;
        e.diff = diff_optional(source.fetch_text(c.id + "^", c.previous_path),
            source.fetch_text(c.id, c.path));
        out.push_back(e);
    }
    return out;
}

} // namespace genepanel
