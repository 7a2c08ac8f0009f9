// revision_source.hpp
// Panel text at a given revision, and panel diffs between two revisions

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "panel_diff.hpp"

namespace genepanel {

struct CommitInfo {
    std::string id;
    std::string date;
    std::string author;
    std::string subject;
    char status = 'M';         // A, M, D, R (as git --name-status)
    std::string path;          // path in this commit
    std::string previous_path; // path in the parent; differs after a rename
};

class RevisionSource {
public:
    virtual ~RevisionSource() = default;

    // nullopt when the path does not exist at ref. "<ref>^" is the parent of ref.
    virtual std::optional<std::string> fetch_text(const std::string& ref,
        const std::string& path) = 0;

    virtual std::vector<std::string> changed_paths(const std::string& base,
        const std::string& head, const std::string& dir) = 0;

    // Commits touching path, newest first.
    virtual std::vector<CommitInfo> history(const std::string& path) = 0;
};

// ==================== in memory ====================

// Refs are commits in the order they were first put; each one's parent is
// the ref put before it.
class MemoryRevisionSource : public RevisionSource {
public:
    void put(const std::string& ref, const std::string& path, const std::string& text);
    void describe(const std::string& ref, const std::string& date,
        const std::string& author, const std::string& subject);

    std::optional<std::string> fetch_text(const std::string& ref,
        const std::string& path) override;
    std::vector<std::string> changed_paths(const std::string& base,
        const std::string& head, const std::string& dir) override;
    std::vector<CommitInfo> history(const std::string& path) override;

private:
    std::vector<std::string> refs_;
    std::map<std::string, std::map<std::string, std::string>> files_; // ref -> path -> text
    std::map<std::string, CommitInfo> info_;
};

// ==================== git (subprocess) ====================

// Paths and directories are relative to the top of the work tree, wherever
// repo_dir points inside it.
class GitRevisionSource : public RevisionSource {
public:
    explicit GitRevisionSource(const std::string& repo_dir);

    std::optional<std::string> fetch_text(const std::string& ref,
        const std::string& path) override;
    std::vector<std::string> changed_paths(const std::string& base,
        const std::string& head, const std::string& dir) override;
    std::vector<CommitInfo> history(const std::string& path) override;

    const std::string& top_level() const { return top_; }

    // Filesystem path -> path relative to the top of the work tree.
    std::string repo_path(const std::string& file) const;

private:
    std::string git_command(const std::string& args) const;

    std::string top_;
};

std::string shell_quote(const std::string& s);

// Changed panel files under dir with a non-empty gene diff, keyed by path.
std::map<std::string, DiffResult> compare_revisions(RevisionSource& source,
    const std::string& base, const std::string& head, const std::string& dir);

struct HistoryEntry {
    CommitInfo commit;
    DiffResult diff; // parent -> commit
};

std::vector<HistoryEntry> panel_history(RevisionSource& source, const std::string& path);

} // namespace genepanel
