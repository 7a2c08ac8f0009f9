#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "panel_report.hpp"
#include "revision_source.hpp"
#include "test_util.hpp"

using namespace genepanel;

using Genes = std::vector<std::string>;

// ============================================================================
// Fixture: a scratch git repository
// ============================================================================

class GitSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!git_available()) GTEST_SKIP() << "git not installed";
        repo.reset(new GitRepo());
    }

    std::unique_ptr<GitRepo> repo;
};

TEST_F(GitSourceTest, FetchTextAtRef) {
    repo->write("panels/a.txt", "A\nB\n");
    repo->commit("add a", "v1");
    repo->write("panels/a.txt", "A\nC\n");
    repo->commit("edit a", "v2");

    GitRevisionSource git(repo->str());
    auto v1 = git.fetch_text("v1", "panels/a.txt");
    ASSERT_TRUE(v1.has_value());
    EXPECT_EQ(*v1, "A\nB\n");
    EXPECT_FALSE(git.fetch_text("v1", "panels/missing.txt").has_value());
    EXPECT_FALSE(git.fetch_text("no-such-ref", "panels/a.txt").has_value());
}

TEST_F(GitSourceTest, GzipBlobIsInflated) {
    repo->write_gz("panels/brca.txt.gz", "BRCA1\nBRCA2\n");
    repo->commit("add brca", "v1");

    GitRevisionSource git(repo->str());
    auto text = git.fetch_text("v1", "panels/brca.txt.gz");
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, "BRCA1\nBRCA2\n");
}

TEST_F(GitSourceTest, RenamedPanelReportsBothPaths) {
    repo->write("panels/old.txt", "K\n");
    repo->commit("add old", "base");
    repo->git("mv panels/old.txt panels/new.txt");
    repo->write("panels/new.txt", "K\nL\n");
    repo->commit("rename", "head");

    GitRevisionSource git(repo->str());
    auto diffs = compare_revisions(git, "base", "head", "panels");
    EXPECT_EQ(render_diff_report(diffs),
        "## panels/new.txt\n"
        "Added: K, L\n"
        "\n"
        "## panels/old.txt\n"
        "Removed: K\n");
}

TEST_F(GitSourceTest, NonAsciiFileName) {
    repo->write("panels/café.txt", "X\n");
    repo->commit("add", "base");
    repo->write("panels/café.txt", "X\nY\n");
    repo->commit("edit", "head");

    GitRevisionSource git(repo->str());
    EXPECT_EQ(git.changed_paths("base", "head", "panels"), (Genes{ "panels/café.txt" }));

    auto diffs = compare_revisions(git, "base", "head", "panels");
    ASSERT_EQ(diffs.count("panels/café.txt"), 1u);
    EXPECT_EQ(diffs["panels/café.txt"].added, (Genes{ "Y" }));
}

TEST_F(GitSourceTest, DirectoryIsRelativeToTopLevel) {
    repo->write("panels/a.txt", "A\n");
    repo->commit("add", "base");
    repo->write("panels/a.txt", "A\nB\n");
    repo->commit("edit", "head");

    GitRevisionSource git((repo->dir.path() / "panels").string());
    auto diffs = compare_revisions(git, "base", "head", "panels");
    ASSERT_EQ(diffs.size(), 1u);
    EXPECT_EQ(diffs["panels/a.txt"].added, (Genes{ "B" }));
    EXPECT_EQ(git.repo_path((repo->dir.path() / "panels" / "a.txt").string()), "panels/a.txt");
}

TEST_F(GitSourceTest, OptionLikeRefIsRejected) {
    repo->write("panels/a.txt", "A\n");
    repo->commit("add", "head");

    GitRevisionSource git(repo->str());
    EXPECT_THROW(git.changed_paths("--output=/tmp/x", "head", "panels"), std::invalid_argument);
    EXPECT_THROW(git.fetch_text("-p", "panels/a.txt"), std::invalid_argument);
}

TEST_F(GitSourceTest, GitFailuresThrow) {
    repo->write("panels/a.txt", "A\n");
    repo->commit("add", "head");

    GitRevisionSource git(repo->str());
    EXPECT_THROW(git.changed_paths("no-such-ref", "head", "panels"), std::runtime_error);

    TempDir plain;
    EXPECT_THROW(GitRevisionSource bad(plain.str()), std::runtime_error);
}

// ============================================================================
// History
// ============================================================================

TEST_F(GitSourceTest, HistoryWithGeneDiffs) {
    repo->write("panels/p.txt", "A\n");
    repo->commit("create panel", "c1");
    repo->write("panels/p.txt", "A\nB\n");
    repo->commit("add B", "c2");
    repo->write("panels/other.txt", "Z\n");
    repo->commit("unrelated", "c3");
    repo->write("panels/p.txt", "B\n");
    repo->commit("drop A", "c4");

    GitRevisionSource git(repo->str());
    auto entries = panel_history(git, "panels/p.txt");
    ASSERT_EQ(entries.size(), 3u);

    EXPECT_EQ(entries[0].commit.subject, "drop A");
    EXPECT_EQ(entries[0].commit.author, "Panel Tester");
    EXPECT_TRUE(entries[0].diff.added.empty());
    EXPECT_EQ(entries[0].diff.removed, (Genes{ "A" }));

    EXPECT_EQ(entries[1].commit.subject, "add B");
    EXPECT_EQ(entries[1].diff.added, (Genes{ "B" }));

    EXPECT_EQ(entries[2].commit.subject, "create panel");
    EXPECT_EQ(entries[2].commit.status, 'A');
    EXPECT_EQ(entries[2].diff.added, (Genes{ "A" }));
}

TEST_F(GitSourceTest, HistoryFollowsRename) {
    repo->write("panels/old.txt", "K\n");
    repo->commit("create", "c1");
    repo->git("mv panels/old.txt panels/new.txt");
    repo->commit("rename", "c2");

    GitRevisionSource git(repo->str());
    auto entries = panel_history(git, "panels/new.txt");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].commit.status, 'R');
    EXPECT_EQ(entries[0].commit.previous_path, "panels/old.txt");
    EXPECT_TRUE(entries[0].diff.empty());
    EXPECT_EQ(entries[1].commit.path, "panels/old.txt");
    EXPECT_EQ(entries[1].diff.added, (Genes{ "K" }));
}
