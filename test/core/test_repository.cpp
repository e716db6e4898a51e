#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include "test_utils.hpp"
#include "core/Constants.hpp"
#include "core/Repository.hpp"

namespace fs = std::filesystem;

using namespace gbranches;
using namespace gbranches::test::utils;

namespace {

constexpr int64_t BASE_TIME = 1700000000;

std::vector<std::string> namesOf(const std::vector<BranchRecord>& branches) {
    std::vector<std::string> names;
    for (const auto& b : branches) names.push_back(b.name);
    return names;
}

const BranchRecord* findBranch(const std::vector<BranchRecord>& branches, const std::string& name) {
    auto it = std::find_if(branches.begin(), branches.end(), [&](const BranchRecord& b) { return b.name == name; });
    return it == branches.end() ? nullptr : &*it;
}

}

class RepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        repo = std::make_unique<TestRepo>(tempDir);
    }

    void TearDown() override {
        repo.reset();
        removeDir(tempDir);
    }

    Repository openRepo() {
        auto res = Repository::open(tempDir);
        EXPECT_TRUE(res.has_value()) << res.error().message;
        return std::move(res.value());
    }

    fs::path tempDir;
    std::unique_ptr<TestRepo> repo;
};

// Test: Opening a directory outside any repository
TEST(RepositoryOpenTest, NotARepository) {
    fs::path dir = createTempDir();
    auto res = Repository::open(dir);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::RepositoryNotFound);
    EXPECT_EQ(res.error().message, "Not a git repository: " + dir.string());
    removeDir(dir);
}

// Test: Discovery walks up from a subdirectory
TEST_F(RepositoryTest, OpenFromSubdirectory) {
    buildSampleHistory(*repo, BASE_TIME);
    fs::path sub = tempDir / "nested" / "deeper";
    fs::create_directories(sub);

    auto res = Repository::open(sub);
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_TRUE(fs::equivalent(res.value().root(), tempDir));
}

// Test: Current branch name
TEST_F(RepositoryTest, CurrentBranchName) {
    buildSampleHistory(*repo, BASE_TIME);
    repo->switchTo("feature/test");

    Repository r = openRepo();
    auto name = r.currentBranchName();
    ASSERT_TRUE(name.has_value()) << name.error().message;
    EXPECT_EQ(name.value(), "feature/test");
}

// Test: Detached HEAD yields the sentinel and no current branch
TEST_F(RepositoryTest, DetachedHead) {
    buildSampleHistory(*repo, BASE_TIME);
    repo->detachHead();

    Repository r = openRepo();
    auto name = r.currentBranchName();
    ASSERT_TRUE(name.has_value()) << name.error().message;
    EXPECT_EQ(name.value(), Constants::DETACHED_HEAD);

    auto branches = r.listBranches(false);
    ASSERT_TRUE(branches.has_value()) << branches.error().message;
    EXPECT_EQ(branches.value().size(), 3u);
    for (const auto& b : branches.value()) EXPECT_FALSE(b.isCurrent) << b.name;
}

// Test: A repository without commits still knows the branch HEAD names
TEST_F(RepositoryTest, UnbornBranchName) {
    Repository r = openRepo();
    auto name = r.currentBranchName();
    ASSERT_TRUE(name.has_value()) << name.error().message;
    EXPECT_EQ(name.value(), "main");
}

// Test: Listing on a repository without commits
TEST_F(RepositoryTest, NoBranchesFound) {
    Repository r = openRepo();
    auto branches = r.listBranches(false);
    ASSERT_FALSE(branches.has_value());
    EXPECT_EQ(branches.error().code, ErrorCode::NoBranchesFound);
    EXPECT_EQ(branches.error().message, "No branches found in repository");
}

// Test: Branches come back newest first with the current one flagged
TEST_F(RepositoryTest, ListSortedByCommitTime) {
    buildSampleHistory(*repo, BASE_TIME);

    Repository r = openRepo();
    auto res = r.listBranches(false);
    ASSERT_TRUE(res.has_value()) << res.error().message;
    const auto& branches = res.value();

    EXPECT_EQ(namesOf(branches), (std::vector<std::string>{"bugfix/test", "feature/test", "main"}));
    EXPECT_FALSE(branches[0].isCurrent);
    EXPECT_FALSE(branches[1].isCurrent);
    EXPECT_TRUE(branches[2].isCurrent);
    EXPECT_EQ(branches[0].summary, "Fix bug");
    EXPECT_EQ(branches[2].summary, "Initial commit");
    EXPECT_EQ(branches[0].commitTime.seconds, BASE_TIME + 200);
    EXPECT_EQ(branches[0].commitHash.size(), 40u);
    for (const auto& b : branches) EXPECT_FALSE(b.isRemote);
}

// Test: An older branch moves ahead once it gets a newer commit
TEST_F(RepositoryTest, ListReflectsNewCommits) {
    buildSampleHistory(*repo, BASE_TIME);
    repo->commitFile("main.txt", "later\n", "Later work on main\n\nWith a body", BASE_TIME + 500);

    Repository r = openRepo();
    auto res = r.listBranches(false);
    ASSERT_TRUE(res.has_value()) << res.error().message;
    ASSERT_FALSE(res.value().empty());
    EXPECT_EQ(res.value()[0].name, "main");
    EXPECT_EQ(res.value()[0].summary, "Later work on main");
}

// Test: Commit timezone offset is carried into the record
TEST_F(RepositoryTest, CommitTimeKeepsOffset) {
    repo->commitFile("README.md", "x\n", "Initial commit", 1705314645, 120);

    Repository r = openRepo();
    auto res = r.listBranches(false);
    ASSERT_TRUE(res.has_value()) << res.error().message;
    ASSERT_EQ(res.value().size(), 1u);
    EXPECT_EQ(res.value()[0].commitTime.offsetMinutes, 120);
    EXPECT_EQ(res.value()[0].formattedDate(), "2024-01-15 12:30:45");
}

// Test: Remote branches are listed only on request and origin/HEAD is skipped
TEST_F(RepositoryTest, ListRemoteBranches) {
    buildSampleHistory(*repo, BASE_TIME);
    repo->addRemote("origin", "https://example.com/repo.git");
    repo->createRemoteRef("origin/main", repo->headCommit());
    repo->createRemoteHead("origin", "origin/main");

    Repository r = openRepo();

    auto localOnly = r.listBranches(false);
    ASSERT_TRUE(localOnly.has_value()) << localOnly.error().message;
    EXPECT_EQ(findBranch(localOnly.value(), "origin/main"), nullptr);

    auto all = r.listBranches(true);
    ASSERT_TRUE(all.has_value()) << all.error().message;
    EXPECT_EQ(all.value().size(), 4u);
    EXPECT_EQ(findBranch(all.value(), "origin/HEAD"), nullptr);

    const BranchRecord* remote = findBranch(all.value(), "origin/main");
    ASSERT_NE(remote, nullptr);
    EXPECT_TRUE(remote->isRemote);
    EXPECT_FALSE(remote->isCurrent);
    EXPECT_EQ(remote->remoteName, "origin");
    EXPECT_EQ(remote->localName(), "main");
}

// Test: A branch whose tip cannot be read is skipped
TEST_F(RepositoryTest, UnreadableBranchSkipped) {
    buildSampleHistory(*repo, BASE_TIME);
    createFile(tempDir, ".git/refs/heads/broken", "0123456789abcdef0123456789abcdef01234567\n");

    Repository r = openRepo();
    auto res = r.listBranches(false);
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(namesOf(res.value()), (std::vector<std::string>{"bugfix/test", "feature/test", "main"}));
}

// Test: Diff of a branch tip against its parent
TEST_F(RepositoryTest, DiffOfLastCommit) {
    buildSampleHistory(*repo, BASE_TIME);

    Repository r = openRepo();
    auto diff = r.lastCommitDiff("feature/test");
    ASSERT_TRUE(diff.has_value()) << diff.error().message;
    EXPECT_NE(diff.value().find("diff --git a/README.md b/README.md"), std::string::npos);
    EXPECT_NE(diff.value().find("+Feature content"), std::string::npos);
    EXPECT_EQ(diff.value().find("-Feature content"), std::string::npos);
}

// Test: A root commit shows every file as added
TEST_F(RepositoryTest, DiffOfRootCommit) {
    repo->commitFile("README.md", "# Test Repository\n", "Initial commit", BASE_TIME);

    Repository r = openRepo();
    auto diff = r.lastCommitDiff("main");
    ASSERT_TRUE(diff.has_value()) << diff.error().message;
    EXPECT_NE(diff.value().find("new file"), std::string::npos);
    EXPECT_NE(diff.value().find("+# Test Repository"), std::string::npos);
}

// Test: A commit that changes nothing
TEST_F(RepositoryTest, DiffOfEmptyCommit) {
    buildSampleHistory(*repo, BASE_TIME);
    repo->commitFile("README.md", "# Test Repository\n", "Empty commit", BASE_TIME + 300);

    Repository r = openRepo();
    auto diff = r.lastCommitDiff("main");
    ASSERT_TRUE(diff.has_value()) << diff.error().message;
    EXPECT_EQ(diff.value(), Constants::NO_CHANGES);
}

// Test: Diff of a remote-tracking branch
TEST_F(RepositoryTest, DiffOfRemoteBranch) {
    buildSampleHistory(*repo, BASE_TIME);
    repo->switchTo("feature/test");
    repo->addRemote("origin", "https://example.com/repo.git");
    repo->createRemoteRef("origin/feature/test", repo->headCommit());
    repo->switchTo("main");

    Repository r = openRepo();
    auto diff = r.lastCommitDiff("origin/feature/test");
    ASSERT_TRUE(diff.has_value()) << diff.error().message;
    EXPECT_NE(diff.value().find("+Feature content"), std::string::npos);
}

// Test: Diff of an unknown branch
TEST_F(RepositoryTest, DiffOfUnknownBranch) {
    buildSampleHistory(*repo, BASE_TIME);

    Repository r = openRepo();
    auto diff = r.lastCommitDiff("no-such-branch");
    ASSERT_FALSE(diff.has_value());
    EXPECT_EQ(diff.error().code, ErrorCode::OperationFailed);
    EXPECT_EQ(diff.error().message.rfind("Failed to get diff for no-such-branch", 0), 0u);
}

// Test: Checkout of a local branch updates HEAD and the working tree
TEST_F(RepositoryTest, CheckoutLocalBranch) {
    buildSampleHistory(*repo, BASE_TIME);

    Repository r = openRepo();
    auto res = r.checkout("feature/test");
    ASSERT_TRUE(res.has_value()) << res.error().message;

    auto name = r.currentBranchName();
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(name.value(), "feature/test");
    EXPECT_EQ(readFile(tempDir / "README.md"), "# Test Repository\n\nFeature content\n");
}

// Test: Checkout of a remote branch creates a tracking local branch
TEST_F(RepositoryTest, CheckoutRemoteCreatesTrackingBranch) {
    buildSampleHistory(*repo, BASE_TIME);
    repo->addRemote("origin", "https://example.com/repo.git");
    repo->createBranch("remote-only");
    repo->switchTo("remote-only");
    std::string tip = repo->commitFile("remote.txt", "from remote\n", "Remote work", BASE_TIME + 400);
    repo->switchTo("main");
    repo->deleteBranch("remote-only");
    repo->createRemoteRef("origin/remote-only", tip);

    Repository r = openRepo();
    auto res = r.checkout("origin/remote-only");
    ASSERT_TRUE(res.has_value()) << res.error().message;

    auto name = r.currentBranchName();
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(name.value(), "remote-only");
    EXPECT_TRUE(repo->branchExists("remote-only"));
    EXPECT_EQ(repo->upstreamOf("remote-only"), "origin/remote-only");
    EXPECT_EQ(readFile(tempDir / "remote.txt"), "from remote\n");
}

// Test: Checkout of a remote branch reuses an existing local branch
TEST_F(RepositoryTest, CheckoutRemoteReusesLocalBranch) {
    buildSampleHistory(*repo, BASE_TIME);
    repo->addRemote("origin", "https://example.com/repo.git");
    repo->switchTo("feature/test");
    repo->createRemoteRef("origin/feature/test", repo->headCommit());
    repo->switchTo("main");

    Repository r = openRepo();
    auto res = r.checkout("origin/feature/test");
    ASSERT_TRUE(res.has_value()) << res.error().message;

    auto name = r.currentBranchName();
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(name.value(), "feature/test");
}

// Test: Checkout of an unknown branch leaves HEAD alone
TEST_F(RepositoryTest, CheckoutUnknownBranch) {
    buildSampleHistory(*repo, BASE_TIME);

    Repository r = openRepo();
    auto res = r.checkout("no-such-branch");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::OperationFailed);
    EXPECT_EQ(res.error().message.rfind("Failed to checkout no-such-branch", 0), 0u);
    EXPECT_EQ(repo->currentBranch(), "main");
}

// Test: Local changes that would be overwritten block the checkout
TEST_F(RepositoryTest, CheckoutRefusesToOverwriteChanges) {
    buildSampleHistory(*repo, BASE_TIME);
    createFile(tempDir, "README.md", "# Local edits\n");

    Repository r = openRepo();
    auto res = r.checkout("feature/test");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::OperationFailed);
    EXPECT_EQ(repo->currentBranch(), "main");
    EXPECT_EQ(readFile(tempDir / "README.md"), "# Local edits\n");
}

// Test: A tracking branch created for a failed checkout is removed again
TEST_F(RepositoryTest, CheckoutRemoteFailureRemovesCreatedBranch) {
    buildSampleHistory(*repo, BASE_TIME);
    repo->addRemote("origin", "https://example.com/repo.git");
    repo->createBranch("remote-only");
    repo->switchTo("remote-only");
    std::string tip = repo->commitFile("README.md", "# Remote README\n", "Rewrite README", BASE_TIME + 400);
    repo->switchTo("main");
    repo->deleteBranch("remote-only");
    repo->createRemoteRef("origin/remote-only", tip);
    createFile(tempDir, "README.md", "# Local edits\n");

    Repository r = openRepo();
    auto res = r.checkout("origin/remote-only");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::OperationFailed);
    EXPECT_FALSE(repo->branchExists("remote-only"));
    EXPECT_EQ(repo->currentBranch(), "main");
    EXPECT_EQ(readFile(tempDir / "README.md"), "# Local edits\n");
}
