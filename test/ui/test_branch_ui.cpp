#include <gtest/gtest.h>
#include <sstream>
#include "core/Constants.hpp"
#include "ui/BranchUI.hpp"

using namespace gbranches;

namespace {

BranchRecord makeRecord(const std::string& name, const std::string& summary, bool current = false) {
    BranchRecord r;
    r.name = name;
    r.commitHash = "abc1234def5678abc1234def5678abc1234def56";
    r.commitTime = CommitTime{1705314645, 0};
    r.summary = summary;
    r.isCurrent = current;
    return r;
}

TerminalInfo wide() {
    TerminalInfo info;
    info.columns = 200;
    return info;
}

}

class BranchUITest : public ::testing::Test {
protected:
    std::string getOutput() { return out.str(); }

    std::istringstream in;
    std::ostringstream out;
    Console console{out, wide()};
    BranchUI ui{console, PromptInput{in, false}};
};

// Test: Table lists every branch and marks the current one
TEST_F(BranchUITest, BranchesTable) {
    std::vector<BranchRecord> branches = {
        makeRecord("feature/x", "Add feature"),
        makeRecord("main", "Initial commit", true),
    };
    ui.displayBranchesTable(branches);

    std::string output = getOutput();
    EXPECT_NE(output.find("Git Branches (sorted by latest commit)"), std::string::npos);
    EXPECT_NE(output.find("Branch"), std::string::npos);
    EXPECT_NE(output.find("Message"), std::string::npos);
    EXPECT_NE(output.find("│ feature/x "), std::string::npos);
    EXPECT_NE(output.find("│ * main "), std::string::npos);
    EXPECT_NE(output.find("abc1234"), std::string::npos);
    EXPECT_NE(output.find("2024-01-15 10:30:45"), std::string::npos);
}

// Test: Long commit messages are cut in the table
TEST_F(BranchUITest, BranchesTableTruncatesMessage) {
    std::string longMessage(70, 'x');
    ui.displayBranchesTable({makeRecord("main", longMessage, true)});

    std::string output = getOutput();
    EXPECT_NE(output.find(std::string(60, 'x') + "..."), std::string::npos);
    EXPECT_EQ(output.find(std::string(61, 'x')), std::string::npos);
}

// Test: Choice labels for the select prompt
TEST_F(BranchUITest, ChoiceLabel) {
    EXPECT_EQ(BranchUI::choiceLabel(makeRecord("main", "Initial commit", true)), "* main (abc1234) - Initial commit");
    EXPECT_EQ(BranchUI::choiceLabel(makeRecord("dev", std::string(80, 'y'))),
              "  dev (abc1234) - " + std::string(50, 'y'));
}

// Test: Selecting through the line prompt returns the record
TEST_F(BranchUITest, SelectBranch) {
    in.str("2\n");
    std::vector<BranchRecord> branches = {makeRecord("a", "first"), makeRecord("b", "second")};
    auto picked = ui.selectBranch(branches);
    ASSERT_TRUE(picked);
    EXPECT_EQ(picked.value().name, "b");
    EXPECT_NE(getOutput().find("Select a branch to view details:"), std::string::npos);
}

// Test: Checkout command for local and remote branches
TEST_F(BranchUITest, CheckoutCommand) {
    EXPECT_EQ(BranchUI::checkoutCommandFor(makeRecord("feature/x", "")), "git checkout feature/x");

    BranchRecord remote = makeRecord("origin/feature/x", "");
    remote.isRemote = true;
    remote.remoteName = "origin";
    EXPECT_EQ(BranchUI::checkoutCommandFor(remote), "git checkout -b feature/x origin/feature/x");

    ui.showCheckoutCommand(remote);
    EXPECT_NE(getOutput().find("To switch to this branch, run: git checkout -b feature/x origin/feature/x"),
              std::string::npos);
}

// Test: Details panel followed by the numbered diff
TEST_F(BranchUITest, BranchDetailsWithDiff) {
    std::string diff =
        "diff --git a/README.md b/README.md\n"
        "--- a/README.md\n"
        "+++ b/README.md\n"
        "@@ -1 +1,2 @@\n"
        " # Title\n"
        "+New line\n";
    ui.displayBranchDetails(makeRecord("feature/x", "Add feature"), diff);

    std::string output = getOutput();
    EXPECT_NE(output.find("Branch Details"), std::string::npos);
    EXPECT_NE(output.find("Branch: feature/x"), std::string::npos);
    EXPECT_NE(output.find("Commit: abc1234def5678abc1234def5678abc1234def56"), std::string::npos);
    EXPECT_NE(output.find("Date: 2024-01-15 10:30:45"), std::string::npos);
    EXPECT_NE(output.find("Message: Add feature"), std::string::npos);
    EXPECT_NE(output.find("Type: Local"), std::string::npos);
    EXPECT_NE(output.find("Commit Diff:"), std::string::npos);
    EXPECT_NE(output.find("1 │ diff --git a/README.md b/README.md"), std::string::npos);
    EXPECT_NE(output.find("6 │ +New line"), std::string::npos);
}

// Test: Empty commits show a note instead of a diff
TEST_F(BranchUITest, BranchDetailsWithoutChanges) {
    BranchRecord remote = makeRecord("origin/x", "Nothing");
    remote.isRemote = true;
    ui.displayBranchDetails(remote, Constants::NO_CHANGES);

    std::string output = getOutput();
    EXPECT_NE(output.find("Type: Remote"), std::string::npos);
    EXPECT_NE(output.find(Constants::NO_CHANGES), std::string::npos);
    EXPECT_EQ(output.find("Commit Diff:"), std::string::npos);
}

// Test: Error and success panels
TEST_F(BranchUITest, MessagePanels) {
    ui.displayError("Something broke");
    ui.displaySuccess("All good");

    std::string output = getOutput();
    EXPECT_NE(output.find(" Error "), std::string::npos);
    EXPECT_NE(output.find("│ Something broke"), std::string::npos);
    EXPECT_NE(output.find(" Success "), std::string::npos);
    EXPECT_NE(output.find("│ All good"), std::string::npos);
    EXPECT_NE(output.find("╰"), std::string::npos);
}
