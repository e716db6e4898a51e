#pragma once

#include <istream>
#include <string>
#include <vector>

#include "core/BranchRecord.hpp"
#include "ui/Console.hpp"
#include "ui/Prompt.hpp"

namespace gbranches {

/**
 * @brief Everything the branch picker shows or asks
 *
 * Rendering and input collection only; decisions stay with the command.
 */
class BranchUI {
public:
    BranchUI(Console& console, PromptInput input);

    Console& console() { return con; }

    /// Table of branches, current branch highlighted and marked with "* "
    void displayBranchesTable(const std::vector<BranchRecord>& branches);

    /// Pick one branch; cancelled when the user backs out
    PromptResult<BranchRecord> selectBranch(const std::vector<BranchRecord>& branches);

    /**
     * @brief Detail panel for a branch followed by its last-commit diff
     * @param diff Patch text; empty or Constants::NO_CHANGES prints a note instead
     */
    void displayBranchDetails(const BranchRecord& branch, const std::string& diff);

    /// Print the git command that would perform the switch
    void showCheckoutCommand(const BranchRecord& branch);

    PromptResult<bool> confirmCheckout(const std::string& branchName);

    void displayError(const std::string& message);
    void displaySuccess(const std::string& message);
    void displayWarning(const std::string& message);
    void displayHint(const std::string& message);

    /// "git checkout <name>", or "git checkout -b <local> <remote/name>"
    static std::string checkoutCommandFor(const BranchRecord& branch);

    /// Line shown for a branch in the select prompt
    static std::string choiceLabel(const BranchRecord& branch);

private:
    Console& con;
    PromptInput input;
};

}
