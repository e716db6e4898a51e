#pragma once

#include "cli/ICommand.hpp"
#include "cli/Options.hpp"

namespace gbranches {

class BranchUI;

/**
 * @brief List branches, let the user pick one, show its last commit, switch
 *
 * Flow:
 *   open repository -> list branches -> table -> select -> diff -> details
 *   -> (current branch? stop) -> suggested command -> confirm -> checkout
 *
 * Cancelling any prompt ends the command successfully.
 */
class BranchesCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "gbranches"; }
    const char* description() const override { return "Interactive git branch explorer and switcher"; }
    const char* helpNameLine() const override { return "gbranches - Interactive git branch explorer and switcher"; }
    const char* helpSynopsis() const override { return "gbranches [OPTIONS]"; }
    const char* helpDescription() const override {
        return "List git branches sorted by latest commit and interactively explore them.\n\n"
               "  Shows branches in a table format sorted by commit date (newest first).\n"
               "  Select a branch to view its last commit details and optionally switch to it.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"-r, --remote", "Include remote branches in the list"},
            {"-s, --switch", "Automatically switch to selected branch without confirmation"},
            {"-p, --path PATH", "Path to git repository (default: current directory)"},
            {"-h, --help", "Show this message and exit"},
        };
    }

private:
    Expected<void> run(BranchUI& ui, const Options& opts);
    Expected<void> report(BranchUI& ui, const Error& error);
};

}
