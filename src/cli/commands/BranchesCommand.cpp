#include "cli/commands/BranchesCommand.hpp"

#include <utility>

#include "cli/commands/HelpCommand.hpp"
#include "core/Repository.hpp"
#include "ui/BranchUI.hpp"
#include "ui/Interrupt.hpp"
#include "util/Logger.hpp"

namespace gbranches {

Expected<void> BranchesCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    Console console(*ctx.out, ctx.terminal);
    BranchUI ui(console, PromptInput{*ctx.in, ctx.rawKeys});

    auto optsRes = parseOptions(args);
    if (!optsRes) {
        ui.displayError(optsRes.error().message);
        ui.displayHint("Try 'gbranches --help' for help.");
        return optsRes.error();
    }
    const Options& opts = optsRes.value();
    if (opts.help) {
        HelpCommand help(*this);
        return help.execute(ctx, {});
    }
    return run(ui, opts);
}

Expected<void> BranchesCommand::report(BranchUI& ui, const Error& error) {
    switch (error.code) {
        case ErrorCode::RepositoryNotFound:
            ui.displayError(error.message);
            ui.displayWarning("Make sure you're in a git repository or provide a valid path with --path");
            break;
        case ErrorCode::NoBranchesFound:
        case ErrorCode::InvalidArgs:
            ui.displayError(error.message);
            break;
        case ErrorCode::OperationFailed:
            ui.displayError("Git operation failed: " + error.message);
            break;
        case ErrorCode::None:
            ui.displayError("Unexpected error: " + error.message);
            break;
    }
    return error;
}

Expected<void> BranchesCommand::run(BranchUI& ui, const Options& opts) {
    auto repoRes = Repository::open(opts.path);
    if (!repoRes) return report(ui, repoRes.error());
    Repository repo = std::move(repoRes.value());

    auto branchesRes = repo.listBranches(opts.includeRemote);
    if (!branchesRes) return report(ui, branchesRes.error());
    const auto& branches = branchesRes.value();

    ui.displayBranchesTable(branches);
    auto selection = ui.selectBranch(branches);
    if (!selection) {
        Logger::instance().debug("Selection cancelled");
        return {};
    }
    const BranchRecord& selected = selection.value();

    std::string diff;
    auto diffRes = repo.lastCommitDiff(selected.name);
    if (diffRes) {
        diff = diffRes.value();
    } else {
        ui.displayError("Could not get diff: " + diffRes.error().message);
    }
    ui.displayBranchDetails(selected, diff);

    if (selected.isCurrent) {
        ui.displayWarning("You are already on this branch.");
        return {};
    }

    ui.showCheckoutCommand(selected);

    bool shouldCheckout = opts.autoSwitch;
    if (!shouldCheckout) {
        auto confirmed = ui.confirmCheckout(selected.name);
        if (!confirmed) {
            ui.displayWarning("\nCancelled by user.");
            return {};
        }
        shouldCheckout = confirmed.value();
    }

    if (!shouldCheckout) {
        ui.displayHint("Branch switch cancelled.");
        return {};
    }

    Expected<void> checkoutRes;
    {
        // A checkout cut short would leave a half-written working tree
        ScopedSignalIgnore ignoreInterrupt(SIGINT);
        checkoutRes = repo.checkout(selected.name);
    }
    if (!checkoutRes) {
        ui.displayError("Failed to switch branch: " + checkoutRes.error().message);
        return checkoutRes.error();
    }
    ui.displaySuccess("Successfully switched to branch: " + selected.name);
    return {};
}

}
