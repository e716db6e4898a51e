#include "ui/BranchUI.hpp"

#include "core/Constants.hpp"
#include "ui/DiffView.hpp"
#include "ui/Pager.hpp"
#include "ui/Panel.hpp"
#include "ui/Table.hpp"

namespace gbranches {

namespace {

const Style LABEL{Color::Cyan, true, false};

std::string detailLine(const Console& console, const std::string& label, const std::string& value) {
    return console.styled(label + ":", LABEL) + " " + value + "\n";
}

}

BranchUI::BranchUI(Console& console, PromptInput input) : con(console), input(input) {}

void BranchUI::displayBranchesTable(const std::vector<BranchRecord>& branches) {
    Table table("Git Branches (sorted by latest commit)");
    table.addColumn("Branch", Style{Color::Cyan, false, false});
    table.addColumn("Commit", Style{Color::Magenta, false, false});
    table.addColumn("Date", Style{Color::Yellow, false, false});
    table.addColumn("Message", Style{Color::White, false, false});

    for (const auto& branch : branches) {
        Style nameStyle = branch.isCurrent ? Style{Color::Green, true, false} : Style{Color::Cyan, false, false};
        std::string name = branch.isCurrent ? "* " + branch.name : branch.name;
        table.addRow({
            Table::Cell(name, nameStyle),
            branch.shortHash(),
            branch.formattedDate(),
            truncateText(branch.summary, Constants::TABLE_MESSAGE_WIDTH),
        });
    }

    con.stream() << table.render(con);
    con.print();
}

std::string BranchUI::choiceLabel(const BranchRecord& branch) {
    std::string summary = firstCodepoints(branch.summary, Constants::SELECT_MESSAGE_WIDTH);
    return branch.displayName() + " (" + branch.shortHash() + ") - " + summary;
}

PromptResult<BranchRecord> BranchUI::selectBranch(const std::vector<BranchRecord>& branches) {
    std::vector<std::string> choices;
    choices.reserve(branches.size());
    for (const auto& branch : branches) choices.push_back(choiceLabel(branch));

    SelectPrompt prompt("Select a branch to view details:", std::move(choices));
    auto picked = prompt.run(con, input);
    if (!picked) return PromptResult<BranchRecord>::cancelled();
    return branches[picked.value()];
}

void BranchUI::displayBranchDetails(const BranchRecord& branch, const std::string& diff) {
    std::string info = detailLine(con, "Branch", branch.name) +
                       detailLine(con, "Commit", branch.commitHash) +
                       detailLine(con, "Date", branch.formattedDate()) +
                       detailLine(con, "Message", branch.summary) +
                       detailLine(con, "Type", branch.isRemote ? "Remote" : "Local");
    con.stream() << Panel(info, "Branch Details", Color::Blue).render(con);
    con.print();

    if (diff.empty() || diff == Constants::NO_CHANGES) {
        con.print(Constants::NO_CHANGES, Style{Color::Default, false, true});
    } else {
        DiffView view(diff);
        std::string rendered = con.styled("Commit Diff:", Style{Color::Yellow, true, false}) + "\n" + view.render(con);
        Pager::show(con, rendered);
    }
    con.print();
}

std::string BranchUI::checkoutCommandFor(const BranchRecord& branch) {
    if (branch.isRemote) return "git checkout -b " + branch.localName() + " " + branch.name;
    return "git checkout " + branch.name;
}

void BranchUI::showCheckoutCommand(const BranchRecord& branch) {
    con.stream() << con.styled("To switch to this branch, run:", Style{Color::Green, true, false}) << " "
                 << checkoutCommandFor(branch) << "\n";
    con.print();
}

PromptResult<bool> BranchUI::confirmCheckout(const std::string& branchName) {
    ConfirmPrompt prompt("Do you want to switch to '" + branchName + "' now?", false);
    return prompt.run(con, input);
}

void BranchUI::displayError(const std::string& message) {
    Panel panel(con.styled(message, Style{Color::Red, true, false}), "Error", Color::Red);
    con.stream() << panel.render(con);
    con.flush();
}

void BranchUI::displaySuccess(const std::string& message) {
    Panel panel(con.styled(message, Style{Color::Green, true, false}), "Success", Color::Green);
    con.stream() << panel.render(con);
    con.flush();
}

void BranchUI::displayWarning(const std::string& message) {
    con.print(message, Style{Color::Yellow, false, false});
}

void BranchUI::displayHint(const std::string& message) {
    con.print(message, Style{Color::Default, false, true});
}

}
