// Entry point: sets up the terminal context and runs the branch picker.

#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include <unistd.h>

#include "cli/CommandInvoker.hpp"
#include "cli/ICommand.hpp"
#include "cli/commands/BranchesCommand.hpp"
#include "core/GitHandles.hpp"
#include "ui/BranchUI.hpp"
#include "ui/Interrupt.hpp"

using namespace gbranches;

int main(int argc, char** argv) {
    installInterruptHandler();

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

    AppContext ctx{};
    ctx.terminal = TerminalInfo::detect();
    const char* term = std::getenv("TERM");
    bool dumb = term && std::strcmp(term, "dumb") == 0;
    ctx.rawKeys = ctx.terminal.isTerminal && !dumb && isatty(STDIN_FILENO) == 1;

    try {
        git::LibGit2Session session;
        BranchesCommand cmd;
        CommandInvoker invoker;
        auto res = invoker.invoke(cmd, ctx, args);
        return CommandInvoker::exitCode(res);
    } catch (const std::exception& e) {
        Console console(std::cout, ctx.terminal);
        BranchUI ui(console, PromptInput{std::cin, false});
        ui.displayError(std::string("Unexpected error: ") + e.what());
        return 1;
    }
}
