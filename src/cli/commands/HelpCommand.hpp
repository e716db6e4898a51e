#pragma once

#include "cli/ICommand.hpp"

namespace gbranches {

/**
 * @brief Prints the help page of another command
 */
class HelpCommand : public ICommand {
public:
    explicit HelpCommand(const ICommand& target) : target(target) {}

    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "help"; }
    const char* description() const override { return "Show usage"; }
    const char* helpNameLine() const override { return "help - Show help for the branch picker"; }
    const char* helpSynopsis() const override { return "gbranches --help"; }
    const char* helpDescription() const override { return "Display usage, description and options."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }

private:
    const ICommand& target;
};

}
