#pragma once

#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "ui/Console.hpp"
#include "util/Expected.hpp"

namespace gbranches {

/**
 * @brief Process-level services handed to a command
 *
 * Defaults suit tests: plain 80x24 output, answers read line by line.
 * main() points these at the real terminal.
 */
struct AppContext {
    std::istream* in{&std::cin};
    std::ostream* out{&std::cout};
    TerminalInfo terminal{};
    bool rawKeys{false};   // Read single key presses from the stdin terminal
};

class ICommand {
public:
    virtual ~ICommand() = default;
    virtual Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) = 0;
    virtual const char* name() const = 0;
    virtual const char* description() const = 0;
    // Detailed help getters
    virtual const char* helpNameLine() const = 0;      // "<cmd> - <one line>"
    virtual const char* helpSynopsis() const = 0;      // usage synopsis
    virtual const char* helpDescription() const = 0;   // long description
    virtual std::vector<std::pair<std::string, std::string>> helpOptions() const = 0; // flag -> description
};

}
