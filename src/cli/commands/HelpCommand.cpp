#include "cli/commands/HelpCommand.hpp"

#include <algorithm>
#include <ostream>
#include <string>
#include <vector>

namespace gbranches {

Expected<void> HelpCommand::execute(const AppContext& ctx, const std::vector<std::string>&) {
    std::ostream& out = *ctx.out;
    out << target.helpNameLine() << "\n\n";
    out << "Usage: " << target.helpSynopsis() << "\n\n";
    out << "  " << target.helpDescription() << "\n\n";

    auto opts = target.helpOptions();
    if (!opts.empty()) {
        size_t width = 0;
        for (const auto& [opt, desc] : opts) width = std::max(width, opt.size());
        out << "Options:\n";
        for (const auto& [opt, desc] : opts) {
            out << "  " << opt << std::string(width - opt.size() + 2, ' ') << desc << "\n";
        }
    }
    return {};
}

}
