#pragma once

#include <vector>

#include "cli/ICommand.hpp"

namespace gbranches {

class CommandInvoker {
public:
    Expected<void> invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args);

    /// 0 on success (cancellation included), 2 for usage errors, 1 otherwise
    static int exitCode(const Expected<void>& result);
};

}
