#include "cli/CommandInvoker.hpp"

#include "util/Logger.hpp"

namespace gbranches {

Expected<void> CommandInvoker::invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args) {
    Logger::instance().debug(std::string("Executing command: ") + cmd.name());
    auto res = cmd.execute(ctx, args);
    if (!res) {
        // The command has already shown the failure to the user
        Logger::instance().debug(std::string(cmd.name()) + ": " + res.error().message);
        return res;
    }
    return {};
}

int CommandInvoker::exitCode(const Expected<void>& result) {
    if (result) return 0;
    switch (result.error().code) {
        case ErrorCode::InvalidArgs:
            return 2;
        case ErrorCode::None:
        case ErrorCode::RepositoryNotFound:
        case ErrorCode::NoBranchesFound:
        case ErrorCode::OperationFailed:
            break;
    }
    return 1;
}

}
