#include "ui/Pager.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>

#include <sys/wait.h>

#include "core/Constants.hpp"
#include "ui/Interrupt.hpp"
#include "util/Logger.hpp"

namespace gbranches {

std::string Pager::command() {
    const char* env = std::getenv("PAGER");
    if (env && *env) return env;
    return Constants::DEFAULT_PAGER;
}

bool Pager::show(Console& console, const std::string& text) {
    auto lines = static_cast<int>(std::count(text.begin(), text.end(), '\n'));
    if (!console.terminal().isTerminal || lines < console.height()) {
        console.stream() << text;
        return false;
    }

    std::string cmd = command();
    console.flush();
    FILE* pipe = popen(cmd.c_str(), "w");
    if (!pipe) {
        Logger::instance().warn("Could not start pager '" + cmd + "', printing inline");
        console.stream() << text;
        return false;
    }

    // The pager handles Ctrl-C itself; the child already has default dispositions
    int status = 0;
    size_t written = 0;
    {
        ScopedSignalIgnore ignoreInterrupt(SIGINT);
        ScopedSignalIgnore ignoreBrokenPipe(SIGPIPE);
        written = std::fwrite(text.data(), 1, text.size(), pipe);
        status = pclose(pipe);
    }

    // 126/127: the shell ran but could not execute the pager
    bool notStarted = status == -1 ||
                      (WIFEXITED(status) && (WEXITSTATUS(status) == 126 || WEXITSTATUS(status) == 127));
    if (notStarted) {
        Logger::instance().warn("Could not start pager '" + cmd + "', printing inline");
        console.stream() << text;
        return false;
    }
    if (written != text.size()) {
        Logger::instance().debug("Pager closed its input early");
    }
    if (status != 0) {
        Logger::instance().debug("Pager '" + cmd + "' exited with status " + std::to_string(status));
    }
    return true;
}

}
