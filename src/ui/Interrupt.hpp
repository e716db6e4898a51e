#pragma once

#include <signal.h>

namespace gbranches {

/**
 * @brief Treat Ctrl-C anywhere outside a prompt as a clean cancellation
 *
 * The handler restores the cursor, prints "Cancelled by user." and exits
 * with status 0. Prompts read keys in raw mode, where Ctrl-C arrives as a
 * key press instead of a signal.
 */
void installInterruptHandler();

/**
 * @brief Ignore one signal for the lifetime of the object
 *
 * Used while a child process (the pager) owns the terminal: SIGINT belongs to
 * the child, and SIGPIPE must not kill us when it exits early.
 */
class ScopedSignalIgnore {
public:
    explicit ScopedSignalIgnore(int signo);
    ~ScopedSignalIgnore();
    ScopedSignalIgnore(const ScopedSignalIgnore&) = delete;
    ScopedSignalIgnore& operator=(const ScopedSignalIgnore&) = delete;

private:
    int signo;
    struct sigaction previous {};
};

}
