#include "ui/Interrupt.hpp"

#include <cstring>

#include <unistd.h>

namespace gbranches {

namespace {

volatile sig_atomic_t stdoutIsTerminal = 0;

void onInterrupt(int) {
    // Only async-signal-safe calls from here on
    static const char message[] = "\033[?25h\nCancelled by user.\n";
    static const char plain[] = "\nCancelled by user.\n";
    if (stdoutIsTerminal) {
        ssize_t ignored = write(STDOUT_FILENO, message, sizeof(message) - 1);
        (void)ignored;
    } else {
        ssize_t ignored = write(STDOUT_FILENO, plain, sizeof(plain) - 1);
        (void)ignored;
    }
    _exit(0);
}

}

void installInterruptHandler() {
    stdoutIsTerminal = isatty(STDOUT_FILENO) == 1 ? 1 : 0;
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = onInterrupt;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);
}

ScopedSignalIgnore::ScopedSignalIgnore(int signo) : signo(signo) {
    struct sigaction ignore;
    std::memset(&ignore, 0, sizeof(ignore));
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    sigaction(signo, &ignore, &previous);
}

ScopedSignalIgnore::~ScopedSignalIgnore() {
    sigaction(signo, &previous, nullptr);
}

}
