#include "signals.hpp"
#include <unistd.h>

namespace platform {

static volatile sig_atomic_t g_interrupt_exit_code = 130;

static void on_interrupt(int /*sig*/) {
    _exit(g_interrupt_exit_code);
}

void exit_quietly_on_interrupt(int exit_code) {
    g_interrupt_exit_code = exit_code;

    struct sigaction sa = {};
    sa.sa_handler = on_interrupt;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
}

void restore_default_interrupts() {
    signal(SIGINT, SIG_DFL);
    signal(SIGQUIT, SIG_DFL);
}

ScopedIgnoreInterrupts::ScopedIgnoreInterrupts() {
    struct sigaction ignore = {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    sigaction(SIGINT, &ignore, &old_int_);
    sigaction(SIGQUIT, &ignore, &old_quit_);
}

ScopedIgnoreInterrupts::~ScopedIgnoreInterrupts() {
    sigaction(SIGINT, &old_int_, nullptr);
    sigaction(SIGQUIT, &old_quit_, nullptr);
}

} // namespace platform
