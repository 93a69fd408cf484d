#pragma once

#include <signal.h>

namespace platform {

// Make SIGINT end the process immediately and silently with `exit_code`.
// Used while blocking in the system resolver, which cannot be cancelled.
void exit_quietly_on_interrupt(int exit_code);

// Put SIGINT and SIGQUIT back to SIG_DFL (called in a freshly forked child).
void restore_default_interrupts();

// Ignore SIGINT and SIGQUIT for the lifetime of the object, then restore
// whatever dispositions were installed before.
class ScopedIgnoreInterrupts {
public:
    ScopedIgnoreInterrupts();
    ~ScopedIgnoreInterrupts();

    ScopedIgnoreInterrupts(const ScopedIgnoreInterrupts&) = delete;
    ScopedIgnoreInterrupts& operator=(const ScopedIgnoreInterrupts&) = delete;

private:
    struct sigaction old_int_;
    struct sigaction old_quit_;
};

} // namespace platform
