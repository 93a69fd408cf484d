#pragma once

#include <string>
#include <vector>

namespace platform {

// Handle to a spawned child process. Owns the pid until it is reaped.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Block until the process exits. Returns its exit code, or 128 + signal
    // number when it was killed by a signal.
    int wait();

private:
    int pid_ = -1;

    friend ProcessHandle spawn(const std::vector<std::string>& argv);
};

// Spawn argv[0] (looked up on PATH) with argv as its arguments. The child
// inherits stdin/stdout/stderr. Throws std::runtime_error if the program
// could not be executed.
ProcessHandle spawn(const std::vector<std::string>& argv);

// Spawn, then wait with SIGINT/SIGQUIT ignored in this process so that the
// child alone decides what an interrupt means. Returns the child's status.
int run(const std::vector<std::string>& argv);

} // namespace platform
