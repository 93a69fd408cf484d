#include "process.hpp"
#include "signals.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <fmt/format.h>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    // Never leave a zombie behind
    if (pid_ > 0) wait();
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
    pid_ = other.pid_;
    other.pid_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        if (pid_ > 0) wait();
        pid_ = other.pid_;
        other.pid_ = -1;
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

int ProcessHandle::wait() {
    if (pid_ <= 0) return -1;

    int status = 0;
    pid_t ret;
    do {
        ret = waitpid(pid_, &status, 0);
    } while (ret < 0 && errno == EINTR);
    pid_ = -1;

    if (ret < 0) return -1;
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// ── spawn ────────────────────────────────────────────────────

ProcessHandle spawn(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        throw std::runtime_error("Nothing to execute");
    }

    // The child writes errno here if execvp fails. On success the pipe is
    // closed by O_CLOEXEC and the parent reads EOF.
    int err_pipe[2];
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        throw std::runtime_error(fmt::format("pipe failed: {}", std::strerror(errno)));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(err_pipe[0]);
        close(err_pipe[1]);
        throw std::runtime_error(fmt::format("fork failed: {}", std::strerror(err)));
    }

    if (pid == 0) {
        // Child process
        close(err_pipe[0]);
        restore_default_interrupts();

        std::vector<char*> args;
        args.reserve(argv.size() + 1);
        for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
        args.push_back(nullptr);

        execvp(args[0], args.data());

        int err = errno;
        ssize_t ignored = write(err_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);  // exec failed
    }

    // Parent
    close(err_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(err_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(err_pipe[0]);

    ProcessHandle handle;
    handle.pid_ = pid;

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        handle.wait();
        throw std::runtime_error(fmt::format("Failed to execute '{}': {}",
                                             argv[0], std::strerror(child_errno)));
    }
    return handle;
}

int run(const std::vector<std::string>& argv) {
    ScopedIgnoreInterrupts ignore;
    ProcessHandle child = spawn(argv);
    return child.wait();
}

} // namespace platform
