#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// A host token that no probe could turn into a connection target.
struct ResolutionFailure {
    enum class Subject { Target, JumpHost };

    Subject subject = Subject::Target;
    std::string attempted_host;     // user@ prefix already stripped

    std::string message() const;
};

// Like Result<T>, but the failure is always a ResolutionFailure.
template <typename T>
struct ResolveResult {
    bool success;
    T value;
    ResolutionFailure failure;

    static ResolveResult<T> Ok(T val) {
        return {true, std::move(val), ResolutionFailure{}};
    }

    static ResolveResult<T> Err(ResolutionFailure f) {
        return {false, T{}, std::move(f)};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Values read from the config file. Read-only once loaded.
struct Settings {
    std::string ssh_port = "22";
    std::string jump_host;
    std::vector<std::string> domains;           // suffixes tried in order, first match wins
    std::string tunnel_port = "1080";
    bool sshpass = false;                       // inject password via `sshpass -e`
};

// Flags supplied on the command line.
struct ConnectionOptions {
    std::optional<std::string> command;         // remote command, run non-interactively
    std::optional<std::string> jump_host;       // -J override
    bool jump = false;                          // -j, use Settings::jump_host
    bool no_pubkey = false;
    std::optional<std::string> port;            // falls back to Settings::ssh_port
    bool tunnel = false;
    int verbosity = 0;
};

// Literal argv handed to the process layer: program first.
using CommandVector = std::vector<std::string>;

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
