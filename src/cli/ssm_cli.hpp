#pragma once

#include <functional>
#include <iostream>
#include <string>
#include <core/types.hpp>
#include <ssh/name_lookup.hpp>
#include "arg_parser.hpp"

// Runs one invocation: resolve the host, build the ssh argv, hand it to the
// executor. Returns the process exit status.
class SsmCli {
public:
    using Executor = std::function<int(const CommandVector&)>;

    SsmCli(const Settings& settings, const NameLookup& lookup,
           std::ostream& out = std::cout, std::ostream& err = std::cerr);

    // Replace platform::run (tests record the argv instead of spawning ssh)
    void set_executor(Executor executor) { executor_ = std::move(executor); }

    int run(const CliArgs& args);

private:
    const Settings& settings_;
    const NameLookup& lookup_;
    std::ostream& out_;
    std::ostream& err_;
    Executor executor_;

    void warn_deprecated_nopubkey();
    void check_password_source(const CommandVector& cmd, const StatusCallback& diag);
};

// argv joined for display, quoting arguments that contain spaces or quotes.
std::string format_command(const CommandVector& cmd);
