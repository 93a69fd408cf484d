#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

struct CliArgs {
    std::string host;               // raw [user@]host token
    ConnectionOptions options;
    bool dev = false;               // print diagnostics and the command, run nothing
    bool help = false;
    bool version = false;
};

// Parse argv (GNU getopt_long rules: options may follow the host, short
// flags may be bundled as in -tvv). -h and -V short-circuit everything else.
// Errors carry an argparse-style message for the usage screen.
Result<CliArgs> parse_args(int argc, char** argv);

// Convenience overload for callers holding std::strings (argv[0] included).
Result<CliArgs> parse_args(const std::vector<std::string>& args);

// One-line synopsis
std::string usage_line();

// Full --help text
std::string help_text();
