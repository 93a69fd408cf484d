#include "arg_parser.hpp"
#include "theme.hpp"
#include <getopt.h>
#include <fmt/format.h>

static const struct option LONG_OPTIONS[] = {
    {"command",  required_argument, nullptr, 'c'},
    {"dev",      no_argument,       nullptr, 'd'},
    {"help",     no_argument,       nullptr, 'h'},
    {"jump",     no_argument,       nullptr, 'j'},
    {"jumphost", required_argument, nullptr, 'J'},
    {"nopubkey", no_argument,       nullptr, 'o'},
    {"port",     required_argument, nullptr, 'p'},
    {"tunnel",   no_argument,       nullptr, 't'},
    {"version",  no_argument,       nullptr, 'V'},
    {nullptr,    0,                 nullptr, 0},
};

// Leading ':' makes getopt return ':' for a missing argument instead of '?'
static const char* SHORT_OPTIONS = ":c:dhjJ:op:tVv";

static std::string describe_option(int opt, char** argv) {
    if (opt != 0) return fmt::format("-{}", static_cast<char>(opt));
    // Unknown long option: getopt leaves optopt at 0
    return argv[optind - 1];
}

Result<CliArgs> parse_args(int argc, char** argv) {
    CliArgs args;
    bool jump_override = false;

    optind = 0;     // glibc: full re-initialisation, so repeated calls work
    opterr = 0;     // errors are reported by the caller

    int opt;
    while ((opt = getopt_long(argc, argv, SHORT_OPTIONS, LONG_OPTIONS, nullptr)) != -1) {
        switch (opt) {
        case 'c':
            // An empty command means "no command", same as leaving it out
            if (*optarg) args.options.command = std::string(optarg);
            break;
        case 'd':
            args.dev = true;
            break;
        case 'h':
            args.help = true;
            return Result<CliArgs>::Ok(args);
        case 'j':
            args.options.jump = true;
            break;
        case 'J':
            jump_override = true;
            if (*optarg) args.options.jump_host = std::string(optarg);
            break;
        case 'o':
            args.options.no_pubkey = true;
            break;
        case 'p':
            args.options.port = std::string(optarg);
            break;
        case 't':
            args.options.tunnel = true;
            break;
        case 'V':
            args.version = true;
            return Result<CliArgs>::Ok(args);
        case 'v':
            args.options.verbosity++;
            break;
        case ':':
            return Result<CliArgs>::Err(fmt::format("option {} expects an argument",
                                                    describe_option(optopt, argv)));
        default:
            return Result<CliArgs>::Err(fmt::format("unrecognized option {}",
                                                    describe_option(optopt, argv)));
        }
    }

    if (args.options.jump && jump_override) {
        return Result<CliArgs>::Err("-j/--jump and -J/--jumphost cannot be used together");
    }

    if (optind >= argc) {
        return Result<CliArgs>::Err("the following arguments are required: host");
    }
    args.host = argv[optind++];

    if (optind < argc) {
        std::string extra;
        for (int i = optind; i < argc; i++) {
            if (!extra.empty()) extra += " ";
            extra += argv[i];
        }
        return Result<CliArgs>::Err("unrecognized arguments: " + extra);
    }

    return Result<CliArgs>::Ok(args);
}

Result<CliArgs> parse_args(const std::vector<std::string>& args) {
    // getopt permutes argv in place, so hand it private copies
    std::vector<std::string> storage(args);
    std::vector<char*> argv;
    for (auto& a : storage) argv.push_back(a.data());
    argv.push_back(nullptr);
    return parse_args(static_cast<int>(storage.size()), argv.data());
}

std::string usage_line() {
    return "usage: ssm [-h] [-c COMMAND] [-j | -J JUMPHOST] [-o] [-p PORT] [-t] [-V] [-v] host\n";
}

std::string help_text() {
    std::string out = usage_line();
    out += "\nAn SSH wrapper to simplify life. Provides shortcuts for common SSH flags,\n"
           "dns name completion from a configurable list of domains, and password\n"
           "autofill via sshpass.\n";

    out += theme::section("Positional Arguments");
    out += theme::option("host", "IP address, FQDN, or the host part of an FQDN");
    out += theme::option("", "(completed from the configured domains when it has no '.')");

    out += theme::section("Options");
    out += theme::option("-c, --command COMMAND", "Run COMMAND remotely instead of a shell (ignores -t)");
    out += theme::option("-j, --jump", "Connect through the configured jump host");
    out += theme::option("-J, --jumphost HOST", "Connect through HOST instead (not with -j)");
    out += theme::option("-o, --nopubkey", "Disable public key authentication (deprecated)");
    out += theme::option("-p, --port PORT", "Port for the SSH session (default from config)");
    out += theme::option("-t, --tunnel", "Open a SOCKS5 tunnel on the configured tunnel port");
    out += theme::option("-v", "More ssh debug output, up to -vvv");
    out += theme::option("-V, --version", "Show version");
    out += theme::option("-h, --help", "Show this help");
    out += "\n";
    return out;
}
