#include "ssm_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include <ssh/host_resolver.hpp>
#include <ssh/command_builder.hpp>

std::string format_command(const CommandVector& cmd) {
    std::string out;
    for (const auto& arg : cmd) {
        if (!out.empty()) out += " ";
        if (arg.empty() || arg.find_first_of(" \t'\"") != std::string::npos) {
            std::string quoted = "'";
            for (char c : arg) {
                if (c == '\'') quoted += "'\\''";
                else quoted += c;
            }
            out += quoted + "'";
        } else {
            out += arg;
        }
    }
    return out;
}

SsmCli::SsmCli(const Settings& settings, const NameLookup& lookup,
               std::ostream& out, std::ostream& err)
    : settings_(settings), lookup_(lookup), out_(out), err_(err),
      executor_(platform::run) {}

void SsmCli::warn_deprecated_nopubkey() {
    err_ << theme::warn("Warning! Detected use of deprecated -o flag.");
    err_ << theme::detail("The behavior of this flag will be changed in a future "
                          "release to support SSH options more generically");
    err_ << "\n";
}

void SsmCli::check_password_source(const CommandVector& cmd, const StatusCallback& diag) {
    if (!diag || cmd.empty() || cmd.front() != SSHPASS_PROGRAM) return;
    if (!platform::get_env(SSHPASS_ENV)) {
        diag(std::string("Password injection is on but $") + SSHPASS_ENV + " is not set");
    }
}

int SsmCli::run(const CliArgs& args) {
    StatusCallback diag = nullptr;
    if (args.dev) {
        diag = [this](const std::string& msg) { err_ << theme::log(msg); };
    }

    if (args.options.no_pubkey) {
        warn_deprecated_nopubkey();
    }

    HostResolver resolver(lookup_);
    auto target = resolver.resolve(args.host, settings_.domains, diag);
    if (target.is_err()) {
        err_ << theme::fail(target.failure.message());
        return 1;
    }
    if (diag) diag("Target: " + target.value);

    CommandBuilder builder(settings_, resolver);
    auto cmd = builder.build(args.options, target.value, diag);
    if (cmd.is_err()) {
        err_ << theme::fail(cmd.failure.message());
        return 1;
    }

    check_password_source(cmd.value, diag);

    if (args.dev) {
        out_ << theme::kv("command", format_command(cmd.value));
        return 0;
    }

    // ssh has already told the user what went wrong; just pass its status on
    return executor_(cmd.value);
}
