#include "command_builder.hpp"
#include <core/constants.hpp>
#include <algorithm>

// ── Assembly steps, in argv order ────────────────────────────

static void append(CommandVector& cmd, std::initializer_list<std::string> args) {
    cmd.insert(cmd.end(), args.begin(), args.end());
}

static void add_password_injection(CommandVector& cmd, const Settings& settings,
                                   bool jumping, const std::string& target) {
    // sshpass can't answer the jump host's prompts, and an explicit user
    // probably isn't the one the stored password belongs to.
    if (jumping || !settings.sshpass || has_user(target)) return;
    append(cmd, {SSHPASS_PROGRAM, "-e"});
}

static void add_program_and_port(CommandVector& cmd, const ConnectionOptions& options,
                                 const Settings& settings) {
    append(cmd, {SSH_PROGRAM, "-p", options.port.value_or(settings.ssh_port)});
}

static void add_verbosity(CommandVector& cmd, int requested) {
    if (requested <= 0) return;
    int count = std::min(requested, MAX_VERBOSITY);
    cmd.push_back("-" + std::string(count, 'v'));
}

static void add_auth_options(CommandVector& cmd, const ConnectionOptions& options) {
    append(cmd, {"-o", SSH_OPT_NO_HOST_KEY_CHECK});
    if (options.no_pubkey) {
        append(cmd, {"-o", SSH_OPT_NO_PUBKEY});
    }
}

static void add_jump(CommandVector& cmd, const std::optional<std::string>& jump) {
    if (jump) append(cmd, {"-J", *jump});
}

static void add_tunnel(CommandVector& cmd, const ConnectionOptions& options,
                       const Settings& settings) {
    // A remote command exits straight away; a tunnel would die with it
    if (!options.tunnel || options.command) return;
    append(cmd, {"-D", settings.tunnel_port});
}

// ── CommandBuilder ───────────────────────────────────────────

CommandBuilder::CommandBuilder(const Settings& settings, const HostResolver& resolver)
    : settings_(settings), resolver_(resolver) {}

ResolveResult<std::optional<std::string>>
CommandBuilder::jump_host(const ConnectionOptions& options, StatusCallback diag) const {
    using R = ResolveResult<std::optional<std::string>>;

    if (!options.jump && !options.jump_host) {
        return R::Ok(std::nullopt);
    }

    const std::string& raw = options.jump_host ? *options.jump_host : settings_.jump_host;
    auto resolved = resolver_.resolve(raw, settings_.domains, diag);
    if (resolved.is_err()) {
        ResolutionFailure failure = resolved.failure;
        failure.subject = ResolutionFailure::Subject::JumpHost;
        return R::Err(failure);
    }
    return R::Ok(resolved.value);
}

ResolveResult<CommandVector> CommandBuilder::build(const ConnectionOptions& options,
                                                   const std::string& target,
                                                   StatusCallback diag) const {
    auto jump = jump_host(options, diag);
    if (jump.is_err()) {
        return ResolveResult<CommandVector>::Err(jump.failure);
    }

    CommandVector cmd;
    add_password_injection(cmd, settings_, jump.value.has_value(), target);
    add_program_and_port(cmd, options, settings_);
    add_verbosity(cmd, options.verbosity);
    add_auth_options(cmd, options);
    add_jump(cmd, jump.value);
    add_tunnel(cmd, options, settings_);
    cmd.push_back(target);
    if (options.command) {
        cmd.push_back(*options.command);
    }
    return ResolveResult<CommandVector>::Ok(cmd);
}
