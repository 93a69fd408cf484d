#pragma once

#include <string>
#include <core/types.hpp>
#include "host_resolver.hpp"

// Assembles the argv for one ssh invocation:
//
//   [sshpass -e] ssh -p PORT [-vvv] -o StrictHostKeyChecking=no
//       [-o PubkeyAuthentication=no] [-J JUMP] [-D TUNNEL] TARGET [COMMAND]
//
// sshpass and -J never appear together, nor do -D and COMMAND.
class CommandBuilder {
public:
    CommandBuilder(const Settings& settings, const HostResolver& resolver);

    // Fails only when the jump host cannot be resolved.
    ResolveResult<CommandVector> build(const ConnectionOptions& options,
                                       const std::string& target,
                                       StatusCallback diag = nullptr) const;

    // The -J value: override if given, otherwise the configured jump host,
    // completed through the resolver. nullopt value when no jump is requested.
    ResolveResult<std::optional<std::string>> jump_host(const ConnectionOptions& options,
                                                        StatusCallback diag = nullptr) const;

private:
    const Settings& settings_;
    const HostResolver& resolver_;
};
