#include "types.hpp"
#include <fmt/format.h>

std::string ResolutionFailure::message() const {
    if (subject == Subject::JumpHost) {
        return fmt::format("Failed to find valid FQDN for jumphost \"{}\"", attempted_host);
    }
    return fmt::format("Failed to find valid FQDN for \"{}\"", attempted_host);
}
