#include "name_lookup.hpp"
#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <cstdint>
#include <fmt/format.h>

Result<void> SystemNameLookup::lookup(const std::string& host) const {
    struct addrinfo hints = {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    int rc = getaddrinfo(host.c_str(), nullptr, &hints, &res);
    if (res) freeaddrinfo(res);

    if (rc != 0) {
        return Result<void>::Err(gai_strerror(rc));
    }
    return Result<void>::Ok();
}

// Host-order value of a dotted quad, or nullopt.
static std::optional<uint32_t> parse_dotted_quad(const std::string& text) {
    struct in_addr addr;
    if (inet_pton(AF_INET, text.c_str(), &addr) != 1) {
        return std::nullopt;
    }
    return ntohl(addr.s_addr);
}

static Result<uint32_t> parse_mask(const std::string& text) {
    if (text.empty()) {
        return Result<uint32_t>::Err("empty prefix length");
    }

    if (text.find('.') != std::string::npos) {
        auto mask = parse_dotted_quad(text);
        if (!mask) {
            return Result<uint32_t>::Err(fmt::format("invalid netmask '{}'", text));
        }
        // Netmask: contiguous ones then zeros, so ~mask + 1 is a power of two (or zero)
        uint32_t inverted = ~*mask;
        if ((inverted & (inverted + 1)) == 0) {
            return Result<uint32_t>::Ok(*mask);
        }
        // Hostmask: contiguous zeros then ones, e.g. 0.0.0.255 for a /24
        if ((*mask & (*mask + 1)) == 0) {
            return Result<uint32_t>::Ok(inverted);
        }
        return Result<uint32_t>::Err(fmt::format("invalid netmask '{}'", text));
    }

    if (text.size() > 2 || text.find_first_not_of("0123456789") != std::string::npos) {
        return Result<uint32_t>::Err(fmt::format("invalid prefix length '{}'", text));
    }
    int bits = std::stoi(text);
    if (bits > 32) {
        return Result<uint32_t>::Err(fmt::format("invalid prefix length '{}'", text));
    }
    uint32_t mask = bits == 0 ? 0u : ~uint32_t(0) << (32 - bits);
    return Result<uint32_t>::Ok(mask);
}

Result<void> parse_ipv4_literal(const std::string& text) {
    auto slash = text.find('/');
    std::string address = text.substr(0, slash);

    auto value = parse_dotted_quad(address);
    if (!value) {
        return Result<void>::Err(fmt::format("'{}' is not an IPv4 address", address));
    }
    if (slash == std::string::npos) {
        return Result<void>::Ok();
    }

    std::string mask_text = text.substr(slash + 1);
    if (mask_text.find('/') != std::string::npos) {
        return Result<void>::Err(fmt::format("'{}' has more than one '/'", text));
    }

    auto mask = parse_mask(mask_text);
    if (mask.is_err()) {
        return Result<void>::Err(mask.error);
    }
    if ((*value & ~mask.value) != 0) {
        return Result<void>::Err(fmt::format("'{}' has host bits set", text));
    }
    return Result<void>::Ok();
}
