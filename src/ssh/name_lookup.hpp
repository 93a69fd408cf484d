#pragma once

#include <string>
#include <core/types.hpp>

// Asks the platform whether a host name resolves. The addresses themselves
// are never used, only success or failure (error text on failure).
class NameLookup {
public:
    virtual ~NameLookup() = default;
    virtual Result<void> lookup(const std::string& host) const = 0;
};

// getaddrinfo(3), no timeout beyond what the system resolver enforces.
class SystemNameLookup : public NameLookup {
public:
    Result<void> lookup(const std::string& host) const override;
};

// Accepts an IPv4 address ("10.0.0.5") or network ("10.0.0.0/24",
// "10.0.0.0/255.255.255.0", "10.0.0.0/0.0.0.255"). A network with host bits
// set is rejected.
// The error says why the text is not a literal.
Result<void> parse_ipv4_literal(const std::string& text);
