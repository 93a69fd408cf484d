#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include "name_lookup.hpp"

// Turns what the user typed ("db1", "root@db1", "10.0.0.5", "web.example.com")
// into the literal target handed to ssh.
//
// Probes, first success wins:
//   1. IPv4 address/network literal       -> token unchanged, no lookup
//   2. host contains '.', resolves as is  -> token unchanged
//   3. host + "." + domain, in list order -> token + "." + domain
//
// An optional user@ prefix (up to the last '@') is kept on the result.
// At most 2 + domains.size() probes, none of them retried.
class HostResolver {
public:
    explicit HostResolver(const NameLookup& lookup);

    ResolveResult<std::string> resolve(const std::string& raw_token,
                                       const std::vector<std::string>& domains,
                                       StatusCallback diag = nullptr) const;

private:
    const NameLookup& lookup_;

    bool probe(const std::string& candidate, const StatusCallback& diag) const;
};

// Host part of a [user@]host token.
std::string strip_user(const std::string& raw_token);

// True if the token names a user explicitly ("user@host").
bool has_user(const std::string& raw_token);
