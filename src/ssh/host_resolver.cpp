#include "host_resolver.hpp"
#include <util/string_utils.hpp>
#include <fmt/format.h>

std::string strip_user(const std::string& raw_token) {
    auto at = raw_token.rfind('@');
    return at == std::string::npos ? raw_token : raw_token.substr(at + 1);
}

bool has_user(const std::string& raw_token) {
    return StringUtils::contains(raw_token, '@');
}

HostResolver::HostResolver(const NameLookup& lookup)
    : lookup_(lookup) {}

bool HostResolver::probe(const std::string& candidate, const StatusCallback& diag) const {
    auto result = lookup_.lookup(candidate);
    if (result.is_err() && diag) {
        diag(fmt::format("Lookup for {} failed: {}", candidate, result.error));
    }
    return result.is_ok();
}

ResolveResult<std::string> HostResolver::resolve(const std::string& raw_token,
                                                 const std::vector<std::string>& domains,
                                                 StatusCallback diag) const {
    std::string host = strip_user(raw_token);
    ResolutionFailure failure{ResolutionFailure::Subject::Target, host};

    // "user@" alone; every candidate would be ".domain"
    if (host.empty()) {
        if (diag) diag("Empty host name");
        return ResolveResult<std::string>::Err(failure);
    }

    auto literal = parse_ipv4_literal(host);
    if (literal.is_ok()) {
        return ResolveResult<std::string>::Ok(raw_token);
    }
    if (diag) diag("Not an IPv4 literal: " + literal.error);

    // A bare label is almost certainly a short name. Asking public DNS about
    // it is slow and the answer is no, so go straight to the suffixes.
    if (StringUtils::contains(host, '.')) {
        if (probe(host, diag)) {
            return ResolveResult<std::string>::Ok(raw_token);
        }
    }

    for (const auto& domain : domains) {
        if (probe(host + "." + domain, diag)) {
            return ResolveResult<std::string>::Ok(raw_token + "." + domain);
        }
    }

    return ResolveResult<std::string>::Err(failure);
}
