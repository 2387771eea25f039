#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <sys/socket.h>

#include "hb/options.hpp"

namespace hb
{
struct ResolvedAddress
{
    sockaddr_storage addr{};
    socklen_t        len{};
    int              family{};
};

struct ResolveResult
{
    int                          rc{};   // 0 if ok
    std::string                  error;  // valid if rc != 0
    std::vector<ResolvedAddress> addresses;
};

// Numeric IPv4/IPv6 literal to an address, no lookup. rc != 0 if not a literal
// or if the literal's family is excluded by the strategy.
ResolveResult resolve_literal(const std::string &host, uint16_t port,
                              DnsStrategy strategy);

// System resolver (getaddrinfo) restricted to the strategy's address family.
ResolveResult resolve_posix(const std::string &host, uint16_t port,
                            DnsStrategy strategy);

// Literal, then raw DNS against dns_server when set, else the system resolver.
ResolveResult resolve_host(const std::string &host, uint16_t port,
                           DnsStrategy strategy, const std::string &dns_server,
                           int timeout_ms);
} // namespace hb
