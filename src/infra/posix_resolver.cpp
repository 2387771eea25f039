#include "hb/resolver.hpp"

#include <algorithm>
#include <cstring>
#include <string>
#include <vector>

// POSIX networking
#include <netdb.h>
#include <arpa/inet.h>
#include <sys/socket.h>

#include "hb/rawdns.hpp"

namespace hb
{
static int strategy_to_af(const DnsStrategy s)
{
    switch (s)
    {
        case DnsStrategy::Ipv4Only: return AF_INET;
        case DnsStrategy::Ipv6Only: return AF_INET6;
        default: return AF_UNSPEC;
    }
}

static bool family_allowed(int af, DnsStrategy s)
{
    const int want = strategy_to_af(s);
    return want == AF_UNSPEC || want == af;
}

static bool to_address(const std::string &ip, uint16_t port, ResolvedAddress &out)
{
    out = ResolvedAddress{};
    sockaddr_in sin{};
    if (inet_pton(AF_INET, ip.c_str(), &sin.sin_addr) == 1)
    {
        sin.sin_family = AF_INET;
        sin.sin_port = htons(port);
        std::memcpy(&out.addr, &sin, sizeof(sin));
        out.len = sizeof(sin);
        out.family = AF_INET;
        return true;
    }
    sockaddr_in6 sin6{};
    if (inet_pton(AF_INET6, ip.c_str(), &sin6.sin6_addr) == 1)
    {
        sin6.sin6_family = AF_INET6;
        sin6.sin6_port = htons(port);
        std::memcpy(&out.addr, &sin6, sizeof(sin6));
        out.len = sizeof(sin6);
        out.family = AF_INET6;
        return true;
    }
    return false;
}

static std::vector<ResolvedAddress> collect_addresses(const addrinfo *res)
{
    std::vector<ResolvedAddress> out;
    for (const addrinfo *ai = res; ai != nullptr; ai = ai->ai_next)
    {
        if (ai->ai_family != AF_INET && ai->ai_family != AF_INET6) continue;
        if (ai->ai_addrlen > sizeof(sockaddr_storage)) continue;
        ResolvedAddress a{};
        std::memcpy(&a.addr, ai->ai_addr, ai->ai_addrlen);
        a.len = static_cast<socklen_t>(ai->ai_addrlen);
        a.family = ai->ai_family;
        // getaddrinfo may list an address once per socktype
        const bool dup = std::ranges::any_of(out, [&](const ResolvedAddress &o)
        {
            return o.len == a.len && std::memcmp(&o.addr, &a.addr, a.len) == 0;
        });
        if (!dup) out.push_back(a);
    }
    return out;
}

ResolveResult resolve_literal(const std::string &host, uint16_t port,
                              DnsStrategy strategy)
{
    ResolveResult result{};
    ResolvedAddress a{};
    if (!to_address(host, port, a))
    {
        result.rc = EAI_NONAME;
        result.error = "not an IP literal";
        return result;
    }
    if (!family_allowed(a.family, strategy))
    {
        result.rc = EAI_FAMILY;
        result.error = "address family excluded by lookup strategy";
        return result;
    }
    result.addresses.push_back(a);
    return result;
}

ResolveResult resolve_posix(const std::string &host, uint16_t port,
                            DnsStrategy strategy)
{
    ResolveResult result{};

    addrinfo hints{};
    hints.ai_family = strategy_to_af(strategy);
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;
    hints.ai_flags = AI_ADDRCONFIG | AI_NUMERICSERV;

    addrinfo *res = nullptr;
    const std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    result.rc = rc;

    if (rc != 0)
    {
        result.error = gai_strerror(rc);
        if (res) freeaddrinfo(res);
        return result;
    }

    result.addresses = collect_addresses(res);
    if (res) freeaddrinfo(res);
    if (result.addresses.empty())
    {
        result.rc = EAI_NONAME;
        result.error = "no usable address";
    }
    return result;
}

ResolveResult resolve_host(const std::string &host, uint16_t port,
                           DnsStrategy strategy, const std::string &dns_server,
                           int timeout_ms)
{
    ResolvedAddress literal{};
    if (to_address(host, port, literal)) return resolve_literal(host, port, strategy);

    if (dns_server.empty()) return resolve_posix(host, port, strategy);

    RawDnsResult rd = resolve_rawdns(host, dns_server, strategy, timeout_ms);
    ResolveResult result{};
    if (rd.rc != 0)
    {
        result.rc = rd.rc;
        result.error = rd.error;
        return result;
    }
    for (const auto &ip: rd.addresses)
    {
        ResolvedAddress a{};
        if (to_address(ip, port, a) && family_allowed(a.family, strategy))
            result.addresses.push_back(a);
    }
    if (result.addresses.empty())
    {
        result.rc = -1;
        result.error = "no usable address";
    }
    return result;
}
} // namespace hb
