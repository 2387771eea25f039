#pragma once

#include <optional>
#include <string>
#include <vector>

namespace hb
{
enum class DnsStrategy { Ipv4AndIpv6, Ipv4Only, Ipv6Only };

struct Options
{
    std::string url;
    // run parameters
    int n_requests = 200;
    bool n_requests_set = false;          // -n given explicitly
    int n_workers = 50;
    std::optional<double> duration_s;     // -z, run until deadline
    std::optional<double> qps;            // -q, global rate limit
    bool no_tui = false;
    int fps = 16;
    // request template
    std::string method = "GET";
    std::vector<std::string> headers;     // raw "name: value"
    std::optional<double> timeout_s;      // per-request timeout
    std::string accept;                   // -A
    std::optional<std::string> body;      // -d
    std::optional<std::string> body_path; // -D
    std::string content_type;             // -T
    std::string basic_auth;               // user:password
    std::string http_version;             // empty = protocol default
    std::string host;                     // Host header override
    bool disable_compression = false;
    // connection
    bool tcp_nodelay = false;
    bool disable_keepalive = false;
    bool ipv4 = false;
    bool ipv6 = false;
    std::string dns_server;               // raw DNS (ldns) when non-empty
    // output
    bool json = false;
    std::string log_level;                // empty = SPDLOG_LEVEL / warn
};

// --ipv4 / --ipv6 combination to a lookup strategy
DnsStrategy dns_strategy_from(const Options &opt);
} // namespace hb
