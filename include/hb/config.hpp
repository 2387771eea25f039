#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "hb/options.hpp"
#include "hb/url.hpp"

namespace hb
{
class ConfigError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

enum class HttpVersion { Http10, Http11 };

using Header = std::pair<std::string, std::string>;

// Request template shared read-only by every worker.
struct ClientConfig
{
    Url url;
    std::string method = "GET";
    std::vector<Header> headers;
    std::shared_ptr<const std::string> body;          // nullptr = no body
    std::optional<HttpVersion> http_version;          // nullopt = HTTP/1.1
    std::optional<std::chrono::nanoseconds> timeout;  // measured from dispatch
    bool tcp_nodelay = false;
    bool disable_keepalive = false;
    DnsStrategy dns = DnsStrategy::Ipv4AndIpv6;
    std::string dns_server;                           // ldns lookups when set

    // Serialized request line and headers, terminated by an empty line.
    std::string request_head;
};

const char *http_version_str(HttpVersion v);

// Sets or replaces a header, comparing names case-insensitively.
void set_header(std::vector<Header> &headers, std::string name,
                std::string value);

std::string base64_encode(std::string_view in);

// Renders request_head from the other fields.
std::string build_request_head(const ClientConfig &cfg);

// Assembles the immutable request template from command line options.
// Throws ConfigError on anything that must stop the run before dispatch.
std::shared_ptr<const ClientConfig> build_client_config(const Options &opt);
} // namespace hb
