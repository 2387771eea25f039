#include "hb/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>

#include <openssl/evp.h>

namespace hb
{
namespace
{
bool iequals(std::string_view a, std::string_view b)
{
    return std::ranges::equal(a, b, [](unsigned char x, unsigned char y)
    {
        return std::tolower(x) == std::tolower(y);
    });
}

// RFC 9110 token characters
bool is_token(std::string_view s)
{
    if (s.empty()) return false;
    return std::ranges::all_of(s, [](unsigned char c)
    {
        return std::isalnum(c) || std::string_view("!#$%&'*+-.^_`|~").find(
                   static_cast<char>(c)) != std::string_view::npos;
    });
}

bool has_line_break(std::string_view s)
{
    return s.find_first_of("\r\n") != std::string_view::npos;
}

std::string read_file(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) throw ConfigError("cannot open body file: " + path);
    std::string data((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());
    if (in.bad()) throw ConfigError("cannot read body file: " + path);
    return data;
}

std::optional<HttpVersion> parse_http_version(const std::string &v)
{
    if (v.empty()) return std::nullopt;
    if (v == "1.0") return HttpVersion::Http10;
    if (v == "1.1") return HttpVersion::Http11;
    if (v == "0.9" || v == "2" || v == "2.0" || v == "3" || v == "3.0")
        throw ConfigError("unsupported HTTP version: " + v);
    throw ConfigError("unknown HTTP version: " + v);
}

std::chrono::nanoseconds to_nanos(double seconds)
{
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::duration<double>(seconds));
}
} // namespace

const char *http_version_str(HttpVersion v)
{
    switch (v)
    {
        case HttpVersion::Http10: return "HTTP/1.0";
        case HttpVersion::Http11: return "HTTP/1.1";
    }
    return "HTTP/1.1";
}

DnsStrategy dns_strategy_from(const Options &opt)
{
    if (opt.ipv4 && !opt.ipv6) return DnsStrategy::Ipv4Only;
    if (opt.ipv6 && !opt.ipv4) return DnsStrategy::Ipv6Only;
    return DnsStrategy::Ipv4AndIpv6;
}

void set_header(std::vector<Header> &headers, std::string name,
                std::string value)
{
    auto it = std::ranges::find_if(headers, [&](const Header &h)
    {
        return iequals(h.first, name);
    });
    if (it != headers.end()) it->second = std::move(value);
    else headers.emplace_back(std::move(name), std::move(value));
}

std::string base64_encode(std::string_view in)
{
    if (in.empty()) return {};
    std::string out(4 * ((in.size() + 2) / 3) + 1, '\0');
    const int n = EVP_EncodeBlock(
        reinterpret_cast<unsigned char *>(out.data()),
        reinterpret_cast<const unsigned char *>(in.data()),
        static_cast<int>(in.size()));
    out.resize(n > 0 ? static_cast<size_t>(n) : 0);
    return out;
}

std::string build_request_head(const ClientConfig &cfg)
{
    std::ostringstream os;
    os << cfg.method << ' ' << cfg.url.target << ' '
       << http_version_str(cfg.http_version.value_or(HttpVersion::Http11))
       << "\r\n";
    for (const auto &[name, value]: cfg.headers)
        os << name << ": " << value << "\r\n";
    os << "\r\n";
    return os.str();
}

std::shared_ptr<const ClientConfig> build_client_config(const Options &opt)
{
    auto cfg = std::make_shared<ClientConfig>();

    auto url = parse_url(opt.url);
    if (!url) throw ConfigError("invalid URL: " + opt.url);
    cfg->url = std::move(*url);

    if (!is_token(opt.method)) throw ConfigError("invalid method: " + opt.method);
    cfg->method = opt.method;

    cfg->http_version = parse_http_version(opt.http_version);

    if (opt.timeout_s)
    {
        if (*opt.timeout_s <= 0) throw ConfigError("timeout must be positive");
        cfg->timeout = to_nanos(*opt.timeout_s);
    }
    cfg->tcp_nodelay = opt.tcp_nodelay;
    cfg->disable_keepalive = opt.disable_keepalive;
    cfg->dns = dns_strategy_from(opt);
    cfg->dns_server = opt.dns_server;

    if (opt.body) cfg->body = std::make_shared<const std::string>(*opt.body);
    else if (opt.body_path)
        cfg->body = std::make_shared<const std::string>(read_file(*opt.body_path));

    auto &h = cfg->headers;
    set_header(h, "Accept", "*/*");
    if (!opt.disable_compression)
        set_header(h, "Accept-Encoding", "gzip, compress, deflate, br");
    set_header(h, "Host", cfg->url.authority());

    for (const auto &raw: opt.headers)
    {
        const auto sep = raw.find(':');
        if (sep == std::string::npos) throw ConfigError("invalid header: " + raw);
        std::string name = raw.substr(0, sep);
        const auto first = raw.find_first_not_of(" \t", sep + 1);
        std::string value = first == std::string::npos ? std::string() : raw.substr(first);
        if (!is_token(name) || has_line_break(value))
            throw ConfigError("invalid header: " + raw);
        set_header(h, std::move(name), std::move(value));
    }

    auto checked = [](const std::string &what, const std::string &value)
    {
        if (has_line_break(value)) throw ConfigError("invalid " + what + ": " + value);
        return value;
    };
    if (!opt.accept.empty()) set_header(h, "Accept", checked("accept header", opt.accept));
    if (!opt.content_type.empty())
        set_header(h, "Content-Type", checked("content type", opt.content_type));
    if (!opt.host.empty()) set_header(h, "Host", checked("host", opt.host));

    if (!opt.basic_auth.empty())
    {
        const auto colon = opt.basic_auth.find(':');
        if (colon == std::string::npos)
            throw ConfigError("basic auth must be user:password");
        set_header(h, "Authorization", "Basic " + base64_encode(opt.basic_auth));
    }

    if (cfg->disable_keepalive) set_header(h, "Connection", "close");
    else if (cfg->http_version == HttpVersion::Http10 &&
             std::ranges::none_of(h, [](const Header &x) { return iequals(x.first, "Connection"); }))
        set_header(h, "Connection", "keep-alive");

    if (cfg->body) set_header(h, "Content-Length", std::to_string(cfg->body->size()));

    cfg->request_head = build_request_head(*cfg);
    return cfg;
}
} // namespace hb
