#include "hb/url.hpp"

#include <algorithm>
#include <cctype>

#include <http_parser.h>

namespace hb
{
namespace
{
bool has_field(const http_parser_url &u, http_parser_url_fields f)
{
    return (u.field_set & (1u << f)) != 0;
}

std::string_view field(std::string_view text, const http_parser_url &u,
                       http_parser_url_fields f)
{
    return text.substr(u.field_data[f].off, u.field_data[f].len);
}
} // namespace

std::string Url::authority() const
{
    const bool v6 = host.find(':') != std::string::npos;
    std::string out = v6 ? "[" + host + "]" : host;
    const uint16_t default_port = is_tls() ? 443 : 80;
    if (port != default_port) out += ":" + std::to_string(port);
    return out;
}

std::optional<Url> parse_url(std::string_view text)
{
    http_parser_url u;
    http_parser_url_init(&u);
    if (text.empty() ||
        http_parser_parse_url(text.data(), text.size(), 0, &u) != 0 ||
        !has_field(u, UF_SCHEMA) || !has_field(u, UF_HOST))
        return std::nullopt;

    Url url{};
    url.scheme = std::string(field(text, u, UF_SCHEMA));
    std::ranges::transform(url.scheme, url.scheme.begin(),
                           [](unsigned char c) { return std::tolower(c); });
    if (url.scheme == "http") url.port = 80;
    else if (url.scheme == "https") url.port = 443;
    else return std::nullopt;

    // brackets of an IPv6 literal are not part of UF_HOST
    url.host = std::string(field(text, u, UF_HOST));
    if (url.host.empty()) return std::nullopt;

    if (has_field(u, UF_PORT))
    {
        if (u.port == 0) return std::nullopt;
        url.port = u.port;
    }

    // userinfo is not sent anywhere (basic auth goes through -a), nor is the fragment
    url.target = has_field(u, UF_PATH) ? std::string(field(text, u, UF_PATH)) : "/";
    if (has_field(u, UF_QUERY))
    {
        url.target += '?';
        url.target += field(text, u, UF_QUERY);
    }
    return url;
}
} // namespace hb
