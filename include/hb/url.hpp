#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace hb
{
struct Url
{
    std::string scheme;  // "http" or "https"
    std::string host;    // without IPv6 brackets
    uint16_t    port{};
    std::string target;  // path + query, at least "/"

    bool is_tls() const { return scheme == "https"; }
    // host[:port] as it belongs in a Host header
    std::string authority() const;
};

// Returns nullopt for anything that is not an absolute http(s) URL.
std::optional<Url> parse_url(std::string_view text);
} // namespace hb
