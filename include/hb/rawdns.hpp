#pragma once

#include <string>
#include <vector>

#include "hb/options.hpp"

namespace hb {

enum class RawDnsErrorKind {
    None = 0,
    NotAvailable,
    InitFailed,
    InvalidQname,
    QueryFailed,
    NoAnswer,
};

struct RawDnsResult {
    int rc{};                 // 0 on success, -1 on error
    std::string error;        // error message when rc != 0
    RawDnsErrorKind kind{RawDnsErrorKind::None};
    std::vector<std::string> addresses; // textual A/AAAA rdata, v4 first
};

// A and/or AAAA lookup of host against nameserver ns using ldns.
// When ldns is not available at build time, returns rc = -1 and kind = NotAvailable.
RawDnsResult resolve_rawdns(const std::string& host,
                            const std::string& ns,
                            DnsStrategy strategy,
                            int timeout_ms);

} // namespace hb
