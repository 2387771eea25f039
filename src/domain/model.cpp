#include "hb/model.hpp"

namespace hb {

const char* failure_kind_str(FailureKind k)
{
    switch (k)
    {
        case FailureKind::Dns: return "dns";
        case FailureKind::Connect: return "connect";
        case FailureKind::Tls: return "tls";
        case FailureKind::Write: return "write";
        case FailureKind::Read: return "read";
        case FailureKind::Timeout: return "timeout";
        case FailureKind::MalformedResponse: return "malformed-response";
    }
    return "unknown";
}

} // namespace hb
