#include "hb/output.hpp"

#include <iomanip>
#include <sstream>

#include "hb/json.hpp"
#include "hb/summary.hpp"

namespace hb
{
namespace
{
void phase_json(std::ostringstream &os, const char *key, const std::optional<PhaseStats> &p)
{
    os << '"' << key << "\":";
    if (!p)
    {
        os << "null";
        return;
    }
    os << R"({"average_s":)" << p->avg_ms / 1000.0
            << R"(,"fastest_s":)" << p->fastest_ms / 1000.0
            << R"(,"slowest_s":)" << p->slowest_ms / 1000.0 << "}";
}
} // namespace

// Times are in seconds, like the text summary
std::string build_summary_json(const Summary &s)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(6);
    os << "{";
    os << R"("summary":{)"
            << R"("success_rate":)" << s.success_rate
            << R"(,"total_s":)" << s.elapsed_s;
    if (s.latency)
    {
        os << R"(,"slowest_s":)" << s.latency->max / 1000.0
                << R"(,"fastest_s":)" << s.latency->min / 1000.0
                << R"(,"average_s":)" << s.latency->avg / 1000.0;
    }
    else
    {
        os << R"(,"slowest_s":null,"fastest_s":null,"average_s":null)";
    }
    os << R"(,"requests_per_sec":)" << s.requests_per_sec
            << R"(,"total_data":)" << s.total_bytes
            << R"(,"size_per_request":)";
    if (s.bytes_per_request) os << *s.bytes_per_request;
    else os << "null";
    os << R"(,"size_per_sec":)" << s.bytes_per_sec
            << R"(,"requests":)" << s.total
            << R"(,"successes":)" << s.successes
            << R"(,"failures":)" << s.failures << "},";

    os << R"("histogram":{)";
    for (size_t i = 0; i < s.histogram.size(); ++i)
    {
        if (i) os << ",";
        os << '"' << s.histogram[i].upper_ms / 1000.0 << "\":" << s.histogram[i].count;
    }
    os << "},";

    os << R"("latency_percentiles":{)";
    if (s.latency)
    {
        for (size_t i = 0; i < s.latency->percentiles.size(); ++i)
        {
            const auto &[p, v] = s.latency->percentiles[i];
            if (i) os << ",";
            os << R"("p)" << p << R"(":)" << v / 1000.0;
        }
    }
    os << "},";

    os << R"("status_codes":{)";
    bool first = true;
    for (const auto &[code, n]: s.status_codes)
    {
        if (!first) os << ",";
        first = false;
        os << '"' << code << "\":" << n;
    }
    os << "},";

    os << R"("errors":{)";
    first = true;
    for (const auto &[msg, n]: s.errors)
    {
        if (!first) os << ",";
        first = false;
        os << json_quote(msg) << ":" << n;
    }
    os << "},";

    os << R"("details":{)";
    phase_json(os, "dns_dialup", s.dialup);
    os << ",";
    phase_json(os, "dns_lookup", s.lookup);
    os << "}";

    os << "}";
    return os.str();
}
} // namespace hb
