#include "hb/summary.hpp"

#include <algorithm>
#include <numeric>

namespace hb
{
const std::vector<int> kSummaryPercentiles = {10, 25, 50, 75, 90, 95, 99};

static std::optional<PhaseStats> phase_stats(const std::vector<double> &v)
{
    if (v.empty()) return std::nullopt;
    auto [lo, hi] = std::ranges::minmax_element(v);
    PhaseStats p{};
    p.fastest_ms = *lo;
    p.slowest_ms = *hi;
    p.avg_ms = std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
    return p;
}

std::vector<HistogramBucket> latency_histogram(const std::vector<double> &sorted_ms,
                                               size_t buckets)
{
    std::vector<HistogramBucket> out;
    if (sorted_ms.empty() || buckets == 0) return out;

    const double lo = sorted_ms.front();
    const double hi = sorted_ms.back();
    if (buckets == 1 || hi <= lo)
    {
        out.push_back({hi, sorted_ms.size()});
        return out;
    }

    // bucket i holds values in (upper[i-1], upper[i]]; the first one starts at lo
    const double step = (hi - lo) / static_cast<double>(buckets - 1);
    out.reserve(buckets);
    auto it = sorted_ms.begin();
    for (size_t i = 0; i < buckets; ++i)
    {
        const double upper = i + 1 == buckets ? hi : lo + step * static_cast<double>(i);
        auto end = std::upper_bound(it, sorted_ms.end(), upper);
        out.push_back({upper, static_cast<uint64_t>(end - it)});
        it = end;
    }
    return out;
}

Summary compute_summary(const std::vector<Outcome> &outcomes, double elapsed_s)
{
    Summary s{};
    s.total = outcomes.size();
    s.elapsed_s = elapsed_s;

    std::vector<double> latencies;
    std::vector<double> lookups;
    std::vector<double> dialups;
    latencies.reserve(outcomes.size());

    for (const auto &o: outcomes)
    {
        if (const Success *ok = o.success())
        {
            ++s.successes;
            s.total_bytes += ok->bytes;
            ++s.status_codes[ok->status];
            latencies.push_back(o.ms);
        }
        else if (const Failure *f = o.failure())
        {
            ++s.failures;
            ++s.failures_by_kind[f->kind];
            ++s.errors[std::string(failure_kind_str(f->kind)) + ": " + f->message];
        }
        if (o.phases.lookup_ms)
        {
            lookups.push_back(*o.phases.lookup_ms);
            if (o.phases.connect_ms)
                dialups.push_back(*o.phases.lookup_ms + *o.phases.connect_ms);
        }
    }

    if (s.total > 0)
        s.success_rate = static_cast<double>(s.successes) / static_cast<double>(s.total);
    if (elapsed_s > 0)
    {
        s.requests_per_sec = static_cast<double>(s.total) / elapsed_s;
        s.bytes_per_sec = static_cast<double>(s.total_bytes) / elapsed_s;
    }
    if (s.successes > 0)
        s.bytes_per_request = static_cast<double>(s.total_bytes) /
                              static_cast<double>(s.successes);

    if (!latencies.empty())
    {
        std::ranges::sort(latencies);
        s.latency = aggregate_times(latencies, kSummaryPercentiles);
        s.histogram = latency_histogram(latencies, 11);
    }
    s.lookup = phase_stats(lookups);
    s.dialup = phase_stats(dialups);
    return s;
}
} // namespace hb
