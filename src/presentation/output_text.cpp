#include "hb/output.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <utility>

#include "hb/aggregate.hpp"
#include "hb/monitor.hpp"
#include "hb/summary.hpp"

namespace hb
{
namespace
{
std::string secs(double ms)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(4) << ms / 1000.0 << " secs";
    return os.str();
}

std::string human_bytes(double bytes)
{
    static const char *kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    size_t u = 0;
    while (bytes >= 1024.0 && u + 1 < std::size(kUnits))
    {
        bytes /= 1024.0;
        ++u;
    }
    std::ostringstream os;
    os << std::fixed << std::setprecision(u == 0 ? 0 : 2) << bytes << ' ' << kUnits[u];
    return os.str();
}

// Most frequent first, ties by text
std::vector<std::pair<std::string, uint64_t>> by_count(
    const std::map<std::string, uint64_t> &m)
{
    std::vector<std::pair<std::string, uint64_t>> v(m.begin(), m.end());
    std::ranges::stable_sort(v, [](const auto &a, const auto &b) { return a.second > b.second; });
    return v;
}
} // namespace

std::string progress_bar(double ratio, int width)
{
    if (width <= 0) return {};
    ratio = std::clamp(ratio, 0.0, 1.0);
    const int filled = static_cast<int>(std::floor(ratio * width));
    std::string bar;
    bar.reserve(static_cast<size_t>(width) + 2);
    bar += '[';
    bar.append(static_cast<size_t>(filled), '#');
    bar.append(static_cast<size_t>(width - filled), '.');
    bar += ']';
    return bar;
}

std::string format_summary_text(const Summary &s)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(4);

    os << "Summary:\n";
    os << "  Success rate:\t" << std::setprecision(2) << s.success_rate * 100.0 << "%\n";
    os << std::setprecision(4);
    os << "  Total:\t" << s.elapsed_s << " secs\n";
    if (s.latency)
    {
        os << "  Slowest:\t" << secs(s.latency->max) << '\n';
        os << "  Fastest:\t" << secs(s.latency->min) << '\n';
        os << "  Average:\t" << secs(s.latency->avg) << '\n';
    }
    else
    {
        os << "  Slowest:\tn/a\n";
        os << "  Fastest:\tn/a\n";
        os << "  Average:\tn/a\n";
    }
    os << "  Requests/sec:\t" << s.requests_per_sec << '\n';
    os << '\n';
    os << "  Total data:\t" << human_bytes(static_cast<double>(s.total_bytes)) << '\n';
    os << "  Size/request:\t"
       << (s.bytes_per_request ? human_bytes(*s.bytes_per_request) : std::string("n/a")) << '\n';
    os << "  Size/sec:\t" << human_bytes(s.bytes_per_sec) << '\n';

    if (!s.histogram.empty())
    {
        os << "\nResponse time histogram:\n";
        uint64_t peak = 0;
        for (const auto &b: s.histogram) peak = std::max(peak, b.count);
        for (const auto &b: s.histogram)
        {
            const size_t bar = peak ? static_cast<size_t>(b.count * 40 / peak) : 0;
            os << "  " << std::setprecision(3) << b.upper_ms / 1000.0
               << " [" << b.count << "]\t|";
            for (size_t i = 0; i < bar; ++i) os << "■";
            os << '\n';
        }
        os << std::setprecision(4);
    }

    if (s.latency && !s.latency->percentiles.empty())
    {
        os << "\nLatency distribution:\n";
        for (const auto &[p, v]: s.latency->percentiles)
            os << "  " << p << "% in " << secs(v) << '\n';
    }

    if (s.lookup || s.dialup)
    {
        os << "\nDetails (average, fastest, slowest):\n";
        if (s.dialup)
            os << "  DNS+dialup:\t" << secs(s.dialup->avg_ms) << ", "
               << secs(s.dialup->fastest_ms) << ", " << secs(s.dialup->slowest_ms) << '\n';
        if (s.lookup)
            os << "  DNS-lookup:\t" << secs(s.lookup->avg_ms) << ", "
               << secs(s.lookup->fastest_ms) << ", " << secs(s.lookup->slowest_ms) << '\n';
    }

    if (!s.status_codes.empty())
    {
        os << "\nStatus code distribution:\n";
        std::vector<std::pair<int, uint64_t>> codes(s.status_codes.begin(), s.status_codes.end());
        std::ranges::stable_sort(codes, [](const auto &a, const auto &b) { return a.second > b.second; });
        for (const auto &[code, n]: codes)
            os << "  [" << code << "] " << n << " responses\n";
    }

    if (!s.errors.empty())
    {
        os << "\nError distribution:\n";
        for (const auto &[msg, n]: by_count(s.errors))
            os << "  [" << n << "] " << msg << '\n';
    }
    return os.str();
}

void print_summary(std::ostream &out,
                   const std::vector<Outcome> &outcomes,
                   double elapsed_s,
                   bool json)
{
    const Summary s = compute_summary(outcomes, elapsed_s);
    if (json) out << build_summary_json(s) << '\n';
    else out << format_summary_text(s);
    out.flush();
}

std::string format_live_frame(RunningAggregate &agg,
                              const EndLine &end_line,
                              double elapsed_s,
                              Clock::time_point now)
{
    const uint64_t done = agg.total();
    double ratio = 0.0;
    std::optional<double> eta_s;
    if (end_line.requests && *end_line.requests > 0)
    {
        const auto target = static_cast<double>(*end_line.requests);
        ratio = static_cast<double>(done) / target;
        if (done > 0) eta_s = elapsed_s * (target - static_cast<double>(done)) /
                              static_cast<double>(done);
    }
    if (end_line.duration_s && *end_line.duration_s > 0)
    {
        ratio = std::max(ratio, elapsed_s / *end_line.duration_s);
        const double left = *end_line.duration_s - elapsed_s;
        eta_s = eta_s ? std::min(*eta_s, left) : left;
    }
    ratio = std::clamp(ratio, 0.0, 1.0);

    std::ostringstream os;
    os << std::fixed << std::setprecision(1);
    os << "hbarrage  elapsed " << elapsed_s << "s  ETA ";
    if (eta_s) os << std::max(0.0, *eta_s) << "s\n";
    else os << "-\n";

    os << "Progress " << progress_bar(ratio, 40) << ' ' << ratio * 100.0 << "%  " << done;
    if (end_line.requests) os << " / " << *end_line.requests;
    os << '\n';
    os << "Requests/sec (last 1s): " << std::setprecision(0) << agg.recent_rps(now) << '\n';
    os << "Success: " << agg.successes() << "  Failure: " << agg.failures()
       << "  Data: " << human_bytes(static_cast<double>(agg.bytes())) << '\n';

    os << std::setprecision(3);
    if (auto mn = agg.min_ms())
        os << "Latency ms: min " << *mn << "  avg " << *agg.avg_ms()
           << "  max " << *agg.max_ms() << '\n';
    else
        os << "Latency ms: -\n";

    if (!agg.status_counts().empty())
    {
        os << "\nStatus codes:\n";
        for (const auto &[code, n]: agg.status_counts())
            os << "  [" << code << "] " << n << '\n';
    }
    if (!agg.error_counts().empty())
    {
        os << "\nErrors:\n";
        size_t shown = 0;
        for (const auto &[msg, n]: by_count(agg.error_counts()))
        {
            if (++shown > 8) break;
            os << "  [" << n << "] " << msg << '\n';
        }
    }
    return os.str();
}
} // namespace hb
