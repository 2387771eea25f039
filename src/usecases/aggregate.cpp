#include "hb/aggregate.hpp"

#include <algorithm>
#include <chrono>
#include <numeric>

namespace hb {

Aggregation aggregate_times(const std::vector<double>& times, const std::vector<int>& pctl)
{
    Aggregation ag{};
    if (times.empty()) return ag;

    std::vector<double> sorted = times;
    std::ranges::sort(sorted);
    ag.min = sorted.front();
    ag.max = sorted.back();
    ag.avg = std::accumulate(sorted.begin(), sorted.end(), 0.0) /
             static_cast<double>(sorted.size());

    auto pct_value = [&](int p) -> double
    {
        size_t n  = sorted.size();
        int    pc = std::clamp(p, 0, 100);
        size_t rank = (static_cast<size_t>(pc) * n + 100 - 1) / 100; // ceil
        if (rank < 1) rank = 1;
        if (rank > n) rank = n;
        return sorted[rank - 1];
    };

    ag.percentiles.reserve(pctl.size());
    for (int p : pctl) ag.percentiles.emplace_back(p, pct_value(p));
    return ag;
}

void RunningAggregate::add(const Outcome& o, Clock::time_point at)
{
    if (const Success* s = o.success())
    {
        if (successes_ == 0 || o.ms < min_ms_) min_ms_ = o.ms;
        if (successes_ == 0 || o.ms > max_ms_) max_ms_ = o.ms;
        ++successes_;
        sum_ms_ += o.ms;
        bytes_ += s->bytes;
        ++status_[s->status];
    }
    else if (const Failure* f = o.failure())
    {
        ++failures_;
        ++errors_[std::string(failure_kind_str(f->kind)) + ": " + f->message];
    }
    recent_.push_back(at);
    while (recent_.front() < at - std::chrono::seconds(1)) recent_.pop_front();
}

std::optional<double> RunningAggregate::min_ms() const
{
    if (successes_ == 0) return std::nullopt;
    return min_ms_;
}

std::optional<double> RunningAggregate::max_ms() const
{
    if (successes_ == 0) return std::nullopt;
    return max_ms_;
}

std::optional<double> RunningAggregate::avg_ms() const
{
    if (successes_ == 0) return std::nullopt;
    return sum_ms_ / static_cast<double>(successes_);
}

double RunningAggregate::recent_rps(Clock::time_point now)
{
    const auto window_start = now - std::chrono::seconds(1);
    while (!recent_.empty() && recent_.front() < window_start) recent_.pop_front();
    return static_cast<double>(recent_.size());
}

} // namespace hb
