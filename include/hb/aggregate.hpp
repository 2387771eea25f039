#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "hb/model.hpp"

namespace hb {

struct Aggregation {
    double min{};
    double avg{};
    double max{};
    std::vector<std::pair<int,double>> percentiles; // (p, value)
};

// Statistics of times with nearest-rank percentiles for pctl (0..100).
// Empty input gives zeros and no percentiles.
Aggregation aggregate_times(const std::vector<double>& times, const std::vector<int>& pctl);

// Live counters folded from the outcome stream while the run is going.
class RunningAggregate {
public:
    void add(const Outcome& o, Clock::time_point at);

    uint64_t total() const { return successes_ + failures_; }
    uint64_t successes() const { return successes_; }
    uint64_t failures() const { return failures_; }
    uint64_t bytes() const { return bytes_; }

    std::optional<double> min_ms() const;
    std::optional<double> max_ms() const;
    std::optional<double> avg_ms() const;

    const std::map<int, uint64_t>& status_counts() const { return status_; }
    const std::map<std::string, uint64_t>& error_counts() const { return errors_; }

    // Completions within the second before now
    double recent_rps(Clock::time_point now);

private:
    uint64_t successes_{};
    uint64_t failures_{};
    uint64_t bytes_{};
    double   sum_ms_{};
    double   min_ms_{};
    double   max_ms_{};
    std::map<int, uint64_t> status_;
    std::map<std::string, uint64_t> errors_;
    std::deque<Clock::time_point> recent_;
};

} // namespace hb
