#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "hb/aggregate.hpp"
#include "hb/model.hpp"

namespace hb
{
// Percentiles reported in the final summary
extern const std::vector<int> kSummaryPercentiles;

struct PhaseStats
{
    double avg_ms{};
    double fastest_ms{};
    double slowest_ms{};
};

struct HistogramBucket
{
    double   upper_ms{};
    uint64_t count{};
};

struct Summary
{
    uint64_t total{};
    uint64_t successes{};
    uint64_t failures{};
    double   elapsed_s{};
    double   success_rate{};       // 0..1, 0 without outcomes
    double   requests_per_sec{};   // 0 for a zero-length run

    uint64_t              total_bytes{};
    std::optional<double> bytes_per_request;
    double                bytes_per_sec{};

    std::optional<Aggregation>   latency;    // over successful requests only
    std::vector<HistogramBucket> histogram;

    std::map<int, uint64_t>         status_codes;
    std::map<FailureKind, uint64_t> failures_by_kind;
    std::map<std::string, uint64_t> errors;   // "<kind>: <message>"

    std::optional<PhaseStats> lookup;    // DNS lookup
    std::optional<PhaseStats> dialup;    // DNS lookup + connect
};

// Full recomputation over every outcome; arrival order does not matter.
Summary compute_summary(const std::vector<Outcome> &outcomes, double elapsed_s);

std::vector<HistogramBucket> latency_histogram(const std::vector<double> &sorted_ms,
                                               size_t buckets);
} // namespace hb
