#include <chrono>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

#include "hb/aggregate.hpp"

using namespace hb;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

static bool approx(double a, double b, double eps = 1e-9)
{
    return std::fabs(a - b) <= eps;
}

static double get_pct_value(const std::vector<std::pair<int,double>>& v, int p)
{
    for (const auto& kv : v)
    {
        if (kv.first == p) return kv.second;
    }
    return std::numeric_limits<double>::quiet_NaN();
}

static Outcome ok_outcome(double ms, int status = 200, uint64_t bytes = 100)
{
    Outcome o;
    o.ms = ms;
    o.result = Success{status, bytes};
    return o;
}

static Outcome failed_outcome(FailureKind kind, std::string msg)
{
    Outcome o;
    o.ms = 1.0;
    o.result = Failure{kind, std::move(msg)};
    return o;
}

static void test_empty()
{
    std::vector<double> t{};
    Aggregation ag = aggregate_times(t, {50, 99});
    assert_true(approx(ag.min, 0.0) && approx(ag.avg, 0.0) && approx(ag.max, 0.0), "empty min/avg/max");
    assert_true(ag.percentiles.empty(), "empty percentiles empty");
}

static void test_singleton()
{
    Aggregation ag = aggregate_times({10.0}, {0, 50, 100});
    assert_true(approx(ag.min, 10.0) && approx(ag.avg, 10.0) && approx(ag.max, 10.0), "singleton min/avg/max");
    assert_true(approx(get_pct_value(ag.percentiles, 0), 10.0), "p0=10");
    assert_true(approx(get_pct_value(ag.percentiles, 100), 10.0), "p100=10");
}

static void test_unsorted_even()
{
    Aggregation ag = aggregate_times({4.0, 1.0, 3.0, 2.0}, {25, 50, 75, 100});
    assert_true(approx(ag.min, 1.0) && approx(ag.avg, 2.5) && approx(ag.max, 4.0), "even set min/avg/max");
    assert_true(approx(get_pct_value(ag.percentiles, 25), 1.0), "p25=1");
    assert_true(approx(get_pct_value(ag.percentiles, 50), 2.0), "p50=2");
    assert_true(approx(get_pct_value(ag.percentiles, 75), 3.0), "p75=3");
}

static void test_clamp()
{
    Aggregation ag = aggregate_times({5.0, 7.0}, {-10, 150});
    assert_true(approx(get_pct_value(ag.percentiles, -10), 5.0), "p-10 -> p0 value=5");
    assert_true(approx(get_pct_value(ag.percentiles, 150), 7.0), "p150 -> p100 value=7");
}

static void test_ten_latencies_nearest_rank()
{
    std::vector<double> t;
    for (int i = 10; i >= 1; --i) t.push_back(10.0 * i);
    Aggregation ag = aggregate_times(t, {10, 50, 90, 95, 99});
    assert_true(approx(ag.min, 10.0) && approx(ag.max, 100.0), "min 10 / max 100");
    assert_true(approx(ag.avg, 55.0), "mean 55");
    assert_true(approx(get_pct_value(ag.percentiles, 10), 10.0), "p10=10");
    assert_true(approx(get_pct_value(ag.percentiles, 50), 50.0), "p50=50");
    assert_true(approx(get_pct_value(ag.percentiles, 90), 90.0), "p90=90");
    assert_true(approx(get_pct_value(ag.percentiles, 95), 100.0), "p95=100");
    assert_true(approx(get_pct_value(ag.percentiles, 99), 100.0), "p99=100");
}

static void test_running_counts()
{
    RunningAggregate agg;
    const auto t0 = Clock::now();
    assert_true(!agg.min_ms() && !agg.avg_ms() && !agg.max_ms(), "no latency before any success");

    agg.add(ok_outcome(20.0, 200, 10), t0);
    agg.add(ok_outcome(40.0, 404, 5), t0);
    agg.add(failed_outcome(FailureKind::Connect, "connection refused"), t0);
    agg.add(failed_outcome(FailureKind::Connect, "connection refused"), t0);
    agg.add(failed_outcome(FailureKind::Timeout, "request timed out"), t0);

    assert_true(agg.total() == 5, "total counts failures");
    assert_true(agg.successes() == 2 && agg.failures() == 3, "success/failure split");
    assert_true(agg.bytes() == 15, "bytes summed over successes");
    assert_true(approx(*agg.min_ms(), 20.0) && approx(*agg.max_ms(), 40.0), "min/max over successes only");
    assert_true(approx(*agg.avg_ms(), 30.0), "avg over successes only");
    assert_true(agg.status_counts().at(200) == 1 && agg.status_counts().at(404) == 1, "status histogram");
    assert_true(agg.error_counts().at("connect: connection refused") == 2, "errors keyed by kind and message");
    assert_true(agg.error_counts().at("timeout: request timed out") == 1, "timeout error");
}

static void test_recent_rps_window()
{
    using namespace std::chrono;
    RunningAggregate agg;
    const auto t0 = Clock::now();
    for (int i = 0; i < 5; ++i) agg.add(ok_outcome(1.0), t0);
    for (int i = 0; i < 3; ++i) agg.add(ok_outcome(1.0), t0 + milliseconds(800));
    assert_true(approx(agg.recent_rps(t0 + milliseconds(900)), 8.0), "all within the last second");
    assert_true(approx(agg.recent_rps(t0 + milliseconds(1500)), 3.0), "older completions leave the window");
    assert_true(approx(agg.recent_rps(t0 + seconds(5)), 0.0), "window empties");
    assert_true(agg.total() == 8, "window does not change totals");
}

int main()
{
    test_empty();
    test_singleton();
    test_unsorted_even();
    test_clamp();
    test_ten_latencies_nearest_rank();
    test_running_counts();
    test_recent_rps_window();
    std::cout << "aggregate tests: OK" << std::endl;
    return 0;
}
