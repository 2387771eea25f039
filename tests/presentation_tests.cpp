#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "hb/aggregate.hpp"
#include "hb/json.hpp"
#include "hb/model.hpp"
#include "hb/monitor.hpp"
#include "hb/output.hpp"
#include "hb/summary.hpp"

using namespace hb;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

static void assert_contains(const std::string& haystack, std::string_view needle, std::string_view msg)
{
    if (haystack.find(needle) == std::string::npos)
    {
        std::cerr << "ASSERT FAILED: missing substring: " << needle << " | " << msg << std::endl;
        std::cerr << "Actual: " << haystack << std::endl;
        std::exit(1);
    }
}

static void assert_not_contains(const std::string& haystack, std::string_view needle, std::string_view msg)
{
    if (haystack.find(needle) != std::string::npos)
    {
        std::cerr << "ASSERT FAILED: unexpected substring: " << needle << " | " << msg << std::endl;
        std::cerr << "Actual: " << haystack << std::endl;
        std::exit(1);
    }
}

static std::vector<Outcome> sample_outcomes()
{
    std::vector<Outcome> v;
    for (int i = 1; i <= 10; ++i)
    {
        Outcome o;
        o.ms = 10.0 * i;
        o.phases.lookup_ms = 1.0;
        o.phases.connect_ms = 2.0;
        o.result = Success{i <= 8 ? 200 : 500, 1024};
        v.push_back(o);
    }
    Outcome f;
    f.ms = 3.0;
    f.result = Failure{FailureKind::Connect, "Connection refused"};
    v.push_back(f);
    return v;
}

static void test_json_escape()
{
    assert_true(json_escape("plain") == "plain", "plain passes through");
    assert_true(json_escape("a\"b\\c") == "a\\\"b\\\\c", "quote and backslash");
    assert_true(json_escape("x\ny\t") == "x\\ny\\t", "newline and tab");
    assert_true(json_escape(std::string(1, '\x01')) == "\\u0001", "control char as \\u");
    assert_true(json_escape(std::string("a\x1fz")) == "a\\u001fz", "hex digits are lower case");
    assert_true(json_escape("caf\xc3\xa9") == "caf\xc3\xa9", "utf-8 passes through");
    assert_true(json_quote("read: \"x\"") == "\"read: \\\"x\\\"\"", "quoted key");
}

static void test_summary_text()
{
    std::string s = format_summary_text(compute_summary(sample_outcomes(), 2.0));
    assert_contains(s, "Summary:\n", "title");
    assert_contains(s, "  Success rate:\t90.91%\n", "success rate");
    assert_contains(s, "  Total:\t2.0000 secs\n", "elapsed");
    assert_contains(s, "  Slowest:\t0.1000 secs\n", "slowest");
    assert_contains(s, "  Fastest:\t0.0100 secs\n", "fastest");
    assert_contains(s, "  Average:\t0.0550 secs\n", "average");
    assert_contains(s, "  Requests/sec:\t5.5000\n", "rps");
    assert_contains(s, "  Total data:\t10.00 KiB\n", "data");
    assert_contains(s, "  Size/request:\t1.00 KiB\n", "size per request");
    assert_contains(s, "Response time histogram:\n", "histogram");
    assert_contains(s, "Latency distribution:\n", "percentiles");
    assert_contains(s, "  50% in 0.0500 secs\n", "p50");
    assert_contains(s, "  99% in 0.1000 secs\n", "p99");
    assert_contains(s, "  DNS+dialup:\t0.0030 secs, 0.0030 secs, 0.0030 secs\n", "dialup");
    assert_contains(s, "  DNS-lookup:\t0.0010 secs, 0.0010 secs, 0.0010 secs\n", "lookup");
    assert_contains(s, "  [200] 8 responses\n", "status 200");
    assert_contains(s, "  [500] 2 responses\n", "status 500");
    assert_contains(s, "Error distribution:\n  [1] connect: Connection refused\n", "errors");
    assert_true(s.find("[200]") < s.find("[500]"), "most frequent status first");
}

static void test_summary_text_empty()
{
    std::string s = format_summary_text(compute_summary({}, 0.0));
    assert_contains(s, "  Success rate:\t0.00%\n", "empty success rate");
    assert_contains(s, "  Slowest:\tn/a\n", "no slowest");
    assert_contains(s, "  Size/request:\tn/a\n", "no size per request");
    assert_not_contains(s, "Latency distribution", "no percentiles");
    assert_not_contains(s, "Status code distribution", "no statuses");
    assert_not_contains(s, "nan", "no NaN");
    assert_not_contains(s, "inf", "no infinity");
}

static void test_summary_json()
{
    std::string j = build_summary_json(compute_summary(sample_outcomes(), 2.0));
    assert_true(j.front() == '{' && j.back() == '}', "single object");
    assert_contains(j, R"("summary":{"success_rate":0.909091,"total_s":2.000000)", "summary head");
    assert_contains(j, R"("slowest_s":0.100000,"fastest_s":0.010000,"average_s":0.055000)", "latency");
    assert_contains(j, R"("requests_per_sec":5.500000)", "rps");
    assert_contains(j, R"("total_data":10240)", "bytes");
    assert_contains(j, R"("latency_percentiles":{"p10":0.010000,"p25":0.030000,"p50":0.050000)", "percentiles");
    assert_contains(j, R"("status_codes":{"200":8,"500":2})", "status codes");
    assert_contains(j, R"("errors":{"connect: Connection refused":1})", "errors");
    assert_contains(j, R"("dns_lookup":{"average_s":0.001000)", "lookup details");

    std::string e = build_summary_json(compute_summary({}, 0.0));
    assert_contains(e, R"("slowest_s":null,"fastest_s":null,"average_s":null)", "empty latency is null");
    assert_contains(e, R"("size_per_request":null)", "empty size is null");
    assert_contains(e, R"("dns_dialup":null)", "empty details");
}

static void test_print_summary_sink()
{
    std::ostringstream out;
    print_summary(out, sample_outcomes(), 2.0, false);
    assert_contains(out.str(), "Summary:\n", "text to sink");
    std::ostringstream jout;
    print_summary(jout, sample_outcomes(), 2.0, true);
    assert_true(jout.str().front() == '{' && jout.str().back() == '\n', "json line to sink");
}

static void test_progress_bar()
{
    assert_true(progress_bar(0.0, 4) == "[....]", "empty bar");
    assert_true(progress_bar(0.5, 4) == "[##..]", "half bar");
    assert_true(progress_bar(1.0, 4) == "[####]", "full bar");
    assert_true(progress_bar(7.0, 4) == "[####]", "clamped above");
    assert_true(progress_bar(-1.0, 4) == "[....]", "clamped below");
    assert_true(progress_bar(0.5, 0).empty(), "zero width");
}

static void test_live_frame()
{
    using namespace std::chrono;
    RunningAggregate agg;
    const auto now = Clock::now();
    for (const auto& o : sample_outcomes()) agg.add(o, now);

    EndLine by_count;
    by_count.requests = 22;
    std::string f = format_live_frame(agg, by_count, 1.0, now);
    assert_contains(f, "50.0%  11 / 22\n", "progress by count");
    assert_contains(f, "ETA 1.0s\n", "eta from the completion rate");
    assert_contains(f, "Requests/sec (last 1s): 11\n", "recent rps");
    assert_contains(f, "Success: 10  Failure: 1", "counts");
    assert_contains(f, "Latency ms: min 10.000  avg 55.000  max 100.000\n", "latency");
    assert_contains(f, "  [200] 8\n", "status");
    assert_contains(f, "  [1] connect: Connection refused\n", "errors");

    EndLine by_time;
    by_time.duration_s = 4.0;
    std::string g = format_live_frame(agg, by_time, 1.0, now);
    assert_contains(g, "25.0%  11\n", "progress by time");
    assert_contains(g, "ETA 3.0s\n", "remaining time");

    RunningAggregate empty;
    std::string h = format_live_frame(empty, by_count, 0.0, now);
    assert_contains(h, "ETA -\n", "no ETA before the first completion");
    assert_contains(h, "Latency ms: -\n", "no latency yet");
}

static void test_failure_kind_names()
{
    assert_true(std::string(failure_kind_str(FailureKind::Dns)) == "dns", "dns");
    assert_true(std::string(failure_kind_str(FailureKind::Connect)) == "connect", "connect");
    assert_true(std::string(failure_kind_str(FailureKind::Tls)) == "tls", "tls");
    assert_true(std::string(failure_kind_str(FailureKind::Timeout)) == "timeout", "timeout");
    assert_true(std::string(failure_kind_str(FailureKind::MalformedResponse)) == "malformed-response",
                "malformed");
}

int main()
{
    test_json_escape();
    test_failure_kind_names();
    test_summary_text();
    test_summary_text_empty();
    test_summary_json();
    test_print_summary_sink();
    test_progress_bar();
    test_live_frame();
    std::cout << "presentation tests: OK" << std::endl;
    return 0;
}
