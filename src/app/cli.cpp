#include "hb/cli.hpp"

#include <cmath>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/core.h>

#include "hb/pacing.hpp"

using namespace std::string_view_literals;

namespace hb {

void print_usage(const char *prog)
{
    fmt::print("HTTP load generator with a live dashboard\n");
    fmt::print("Usage: {} [options] <url>\n", prog);
    fmt::print("Options:\n");
    fmt::print("  -n N                   Number of requests to run (default: 200)\n");
    fmt::print("  -c N                   Number of workers to run concurrently (default: 50)\n");
    fmt::print("  -z DUR                 Run for this long, e.g. 10s, 3m, 500ms\n");
    fmt::print("                         -n is ignored unless also given explicitly\n");
    fmt::print("  -q QPS                 Overall rate limit in requests per second\n");
    fmt::print("  --no-tui               No live dashboard, summary only\n");
    fmt::print("  --fps N                Dashboard frames per second (default: 16)\n");
    fmt::print("  -m METHOD              HTTP method (default: GET)\n");
    fmt::print("  -H \"K: V\"              Extra request header, repeatable\n");
    fmt::print("  -t DUR                 Per-request timeout (default: none)\n");
    fmt::print("  -A VALUE               Accept header\n");
    fmt::print("  -d BODY                Request body\n");
    fmt::print("  -D PATH                Request body read from a file\n");
    fmt::print("  -T VALUE               Content-Type header\n");
    fmt::print("  -a USER:PASS           Basic authentication\n");
    fmt::print("  --http-version V       1.0 or 1.1 (default: 1.1)\n");
    fmt::print("  --host HOST            Host header override\n");
    fmt::print("  --disable-compression  Do not send Accept-Encoding\n");
    fmt::print("  --tcp-nodelay          Set TCP_NODELAY on connections\n");
    fmt::print("  --disable-keepalive    Open a new connection for every request\n");
    fmt::print("  --ipv4                 Resolve IPv4 addresses only\n");
    fmt::print("  --ipv6                 Resolve IPv6 addresses only\n");
    fmt::print("  --dns-server IP        Resolve through this DNS server (ldns)\n");
    fmt::print("  --json                 Print the summary as JSON\n");
    fmt::print("  --log-level L          trace|debug|info|warn|error|off (default: warn)\n");
    fmt::print("  -h, --help             Show this help\n");
    fmt::print("\n");
    fmt::print("Examples:\n");
    fmt::print("  {} -n 1000 -c 100 http://127.0.0.1:8080/\n", prog);
    fmt::print("  {} -z 30s -q 200 --no-tui https://example.com/api\n", prog);
}

std::optional<double> parse_duration_s(std::string_view s)
{
    if (s.empty()) return std::nullopt;

    double scale = 1.0;
    std::string_view num = s;
    if (s.ends_with("ms"sv))
    {
        scale = 0.001;
        num.remove_suffix(2);
    }
    else if (s.ends_with('s'))
    {
        num.remove_suffix(1);
    }
    else if (s.ends_with('m'))
    {
        scale = 60.0;
        num.remove_suffix(1);
    }
    else if (s.ends_with('h'))
    {
        scale = 3600.0;
        num.remove_suffix(1);
    }
    if (num.empty()) return std::nullopt;

    double v = 0.0;
    try
    {
        size_t used = 0;
        v = std::stod(std::string(num), &used);
        if (used != num.size()) return std::nullopt;
    }
    catch (const std::exception &)
    {
        return std::nullopt;
    }
    if (!std::isfinite(v) || v < 0.0) return std::nullopt;
    return v * scale;
}

namespace {

// Accepts "-x VALUE", "--name VALUE" and "--name=VALUE"
std::optional<std::string> take_value(std::string_view a,
                                      std::string_view name,
                                      int argc, char **argv, int &i)
{
    if (a == name)
    {
        if (i + 1 < argc) return std::string(argv[++i]);
        return std::nullopt;
    }
    if (name.starts_with("--"sv) && a.size() > name.size() &&
        a.starts_with(name) && a[name.size()] == '=')
        return std::string(a.substr(name.size() + 1));
    return std::nullopt;
}

bool matches(std::string_view a, std::string_view name)
{
    if (a == name) return true;
    return name.starts_with("--"sv) && a.size() > name.size() &&
           a.starts_with(name) && a[name.size()] == '=';
}

bool to_int(const std::string &val, int &out)
{
    try
    {
        size_t used = 0;
        out = std::stoi(val, &used);
        return used == val.size();
    }
    catch (const std::exception &)
    {
        return false;
    }
}

bool to_double(const std::string &val, double &out)
{
    try
    {
        size_t used = 0;
        out = std::stod(val, &used);
        return used == val.size() && std::isfinite(out);
    }
    catch (const std::exception &)
    {
        return false;
    }
}

} // namespace

bool parse_args(int argc, char **argv, Options &opt)
{
    auto usage_error = [&](const std::string &msg)
    {
        fmt::print(stderr, "{}\n", msg);
        fmt::print(stderr, "Try '{} --help' for more information.\n", argv[0]);
        return false;
    };

    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i];
        if (a == "-h"sv || a == "--help"sv)
        {
            print_usage(argv[0]);
            return false;
        }

        // valued options
        static constexpr std::string_view kValued[] = {
            "-n", "-c", "-z", "-q", "--fps", "-m", "-H", "-t", "-A", "-d", "-D",
            "-T", "-a", "--http-version", "--host", "--dns-server", "--log-level"};
        std::string_view name;
        for (auto n: kValued)
        {
            if (matches(a, n))
            {
                name = n;
                break;
            }
        }
        if (!name.empty())
        {
            auto v = take_value(a, name, argc, argv, i);
            if (!v) return usage_error(fmt::format("missing value for {}", name));
            const std::string &val = *v;

            if (name == "-n"sv)
            {
                if (!to_int(val, opt.n_requests) || opt.n_requests < 0)
                    return usage_error(fmt::format("invalid request count: {}", val));
                opt.n_requests_set = true;
            }
            else if (name == "-c"sv)
            {
                if (!to_int(val, opt.n_workers) || opt.n_workers <= 0)
                    return usage_error(fmt::format("invalid worker count: {}", val));
            }
            else if (name == "-z"sv)
            {
                opt.duration_s = parse_duration_s(val);
                if (!opt.duration_s || *opt.duration_s <= 0.0)
                    return usage_error(fmt::format("invalid duration: {}", val));
            }
            else if (name == "-q"sv)
            {
                double q = 0.0;
                if (!to_double(val, q) || q <= 0.0)
                    return usage_error(fmt::format("invalid rate: {}", val));
                if (q < FixedRatePacer::kMinRate)
                    return usage_error(fmt::format("rate too low: {} (minimum {:g}/s)",
                                                   val, FixedRatePacer::kMinRate));
                opt.qps = q;
            }
            else if (name == "--fps"sv)
            {
                if (!to_int(val, opt.fps) || opt.fps <= 0)
                    return usage_error(fmt::format("invalid --fps value: {}", val));
            }
            else if (name == "-m"sv) opt.method = val;
            else if (name == "-H"sv) opt.headers.push_back(val);
            else if (name == "-t"sv)
            {
                opt.timeout_s = parse_duration_s(val);
                if (!opt.timeout_s || *opt.timeout_s <= 0.0)
                    return usage_error(fmt::format("invalid timeout: {}", val));
            }
            else if (name == "-A"sv) opt.accept = val;
            else if (name == "-d"sv) opt.body = val;
            else if (name == "-D"sv) opt.body_path = val;
            else if (name == "-T"sv) opt.content_type = val;
            else if (name == "-a"sv) opt.basic_auth = val;
            else if (name == "--http-version"sv) opt.http_version = val;
            else if (name == "--host"sv) opt.host = val;
            else if (name == "--dns-server"sv) opt.dns_server = val;
            else if (name == "--log-level"sv) opt.log_level = val;
            continue;
        }

        if (a == "--no-tui"sv)
        {
            opt.no_tui = true;
        }
        else if (a == "--disable-compression"sv)
        {
            opt.disable_compression = true;
        }
        else if (a == "--tcp-nodelay"sv)
        {
            opt.tcp_nodelay = true;
        }
        else if (a == "--disable-keepalive"sv)
        {
            opt.disable_keepalive = true;
        }
        else if (a == "--ipv4"sv)
        {
            opt.ipv4 = true;
        }
        else if (a == "--ipv6"sv)
        {
            opt.ipv6 = true;
        }
        else if (a == "--json"sv)
        {
            opt.json = true;
        }
        else if (a.size() > 1 && a[0] == '-')
        {
            return usage_error(fmt::format("unknown option: {}", a));
        }
        else if (!opt.url.empty())
        {
            return usage_error(fmt::format("unexpected argument: {}", a));
        }
        else
        {
            opt.url = std::string(a);
        }
    }
    if (opt.body && opt.body_path)
        return usage_error("-d and -D cannot be used together");
    if (opt.url.empty()) return usage_error("missing <url>");
    return true;
}

} // namespace hb
