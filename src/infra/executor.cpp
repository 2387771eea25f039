#include "hb/executor.hpp"

#include <chrono>
#include <string>
#include <string_view>

#include "hb/http_codec.hpp"
#include "hb/logging.hpp"
#include "hb/resolver.hpp"

namespace hb
{
namespace
{
double ms_between(Clock::time_point a, Clock::time_point b)
{
    return std::chrono::duration<double, std::milli>(b - a).count();
}

// Budget left for a lookup that cannot be interrupted midway; 0 = no limit
int remaining_ms(const Deadline &deadline)
{
    if (!deadline) return 0;
    const auto left = std::chrono::ceil<std::chrono::milliseconds>(
        *deadline - Clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 1;
}

bool expired(const Deadline &deadline)
{
    return deadline && Clock::now() >= *deadline;
}
} // namespace

ConnectionExecutor::ConnectionExecutor(std::shared_ptr<const ClientConfig> cfg,
                                       std::shared_ptr<TlsContext> tls)
    : cfg_(std::move(cfg)), tls_(std::move(tls))
{
}

Outcome ConnectionExecutor::execute()
{
    Outcome out{};
    const auto t0 = Clock::now();
    Deadline deadline;
    if (cfg_->timeout)
        deadline = t0 + std::chrono::duration_cast<Clock::duration>(*cfg_->timeout);

    auto fail = [&](Failure f) -> Outcome
    {
        conn_.close();
        out.ms = ms_between(t0, Clock::now());
        logger()->debug("request failed ({}): {}", failure_kind_str(f.kind), f.message);
        out.result = std::move(f);
        return std::move(out);
    };

    const Url &url = cfg_->url;
    // A kept-alive connection may have been closed by the server while idle.
    // If it dies before any response byte, the request goes again on a new one.
    bool reused = conn_.is_open() && !cfg_->disable_keepalive;
    ResponseParser parser(cfg_->method == "HEAD");
    Clock::time_point t_first{};
    for (;;)
    {
        if (!reused)
        {
            conn_.close();
            const ResolveResult res = resolve_host(url.host, url.port, cfg_->dns,
                                                   cfg_->dns_server,
                                                   remaining_ms(deadline));
            const auto t_lookup = Clock::now();
            out.phases.lookup_ms = ms_between(t0, t_lookup);
            if (expired(deadline))
                return fail(Failure{FailureKind::Timeout, "dns lookup timed out"});
            if (res.rc != 0)
                return fail(Failure{FailureKind::Dns, url.host + ": " + res.error});

            if (auto f = conn_.connect(res.addresses, cfg_->tcp_nodelay, deadline))
                return fail(std::move(*f));
            if (tls_)
            {
                if (auto f = conn_.handshake(*tls_, url.host, deadline))
                    return fail(std::move(*f));
            }
            out.phases.connect_ms = ms_between(t_lookup, Clock::now());
        }

        const auto t_write = Clock::now();
        std::string_view body = cfg_->body ? std::string_view(*cfg_->body) : std::string_view{};
        if (auto f = conn_.write_request(cfg_->request_head, body, deadline))
        {
            if (reused && f->kind == FailureKind::Write)
            {
                logger()->debug("idle connection gone ({}), reconnecting", f->message);
                reused = false;
                continue;
            }
            return fail(std::move(*f));
        }
        const auto t_written = Clock::now();
        out.phases.write_ms = ms_between(t_write, t_written);

        char buf[16 * 1024];
        bool got_bytes = false;
        bool retry = false;
        while (!parser.done())
        {
            auto r = conn_.read_some(buf, sizeof(buf), deadline);
            if (auto *f = std::get_if<Failure>(&r))
            {
                if (reused && !got_bytes && f->kind == FailureKind::Read)
                {
                    retry = true;
                    break;
                }
                return fail(std::move(*f));
            }
            const size_t n = std::get<size_t>(r);
            if (!got_bytes && n > 0)
            {
                got_bytes = true;
                t_first = Clock::now();
                out.phases.first_byte_ms = ms_between(t_written, t_first);
            }
            if (n == 0)
            {
                if (!got_bytes)
                {
                    if (reused)
                    {
                        retry = true;
                        break;
                    }
                    return fail(Failure{FailureKind::Read, "connection closed before response"});
                }
                if (!parser.finish())
                    return fail(Failure{FailureKind::Read, parser.error()});
                break;
            }
            if (!parser.feed(std::string_view(buf, n)))
                return fail(Failure{FailureKind::MalformedResponse, parser.error()});
        }
        if (!retry) break;
        logger()->debug("idle connection closed by peer, reconnecting");
        reused = false;
    }

    const auto t_done = Clock::now();
    out.phases.read_ms = ms_between(t_first, t_done);
    if (cfg_->disable_keepalive || !parser.keep_alive()) conn_.close();

    out.ms = ms_between(t0, t_done);
    out.result = Success{parser.status(), parser.body_bytes()};
    return out;
}

ExecutorFactory make_executor_factory(std::shared_ptr<const ClientConfig> cfg)
{
    std::shared_ptr<TlsContext> tls;
    if (cfg->url.is_tls()) tls = TlsContext::create();
    return [cfg = std::move(cfg), tls = std::move(tls)]() -> std::unique_ptr<RequestExecutor>
    {
        return std::make_unique<ConnectionExecutor>(cfg, tls);
    };
}
} // namespace hb
