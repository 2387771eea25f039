#include "hb/app.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <thread>

#include "hb/config.hpp"
#include "hb/executor.hpp"
#include "hb/logging.hpp"
#include "hb/monitor.hpp"
#include "hb/output.hpp"
#include "hb/pacing.hpp"
#include "hb/stop.hpp"
#include "hb/system.hpp"
#include "hb/terminal.hpp"
#include "hb/worker_pool.hpp"

namespace hb
{
namespace
{
// Descriptors beyond one per worker: stdio, resolver sockets, the logger
constexpr uint64_t kSpareFds = 64;

[[noreturn]] void exit_cancelled(const MonitorResult &r, bool json)
{
    restore_terminal();
    print_summary(std::cout, r.outcomes, r.elapsed_s, json);
    std::cout.flush();
    logger()->flush();
    // workers may still be blocked in I/O; do not wait for them
    std::_Exit(EXIT_SUCCESS);
}
} // namespace

int run_app(const Options &opt)
{
    std::signal(SIGPIPE, SIG_IGN);

    std::shared_ptr<const ClientConfig> cfg;
    ExecutorFactory factory;
    try
    {
        cfg = build_client_config(opt);
        factory = make_executor_factory(cfg);
    }
    catch (const ConfigError &e)
    {
        logger()->error("{}", e.what());
        return 1;
    }

    logger()->info("target {}://{}{} with {} worker(s)",
                   cfg->url.scheme, cfg->url.authority(), cfg->url.target, opt.n_workers);
    raise_fd_limit(static_cast<uint64_t>(opt.n_workers) + kSpareFds);

    // -z alone runs by time; -n given explicitly as well keeps the count too
    std::optional<uint64_t> budget;
    if (!opt.duration_s || opt.n_requests_set)
        budget = static_cast<uint64_t>(opt.n_requests);

    const auto start = Clock::now();
    std::optional<Clock::time_point> deadline;
    if (opt.duration_s)
        deadline = start + std::chrono::duration_cast<Clock::duration>(
                               std::chrono::duration<double>(*opt.duration_s));

    std::unique_ptr<Pacer> pacer;
    std::unique_ptr<StopCondition> stop;
    try
    {
        pacer = make_pacer(opt.qps, start);
        stop = make_stop_condition(budget, deadline);
    }
    catch (const std::invalid_argument &e)
    {
        logger()->error("{}", e.what());
        return 1;
    }

    Cancellation cancel;
    install_interrupt_handler(&cancel);

    OutcomeChannel channel;
    std::exception_ptr run_error;
    double run_elapsed_s = 0.0;

    std::thread runner([&]
    {
        try
        {
            const uint64_t n = run_workers(opt.n_workers, *pacer, *stop, factory,
                                           [&](Outcome &&o) { return channel.send(std::move(o)); },
                                           &cancel);
            logger()->debug("dispatched {} request(s)", n);
        }
        catch (const std::exception &e)
        {
            logger()->error("run aborted: {}", e.what());
            run_error = std::current_exception();
        }
        run_elapsed_s = std::chrono::duration<double>(Clock::now() - start).count();
        channel.close();
    });

    MonitorSettings ms;
    ms.end_line.requests = budget;
    ms.end_line.duration_s = opt.duration_s;
    ms.start = start;
    ms.render = !opt.no_tui;
    ms.fps = opt.fps;

    MonitorResult result;
    {
        std::optional<TerminalGuard> guard;
        if (!opt.no_tui) guard.emplace();

        Monitor monitor(channel, cancel, ms);
        result = monitor.run();
        if (result.state == MonitorState::Cancelling)
        {
            exit_cancelled(result, opt.json);
        }
    }

    runner.join();
    install_interrupt_handler(nullptr);

    print_summary(std::cout, result.outcomes, run_elapsed_s, opt.json);
    return run_error ? 1 : 0;
}
} // namespace hb
