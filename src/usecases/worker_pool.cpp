#include "hb/worker_pool.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <memory>
#include <stdexcept>

#include "hb/logging.hpp"

namespace hb
{
uint64_t run_workers(int n_workers,
                     Pacer &pacer,
                     StopCondition &stop,
                     const ExecutorFactory &factory,
                     const OutcomeSink &sink,
                     const Cancellation *cancel)
{
    if (n_workers <= 0) throw std::invalid_argument("worker count must be positive");

    std::atomic<uint64_t> dispatched{0};
    ThreadPool pool(n_workers);

    auto worker = [&](const std::atomic<bool> &pool_cancel)
    {
        auto cancelled = [&]
        {
            return pool_cancel.load(std::memory_order_relaxed) ||
                   (cancel && cancel->is_cancelled());
        };

        std::unique_ptr<RequestExecutor> exec = factory();
        while (!cancelled())
        {
            // claim first, then wait: nothing shared is held while sleeping.
            // A pacer running behind hands out past slots; those go out now.
            const auto slot = pacer.claim();
            if (!stop.try_admit(std::max(slot, Clock::now()))) break;
            pacer.wait(slot);
            if (stop.expired(Clock::now())) break;
            dispatched.fetch_add(1, std::memory_order_relaxed);
            if (!sink(exec->execute())) break;
        }
    };

    for (int i = 0; i < n_workers; ++i)
    {
        if (!pool.submit_cancelable(worker))
            throw std::runtime_error("worker pool refused a worker loop");
    }
    pool.wait_idle();

    logger()->debug("{} worker(s) finished after {} request(s)",
                    n_workers, dispatched.load());
    if (auto ep = pool.first_exception())
    {
        logger()->warn("{} worker loop(s) failed", pool.failed_tasks());
        std::rethrow_exception(ep);
    }
    return dispatched.load();
}
} // namespace hb
