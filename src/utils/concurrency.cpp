#include "hb/concurrency.hpp"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <pthread.h>

#include "hb/logging.hpp"

namespace hb {

namespace {

void name_current_thread(int index)
{
    // Linux caps thread names at 15 characters
    const std::string name = "hb-worker-" + std::to_string(index);
    pthread_setname_np(pthread_self(), name.substr(0, 15).c_str());
}

} // namespace

struct ThreadPool::Impl {
    using Task = std::function<void()>;

    std::atomic<bool> cancel{false};

    mutable std::mutex mtx;
    std::condition_variable work_ready;
    std::condition_variable drained;
    std::deque<Task> pending;
    std::vector<std::thread> threads;
    size_t running = 0;
    size_t failures = 0;
    bool closing = false;
    std::exception_ptr first_error;

    explicit Impl(int n)
    {
        const size_t count = n > 0 ? static_cast<size_t>(n) : 1;
        threads.reserve(count);
        try
        {
            for (size_t i = 0; i < count; ++i)
                threads.emplace_back(&Impl::thread_main, this, static_cast<int>(i));
        }
        catch (const std::system_error& e)
        {
            // RLIMIT_NPROC or memory; stop the ones already running
            logger()->error("started {} of {} worker thread(s): {}",
                            threads.size(), count, e.what());
            close_and_join();
            throw;
        }
    }

    ~Impl() { close_and_join(); }

    void close_and_join()
    {
        {
            std::lock_guard<std::mutex> lk(mtx);
            closing = true;
        }
        work_ready.notify_all();
        for (auto& th : threads)
        {
            if (th.joinable()) th.join();
        }
    }

    bool enqueue(Task task)
    {
        std::unique_lock<std::mutex> lk(mtx);
        if (closing) return false;
        pending.push_back(std::move(task));
        lk.unlock();
        work_ready.notify_one();
        return true;
    }

    void wait_drained()
    {
        std::unique_lock<std::mutex> lk(mtx);
        drained.wait(lk, [this] { return pending.empty() && running == 0; });
    }

    std::optional<Task> next_task()
    {
        std::unique_lock<std::mutex> lk(mtx);
        work_ready.wait(lk, [this] { return closing || !pending.empty(); });
        if (pending.empty()) return std::nullopt;
        Task t = std::move(pending.front());
        pending.pop_front();
        ++running;
        return t;
    }

    void task_done(std::exception_ptr err)
    {
        std::lock_guard<std::mutex> lk(mtx);
        if (err)
        {
            ++failures;
            if (!first_error) first_error = err;
            cancel.store(true, std::memory_order_relaxed);
        }
        --running;
        if (pending.empty() && running == 0) drained.notify_all();
    }

    void thread_main(int index)
    {
        name_current_thread(index);
        while (auto task = next_task())
        {
            std::exception_ptr err;
            try
            {
                (*task)();
            }
            catch (const std::exception& e)
            {
                logger()->error("worker {} stopped: {}", index, e.what());
                err = std::current_exception();
            }
            catch (...)
            {
                logger()->error("worker {} stopped by a non-standard exception", index);
                err = std::current_exception();
            }
            task_done(err);
        }
    }
};

ThreadPool::ThreadPool(int threads)
    : impl_(std::make_unique<Impl>(threads))
{
}

ThreadPool::~ThreadPool() = default;

int ThreadPool::size() const
{
    return static_cast<int>(impl_->threads.size());
}

bool ThreadPool::submit(std::function<void()> task)
{
    return impl_->enqueue(std::move(task));
}

bool ThreadPool::submit_cancelable(std::function<void(const std::atomic<bool>&)> task)
{
    Impl* impl = impl_.get();
    return impl_->enqueue([impl, t = std::move(task)] { t(impl->cancel); });
}

void ThreadPool::wait_idle()
{
    impl_->wait_drained();
}

void ThreadPool::cancel()
{
    impl_->cancel.store(true, std::memory_order_relaxed);
}

const std::atomic<bool>& ThreadPool::cancel_flag() const
{
    return impl_->cancel;
}

std::exception_ptr ThreadPool::first_exception() const
{
    std::lock_guard<std::mutex> lk(impl_->mtx);
    return impl_->first_error;
}

size_t ThreadPool::failed_tasks() const
{
    std::lock_guard<std::mutex> lk(impl_->mtx);
    return impl_->failures;
}

} // namespace hb
