#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <utility>
#include <vector>

#include "hb/model.hpp"

namespace hb
{
enum class RecvStatus { Items, Timeout, Closed };

// Unbounded multi-producer / single-consumer queue. Items come out in no
// guaranteed order relative to dispatch; nothing is accepted after close().
template <typename T>
class Channel
{
public:
    // false when the channel is already closed; the item is dropped
    bool send(T item)
    {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (closed_) return false;
            q_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    void close()
    {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const
    {
        std::lock_guard<std::mutex> lk(mtx_);
        return closed_;
    }

    // Moves everything queued into out, waiting until `until` for at least one
    // item. Closed is reported only once the queue has been drained.
    RecvStatus recv_batch(std::vector<T> &out,
                          std::chrono::steady_clock::time_point until)
    {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait_until(lk, until, [&] { return closed_ || !q_.empty(); });
        if (q_.empty()) return closed_ ? RecvStatus::Closed : RecvStatus::Timeout;
        out.reserve(out.size() + q_.size());
        for (auto &item: q_) out.push_back(std::move(item));
        q_.clear();
        return RecvStatus::Items;
    }

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<T> q_;
    bool closed_{false};
};

using OutcomeChannel = Channel<Outcome>;
} // namespace hb
