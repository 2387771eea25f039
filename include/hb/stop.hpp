#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>

#include "hb/model.hpp"

namespace hb
{
// Run-end rule. try_admit(at) is called once per prospective request with the
// instant it would be dispatched (never earlier than now); true grants it,
// false ends the calling loop. expired(now) tells a worker that slept after
// admission whether it may still send.
class StopCondition
{
public:
    virtual ~StopCondition() = default;
    virtual bool try_admit(Clock::time_point at) = 0;
    virtual bool expired(Clock::time_point) const { return false; }
};

class CountStop : public StopCondition
{
public:
    explicit CountStop(uint64_t budget) : remaining_(budget) {}

    bool try_admit(Clock::time_point at) override;
    uint64_t remaining() const { return remaining_.load(std::memory_order_relaxed); }

private:
    std::atomic<uint64_t> remaining_;
};

class DeadlineStop : public StopCondition
{
public:
    explicit DeadlineStop(Clock::time_point deadline) : deadline_(deadline) {}

    bool try_admit(Clock::time_point at) override { return at < deadline_; }
    bool expired(Clock::time_point now) const override { return now >= deadline_; }
    Clock::time_point deadline() const { return deadline_; }

private:
    Clock::time_point deadline_;
};

// Count and deadline together; either one refusing stops the run. The deadline
// is checked first so a refused request never consumes budget.
class CombinedStop : public StopCondition
{
public:
    CombinedStop(uint64_t budget, Clock::time_point deadline)
        : count_(budget), deadline_(deadline) {}

    bool try_admit(Clock::time_point at) override;
    bool expired(Clock::time_point now) const override { return deadline_.expired(now); }

private:
    CountStop count_;
    DeadlineStop deadline_;
};

// At least one of budget / deadline must be set.
std::unique_ptr<StopCondition> make_stop_condition(
    std::optional<uint64_t> budget,
    std::optional<Clock::time_point> deadline);
} // namespace hb
