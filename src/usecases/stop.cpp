#include "hb/stop.hpp"

#include <stdexcept>

namespace hb
{
bool CountStop::try_admit(Clock::time_point)
{
    uint64_t cur = remaining_.load(std::memory_order_relaxed);
    while (cur > 0)
    {
        if (remaining_.compare_exchange_weak(cur, cur - 1,
                                             std::memory_order_relaxed))
            return true;
    }
    return false;
}

bool CombinedStop::try_admit(Clock::time_point at)
{
    return deadline_.try_admit(at) && count_.try_admit(at);
}

std::unique_ptr<StopCondition> make_stop_condition(
    std::optional<uint64_t> budget,
    std::optional<Clock::time_point> deadline)
{
    if (budget && deadline) return std::make_unique<CombinedStop>(*budget, *deadline);
    if (deadline) return std::make_unique<DeadlineStop>(*deadline);
    if (budget) return std::make_unique<CountStop>(*budget);
    throw std::invalid_argument("stop condition needs a request count or a deadline");
}
} // namespace hb
