#include "hb/pacing.hpp"

#include <chrono>
#include <cmath>
#include <stdexcept>
#include <string>
#include <thread>

namespace hb
{
FixedRatePacer::FixedRatePacer(double rate, Clock::time_point start)
    : rate_(rate), start_(start)
{
    if (!std::isfinite(rate) || rate < kMinRate)
        throw std::invalid_argument("rate must be at least " + std::to_string(kMinRate) + "/s");
}

Clock::time_point FixedRatePacer::slot_instant(uint64_t k) const
{
    // k / rate computed in one step so slots do not drift with rounding
    const std::chrono::duration<double> offset(static_cast<double>(k) / rate_);
    const std::chrono::duration<double> room = Clock::time_point::max() - start_;
    if (offset >= room) return Clock::time_point::max();
    return start_ + std::chrono::duration_cast<Clock::duration>(offset);
}

Clock::time_point FixedRatePacer::claim()
{
    const uint64_t k = next_.fetch_add(1, std::memory_order_relaxed);
    return slot_instant(k);
}

void FixedRatePacer::wait(Clock::time_point slot)
{
    if (slot > Clock::now()) std::this_thread::sleep_until(slot);
}

std::unique_ptr<Pacer> make_pacer(std::optional<double> qps,
                                  Clock::time_point start)
{
    if (qps && *qps > 0) return std::make_unique<FixedRatePacer>(*qps, start);
    return std::make_unique<UnconstrainedPacer>();
}
} // namespace hb
