#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>

#include "hb/model.hpp"

namespace hb
{
// Decides when a worker may dispatch. claim() reserves a dispatch instant,
// wait() blocks the calling worker until that instant.
class Pacer
{
public:
    virtual ~Pacer() = default;
    virtual Clock::time_point claim() = 0;
    virtual void wait(Clock::time_point slot) = 0;
};

// Dispatch as soon as a worker is free.
class UnconstrainedPacer : public Pacer
{
public:
    Clock::time_point claim() override { return Clock::now(); }
    void wait(Clock::time_point) override {}
};

// Slot k is eligible at start + k / rate. Every claim gets its own slot.
// Slots too far out to represent saturate at Clock::time_point::max().
class FixedRatePacer : public Pacer
{
public:
    // One request per quarter hour; slower rates are rejected
    static constexpr double kMinRate = 1.0 / 900.0;

    // Throws std::invalid_argument for rates below kMinRate or not finite
    FixedRatePacer(double rate, Clock::time_point start);

    Clock::time_point claim() override;
    void wait(Clock::time_point slot) override;

    // Number of slots handed out so far
    uint64_t claimed() const { return next_.load(std::memory_order_relaxed); }
    Clock::time_point slot_instant(uint64_t k) const;

private:
    double rate_;
    Clock::time_point start_;
    std::atomic<uint64_t> next_{0};
};

// nullopt or a non-positive rate gives the unconstrained pacer.
std::unique_ptr<Pacer> make_pacer(std::optional<double> qps,
                                  Clock::time_point start);
} // namespace hb
