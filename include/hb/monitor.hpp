#pragma once

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <vector>

#include "hb/aggregate.hpp"
#include "hb/channel.hpp"
#include "hb/concurrency.hpp"
#include "hb/model.hpp"

namespace hb
{
// What "finished" means for progress and ETA
struct EndLine
{
    std::optional<uint64_t> requests;
    std::optional<double>   duration_s;
};

enum class MonitorState { Running, Cancelling, Done };

struct MonitorResult
{
    MonitorState         state{MonitorState::Done};
    std::vector<Outcome> outcomes;
    double               elapsed_s{};   // at the moment the monitor stopped
};

struct MonitorSettings
{
    EndLine           end_line;
    Clock::time_point start{Clock::now()};
    bool              render = true;
    int               fps = 16;
    std::ostream     *out = nullptr;    // stdout when null
    // Longest wait between interrupt checks
    std::chrono::milliseconds poll_interval{50};
};

// Drains the outcome channel while the run goes on, renders frames and watches
// the interrupt flag. run() returns Done once the channel is closed and empty,
// or Cancelling with the outcomes gathered so far as soon as `cancel` is set.
class Monitor
{
public:
    Monitor(OutcomeChannel &channel, const Cancellation &cancel,
            MonitorSettings settings);

    MonitorResult run();
    MonitorState state() const { return state_; }

private:
    void render(Clock::time_point now);

    OutcomeChannel &channel_;
    const Cancellation &cancel_;
    MonitorSettings settings_;
    MonitorState state_{MonitorState::Running};
    RunningAggregate agg_;
    std::vector<Outcome> outcomes_;
};
} // namespace hb
