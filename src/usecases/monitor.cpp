#include "hb/monitor.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

#include "hb/logging.hpp"
#include "hb/output.hpp"

namespace hb
{
namespace
{
constexpr const char *kClearHome = "\x1b[2J\x1b[H";

double seconds_since(Clock::time_point start, Clock::time_point now)
{
    return std::chrono::duration<double>(now - start).count();
}
} // namespace

Monitor::Monitor(OutcomeChannel &channel, const Cancellation &cancel,
                 MonitorSettings settings)
    : channel_(channel), cancel_(cancel), settings_(std::move(settings))
{
    if (settings_.fps <= 0) settings_.fps = 1;
    if (settings_.poll_interval <= std::chrono::milliseconds::zero())
        settings_.poll_interval = std::chrono::milliseconds(1);
}

MonitorResult Monitor::run()
{
    const auto frame = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(1.0 / settings_.fps));
    auto next_frame = Clock::now();
    std::vector<Outcome> batch;

    while (state_ == MonitorState::Running)
    {
        if (cancel_.is_cancelled())
        {
            state_ = MonitorState::Cancelling;
            logger()->info("interrupted with {} outcome(s) collected", outcomes_.size());
            break;
        }

        const auto now = Clock::now();
        if (settings_.render && now >= next_frame)
        {
            render(now);
            next_frame = now + frame;
        }

        auto until = now + settings_.poll_interval;
        if (settings_.render) until = std::min(until, next_frame);

        batch.clear();
        switch (channel_.recv_batch(batch, until))
        {
            case RecvStatus::Items:
            {
                const auto at = Clock::now();
                for (auto &o: batch)
                {
                    agg_.add(o, at);
                    outcomes_.push_back(std::move(o));
                }
                break;
            }
            case RecvStatus::Timeout:
                break;
            case RecvStatus::Closed:
                state_ = MonitorState::Done;
                if (settings_.render) render(Clock::now());
                break;
        }
    }

    MonitorResult r;
    r.state = state_;
    r.elapsed_s = seconds_since(settings_.start, Clock::now());
    r.outcomes = std::move(outcomes_);
    outcomes_.clear();
    return r;
}

void Monitor::render(Clock::time_point now)
{
    std::ostream &out = settings_.out ? *settings_.out : std::cout;
    out << kClearHome
        << format_live_frame(agg_, settings_.end_line, seconds_since(settings_.start, now), now);
    out.flush();
}
} // namespace hb
