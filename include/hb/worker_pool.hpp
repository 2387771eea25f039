#pragma once

#include <cstdint>
#include <functional>

#include "hb/concurrency.hpp"
#include "hb/executor.hpp"
#include "hb/model.hpp"
#include "hb/pacing.hpp"
#include "hb/stop.hpp"

namespace hb
{
// Receives each finished outcome; returning false (sink closed) ends the
// publishing loop.
using OutcomeSink = std::function<bool(Outcome &&)>;

// Runs exactly n_workers loops of
//   claim pacing slot -> stop.try_admit(slot) -> wait -> execute -> publish
// until the stop condition refuses or `cancel` is set, and returns once every
// loop has ended. Returns the number of requests dispatched. An exception
// thrown by the factory or an executor is rethrown after all loops have joined.
uint64_t run_workers(int n_workers,
                     Pacer &pacer,
                     StopCondition &stop,
                     const ExecutorFactory &factory,
                     const OutcomeSink &sink,
                     const Cancellation *cancel = nullptr);
} // namespace hb
