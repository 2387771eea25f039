#pragma once

#include <cstdint>

#include "hb/concurrency.hpp"

namespace hb
{
// SIGINT/SIGTERM call cancel->cancel(). Only one handle is active at a time.
void install_interrupt_handler(Cancellation *cancel);

// Raises the soft RLIMIT_NOFILE toward `wanted` (capped by the hard limit).
// Returns the soft limit in effect afterwards, 0 if it cannot be read.
uint64_t raise_fd_limit(uint64_t wanted);
} // namespace hb
