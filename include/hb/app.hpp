#pragma once

#include "hb/options.hpp"

namespace hb
{
// Whole run: config, workers, monitor, summary. Returns the exit status.
int run_app(const Options &opt);
} // namespace hb
