#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace hb
{
// Creates the "hbarrage" stderr logger and makes it the default one.
// level: trace|debug|info|warn|error|off; empty keeps SPDLOG_LEVEL or warn.
// Returns false for an unknown level name.
bool init_logging(const std::string &level);

std::shared_ptr<spdlog::logger> logger();
} // namespace hb
