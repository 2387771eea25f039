#include "hb/logging.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace hb
{
namespace
{
constexpr const char *kLoggerName = "hbarrage";
}

bool init_logging(const std::string &level)
{
    auto lg = spdlog::get(kLoggerName);
    if (!lg) lg = spdlog::stderr_color_mt(kLoggerName);
    lg->set_pattern("[%Y-%m-%dT%H:%M:%S.%e] [%^%l%$] %v");
    lg->set_level(spdlog::level::warn);
    spdlog::set_default_logger(lg);

    // SPDLOG_LEVEL=debug or SPDLOG_LEVEL=hbarrage=debug
    spdlog::cfg::load_env_levels();

    if (level.empty()) return true;
    const auto lv = spdlog::level::from_str(level);
    // from_str maps unknown names to off
    if (lv == spdlog::level::off && level != "off") return false;
    lg->set_level(lv);
    return true;
}

std::shared_ptr<spdlog::logger> logger()
{
    if (auto lg = spdlog::get(kLoggerName)) return lg;
    return spdlog::default_logger();
}
} // namespace hb
