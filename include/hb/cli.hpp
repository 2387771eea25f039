#pragma once

#include <optional>
#include <string_view>

#include "hb/options.hpp"

namespace hb
{
void print_usage(const char *prog);

// Fills opt from argv. Returns false on --help or on a usage error
// (the error is printed before returning).
bool parse_args(int argc, char **argv, Options &opt);

// "10s", "3m", "1h", "250ms", "1.5s"; a bare number means seconds
std::optional<double> parse_duration_s(std::string_view s);
} // namespace hb
