#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include "hb/model.hpp"

namespace hb
{
// Forward declarations to avoid heavy includes in header
struct Summary;
struct EndLine;
class RunningAggregate;

// Text summary (complete block with trailing newline)
std::string format_summary_text(const Summary &s);

// Final JSON (single object string without trailing newline)
std::string build_summary_json(const Summary &s);

// Computes the summary over outcomes and writes it to out as text or JSON.
void print_summary(std::ostream &out,
                   const std::vector<Outcome> &outcomes,
                   double elapsed_s,
                   bool json);

// Live dashboard frame, without terminal control sequences
std::string format_live_frame(RunningAggregate &agg,
                              const EndLine &end_line,
                              double elapsed_s,
                              Clock::time_point now);

// Progress bar of `width` cells for ratio 0..1
std::string progress_bar(double ratio, int width);
} // namespace hb
