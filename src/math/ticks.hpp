#pragma once

#include <string>
#include <utility>
#include <vector>

namespace telechart
{

struct TickResult
{
    std::vector<double>      positions;
    std::vector<std::string> labels;
};

// Tick spacing of 1, 2 or 5 x 10^n giving roughly `target_ticks` ticks
// across [dmin, dmax].  Returns 0 for an empty or non-finite range.
double nice_tick_spacing(double dmin, double dmax, int target_ticks);

// Widens [dmin, dmax] outward to multiples of nice_tick_spacing().
// The result always contains the input interval.
std::pair<double, double> nice_extent(double dmin, double dmax, int target_ticks);

TickResult generate_ticks(double dmin, double dmax, int target_ticks = 7);

// Enough decimal digits that neighbouring ticks at `spacing` differ.
std::string format_tick_value(double value, double spacing);

// ─── Time axis (milliseconds since epoch, UTC) ──────────────────────────────

// Smallest calendar-friendly interval (1 s ... 1 year) that yields at most
// `target_ticks` ticks over the range.
double time_tick_interval(double dmin_ms, double dmax_ms, int target_ticks);

std::pair<double, double> nice_time_extent(double dmin_ms, double dmax_ms, int target_ticks);

TickResult generate_time_ticks(double dmin_ms, double dmax_ms, int target_ticks = 7);

// "HH:MM:SS" below a minute, "HH:MM" below a day, "YYYY-MM-DD" otherwise.
std::string format_time_tick(double ms, double interval_ms);

}   // namespace telechart
