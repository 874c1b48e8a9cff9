#include "math/ticks.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <limits>

namespace telechart
{

// Rounds x (> 0) onto the 1, 2, 5, 10 ladder times a power of ten.
// `nearest` picks the closest rung, otherwise the smallest rung >= x.
static double nice_number(double x, bool nearest)
{
    static constexpr std::array<double, 4> RUNGS        = {1.0, 2.0, 5.0, 10.0};
    static constexpr std::array<double, 3> NEAREST_CUTS = {1.5, 3.0, 7.0};

    const double magnitude = std::pow(10.0, std::floor(std::log10(x)));
    const double f         = x / magnitude;

    std::size_t rung = 0;
    if (nearest)
    {
        while (rung < NEAREST_CUTS.size() && f >= NEAREST_CUTS[rung])
            ++rung;
    }
    else
    {
        while (rung + 1 < RUNGS.size() && f > RUNGS[rung])
            ++rung;
    }
    return RUNGS[rung] * magnitude;
}

double nice_tick_spacing(double dmin, double dmax, int target_ticks)
{
    const double range = dmax - dmin;
    if (!(range > 0.0) || !std::isfinite(range))
        return 0.0;

    const int    intervals = std::max(target_ticks, 2) - 1;
    const double spacing   = nice_number(nice_number(range, false) / intervals, true);
    return std::isfinite(spacing) && spacing > 0.0 ? spacing : 0.0;
}

std::pair<double, double> nice_extent(double dmin, double dmax, int target_ticks)
{
    const double spacing = nice_tick_spacing(dmin, dmax, target_ticks);
    if (spacing <= 0.0)
        return {dmin, dmax};

    // floor/ceil of a quotient can land a hair inside the original bounds
    return {std::min(std::floor(dmin / spacing) * spacing, dmin),
            std::max(std::ceil(dmax / spacing) * spacing, dmax)};
}

std::string format_tick_value(double value, double spacing)
{
    spacing = std::abs(spacing);
    if (std::abs(value) < spacing * 1e-6)
        return "0";

    char buf[64];
    if (!(spacing > 0.0) || !std::isfinite(spacing))
    {
        std::snprintf(buf, sizeof(buf), "%g", value);
        return buf;
    }

    // Just enough decimals that neighbours one spacing apart differ.
    const int    decimals  = std::max(0, static_cast<int>(std::ceil(-std::log10(spacing) - 1e-9)));
    const double magnitude = std::abs(value);

    if (decimals <= 9 && magnitude >= 1e-3 && magnitude < 1e9)
    {
        std::snprintf(buf, sizeof(buf), "%.*f", decimals, value);
    }
    else
    {
        const int significant =
            std::clamp(static_cast<int>(std::ceil(std::log10(magnitude / spacing))) + 1, 3, 15);
        std::snprintf(buf, sizeof(buf), "%.*e", significant - 1, value);
    }

    std::string label(buf);
    // Rounding can leave "-0" or "-0.00".
    if (label.front() == '-' && label.find_first_of("123456789") == std::string::npos)
        label.erase(0, 1);
    return label;
}

TickResult generate_ticks(double dmin, double dmax, int target_ticks)
{
    if (dmin > dmax)
        std::swap(dmin, dmax);

    TickResult out;
    auto       emit = [&out](double v, double spacing)
    {
        out.positions.push_back(v);
        out.labels.push_back(format_tick_value(v, spacing));
    };

    if (dmin == dmax)
    {
        if (dmin == 0.0)
        {
            emit(0.0, 1.0);
            return out;
        }
        const double pad = std::abs(dmin) * 0.1;
        return generate_ticks(dmin - pad, dmax + pad, target_ticks);
    }

    // Below a few ulps of the bounds neighbouring ticks would print the same.
    const double span       = dmax - dmin;
    const double resolution = std::max(std::max(std::abs(dmin), std::abs(dmax))
                                           * std::numeric_limits<double>::epsilon() * 16.0,
                                       std::numeric_limits<double>::min());
    const double spacing    = span < resolution ? 0.0 : nice_tick_spacing(dmin, dmax, target_ticks);
    if (spacing <= 0.0)
    {
        emit(dmin + span * 0.5, span);
        return out;
    }

    // Integer multiples of the spacing, so positions carry no accumulated error.
    const auto      first = static_cast<long long>(std::ceil(dmin / spacing - 0.01));
    const auto      last  = static_cast<long long>(std::floor(dmax / spacing + 0.01));
    const long long limit = first + 3LL * std::max(target_ticks, 2);
    for (long long k = first; k <= last && k < limit; ++k)
        emit(k == 0 ? 0.0 : static_cast<double>(k) * spacing, spacing);
    return out;
}

// ─── Time axis ──────────────────────────────────────────────────────────────

namespace
{

constexpr double SECOND = 1000.0;
constexpr double MINUTE = 60.0 * SECOND;
constexpr double HOUR   = 60.0 * MINUTE;
constexpr double DAY    = 24.0 * HOUR;

constexpr std::array<double, 17> TIME_INTERVALS = {
    SECOND,      5 * SECOND, 15 * SECOND, 30 * SECOND, MINUTE,    5 * MINUTE,
    15 * MINUTE, 30 * MINUTE, HOUR,       3 * HOUR,    6 * HOUR,  12 * HOUR,
    DAY,         2 * DAY,    7 * DAY,     30 * DAY,    365 * DAY,
};

}   // namespace

double time_tick_interval(double dmin_ms, double dmax_ms, int target_ticks)
{
    const double range = std::abs(dmax_ms - dmin_ms);
    target_ticks       = std::max(target_ticks, 1);
    for (double interval : TIME_INTERVALS)
    {
        if (range / interval <= static_cast<double>(target_ticks))
            return interval;
    }
    // Beyond a year per tick: whole multiples of a year.
    const double years = std::ceil(range / (TIME_INTERVALS.back() * target_ticks));
    return years * TIME_INTERVALS.back();
}

std::pair<double, double> nice_time_extent(double dmin_ms, double dmax_ms, int target_ticks)
{
    if (!(dmax_ms > dmin_ms))
        return {dmin_ms, dmax_ms};
    const double interval = time_tick_interval(dmin_ms, dmax_ms, target_ticks);
    return {std::min(std::floor(dmin_ms / interval) * interval, dmin_ms),
            std::max(std::ceil(dmax_ms / interval) * interval, dmax_ms)};
}

std::string format_time_tick(double ms, double interval_ms)
{
    const auto secs = static_cast<std::time_t>(std::floor(ms / 1000.0));
    std::tm    tm_buf{};
    gmtime_r(&secs, &tm_buf);

    const char* fmt = "%Y-%m-%d";
    if (interval_ms < MINUTE)
        fmt = "%H:%M:%S";
    else if (interval_ms < DAY)
        fmt = "%H:%M";

    char buf[32];
    std::strftime(buf, sizeof(buf), fmt, &tm_buf);
    return buf;
}

TickResult generate_time_ticks(double dmin_ms, double dmax_ms, int target_ticks)
{
    if (dmin_ms > dmax_ms)
        std::swap(dmin_ms, dmax_ms);

    // Sub-second spans read better as plain millisecond numbers.
    if (dmax_ms - dmin_ms < SECOND)
        return generate_ticks(dmin_ms, dmax_ms, target_ticks);

    TickResult   result;
    const double interval = time_tick_interval(dmin_ms, dmax_ms, target_ticks);
    for (double v = std::ceil(dmin_ms / interval) * interval; v <= dmax_ms; v += interval)
    {
        result.positions.push_back(v);
        result.labels.push_back(format_time_tick(v, interval));
    }
    return result;
}

}   // namespace telechart
