#include <telechart/data/interpolation.hpp>

#include <cmath>
#include <stdexcept>
#include <string>

namespace telechart::data
{

const char* interpolation_method_name(InterpolationMethod method)
{
    switch (method)
    {
        case InterpolationMethod::Linear:
            return "linear";
        case InterpolationMethod::Step:
            return "step";
        case InterpolationMethod::Spline:
            return "spline";
    }
    return "unknown";
}

InterpolationMethod parse_interpolation_method(std::string_view name)
{
    if (name == "linear")
        return InterpolationMethod::Linear;
    if (name == "step")
        return InterpolationMethod::Step;
    if (name == "spline")
        return InterpolationMethod::Spline;
    throw std::invalid_argument("Unknown interpolation method: " + std::string(name));
}

static double blend(InterpolationMethod method, double from, double to, double t)
{
    switch (method)
    {
        case InterpolationMethod::Linear:
            return from + (to - from) * t;
        case InterpolationMethod::Step:
            return from;
        case InterpolationMethod::Spline:
        {
            const double eased = t * t * (3.0 - 2.0 * t);
            return from + (to - from) * eased;
        }
    }
    return from;
}

Series interpolate_missing(std::span<const Sample>     series,
                           InterpolationMethod         method,
                           const InterpolationOptions& options)
{
    if (!(options.interval_ms > 0.0))
        throw std::invalid_argument("interpolate_missing: interval_ms must be positive");

    Series s = prepare(series);
    if (s.size() < 2)
        return s;

    Series out;
    out.reserve(s.size());

    for (std::size_t i = 0; i + 1 < s.size(); ++i)
    {
        const Sample& a = s[i];
        const Sample& b = s[i + 1];
        out.push_back(a);

        const double gap = b.time - a.time;
        if (gap <= options.gap_threshold_ms)
            continue;

        for (std::size_t k = 1; k <= options.max_points_per_gap; ++k)
        {
            const double t = a.time + static_cast<double>(k) * options.interval_ms;
            if (t >= b.time)
                break;

            Sample fill;
            fill.time                     = t;
            fill.value                    = blend(method, a.value, b.value, (t - a.time) / gap);
            fill.category                 = a.category;
            fill.metadata["interpolated"] = true;
            fill.metadata["method"]       = std::string(interpolation_method_name(method));
            fill.metadata["source_start"] = a.time;
            fill.metadata["source_end"]   = b.time;
            out.push_back(std::move(fill));
        }
    }
    out.push_back(s.back());

    return out;
}

}   // namespace telechart::data
