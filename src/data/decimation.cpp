#include <telechart/data/decimation.hpp>
#include <telechart/logger.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

namespace telechart::data
{

namespace
{

struct Extremes
{
    std::size_t min_idx = 0;
    std::size_t max_idx = 0;
};

// First occurrence of the global min and max value.
Extremes find_extremes(const Series& s)
{
    Extremes e;
    for (std::size_t i = 1; i < s.size(); ++i)
    {
        if (s[i].value < s[e.min_idx].value)
            e.min_idx = i;
        if (s[i].value > s[e.max_idx].value)
            e.max_idx = i;
    }
    return e;
}

// Indices kept by an extreme-preserving pass with the given stride.
// Returned sorted and unique.
std::vector<std::size_t> min_max_indices(const Series& s, std::size_t step, const Extremes& ext)
{
    const std::size_t        n = s.size();
    std::vector<std::size_t> keep;
    keep.reserve(2 * (n / step + 1) + 4);

    keep.push_back(0);
    keep.push_back(n - 1);
    keep.push_back(ext.min_idx);
    keep.push_back(ext.max_idx);

    for (std::size_t start = 0; start < n; start += step)
    {
        const std::size_t end     = std::min(start + step, n);
        std::size_t       min_idx = start;
        std::size_t       max_idx = start;
        for (std::size_t i = start + 1; i < end; ++i)
        {
            if (s[i].value < s[min_idx].value)
                min_idx = i;
            if (s[i].value > s[max_idx].value)
                max_idx = i;
        }
        keep.push_back(min_idx);
        keep.push_back(max_idx);
    }

    std::sort(keep.begin(), keep.end());
    keep.erase(std::unique(keep.begin(), keep.end()), keep.end());
    return keep;
}

Series gather(const Series& s, const std::vector<std::size_t>& indices)
{
    Series out;
    out.reserve(indices.size());
    for (std::size_t idx : indices)
        out.push_back(s[idx]);
    return out;
}

}   // namespace

Series decimate(std::span<const Sample> series, std::size_t max_points, bool preserve_extremes)
{
    if (max_points == 0)
        throw std::invalid_argument("decimate: max_points must be positive");

    if (series.size() <= max_points)
        return Series(series.begin(), series.end());

    Series prepared = prepare(series);
    const std::size_t n = prepared.size();
    if (n <= max_points)
        return prepared;

    std::size_t step = (n + max_points - 1) / max_points;

    if (!preserve_extremes)
    {
        Series out;
        out.reserve(max_points);
        for (std::size_t i = 0; i < n; i += step)
            out.push_back(prepared[i]);
        TELECHART_LOG_DEBUG("decimation", "Uniform decimation {} -> {} (step {})", n, out.size(), step);
        return out;
    }

    const Extremes ext  = find_extremes(prepared);
    auto           keep = min_max_indices(prepared, step, ext);

    // Each window contributes up to two samples, so the first pass can land
    // at roughly 2 * max_points.  Widen the stride until it fits.
    while (keep.size() > max_points && step < n)
    {
        const std::size_t grown =
            (step * keep.size() + max_points - 1) / max_points;
        step = std::min(std::max(grown, step + 1), n);
        keep = min_max_indices(prepared, step, ext);
    }

    if (keep.size() > max_points)
    {
        // Only the pinned samples are left and they still do not fit.
        std::vector<std::size_t> priority = {ext.max_idx, ext.min_idx, 0, n - 1};
        keep.clear();
        for (std::size_t idx : priority)
        {
            if (keep.size() == max_points)
                break;
            if (std::find(keep.begin(), keep.end(), idx) == keep.end())
                keep.push_back(idx);
        }
        std::sort(keep.begin(), keep.end());
    }

    TELECHART_LOG_DEBUG("decimation", "Min/max decimation {} -> {} (step {})", n, keep.size(), step);
    return gather(prepared, keep);
}

Series lttb(std::span<const Sample> series, std::size_t target_count)
{
    Series            s = prepare(series);
    const std::size_t n = s.size();

    if (target_count >= n || target_count < 3)
        return s;

    Series out;
    out.reserve(target_count);

    // Always keep the first point
    out.push_back(s[0]);

    const double bucket_size = static_cast<double>(n - 2) / static_cast<double>(target_count - 2);

    std::size_t prev_selected = 0;

    for (std::size_t bucket = 0; bucket < target_count - 2; ++bucket)
    {
        const auto bucket_start =
            static_cast<std::size_t>(std::floor(static_cast<double>(bucket) * bucket_size)) + 1;
        const auto bucket_end =
            static_cast<std::size_t>(std::floor(static_cast<double>(bucket + 1) * bucket_size)) + 1;

        // Next bucket range (for computing the average point)
        const std::size_t next_start = bucket_end;
        const std::size_t next_end =
            (bucket + 2 < target_count - 1)
                ? static_cast<std::size_t>(std::floor(static_cast<double>(bucket + 2) * bucket_size))
                      + 1
                : n;

        double            avg_t = 0.0, avg_v = 0.0;
        const std::size_t next_count = std::min(next_end, n) - std::min(next_start, n);
        if (next_count > 0)
        {
            for (std::size_t i = next_start; i < next_end && i < n; ++i)
            {
                avg_t += s[i].time;
                avg_v += s[i].value;
            }
            avg_t /= static_cast<double>(next_count);
            avg_v /= static_cast<double>(next_count);
        }

        // Point in the current bucket forming the largest triangle with the
        // previously selected point and the next bucket's average.
        double      max_area = -1.0;
        std::size_t best     = bucket_start;

        const double pt = s[prev_selected].time;
        const double pv = s[prev_selected].value;

        for (std::size_t i = bucket_start; i < bucket_end && i < n; ++i)
        {
            const double area =
                std::abs((pt - avg_t) * (s[i].value - pv) - (pt - s[i].time) * (avg_v - pv));
            if (area > max_area)
            {
                max_area = area;
                best     = i;
            }
        }

        out.push_back(s[best]);
        prev_selected = best;
    }

    // Always keep the last point
    out.push_back(s[n - 1]);

    return out;
}

Series resample_uniform(std::span<const Sample> series, std::size_t output_count)
{
    Series            s = prepare(series);
    const std::size_t n = s.size();

    if (n == 0 || output_count == 0)
        return {};
    if (n == 1)
        return s;

    Series out;
    out.reserve(output_count);

    const double t_start = s.front().time;
    const double t_end   = s.back().time;
    const double step =
        (output_count > 1) ? (t_end - t_start) / static_cast<double>(output_count - 1) : 0.0;

    std::size_t j = 0;   // current index into the input

    for (std::size_t i = 0; i < output_count; ++i)
    {
        const double ti = t_start + static_cast<double>(i) * step;

        // Advance j so that s[j].time <= ti < s[j+1].time
        while (j + 1 < n && s[j + 1].time < ti)
            ++j;

        Sample sample;
        sample.time = ti;
        if (j + 1 >= n)
        {
            sample.value    = s[n - 1].value;
            sample.category = s[n - 1].category;
        }
        else
        {
            const double dt = s[j + 1].time - s[j].time;
            sample.category = s[j].category;
            if (dt <= 0.0)
            {
                sample.value = s[j].value;
            }
            else
            {
                const double t = std::clamp((ti - s[j].time) / dt, 0.0, 1.0);
                sample.value   = s[j].value + t * (s[j + 1].value - s[j].value);
            }
        }
        out.push_back(std::move(sample));
    }

    return out;
}

}   // namespace telechart::data
