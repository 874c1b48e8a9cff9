#include <telechart/data/stats.hpp>

#include <algorithm>
#include <cmath>

namespace telechart::data
{

std::vector<double> finite_values(std::span<const double> values)
{
    std::vector<double> out;
    out.reserve(values.size());
    for (double v : values)
    {
        if (std::isfinite(v))
            out.push_back(v);
    }
    return out;
}

std::optional<double> mean(std::span<const double> values)
{
    double      sum   = 0.0;
    std::size_t count = 0;
    for (double v : values)
    {
        if (!std::isfinite(v))
            continue;
        sum += v;
        ++count;
    }
    if (count == 0)
        return std::nullopt;
    return sum / static_cast<double>(count);
}

std::optional<double> variance(std::span<const double> values)
{
    // Welford: stable for long telemetry windows with a large offset.
    double      m     = 0.0;
    double      m2    = 0.0;
    std::size_t count = 0;
    for (double v : values)
    {
        if (!std::isfinite(v))
            continue;
        ++count;
        const double delta = v - m;
        m += delta / static_cast<double>(count);
        m2 += delta * (v - m);
    }
    if (count == 0)
        return std::nullopt;
    return m2 / static_cast<double>(count);
}

std::optional<double> stddev(std::span<const double> values)
{
    auto var = variance(values);
    if (!var)
        return std::nullopt;
    return std::sqrt(std::max(*var, 0.0));
}

double quantile_sorted(std::span<const double> sorted, double p)
{
    if (sorted.size() == 1)
        return sorted[0];

    const double idx  = std::clamp(p, 0.0, 1.0) * static_cast<double>(sorted.size() - 1);
    const auto   lo   = static_cast<std::size_t>(std::floor(idx));
    const auto   hi   = static_cast<std::size_t>(std::ceil(idx));
    if (lo == hi)
        return sorted[lo];
    const double frac = idx - static_cast<double>(lo);
    return sorted[lo] * (1.0 - frac) + sorted[hi] * frac;
}

std::optional<double> quantile(std::span<const double> values, double p)
{
    if (std::isnan(p))
        return std::nullopt;
    auto sorted = finite_values(values);
    if (sorted.empty())
        return std::nullopt;
    std::sort(sorted.begin(), sorted.end());
    return quantile_sorted(sorted, p);
}

std::optional<double> median(std::span<const double> values)
{
    return quantile(values, 0.5);
}

std::optional<double> mad(std::span<const double> values)
{
    auto finite = finite_values(values);
    auto med    = median(finite);
    if (!med)
        return std::nullopt;
    for (auto& v : finite)
        v = std::abs(v - *med);
    return median(finite);
}

std::optional<std::pair<double, double>> min_max(std::span<const double> values)
{
    bool   any = false;
    double lo  = 0.0;
    double hi  = 0.0;
    for (double v : values)
    {
        if (!std::isfinite(v))
            continue;
        if (!any)
        {
            lo = hi = v;
            any     = true;
            continue;
        }
        lo = std::min(lo, v);
        hi = std::max(hi, v);
    }
    if (!any)
        return std::nullopt;
    return std::make_pair(lo, hi);
}

std::optional<double> pearson_correlation(std::span<const double> x, std::span<const double> y)
{
    const std::size_t n = std::min(x.size(), y.size());
    std::vector<double> xs, ys;
    xs.reserve(n);
    ys.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
    {
        if (std::isfinite(x[i]) && std::isfinite(y[i]))
        {
            xs.push_back(x[i]);
            ys.push_back(y[i]);
        }
    }
    if (xs.size() < 2)
        return std::nullopt;

    const double mx = *mean(xs);
    const double my = *mean(ys);

    double sxy = 0.0, sxx = 0.0, syy = 0.0;
    for (std::size_t i = 0; i < xs.size(); ++i)
    {
        const double dx = xs[i] - mx;
        const double dy = ys[i] - my;
        sxy += dx * dy;
        sxx += dx * dx;
        syy += dy * dy;
    }
    if (sxx <= 0.0 || syy <= 0.0)
        return std::nullopt;
    return std::clamp(sxy / std::sqrt(sxx * syy), -1.0, 1.0);
}

}   // namespace telechart::data
