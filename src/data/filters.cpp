#include <telechart/data/filters.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace telechart::data
{

const char* smoothing_method_name(SmoothingMethod method)
{
    switch (method)
    {
        case SmoothingMethod::Simple:
            return "simple";
        case SmoothingMethod::Exponential:
            return "exponential";
        case SmoothingMethod::Gaussian:
            return "gaussian";
    }
    return "unknown";
}

SmoothingMethod parse_smoothing_method(std::string_view name)
{
    if (name == "simple" || name == "sma")
        return SmoothingMethod::Simple;
    if (name == "exponential" || name == "ema")
        return SmoothingMethod::Exponential;
    if (name == "gaussian")
        return SmoothingMethod::Gaussian;
    throw std::invalid_argument("Unknown smoothing method: " + std::string(name));
}

Series smooth(std::span<const Sample> series, std::size_t window_size, SmoothingMethod method)
{
    if (series.size() < window_size)
        return Series(series.begin(), series.end());
    if (window_size == 0)
        window_size = 1;

    Series out = sorted_by_time(sanitize(series));
    if (out.size() < window_size)
        return Series(series.begin(), series.end());

    const auto values = values_of(out);

    std::vector<double> smoothed;
    switch (method)
    {
        case SmoothingMethod::Simple:
            smoothed = moving_average(values, window_size);
            break;
        case SmoothingMethod::Exponential:
            smoothed = exponential_smoothing(values, 2.0 / (static_cast<double>(window_size) + 1.0));
            break;
        case SmoothingMethod::Gaussian:
            // A one-sample window has nothing to blend.
            if (window_size / 2 == 0)
                smoothed = values;
            else
                smoothed = gaussian_smooth(values,
                                           static_cast<double>(window_size) / 3.0,
                                           window_size / 2);
            break;
    }

    for (std::size_t i = 0; i < out.size(); ++i)
        out[i].value = smoothed[i];

    for (const auto& s : series)
    {
        if (!is_valid(s))
            out.push_back(s);
    }
    return out;
}

std::vector<double> moving_average(std::span<const double> values, std::size_t window_size)
{
    const std::size_t n = values.size();
    if (n == 0)
        return {};
    if (window_size == 0)
        window_size = 1;

    std::vector<double> out(n);

    // Half-window (centered)
    const std::size_t half = window_size / 2;

    // Prefix sums keep this O(n) regardless of the window
    std::vector<double> prefix(n + 1, 0.0);
    for (std::size_t i = 0; i < n; ++i)
        prefix[i + 1] = prefix[i] + values[i];

    for (std::size_t i = 0; i < n; ++i)
    {
        const std::size_t lo    = (i >= half) ? (i - half) : 0;
        const std::size_t hi    = std::min(i + half, n - 1);
        const auto        count = static_cast<double>(hi - lo + 1);
        out[i]                  = (prefix[hi + 1] - prefix[lo]) / count;
    }

    return out;
}

std::vector<double> exponential_smoothing(std::span<const double> values, double alpha)
{
    const std::size_t n = values.size();
    if (n == 0)
        return {};
    if (!(alpha > 0.0 && alpha <= 1.0))
        throw std::invalid_argument("exponential_smoothing: alpha must be in (0, 1]");

    std::vector<double> out(n);
    out[0] = values[0];

    const double one_minus_alpha = 1.0 - alpha;
    for (std::size_t i = 1; i < n; ++i)
        out[i] = alpha * values[i] + one_minus_alpha * out[i - 1];

    return out;
}

std::vector<double> gaussian_smooth(std::span<const double> values, double sigma, std::size_t radius)
{
    const std::size_t n = values.size();
    if (n == 0)
        return {};
    if (sigma <= 0.0)
        return {values.begin(), values.end()};

    if (radius == 0)
        radius = static_cast<std::size_t>(std::ceil(3.0 * sigma));

    const std::size_t   kernel_size = 2 * radius + 1;
    std::vector<double> kernel(kernel_size);
    const double        inv_2sigma2 = 1.0 / (2.0 * sigma * sigma);
    for (std::size_t k = 0; k < kernel_size; ++k)
    {
        const auto d = static_cast<double>(static_cast<long long>(k) - static_cast<long long>(radius));
        kernel[k]    = std::exp(-d * d * inv_2sigma2);
    }

    std::vector<double> out(n);
    const auto          signed_n = static_cast<long long>(n);
    for (std::size_t i = 0; i < n; ++i)
    {
        double acc   = 0.0;
        double w_sum = 0.0;
        for (std::size_t k = 0; k < kernel_size; ++k)
        {
            const long long j = static_cast<long long>(i) + static_cast<long long>(k)
                                - static_cast<long long>(radius);
            if (j >= 0 && j < signed_n)
            {
                acc += kernel[k] * values[static_cast<std::size_t>(j)];
                w_sum += kernel[k];
            }
        }
        out[i] = acc / w_sum;
    }

    return out;
}

}   // namespace telechart::data
