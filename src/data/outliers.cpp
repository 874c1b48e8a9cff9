#include <telechart/data/outliers.hpp>
#include <telechart/data/stats.hpp>

#include <cmath>
#include <stdexcept>
#include <string>

namespace telechart::data
{

const char* outlier_method_name(OutlierMethod method)
{
    switch (method)
    {
        case OutlierMethod::Iqr:
            return "iqr";
        case OutlierMethod::ZScore:
            return "zscore";
        case OutlierMethod::ModifiedZScore:
            return "modified_zscore";
    }
    return "unknown";
}

OutlierMethod parse_outlier_method(std::string_view name)
{
    if (name == "iqr")
        return OutlierMethod::Iqr;
    if (name == "zscore" || name == "z-score")
        return OutlierMethod::ZScore;
    if (name == "modified_zscore" || name == "modified-zscore")
        return OutlierMethod::ModifiedZScore;
    throw std::invalid_argument("Unknown outlier method: " + std::string(name));
}

double default_outlier_threshold(OutlierMethod method)
{
    switch (method)
    {
        case OutlierMethod::Iqr:
            return 1.5;
        case OutlierMethod::ZScore:
            return 3.0;
        case OutlierMethod::ModifiedZScore:
            return 3.5;
    }
    return 1.5;
}

std::vector<bool> outlier_mask(std::span<const Sample> series, OutlierMethod method, double threshold)
{
    const auto        values = values_of(series);
    std::vector<bool> mask(values.size(), false);

    for (std::size_t i = 0; i < values.size(); ++i)
        mask[i] = !std::isfinite(values[i]);

    switch (method)
    {
        case OutlierMethod::Iqr:
        {
            auto q1 = quantile(values, 0.25);
            auto q3 = quantile(values, 0.75);
            if (!q1 || !q3)
                break;
            const double iqr   = *q3 - *q1;
            const double lower = *q1 - threshold * iqr;
            const double upper = *q3 + threshold * iqr;
            for (std::size_t i = 0; i < values.size(); ++i)
            {
                if (!mask[i] && (values[i] < lower || values[i] > upper))
                    mask[i] = true;
            }
            break;
        }
        case OutlierMethod::ZScore:
        {
            auto m  = mean(values);
            auto sd = stddev(values);
            if (!m || !sd || *sd <= 0.0)
                break;
            for (std::size_t i = 0; i < values.size(); ++i)
            {
                if (!mask[i] && std::abs(values[i] - *m) / *sd > threshold)
                    mask[i] = true;
            }
            break;
        }
        case OutlierMethod::ModifiedZScore:
        {
            auto med = median(values);
            auto dev = mad(values);
            if (!med || !dev || *dev <= 0.0)
                break;
            for (std::size_t i = 0; i < values.size(); ++i)
            {
                if (!mask[i] && std::abs(0.6745 * (values[i] - *med) / *dev) > threshold)
                    mask[i] = true;
            }
            break;
        }
    }
    return mask;
}

OutlierPartition remove_outliers(std::span<const Sample> series,
                                 OutlierMethod           method,
                                 std::optional<double>   threshold)
{
    const double k    = threshold.value_or(default_outlier_threshold(method));
    const auto   mask = outlier_mask(series, method, k);

    OutlierPartition result;
    result.cleaned.reserve(series.size());
    for (std::size_t i = 0; i < series.size(); ++i)
    {
        if (mask[i])
            result.outliers.push_back(series[i]);
        else
            result.cleaned.push_back(series[i]);
    }
    return result;
}

}   // namespace telechart::data
