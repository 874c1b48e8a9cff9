#pragma once

#include <telechart/methods.hpp>
#include <telechart/sample.hpp>

#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace telechart::data
{

struct OutlierPartition
{
    Series cleaned;
    Series outliers;
};

/// Per-index classification (true = outlier), aligned with `series`.
/// Samples with a non-finite value are always outliers.  A distribution
/// with zero spread (stddev or MAD of 0) flags nothing else.
[[nodiscard]] std::vector<bool> outlier_mask(std::span<const Sample> series,
                                             OutlierMethod           method,
                                             double                  threshold);

/// Splits `series` into cleaned samples and outliers.  Both keep the input
/// order and together contain every input sample exactly once.
[[nodiscard]] OutlierPartition remove_outliers(std::span<const Sample> series,
                                               OutlierMethod           method = OutlierMethod::Iqr,
                                               std::optional<double>   threshold = std::nullopt);

}   // namespace telechart::data
