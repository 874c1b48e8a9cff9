#pragma once

#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace telechart::data
{

/// Statistics kernel.  Every function ignores NaN/inf entries and returns
/// std::nullopt when nothing finite is left, so callers can apply their own
/// fallback instead of catching.

/// Finite entries of `values`, in their original order.
[[nodiscard]] std::vector<double> finite_values(std::span<const double> values);

[[nodiscard]] std::optional<double> mean(std::span<const double> values);

/// Population variance / standard deviation (divides by N).
[[nodiscard]] std::optional<double> variance(std::span<const double> values);
[[nodiscard]] std::optional<double> stddev(std::span<const double> values);

[[nodiscard]] std::optional<double> median(std::span<const double> values);

/// Quantile for p in [0, 1] (clamped), linear interpolation between the
/// closest order statistics.
[[nodiscard]] std::optional<double> quantile(std::span<const double> values, double p);

/// Same as quantile() but on an already sorted, finite input.  No checks.
[[nodiscard]] double quantile_sorted(std::span<const double> sorted, double p);

/// Median absolute deviation from the median (unscaled).
[[nodiscard]] std::optional<double> mad(std::span<const double> values);

[[nodiscard]] std::optional<std::pair<double, double>> min_max(std::span<const double> values);

/// Pearson correlation over pairs where both x[i] and y[i] are finite.
/// nullopt when fewer than two pairs remain or either side has zero variance.
[[nodiscard]] std::optional<double> pearson_correlation(std::span<const double> x,
                                                        std::span<const double> y);

}   // namespace telechart::data
