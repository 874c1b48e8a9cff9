#pragma once

#include <telechart/methods.hpp>
#include <telechart/sample.hpp>

#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

namespace telechart::data
{

/// Smooths the values of a series.  Output has the same length as the input
/// and is ordered by time; only `value` changes.  Samples with a non-finite
/// time or value are excluded from every window and passed through at the
/// end of the output unchanged.
/// If the series is shorter than `window_size` it is returned unchanged.
[[nodiscard]] Series smooth(std::span<const Sample> series,
                            std::size_t             window_size,
                            SmoothingMethod         method = SmoothingMethod::Simple);

/// Simple moving average (SMA) filter.
/// Each output sample is the mean of the surrounding `window_size` input samples
/// (centered window).  Output has the same length as input.
/// Edge samples use a smaller, asymmetric window (no padding).
[[nodiscard]] std::vector<double> moving_average(std::span<const double> values,
                                                 std::size_t             window_size);

/// Exponential moving average (EMA) filter, single forward pass.
/// alpha in (0, 1] controls smoothing: higher alpha = less smoothing.
/// Output[0] = values[0]; Output[i] = alpha * values[i] + (1 - alpha) * Output[i-1].
[[nodiscard]] std::vector<double> exponential_smoothing(std::span<const double> values,
                                                        double                  alpha);

/// Gaussian-weighted moving average.
/// `sigma` controls the width of the kernel (in samples), `radius` is the
/// half-width of the window (kernel size = 2*radius + 1).  If radius == 0 it
/// is set to ceil(3 * sigma).  Weights are renormalized over the part of the
/// window that falls inside the data.
[[nodiscard]] std::vector<double> gaussian_smooth(std::span<const double> values,
                                                  double                  sigma,
                                                  std::size_t             radius = 0);

}   // namespace telechart::data
