#pragma once

#include <telechart/sample.hpp>

#include <cstddef>
#include <span>

namespace telechart::data
{

/// Stride decimation that bounds a series to `max_points` samples.
/// Input of `max_points` samples or fewer is returned unchanged.  Otherwise
/// the series is sanitized and sorted by time first.
///
/// With `preserve_extremes`, the first and last samples and the local
/// minimum and maximum of every stride window are kept, and the global
/// minimum and maximum samples are never dropped.  The stride widens until
/// the result fits in `max_points`; if even the pinned samples do not fit
/// (max_points < 4) they are kept in the order global max, global min,
/// first, last.
/// Without it, every `step`-th sample is kept (uniform stride).
/// Output is sorted by time.  Throws std::invalid_argument when max_points == 0.
[[nodiscard]] Series decimate(std::span<const Sample> series,
                              std::size_t             max_points,
                              bool                    preserve_extremes = true);

/// Largest-Triangle-Three-Buckets (LTTB) decimation.
/// Reduces N samples to `target_count` representative samples while
/// preserving the visual shape of the data.  O(N) time.
/// If target_count >= N or target_count < 3, returns the prepared input.
[[nodiscard]] Series lttb(std::span<const Sample> series, std::size_t target_count);

/// Uniform resampling of irregularly-spaced samples via linear interpolation.
/// Produces `output_count` evenly spaced samples in [first.time, last.time];
/// each output inherits the category of its left neighbour.
[[nodiscard]] Series resample_uniform(std::span<const Sample> series, std::size_t output_count);

}   // namespace telechart::data
