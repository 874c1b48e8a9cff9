#pragma once

#include <telechart/methods.hpp>
#include <telechart/sample.hpp>

#include <cstddef>
#include <span>
#include <string_view>

namespace telechart::data
{

/// Fills time gaps between consecutive samples.  For each gap longer than
/// `gap_threshold_ms`, samples are synthesized every `interval_ms` after the
/// gap's start (never at or past its end), at most `max_points_per_gap` of
/// them.  Synthesized samples carry metadata `interpolated = true`,
/// `method`, `source_start` and `source_end`, and the category of the sample
/// before the gap.  Input is sanitized and sorted first.
/// Throws std::invalid_argument when interval_ms is not positive.
[[nodiscard]] Series interpolate_missing(std::span<const Sample>     series,
                                         InterpolationMethod         method  = InterpolationMethod::Linear,
                                         const InterpolationOptions& options = {});

}   // namespace telechart::data
