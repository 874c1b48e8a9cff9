#pragma once

#include <telechart/errors.hpp>
#include <telechart/methods.hpp>
#include <telechart/sample.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace telechart
{

using TransformFunc = std::function<Series(const Series&)>;

struct TransformStep
{
    std::string   name;
    TransformFunc transform;
    bool          enabled = true;
};

// ─── Transform pipeline ─────────────────────────────────────────────────────

// A chain of named steps applied in order, each step's output feeding the
// next.  A step that throws is skipped: the series it was given passes on
// to the following step unchanged.
class TransformPipeline
{
   public:
    TransformPipeline() = default;
    explicit TransformPipeline(const std::string& name) : name_(name) {}

    // Append a step; returns *this so presets can be built fluently.
    TransformPipeline& add_step(TransformStep step);
    TransformPipeline& add_step(const std::string& name, TransformFunc transform);

    // Insert at `index` (clamped to the end).
    void insert_step(size_t index, TransformStep step);

    // Removes every step called `name`; returns how many were removed.
    size_t remove_step(const std::string& name);

    // Remove a step by index (out of range is a no-op)
    void remove(size_t index);

    void clear();

    // Move a step from one position to another
    void move_step(size_t from, size_t to);

    // Disabled steps are skipped by apply()
    void set_enabled(size_t index, bool enabled);
    bool is_enabled(size_t index) const;

    // A step that throws, whatever the type, is logged and its input passed
    // on to the next step.
    [[nodiscard]] Series apply(const Series& input) const;

    // As apply(), additionally recording every step that failed.
    [[nodiscard]] Series apply(const Series& input, std::vector<TransformStepError>& failures) const;

    size_t                            step_count() const { return steps_.size(); }
    const std::vector<TransformStep>& steps() const { return steps_; }
    const TransformStep&              step(size_t index) const { return steps_.at(index); }

    const std::string& name() const { return name_; }
    void               set_name(const std::string& n) { name_ = n; }

    // "outliers(iqr) → smooth(simple, 3)"
    std::string description() const;

    // True when empty or every step is disabled
    bool is_identity() const;

   private:
    std::string                name_;
    std::vector<TransformStep> steps_;
};

// ─── Built-in steps ─────────────────────────────────────────────────────────

namespace steps
{

// Keeps the cleaned part of the partition.
TransformStep remove_outliers(data::OutlierMethod   method    = data::OutlierMethod::Iqr,
                              std::optional<double> threshold = std::nullopt);

TransformStep smooth(size_t window, data::SmoothingMethod method = data::SmoothingMethod::Simple);

TransformStep interpolate(data::InterpolationMethod   method = data::InterpolationMethod::Linear,
                          const data::InterpolationOptions& options = {});

// Throws std::invalid_argument when max_points is 0.
TransformStep decimate(size_t max_points, bool preserve_extremes = true);

// Throws std::invalid_argument when window_ms is not positive.
TransformStep aggregate(double window_ms, data::Reducer reducer = data::Reducer::Mean);

// Drops non-finite samples and sorts by time.
TransformStep sanitize();

}   // namespace steps

// ─── Presets ────────────────────────────────────────────────────────────────

namespace pipelines
{

// IQR outlier removal (k = 1.5), then a 3-point moving average.
TransformPipeline telemetry_smoothing();

// Extreme-preserving decimation to 1000 points.
TransformPipeline performance_optimization();

}   // namespace pipelines

}   // namespace telechart
