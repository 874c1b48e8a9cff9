#include <telechart/data/aggregation.hpp>
#include <telechart/data/decimation.hpp>
#include <telechart/data/filters.hpp>
#include <telechart/data/interpolation.hpp>
#include <telechart/data/outliers.hpp>
#include <telechart/logger.hpp>
#include <telechart/pipeline.hpp>

#include <cmath>
#include <cstdio>
#include <sstream>
#include <stdexcept>

namespace telechart
{

// ─── TransformPipeline ──────────────────────────────────────────────────────

TransformPipeline& TransformPipeline::add_step(TransformStep step)
{
    steps_.push_back(std::move(step));
    return *this;
}

TransformPipeline& TransformPipeline::add_step(const std::string& name, TransformFunc transform)
{
    return add_step(TransformStep{name, std::move(transform), true});
}

void TransformPipeline::insert_step(size_t index, TransformStep step)
{
    if (index > steps_.size())
        index = steps_.size();
    steps_.insert(steps_.begin() + static_cast<std::ptrdiff_t>(index), std::move(step));
}

size_t TransformPipeline::remove_step(const std::string& name)
{
    return std::erase_if(steps_, [&](const TransformStep& s) { return s.name == name; });
}

void TransformPipeline::remove(size_t index)
{
    if (index < steps_.size())
    {
        steps_.erase(steps_.begin() + static_cast<std::ptrdiff_t>(index));
    }
}

void TransformPipeline::clear()
{
    steps_.clear();
}

void TransformPipeline::move_step(size_t from, size_t to)
{
    if (from >= steps_.size() || to >= steps_.size() || from == to)
        return;
    auto step = std::move(steps_[from]);
    steps_.erase(steps_.begin() + static_cast<std::ptrdiff_t>(from));
    steps_.insert(steps_.begin() + static_cast<std::ptrdiff_t>(to), std::move(step));
}

void TransformPipeline::set_enabled(size_t index, bool enabled)
{
    if (index < steps_.size())
    {
        steps_[index].enabled = enabled;
    }
}

bool TransformPipeline::is_enabled(size_t index) const
{
    if (index < steps_.size())
        return steps_[index].enabled;
    return false;
}

Series TransformPipeline::apply(const Series& input) const
{
    std::vector<TransformStepError> failures;
    return apply(input, failures);
}

Series TransformPipeline::apply(const Series& input, std::vector<TransformStepError>& failures) const
{
    Series current = input;
    for (const auto& step : steps_)
    {
        if (!step.enabled)
            continue;

        try
        {
            Series next = step.transform(current);
            TELECHART_LOG_TRACE("pipeline",
                                "step '{}': {} -> {} samples",
                                step.name,
                                current.size(),
                                next.size());
            current = std::move(next);
        }
        catch (const std::exception& e)
        {
            TELECHART_LOG_WARN("pipeline",
                               "step '{}' failed, passing its input through: {}",
                               step.name,
                               e.what());
            failures.emplace_back(step.name, e.what());
        }
        catch (...)
        {
            TELECHART_LOG_WARN("pipeline",
                               "step '{}' threw a non-standard exception, passing its input through",
                               step.name);
            failures.emplace_back(step.name, "unknown exception");
        }
    }
    return current;
}

std::string TransformPipeline::description() const
{
    if (steps_.empty())
        return "Empty pipeline";

    std::ostringstream ss;
    bool               first = true;
    for (const auto& step : steps_)
    {
        if (!step.enabled)
            continue;
        if (!first)
            ss << " → ";
        first = false;
        ss << step.name;
    }
    return first ? "All steps disabled" : ss.str();
}

bool TransformPipeline::is_identity() const
{
    for (const auto& step : steps_)
    {
        if (step.enabled)
            return false;
    }
    return true;
}

// ─── Built-in steps ─────────────────────────────────────────────────────────

namespace steps
{

namespace
{

std::string format_param(double v)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%g", v);
    return buf;
}

}   // namespace

TransformStep remove_outliers(data::OutlierMethod method, std::optional<double> threshold)
{
    std::string name = std::string("outliers(") + data::outlier_method_name(method);
    if (threshold)
        name += ", " + format_param(*threshold);
    name += ")";

    return {name,
            [method, threshold](const Series& s)
            { return data::remove_outliers(s, method, threshold).cleaned; },
            true};
}

TransformStep smooth(size_t window, data::SmoothingMethod method)
{
    return {std::string("smooth(") + data::smoothing_method_name(method) + ", "
                + std::to_string(window) + ")",
            [window, method](const Series& s) { return data::smooth(s, window, method); },
            true};
}

TransformStep interpolate(data::InterpolationMethod method, const data::InterpolationOptions& options)
{
    if (!(options.interval_ms > 0.0))
        throw std::invalid_argument("interpolate: interval_ms must be positive");
    return {std::string("interpolate(") + data::interpolation_method_name(method) + ")",
            [method, options](const Series& s)
            { return data::interpolate_missing(s, method, options); },
            true};
}

TransformStep decimate(size_t max_points, bool preserve_extremes)
{
    if (max_points == 0)
        throw std::invalid_argument("decimate: max_points must be positive");
    return {"decimate(" + std::to_string(max_points) + (preserve_extremes ? ", extremes)" : ")"),
            [max_points, preserve_extremes](const Series& s)
            { return data::decimate(s, max_points, preserve_extremes); },
            true};
}

TransformStep aggregate(double window_ms, data::Reducer reducer)
{
    if (!(window_ms > 0.0) || !std::isfinite(window_ms))
        throw std::invalid_argument("aggregate: window_ms must be positive");
    return {std::string("aggregate(") + data::reducer_name(reducer) + ", "
                + format_param(window_ms) + "ms)",
            [window_ms, reducer](const Series& s)
            { return data::aggregate_by_window(s, window_ms, reducer); },
            true};
}

TransformStep sanitize()
{
    return {"sanitize", [](const Series& s) { return prepare(s); }, true};
}

}   // namespace steps

// ─── Presets ────────────────────────────────────────────────────────────────

namespace pipelines
{

TransformPipeline telemetry_smoothing()
{
    TransformPipeline p("telemetry_smoothing");
    p.add_step(steps::remove_outliers(data::OutlierMethod::Iqr, 1.5))
        .add_step(steps::smooth(3, data::SmoothingMethod::Simple));
    return p;
}

TransformPipeline performance_optimization()
{
    TransformPipeline p("performance_optimization");
    p.add_step(steps::decimate(1000, true));
    return p;
}

}   // namespace pipelines

}   // namespace telechart
