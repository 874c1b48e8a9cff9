#include <telechart/data/stats.hpp>
#include <telechart/errors.hpp>
#include <telechart/logger.hpp>
#include <telechart/threshold.hpp>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <stdexcept>

namespace telechart
{

namespace
{

bool is_range_operator(ThresholdOperator op)
{
    return op == ThresholdOperator::InRange || op == ThresholdOperator::OutOfRange;
}

std::string format_number(double v)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%g", v);
    return buf;
}

std::span<const double> tail(std::span<const double> values, std::size_t count)
{
    if (values.size() <= count)
        return values;
    return values.subspan(values.size() - count);
}

// Order statistic at percentile p (0..100) of a sorted, non-empty window.
double order_statistic(const std::vector<double>& sorted, double p)
{
    const double n   = static_cast<double>(sorted.size());
    const auto   idx = static_cast<std::size_t>(std::floor(std::clamp(p, 0.0, 100.0) / 100.0 * n));
    return sorted[std::min(idx, sorted.size() - 1)];
}

std::vector<double> absolute_deltas(std::span<const double> values)
{
    std::vector<double> deltas;
    if (values.size() < 2)
        return deltas;
    deltas.reserve(values.size() - 1);
    for (std::size_t i = 1; i < values.size(); ++i)
        deltas.push_back(std::abs(values[i] - values[i - 1]));
    return deltas;
}

std::size_t dynamic_window(const ThresholdDefinition& def)
{
    return std::max(def.min_data_points.value_or(DEFAULT_MIN_DATA_POINTS), DYNAMIC_WINDOW_SIZE);
}

// Distance from v to the nearest edge that decides the comparison.
double boundary_distance(const ThresholdDefinition& def, double v, double threshold)
{
    if (is_range_operator(def.op))
        return std::min(std::abs(v - *def.lower_bound), std::abs(v - *def.upper_bound));
    return std::abs(v - threshold);
}

// Replays the dead-band state machine over `observed`, starting from the
// non-violated state.  A state change needs the value to leave the band
// |v - threshold| < hysteresis.
bool replay_with_hysteresis(const ThresholdDefinition& def,
                            std::span<const double>    observed,
                            double                     threshold)
{
    const double h     = def.hysteresis.value_or(0.0);
    bool         state = false;
    for (double v : observed)
    {
        const bool raw = compare_threshold(def, v, threshold);
        if (raw != state && h > 0.0 && boundary_distance(def, v, threshold) < h)
            continue;
        state = raw;
    }
    return state;
}

}   // namespace

// ─── Names ──────────────────────────────────────────────────────────────────

const char* threshold_kind_name(ThresholdKind kind)
{
    switch (kind)
    {
        case ThresholdKind::Static:
            return "static";
        case ThresholdKind::DynamicPercentile:
            return "dynamic_percentile";
        case ThresholdKind::DynamicStddev:
            return "dynamic_stddev";
        case ThresholdKind::RateOfChange:
            return "rate_of_change";
    }
    return "static";
}

const char* threshold_operator_name(ThresholdOperator op)
{
    switch (op)
    {
        case ThresholdOperator::Gt:
            return "gt";
        case ThresholdOperator::Gte:
            return "gte";
        case ThresholdOperator::Lt:
            return "lt";
        case ThresholdOperator::Lte:
            return "lte";
        case ThresholdOperator::Eq:
            return "eq";
        case ThresholdOperator::Neq:
            return "neq";
        case ThresholdOperator::InRange:
            return "in_range";
        case ThresholdOperator::OutOfRange:
            return "out_of_range";
    }
    return "gt";
}

const char* severity_name(Severity severity)
{
    switch (severity)
    {
        case Severity::Info:
            return "info";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
        case Severity::Critical:
            return "critical";
    }
    return "warning";
}

ThresholdKind parse_threshold_kind(std::string_view name)
{
    if (name == "static")
        return ThresholdKind::Static;
    if (name == "dynamic_percentile")
        return ThresholdKind::DynamicPercentile;
    if (name == "dynamic_stddev")
        return ThresholdKind::DynamicStddev;
    if (name == "rate_of_change")
        return ThresholdKind::RateOfChange;
    throw std::invalid_argument("Unknown threshold kind: '" + std::string(name) + "'");
}

ThresholdOperator parse_threshold_operator(std::string_view name)
{
    if (name == "gt" || name == ">")
        return ThresholdOperator::Gt;
    if (name == "gte" || name == ">=")
        return ThresholdOperator::Gte;
    if (name == "lt" || name == "<")
        return ThresholdOperator::Lt;
    if (name == "lte" || name == "<=")
        return ThresholdOperator::Lte;
    if (name == "eq" || name == "==")
        return ThresholdOperator::Eq;
    if (name == "neq" || name == "!=")
        return ThresholdOperator::Neq;
    if (name == "in_range")
        return ThresholdOperator::InRange;
    if (name == "out_of_range")
        return ThresholdOperator::OutOfRange;
    throw std::invalid_argument("Unknown threshold operator: '" + std::string(name) + "'");
}

Severity parse_severity(std::string_view name)
{
    if (name == "info")
        return Severity::Info;
    if (name == "warning")
        return Severity::Warning;
    if (name == "error")
        return Severity::Error;
    if (name == "critical")
        return Severity::Critical;
    throw std::invalid_argument("Unknown severity: '" + std::string(name) + "'");
}

Color severity_color(Severity severity)
{
    switch (severity)
    {
        case Severity::Info:
            return palette::severity_info;
        case Severity::Warning:
            return palette::severity_warning;
        case Severity::Error:
            return palette::severity_error;
        case Severity::Critical:
            return palette::severity_critical;
    }
    return palette::severity_warning;
}

// ─── Validation ─────────────────────────────────────────────────────────────

void validate_threshold(const ThresholdDefinition& def)
{
    if (is_range_operator(def.op))
    {
        if (!def.lower_bound || !def.upper_bound)
            throw std::invalid_argument("Threshold '" + def.id
                                        + "': both bounds required for range operators");
        if (*def.lower_bound > *def.upper_bound)
            throw std::invalid_argument("Threshold '" + def.id
                                        + "': lower_bound exceeds upper_bound");
    }
    if (def.percentile && !(*def.percentile >= 0.0 && *def.percentile <= 100.0))
        throw std::invalid_argument("Threshold '" + def.id + "': percentile must be in [0, 100]");
    if (def.hysteresis && !(*def.hysteresis >= 0.0))
        throw std::invalid_argument("Threshold '" + def.id + "': hysteresis must be non-negative");
    if (def.stddev_multiplier && !(*def.stddev_multiplier >= 0.0))
        throw std::invalid_argument("Threshold '" + def.id
                                    + "': multiplier must be non-negative");
}

// ─── Calculation ────────────────────────────────────────────────────────────

std::optional<ThresholdValue> calculate_threshold_value(const ThresholdDefinition& def,
                                                        std::span<const double>    values)
{
    if (def.kind == ThresholdKind::Static)
    {
        if (!def.value)
            return std::nullopt;
        return ThresholdValue{*def.value, std::nullopt};
    }

    const std::vector<double> finite = data::finite_values(values);
    const double              multiplier = def.stddev_multiplier.value_or(DEFAULT_STDDEV_MULTIPLIER);

    if (def.kind == ThresholdKind::RateOfChange)
    {
        if (finite.size() < 2)
            throw InsufficientDataError(finite.size(), 2);
        const auto   deltas     = absolute_deltas(tail(finite, RATE_WINDOW_SIZE));
        const double mean_delta = data::mean(deltas).value_or(0.0);
        return ThresholdValue{mean_delta * multiplier, std::nullopt};
    }

    const std::size_t required =
        std::max<std::size_t>(def.min_data_points.value_or(DEFAULT_MIN_DATA_POINTS), 1);
    if (finite.size() < required)
        throw InsufficientDataError(finite.size(), required);

    const auto window = tail(finite, dynamic_window(def));

    if (def.kind == ThresholdKind::DynamicPercentile)
    {
        std::vector<double> sorted(window.begin(), window.end());
        std::sort(sorted.begin(), sorted.end());
        const double   p = def.percentile.value_or(DEFAULT_PERCENTILE);
        ThresholdValue out{order_statistic(sorted, p), std::nullopt};
        if (def.confidence)
            out.confidence_interval = {order_statistic(sorted, p - 5.0),
                                       order_statistic(sorted, p + 5.0)};
        return out;
    }

    // DynamicStddev
    const double   m     = *data::mean(window);
    const double   sigma = *data::stddev(window);
    ThresholdValue out{m + multiplier * sigma, std::nullopt};
    if (def.confidence)
        out.confidence_interval = {m + (multiplier - 0.5) * sigma,
                                   m + (multiplier + 0.5) * sigma};
    return out;
}

bool compare_threshold(const ThresholdDefinition& def, double current, double threshold)
{
    switch (def.op)
    {
        case ThresholdOperator::Gt:
            return current > threshold;
        case ThresholdOperator::Gte:
            return current >= threshold;
        case ThresholdOperator::Lt:
            return current < threshold;
        case ThresholdOperator::Lte:
            return current <= threshold;
        case ThresholdOperator::Eq:
            return std::abs(current - threshold) < EQUALITY_TOLERANCE;
        case ThresholdOperator::Neq:
            return std::abs(current - threshold) >= EQUALITY_TOLERANCE;
        case ThresholdOperator::InRange:
            return current >= *def.lower_bound && current <= *def.upper_bound;
        case ThresholdOperator::OutOfRange:
            return current < *def.lower_bound || current > *def.upper_bound;
    }
    return false;
}

// ─── Evaluation ─────────────────────────────────────────────────────────────

ThresholdResult evaluate_threshold(const ThresholdDefinition& def, const Series& series)
{
    validate_threshold(def);

    ThresholdResult result;
    result.threshold_id = def.id;
    result.severity     = def.severity;

    const std::vector<double> values = values_of(prepare(series));

    // The values the comparison runs over: raw values, or consecutive
    // deltas for rate-of-change.
    std::vector<double> observed;
    if (def.kind == ThresholdKind::RateOfChange)
    {
        observed = absolute_deltas(tail(values, RATE_WINDOW_SIZE));
    }
    else
    {
        auto window = tail(values, dynamic_window(def));
        observed.assign(window.begin(), window.end());
    }
    if (!observed.empty())
        result.current_value = observed.back();

    try
    {
        auto computed = calculate_threshold_value(def, values);
        if (computed)
        {
            result.calculated_value    = computed->value;
            result.confidence_interval = computed->confidence_interval;
        }
    }
    catch (const InsufficientDataError& e)
    {
        result.insufficient_data = true;
        if (def.value)
        {
            result.calculated_value = *def.value;
            result.reason           = std::string(e.what()) + "; using static value";
        }
        else
        {
            result.reason = e.what();
            TELECHART_LOG_DEBUG("threshold", "'{}' indeterminate: {}", def.id, e.what());
            return result;
        }
    }

    if (!result.calculated_value && !is_range_operator(def.op))
    {
        result.reason = "no threshold value configured";
        return result;
    }
    if (!result.current_value)
    {
        if (result.reason.empty())
            result.reason = "no data";
        return result;
    }

    const double threshold = result.calculated_value.value_or(0.0);
    result.violated        = replay_with_hysteresis(def, observed, threshold);

    if (result.violated)
    {
        std::string detail = format_number(*result.current_value) + " "
                             + threshold_operator_name(def.op) + " ";
        if (is_range_operator(def.op))
            detail += "[" + format_number(*def.lower_bound) + ", "
                      + format_number(*def.upper_bound) + "]";
        else
            detail += format_number(threshold);
        result.reason = result.reason.empty() ? detail : result.reason + "; " + detail;
        TELECHART_LOG_DEBUG("threshold",
                            "'{}' violated ({}): {}",
                            def.id,
                            severity_name(def.severity),
                            detail);
    }
    return result;
}

std::vector<ThresholdResult> evaluate(std::span<const ThresholdDefinition> thresholds,
                                      const Series&                        series)
{
    std::vector<ThresholdResult> results;
    results.reserve(thresholds.size());
    for (const auto& def : thresholds)
    {
        if (!def.enabled)
            continue;
        try
        {
            results.push_back(evaluate_threshold(def, series));
        }
        catch (const std::invalid_argument& e)
        {
            TELECHART_LOG_ERROR("threshold", "Skipping invalid threshold: {}", e.what());
            ThresholdResult bad;
            bad.threshold_id = def.id;
            bad.severity     = def.severity;
            bad.reason       = e.what();
            results.push_back(std::move(bad));
        }
    }
    return results;
}

}   // namespace telechart
