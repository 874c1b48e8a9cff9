#pragma once

#include <telechart/color.hpp>
#include <telechart/sample.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace telechart
{

enum class ThresholdKind
{
    Static,
    DynamicPercentile,
    DynamicStddev,
    RateOfChange,
};

enum class ThresholdOperator
{
    Gt,
    Gte,
    Lt,
    Lte,
    Eq,    // |v - threshold| < 1e-4
    Neq,
    InRange,      // violated inside [lower_bound, upper_bound]
    OutOfRange,   // violated outside [lower_bound, upper_bound]
};

enum class Severity
{
    Info,
    Warning,
    Error,
    Critical,
};

inline constexpr double      DEFAULT_PERCENTILE        = 95.0;
inline constexpr double      DEFAULT_STDDEV_MULTIPLIER = 2.0;
inline constexpr std::size_t DEFAULT_MIN_DATA_POINTS   = 10;
inline constexpr std::size_t DYNAMIC_WINDOW_SIZE       = 50;
inline constexpr std::size_t RATE_WINDOW_SIZE          = 10;
inline constexpr double      EQUALITY_TOLERANCE        = 1e-4;

struct ThresholdDefinition
{
    std::string       id;
    ThresholdKind     kind     = ThresholdKind::Static;
    Severity          severity = Severity::Warning;
    ThresholdOperator op       = ThresholdOperator::Gt;

    std::optional<double> value;   // static value, and the fallback for dynamic kinds
    std::optional<double> lower_bound;
    std::optional<double> upper_bound;

    std::optional<double>      percentile;          // 0..100
    std::optional<double>      stddev_multiplier;   // also the rate-of-change multiplier
    std::optional<std::size_t> min_data_points;
    std::optional<double>      hysteresis;   // dead-band half-width around the threshold

    bool confidence = false;   // compute a confidence interval
    bool enabled    = true;
};

struct ThresholdValue
{
    double                                   value = 0.0;
    std::optional<std::pair<double, double>> confidence_interval;
};

struct ThresholdResult
{
    std::string                              threshold_id;
    Severity                                 severity = Severity::Warning;
    std::optional<double>                    calculated_value;
    std::optional<std::pair<double, double>> confidence_interval;
    std::optional<double>                    current_value;
    bool                                     violated          = false;
    bool                                     insufficient_data = false;
    std::string                              reason;
};

const char* threshold_kind_name(ThresholdKind kind);
const char* threshold_operator_name(ThresholdOperator op);
const char* severity_name(Severity severity);

// Inverse of the *_name functions; std::invalid_argument on unknown names.
ThresholdKind     parse_threshold_kind(std::string_view name);
ThresholdOperator parse_threshold_operator(std::string_view name);
Severity          parse_severity(std::string_view name);

Color severity_color(Severity severity);

// Rejects definitions that cannot be evaluated at all: range operators
// without both bounds (or with lower > upper), a percentile outside
// [0, 100], negative hysteresis or multiplier.  Throws std::invalid_argument.
void validate_threshold(const ThresholdDefinition& def);

// Threshold value over `values` (oldest first).  nullopt for a static
// definition without a value.  Throws InsufficientDataError when a dynamic
// kind has fewer finite values than it needs.
std::optional<ThresholdValue> calculate_threshold_value(const ThresholdDefinition& def,
                                                        std::span<const double>    values);

// Raw comparison of `current` against `threshold` (or the bounds, for the
// range operators), without hysteresis.
bool compare_threshold(const ThresholdDefinition& def, double current, double threshold);

ThresholdResult evaluate_threshold(const ThresholdDefinition& def, const Series& series);

// One result per enabled definition, in input order.
std::vector<ThresholdResult> evaluate(std::span<const ThresholdDefinition> thresholds,
                                      const Series&                        series);

}   // namespace telechart
