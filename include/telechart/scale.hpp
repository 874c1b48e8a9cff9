#pragma once

#include <telechart/color.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace telechart
{

enum class ScaleKind
{
    Linear,
    Log,
    Time,
    Band,
    Ordinal,
    Sequential,
};

const char* scale_kind_name(ScaleKind kind);

// Throws UnsupportedScaleKindError for anything but the lowercase kind names.
ScaleKind parse_scale_kind(std::string_view name);

// A point in time, milliseconds since the Unix epoch.  Distinguishes dates
// from plain numbers when inferring a scale kind.
struct Instant
{
    double ms = 0.0;
};

using DomainValue  = std::variant<double, Instant, std::string>;
using RangeValue   = std::variant<double, std::string, Color>;
using Interpolator = std::function<Color(double)>;

struct ScaleSpec
{
    ScaleKind kind = ScaleKind::Linear;

    // Two bounds for continuous kinds, the ordered categories for band/ordinal.
    std::vector<DomainValue> domain;

    // Two numbers for linear/log/time/band (defaults to [0, 1]), the
    // output values for ordinal.  Ignored by sequential scales.
    std::vector<RangeValue> range;

    double padding  = 0.0;   // band: fraction of each slot left as gap, in [0, 1)
    bool   nice     = false;
    bool   clamp    = false;
    double log_base = 10.0;

    // Sequential only.  A custom interpolator wins over the named one.
    std::string  interpolator = "viridis";
    Interpolator custom_interpolator;
};

class Scale
{
   public:
    ScaleKind kind() const { return kind_; }

    // Continuous mapping.  Linear/log/time return the range coordinate,
    // sequential returns t in [0, 1]; band and ordinal return NaN.
    double operator()(double value) const;
    double operator()(Instant value) const { return (*this)(value.ms); }

    // Band mapping: start of the category's band, NaN when unknown.
    double operator()(std::string_view category) const;

    // Ordinal mapping: nullopt when the category is not in the domain.
    std::optional<RangeValue> ordinal(std::string_view category) const;

    // Sequential mapping through the interpolator.
    // Throws std::logic_error on other kinds.
    Color color(double value) const;

    // Kind-appropriate mapping of any domain value.  Values a scale
    // cannot place come back as NaN.
    RangeValue map(const DomainValue& value) const;

    // Range coordinate back to a domain value (continuous kinds).
    double invert(double coordinate) const;

    std::vector<double> ticks(int count = 10) const;
    std::string         tick_format(double value, int count = 10) const;

    std::pair<double, double>       domain() const { return {d0_, d1_}; }
    std::pair<double, double>       range() const { return {r0_, r1_}; }
    const std::vector<std::string>& categories() const { return categories_; }

    double bandwidth() const { return bandwidth_; }
    double step() const { return step_; }
    double log_base() const { return log_base_; }
    bool   clamped() const { return clamp_; }

   private:
    friend Scale create_scale(const ScaleSpec& spec);
    Scale() = default;

    double normalize(double value) const;
    double band_position(std::size_t index) const;
    int    category_index(std::string_view category) const;

    ScaleKind kind_     = ScaleKind::Linear;
    double    d0_       = 0.0;
    double    d1_       = 1.0;
    double    r0_       = 0.0;
    double    r1_       = 1.0;
    bool      clamp_    = false;
    double    log_base_ = 10.0;

    std::vector<std::string> categories_;
    std::vector<RangeValue>  outputs_;
    double                   padding_   = 0.0;
    double                   step_      = 0.0;
    double                   bandwidth_ = 0.0;

    Interpolator interpolator_;
};

// Validates the spec and builds the mapping.  Throws InvalidDomainError for
// non-finite or equal bounds, a log domain touching zero or below, an empty
// band/ordinal domain or ordinal range, or an unknown interpolator name.
// Malformed numeric ranges, padding or log base throw std::invalid_argument.
Scale create_scale(const ScaleSpec& spec);

// Instants → Time, any string → Band, positive numbers spanning more than
// `log_threshold` orders of magnitude → Log, otherwise Linear.
ScaleKind infer_scale_type(std::span<const DomainValue> values, double log_threshold = 3.0);

struct AdaptiveScaleOptions
{
    bool   force_zero    = false;   // extend the domain to include 0
    bool   symmetric     = false;   // domain becomes [-m, m], m = max |bound|
    double log_threshold = 3.0;     // orders of magnitude before switching to log
    bool   nice          = true;
};

Scale create_adaptive_scale(std::span<const double>   values,
                            std::pair<double, double> range,
                            const AdaptiveScaleOptions& options = {});

}   // namespace telechart
