#include <telechart/data/stats.hpp>
#include <telechart/errors.hpp>
#include <telechart/logger.hpp>
#include <telechart/scale.hpp>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <stdexcept>
#include <tuple>

#include "math/colormap.hpp"
#include "math/ticks.hpp"

namespace telechart
{

namespace
{

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

double numeric_bound(const DomainValue& v, const char* kind)
{
    if (const auto* d = std::get_if<double>(&v))
        return *d;
    if (const auto* t = std::get_if<Instant>(&v))
        return t->ms;
    throw InvalidDomainError(std::string(kind) + " scale needs a numeric domain");
}

std::pair<double, double> numeric_range(const std::vector<RangeValue>& range, const char* kind)
{
    if (range.empty())
        return {0.0, 1.0};
    if (range.size() != 2)
        throw std::invalid_argument(std::string(kind) + " scale needs exactly two range values");
    const auto* r0 = std::get_if<double>(&range[0]);
    const auto* r1 = std::get_if<double>(&range[1]);
    if (!r0 || !r1)
        throw std::invalid_argument(std::string(kind) + " scale needs a numeric range");
    return {*r0, *r1};
}

// Numbers used as categories are matched by their shortest text form.
std::string category_label(const DomainValue& v)
{
    if (const auto* s = std::get_if<std::string>(&v))
        return *s;
    char buf[32];
    const double x =
        std::holds_alternative<double>(v) ? std::get<double>(v) : std::get<Instant>(v).ms;
    std::snprintf(buf, sizeof(buf), "%g", x);
    return buf;
}

std::vector<std::string> unique_categories(const std::vector<DomainValue>& domain)
{
    std::vector<std::string> out;
    out.reserve(domain.size());
    for (const auto& v : domain)
    {
        std::string label = category_label(v);
        if (std::find(out.begin(), out.end(), label) == out.end())
            out.push_back(std::move(label));
    }
    return out;
}

double log_in_base(double v, double base)
{
    return std::log(v) / std::log(base);
}

// Keeps the orientation of [d0, d1] while widening its extent.
std::pair<double, double> reorient(double d0, double d1, std::pair<double, double> widened)
{
    if (d0 <= d1)
        return widened;
    return {widened.second, widened.first};
}

}   // namespace

// ─── Kind names ─────────────────────────────────────────────────────────────

const char* scale_kind_name(ScaleKind kind)
{
    switch (kind)
    {
        case ScaleKind::Linear:
            return "linear";
        case ScaleKind::Log:
            return "log";
        case ScaleKind::Time:
            return "time";
        case ScaleKind::Band:
            return "band";
        case ScaleKind::Ordinal:
            return "ordinal";
        case ScaleKind::Sequential:
            return "sequential";
    }
    return "linear";
}

ScaleKind parse_scale_kind(std::string_view name)
{
    if (name == "linear")
        return ScaleKind::Linear;
    if (name == "log")
        return ScaleKind::Log;
    if (name == "time")
        return ScaleKind::Time;
    if (name == "band")
        return ScaleKind::Band;
    if (name == "ordinal")
        return ScaleKind::Ordinal;
    if (name == "sequential")
        return ScaleKind::Sequential;
    throw UnsupportedScaleKindError(std::string(name));
}

// ─── Mapping ────────────────────────────────────────────────────────────────

double Scale::normalize(double value) const
{
    if (!std::isfinite(value))
        return NaN;
    if (kind_ == ScaleKind::Log)
    {
        if (value <= 0.0)
            return NaN;
        return (std::log(value) - std::log(d0_)) / (std::log(d1_) - std::log(d0_));
    }
    return (value - d0_) / (d1_ - d0_);
}

double Scale::operator()(double value) const
{
    if (kind_ == ScaleKind::Band || kind_ == ScaleKind::Ordinal)
        return NaN;

    double t = normalize(value);
    if (std::isnan(t))
        return NaN;
    if (clamp_ || kind_ == ScaleKind::Sequential)
        t = std::clamp(t, 0.0, 1.0);
    if (kind_ == ScaleKind::Sequential)
        return t;
    return r0_ + t * (r1_ - r0_);
}

int Scale::category_index(std::string_view category) const
{
    auto it = std::find(categories_.begin(), categories_.end(), category);
    if (it == categories_.end())
        return -1;
    return static_cast<int>(it - categories_.begin());
}

double Scale::band_position(std::size_t index) const
{
    // Slots are laid out from the low end of the range; a reversed range
    // hands the first category the highest slot.
    const std::size_t n    = categories_.size();
    const double      lo   = std::min(r0_, r1_);
    const std::size_t slot = r0_ <= r1_ ? index : n - 1 - index;
    return lo + static_cast<double>(slot) * step_ + step_ * padding_ * 0.5;
}

double Scale::operator()(std::string_view category) const
{
    if (kind_ != ScaleKind::Band)
        return NaN;
    const int idx = category_index(category);
    if (idx < 0)
        return NaN;
    return band_position(static_cast<std::size_t>(idx));
}

std::optional<RangeValue> Scale::ordinal(std::string_view category) const
{
    if (kind_ != ScaleKind::Ordinal || outputs_.empty())
        return std::nullopt;
    const int idx = category_index(category);
    if (idx < 0)
        return std::nullopt;
    return outputs_[static_cast<std::size_t>(idx) % outputs_.size()];
}

Color Scale::color(double value) const
{
    if (kind_ != ScaleKind::Sequential)
        throw std::logic_error(std::string("color() called on a ") + scale_kind_name(kind_)
                               + " scale");
    const double t = (*this)(value);
    if (std::isnan(t))
        return colors::gray;
    return interpolator_(t);
}

RangeValue Scale::map(const DomainValue& value) const
{
    switch (kind_)
    {
        case ScaleKind::Band:
            return (*this)(std::string_view(category_label(value)));
        case ScaleKind::Ordinal:
        {
            auto out = ordinal(category_label(value));
            if (out)
                return *out;
            return NaN;
        }
        case ScaleKind::Sequential:
            if (std::holds_alternative<std::string>(value))
                return NaN;
            return color(numeric_bound(value, "sequential"));
        case ScaleKind::Linear:
        case ScaleKind::Log:
        case ScaleKind::Time:
            break;
    }
    if (std::holds_alternative<std::string>(value))
        return NaN;
    return (*this)(numeric_bound(value, scale_kind_name(kind_)));
}

double Scale::invert(double coordinate) const
{
    if (kind_ == ScaleKind::Band || kind_ == ScaleKind::Ordinal || !std::isfinite(coordinate))
        return NaN;
    if (r1_ == r0_)
        return d0_;

    double t = (coordinate - r0_) / (r1_ - r0_);
    if (clamp_)
        t = std::clamp(t, 0.0, 1.0);
    if (kind_ == ScaleKind::Log)
        return std::exp(std::log(d0_) + t * (std::log(d1_) - std::log(d0_)));
    return d0_ + t * (d1_ - d0_);
}

// ─── Ticks ──────────────────────────────────────────────────────────────────

std::vector<double> Scale::ticks(int count) const
{
    const double lo = std::min(d0_, d1_);
    const double hi = std::max(d0_, d1_);

    switch (kind_)
    {
        case ScaleKind::Band:
        case ScaleKind::Ordinal:
            return {};
        case ScaleKind::Time:
            return generate_time_ticks(lo, hi, count).positions;
        case ScaleKind::Log:
        {
            std::vector<double> out;
            const double        first = std::ceil(log_in_base(lo, log_base_) - 1e-9);
            const double        last  = std::floor(log_in_base(hi, log_base_) + 1e-9);
            for (double e = first; e <= last; e += 1.0)
                out.push_back(std::pow(log_base_, e));
            // Less than a decade: powers alone say nothing useful.
            if (out.size() < 2)
                return generate_ticks(lo, hi, count).positions;
            return out;
        }
        case ScaleKind::Linear:
        case ScaleKind::Sequential:
            break;
    }
    return generate_ticks(lo, hi, count).positions;
}

std::string Scale::tick_format(double value, int count) const
{
    const double lo = std::min(d0_, d1_);
    const double hi = std::max(d0_, d1_);

    if (kind_ == ScaleKind::Time && hi - lo >= 1000.0)
        return format_time_tick(value, time_tick_interval(lo, hi, count));

    if (kind_ == ScaleKind::Log && value > 0.0)
        return format_tick_value(value,
                                 std::pow(log_base_, std::floor(log_in_base(value, log_base_))));

    double spacing = nice_tick_spacing(lo, hi, count);
    if (spacing <= 0.0)
        spacing = 1.0;
    return format_tick_value(value, spacing);
}

// ─── Factory ────────────────────────────────────────────────────────────────

Scale create_scale(const ScaleSpec& spec)
{
    Scale s;
    s.kind_          = spec.kind;
    s.clamp_         = spec.clamp;
    const char* kind = scale_kind_name(spec.kind);

    switch (spec.kind)
    {
        case ScaleKind::Band:
        {
            s.categories_ = unique_categories(spec.domain);
            if (s.categories_.empty())
                throw InvalidDomainError("band scale needs at least one category");
            if (!(spec.padding >= 0.0 && spec.padding < 1.0))
                throw std::invalid_argument("band padding must be in [0, 1)");
            std::tie(s.r0_, s.r1_) = numeric_range(spec.range, kind);
            s.padding_             = spec.padding;
            s.step_      = std::abs(s.r1_ - s.r0_) / static_cast<double>(s.categories_.size());
            s.bandwidth_ = s.step_ * (1.0 - spec.padding);
            s.d0_        = 0.0;
            s.d1_        = static_cast<double>(s.categories_.size());
            TELECHART_LOG_DEBUG("scale",
                                "band scale: {} categories, step {}, bandwidth {}",
                                s.categories_.size(),
                                s.step_,
                                s.bandwidth_);
            return s;
        }
        case ScaleKind::Ordinal:
        {
            s.categories_ = unique_categories(spec.domain);
            if (s.categories_.empty())
                throw InvalidDomainError("ordinal scale needs at least one category");
            if (spec.range.empty())
                throw InvalidDomainError("ordinal scale needs at least one output value");
            s.outputs_ = spec.range;
            s.d0_      = 0.0;
            s.d1_      = static_cast<double>(s.categories_.size());
            return s;
        }
        case ScaleKind::Linear:
        case ScaleKind::Log:
        case ScaleKind::Time:
        case ScaleKind::Sequential:
            break;
    }

    if (spec.domain.size() != 2)
        throw InvalidDomainError(std::string(kind) + " scale needs exactly two domain bounds");
    double d0 = numeric_bound(spec.domain[0], kind);
    double d1 = numeric_bound(spec.domain[1], kind);
    if (!std::isfinite(d0) || !std::isfinite(d1))
        throw InvalidDomainError(std::string(kind) + " scale domain must be finite");
    if (d0 == d1)
        throw InvalidDomainError(std::string(kind) + " scale domain is empty");

    if (spec.kind == ScaleKind::Sequential)
    {
        s.r0_ = 0.0;
        s.r1_ = 1.0;
        if (spec.custom_interpolator)
        {
            s.interpolator_ = spec.custom_interpolator;
        }
        else
        {
            auto cm = parse_colormap(spec.interpolator);
            if (!cm)
                throw InvalidDomainError("Unknown interpolator: '" + spec.interpolator + "'");
            const ColormapType type = *cm;
            s.interpolator_         = [type](double t)
            { return sample_colormap(type, static_cast<float>(t)); };
        }
    }
    else
    {
        std::tie(s.r0_, s.r1_) = numeric_range(spec.range, kind);
    }

    if (spec.kind == ScaleKind::Log)
    {
        if (!(spec.log_base > 0.0) || spec.log_base == 1.0 || !std::isfinite(spec.log_base))
            throw std::invalid_argument("log base must be positive and not 1");
        if (d0 <= 0.0 || d1 <= 0.0)
            throw InvalidDomainError("log scale domain must be strictly positive");
        s.log_base_ = spec.log_base;
    }

    if (spec.nice)
    {
        const double lo = std::min(d0, d1);
        const double hi = std::max(d0, d1);
        std::pair<double, double> widened;
        switch (spec.kind)
        {
            case ScaleKind::Log:
            {
                const double base = spec.log_base;
                widened = {std::min(std::pow(base, std::floor(log_in_base(lo, base))), lo),
                           std::max(std::pow(base, std::ceil(log_in_base(hi, base))), hi)};
                break;
            }
            case ScaleKind::Time:
                widened = nice_time_extent(lo, hi, 10);
                break;
            default:
                widened = nice_extent(lo, hi, 10);
                break;
        }
        std::tie(d0, d1) = reorient(d0, d1, widened);
    }

    s.d0_ = d0;
    s.d1_ = d1;
    TELECHART_LOG_DEBUG("scale",
                        "{} scale: domain [{}, {}] -> range [{}, {}]",
                        kind,
                        d0,
                        d1,
                        s.r0_,
                        s.r1_);
    return s;
}

// ─── Inference ──────────────────────────────────────────────────────────────

ScaleKind infer_scale_type(std::span<const DomainValue> values, double log_threshold)
{
    bool                any_instant = false;
    std::vector<double> numbers;
    numbers.reserve(values.size());

    for (const auto& v : values)
    {
        if (std::holds_alternative<std::string>(v))
            return ScaleKind::Band;
        if (std::holds_alternative<Instant>(v))
        {
            any_instant = true;
            continue;
        }
        numbers.push_back(std::get<double>(v));
    }
    if (any_instant)
        return ScaleKind::Time;

    auto extent = data::min_max(numbers);
    if (extent && extent->first > 0.0
        && std::log10(extent->second / extent->first) > log_threshold)
        return ScaleKind::Log;
    return ScaleKind::Linear;
}

Scale create_adaptive_scale(std::span<const double>     values,
                            std::pair<double, double>   range,
                            const AdaptiveScaleOptions& options)
{
    auto extent = data::min_max(values);
    if (!extent)
        throw InvalidDomainError("adaptive scale needs at least one finite value");
    auto [lo, hi] = *extent;

    ScaleSpec spec;
    spec.range = {range.first, range.second};
    spec.nice  = options.nice;

    const bool wants_log = !options.force_zero && !options.symmetric && lo > 0.0
                           && std::log10(hi / lo) > options.log_threshold;
    if (wants_log)
    {
        spec.kind   = ScaleKind::Log;
        spec.domain = {lo, hi};
        TELECHART_LOG_DEBUG("scale", "adaptive scale switched to log for [{}, {}]", lo, hi);
        return create_scale(spec);
    }

    if (options.force_zero)
    {
        lo = std::min(lo, 0.0);
        hi = std::max(hi, 0.0);
    }
    if (options.symmetric)
    {
        const double m = std::max(std::abs(lo), std::abs(hi));
        lo             = -m;
        hi             = m;
    }
    if (lo == hi)
    {
        const double half = lo != 0.0 ? std::abs(lo) * 0.1 : 0.5;
        lo -= half;
        hi += half;
    }

    spec.kind   = ScaleKind::Linear;
    spec.domain = {lo, hi};
    return create_scale(spec);
}

}   // namespace telechart
