#pragma once

#include <cstddef>
#include <string_view>

// Method selectors shared by the data algorithms, the pipeline step
// factories and the persisted configuration.

namespace telechart::data
{

// ─── Smoothing ──────────────────────────────────────────────────────────────

enum class SmoothingMethod
{
    Simple,        // centered moving average
    Exponential,   // forward EMA, alpha = 2 / (window + 1)
    Gaussian,      // sigma = window / 3, radius = window / 2
};

const char* smoothing_method_name(SmoothingMethod method);

// Throws std::invalid_argument for an unknown name.
SmoothingMethod parse_smoothing_method(std::string_view name);

// ─── Outlier detection ──────────────────────────────────────────────────────

enum class OutlierMethod
{
    Iqr,              // outside [Q1 - k*IQR, Q3 + k*IQR]
    ZScore,           // |v - mean| / stddev > k
    ModifiedZScore,   // |0.6745 * (v - median) / MAD| > k
};

const char*   outlier_method_name(OutlierMethod method);
OutlierMethod parse_outlier_method(std::string_view name);

// 1.5 for IQR, 3 for z-score, 3.5 for modified z-score.
double default_outlier_threshold(OutlierMethod method);

// ─── Gap filling ────────────────────────────────────────────────────────────

enum class InterpolationMethod
{
    Linear,   // proportional between the gap's endpoints
    Step,     // hold the value before the gap
    Spline,   // smoothstep ease between the endpoints
};

const char*         interpolation_method_name(InterpolationMethod method);
InterpolationMethod parse_interpolation_method(std::string_view name);

struct InterpolationOptions
{
    double      gap_threshold_ms   = 60'000.0;   // gaps longer than this are filled
    double      interval_ms        = 30'000.0;   // spacing of synthesized samples
    std::size_t max_points_per_gap = 10;         // cap per gap
};

// ─── Window reduction ───────────────────────────────────────────────────────

enum class Reducer
{
    Mean,
    Sum,
    Min,
    Max,
    Count,
};

const char* reducer_name(Reducer reducer);
Reducer     parse_reducer(std::string_view name);

}   // namespace telechart::data
