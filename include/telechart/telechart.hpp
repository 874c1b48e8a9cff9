#pragma once

#include <telechart/color.hpp>
#include <telechart/config.hpp>
#include <telechart/data/aggregation.hpp>
#include <telechart/data/decimation.hpp>
#include <telechart/data/filters.hpp>
#include <telechart/data/interpolation.hpp>
#include <telechart/data/outliers.hpp>
#include <telechart/data/stats.hpp>
#include <telechart/errors.hpp>
#include <telechart/logger.hpp>
#include <telechart/methods.hpp>
#include <telechart/pipeline.hpp>
#include <telechart/sample.hpp>
#include <telechart/scale.hpp>
#include <telechart/threshold.hpp>

// ─── Typical use ─────────────────────────────────────────────────────────────
//
//   telechart::Series raw = ...;
//   auto pipeline = telechart::pipelines::telemetry_smoothing();
//   pipeline.add_step(telechart::steps::decimate(800));
//   auto series = pipeline.apply(raw);
//
//   auto y = telechart::create_adaptive_scale(telechart::values_of(series), {400.0, 0.0});
//   double py = y(series.front().value);
//
//   auto results = telechart::evaluate(thresholds, series);
