// Telemetry Dashboard Demo
// Runs a simulated coolant-temperature feed through a configurable pipeline,
// lays the result out on screen scales and checks it against thresholds.
//
// Usage: telemetry_dashboard [config.json]
//   TELECHART_LOG_LEVEL=debug raises the log verbosity.
//   Without an argument the pipeline comes from ~/.config/telechart/pipeline.json
//   when that file exists, and from a built-in default otherwise.

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <telechart/telechart.hpp>
#include <vector>

using namespace telechart;

// 3 hours of 10 s readings: a slow daily drift, sensor noise, a few spikes,
// one dropped reading and a 10 minute outage.
static Series simulate_feed()
{
    const double start = 1'704'067'200'000.0;   // 2024-01-01 00:00 UTC
    Series       s;
    unsigned     seed = 12345;
    for (int i = 0; i < 1080; ++i)
    {
        if (i >= 400 && i < 460)
            continue;

        seed           = seed * 1103515245u + 12345u;
        const double n = static_cast<double>((seed >> 16) % 1000) / 1000.0 - 0.5;

        Sample sample;
        sample.time     = start + i * 10'000.0;
        sample.value    = 82.0 + 6.0 * std::sin(i * 0.006) + 1.5 * n + i * 0.01;
        sample.category = i < 540 ? "day" : "night";
        if (i % 157 == 0)
            sample.value += 35.0;
        if (i == 700)
            sample.value = std::nan("");
        s.push_back(std::move(sample));
    }
    return s;
}

static TelemetryConfig default_config()
{
    TelemetryConfig config;
    config.set_name("coolant");

    TelemetryConfig::StepConfig step;
    step.kind = "sanitize";
    config.add_step(step);

    step        = {};
    step.kind   = "outliers";
    step.method = "modified_zscore";
    config.add_step(step);

    step             = {};
    step.kind        = "interpolate";
    step.interval_ms = 60'000.0;
    config.add_step(step);

    step        = {};
    step.kind   = "smooth";
    step.method = "gaussian";
    step.window = 5;
    config.add_step(step);

    step            = {};
    step.kind       = "decimate";
    step.max_points = 300;
    config.add_step(step);

    ThresholdDefinition hot;
    hot.id         = "overheat";
    hot.severity   = Severity::Critical;
    hot.op         = ThresholdOperator::Gte;
    hot.value      = 110.0;
    hot.hysteresis = 2.0;
    config.add_threshold(hot);

    ThresholdDefinition p95;
    p95.id         = "above_p95";
    p95.kind       = ThresholdKind::DynamicPercentile;
    p95.confidence = true;
    config.add_threshold(p95);

    ThresholdDefinition band;
    band.id          = "nominal_band";
    band.severity    = Severity::Info;
    band.op          = ThresholdOperator::OutOfRange;
    band.lower_bound = 70.0;
    band.upper_bound = 95.0;
    config.add_threshold(band);

    ThresholdDefinition ramp;
    ramp.id                = "fast_ramp";
    ramp.kind              = ThresholdKind::RateOfChange;
    ramp.severity          = Severity::Error;
    ramp.stddev_multiplier = 4.0;
    config.add_threshold(ramp);
    return config;
}

int main(int argc, char** argv)
{
    const char* level_env = std::getenv("TELECHART_LOG_LEVEL");
    Logger::instance().set_level(
        parse_log_level(level_env ? level_env : "").value_or(LogLevel::Info));
    Logger::instance().add_sink(sinks::console_sink());

    TelemetryConfig config;
    const std::string path = argc > 1 ? argv[1] : TelemetryConfig::default_path();
    if (!config.load(path))
    {
        TELECHART_LOG_INFO("example", "Using built-in configuration (no '{}')", path);
        config = default_config();
    }

    const Series raw      = simulate_feed();
    const auto   pipeline = config.build_pipeline();

    std::vector<TransformStepError> failures;
    const Series series = pipeline.apply(raw, failures);
    for (const auto& f : failures)
        TELECHART_LOG_WARN("example", "{}", f.what());

    std::cout << "=== Telemetry Dashboard ===\n";
    std::cout << "Pipeline: " << pipeline.description() << "\n";
    std::cout << "Samples:  " << raw.size() << " raw -> " << series.size() << " shown\n";
    if (series.empty())
        return 1;

    const auto values = values_of(series);
    const auto extent = data::min_max(values);
    std::printf("Range:    %.2f .. %.2f  mean %.2f  sd %.2f\n",
                extent->first,
                extent->second,
                data::mean(values).value_or(0.0),
                data::stddev(values).value_or(0.0));

    // ─── Layout ──────────────────────────────────────────────────────────────

    ScaleSpec x_spec;
    x_spec.kind   = ScaleKind::Time;
    x_spec.domain = {Instant{series.front().time}, Instant{series.back().time}};
    x_spec.range  = {0.0, 1200.0};
    const Scale x = create_scale(x_spec);

    const Scale y = create_adaptive_scale(values, {400.0, 0.0});

    ScaleSpec heat_spec;
    heat_spec.kind         = ScaleKind::Sequential;
    heat_spec.domain       = {extent->first, extent->second};
    heat_spec.interpolator = "inferno";
    const Scale heat       = create_scale(heat_spec);

    std::cout << "\nX ticks:";
    for (double t : x.ticks(6))
        std::cout << " " << x.tick_format(t, 6) << "@" << static_cast<int>(x(t));
    std::cout << "\nY ticks (" << scale_kind_name(y.kind()) << "):";
    for (double t : y.ticks(5))
        std::cout << " " << y.tick_format(t, 5) << "@" << static_cast<int>(y(t));
    std::cout << "\n";

    std::cout << "\nHourly peaks:\n";
    for (const auto& bucket : data::aggregate_by_window(series, 3'600'000.0, data::Reducer::Max))
    {
        std::printf("  %s  %6.2f  %s  (%s)\n",
                    x.tick_format(bucket.time, 3).c_str(),
                    bucket.value,
                    heat.color(bucket.value).to_hex().c_str(),
                    bucket.category.value_or("-").c_str());
    }

    // ─── Thresholds ──────────────────────────────────────────────────────────

    std::cout << "\nThresholds:\n";
    for (const auto& r : evaluate(config.thresholds(), series))
    {
        std::printf("  %-14s %-8s %-9s %s\n",
                    r.threshold_id.c_str(),
                    severity_name(r.severity),
                    r.insufficient_data ? "n/a" : (r.violated ? "VIOLATED" : "ok"),
                    r.reason.c_str());
    }

    return 0;
}
