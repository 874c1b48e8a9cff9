#include <filesystem>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <telechart/config.hpp>
#include <telechart/logger.hpp>
#include <vector>

using namespace telechart;

static TelemetryConfig sample_config()
{
    TelemetryConfig config;
    config.set_name("engine_temp");

    TelemetryConfig::StepConfig outliers;
    outliers.kind      = "outliers";
    outliers.method    = "zscore";
    outliers.threshold = 2.5;
    config.add_step(outliers);

    TelemetryConfig::StepConfig smooth;
    smooth.kind   = "smooth";
    smooth.method = "exponential";
    smooth.window = 5;
    config.add_step(smooth);

    TelemetryConfig::StepConfig decimate;
    decimate.kind              = "decimate";
    decimate.max_points        = 500;
    decimate.preserve_extremes = false;
    decimate.enabled           = false;
    config.add_step(decimate);

    ThresholdDefinition hot;
    hot.id         = "overheat";
    hot.kind       = ThresholdKind::Static;
    hot.severity   = Severity::Critical;
    hot.op         = ThresholdOperator::Gte;
    hot.value      = 110.0;
    hot.hysteresis = 1.5;
    config.add_threshold(hot);

    ThresholdDefinition band;
    band.id              = "nominal";
    band.kind            = ThresholdKind::DynamicPercentile;
    band.op              = ThresholdOperator::OutOfRange;
    band.lower_bound     = 60.0;
    band.upper_bound     = 95.0;
    band.percentile      = 90.0;
    band.min_data_points = 20;
    band.confidence      = true;
    config.add_threshold(band);
    return config;
}

// ─── Contents ────────────────────────────────────────────────────────────────

TEST(TelemetryConfigContents, InitiallyEmpty)
{
    TelemetryConfig config;
    EXPECT_TRUE(config.name().empty());
    EXPECT_TRUE(config.steps().empty());
    EXPECT_TRUE(config.thresholds().empty());
    EXPECT_TRUE(config.build_pipeline().is_identity());
}

TEST(TelemetryConfigContents, Clear)
{
    auto config = sample_config();
    config.clear();
    EXPECT_TRUE(config.name().empty());
    EXPECT_TRUE(config.steps().empty());
    EXPECT_TRUE(config.thresholds().empty());
}

// ─── Pipeline construction ───────────────────────────────────────────────────

TEST(TelemetryConfigPipeline, BuildsStepsInOrder)
{
    auto pipeline = sample_config().build_pipeline();
    EXPECT_EQ(pipeline.name(), "engine_temp");
    ASSERT_EQ(pipeline.step_count(), 3u);
    EXPECT_EQ(pipeline.step(0).name, "outliers(zscore, 2.5)");
    EXPECT_EQ(pipeline.step(1).name, "smooth(exponential, 5)");
    EXPECT_EQ(pipeline.step(2).name, "decimate(500)");
    EXPECT_FALSE(pipeline.is_enabled(2));
    EXPECT_EQ(pipeline.description(), "outliers(zscore, 2.5) → smooth(exponential, 5)");
}

TEST(TelemetryConfigPipeline, DefaultsAndNameOverride)
{
    TelemetryConfig             config;
    TelemetryConfig::StepConfig step;
    step.kind = "outliers";
    step.name = "despike";
    config.add_step(step);

    TelemetryConfig::StepConfig agg;
    agg.kind    = "aggregate";
    agg.reducer = "max";
    config.add_step(agg);

    auto pipeline = config.build_pipeline();
    ASSERT_EQ(pipeline.step_count(), 2u);
    EXPECT_EQ(pipeline.step(0).name, "despike");
    EXPECT_EQ(pipeline.step(1).name, "aggregate(max, 60000ms)");
}

TEST(TelemetryConfigPipeline, InvalidStepsSkippedWithWarning)
{
    auto entries = std::make_shared<std::vector<Logger::LogEntry>>();
    Logger::instance().clear_sinks();
    Logger::instance().add_sink(sinks::memory_sink(entries));

    TelemetryConfig             config;
    TelemetryConfig::StepConfig unknown;
    unknown.kind = "fourier";
    config.add_step(unknown);

    TelemetryConfig::StepConfig bad_method;
    bad_method.kind   = "smooth";
    bad_method.method = "median";
    config.add_step(bad_method);

    TelemetryConfig::StepConfig zero;
    zero.kind       = "decimate";
    zero.max_points = 0;
    config.add_step(zero);

    TelemetryConfig::StepConfig ok;
    ok.kind = "sanitize";
    config.add_step(ok);

    auto pipeline = config.build_pipeline();
    Logger::instance().clear_sinks();

    ASSERT_EQ(pipeline.step_count(), 1u);
    EXPECT_EQ(pipeline.step(0).name, "sanitize");
    ASSERT_EQ(entries->size(), 3u);
    EXPECT_EQ((*entries)[0].level, LogLevel::Warning);
    EXPECT_EQ((*entries)[0].category, "config");
    EXPECT_NE((*entries)[0].message.find("fourier"), std::string::npos);
}

TEST(TelemetryConfigPipeline, InterpolationOptionsApplied)
{
    TelemetryConfig             config;
    TelemetryConfig::StepConfig step;
    step.kind             = "interpolate";
    step.method           = "step";
    step.gap_threshold_ms = 5000.0;
    step.interval_ms      = 1000.0;
    config.add_step(step);

    auto pipeline = config.build_pipeline();
    ASSERT_EQ(pipeline.step_count(), 1u);
    EXPECT_EQ(pipeline.step(0).name, "interpolate(step)");

    Series s   = {{0, 1, {}, {}}, {10'000, 2, {}, {}}};
    auto   out = pipeline.apply(s);
    EXPECT_GT(out.size(), 2u);
}

// ─── Serialization ───────────────────────────────────────────────────────────

TEST(TelemetryConfigSerialize, EmptyConfig)
{
    TelemetryConfig config;
    std::string     json = config.serialize();
    EXPECT_NE(json.find("\"version\": 1"), std::string::npos);
    EXPECT_NE(json.find("\"steps\""), std::string::npos);
    EXPECT_NE(json.find("\"thresholds\""), std::string::npos);
}

TEST(TelemetryConfigSerialize, RoundTrip)
{
    auto        config = sample_config();
    std::string json   = config.serialize();

    TelemetryConfig config2;
    ASSERT_TRUE(config2.deserialize(json));
    EXPECT_EQ(config2.name(), "engine_temp");

    ASSERT_EQ(config2.steps().size(), 3u);
    EXPECT_EQ(config2.steps()[0].kind, "outliers");
    EXPECT_EQ(config2.steps()[0].method, "zscore");
    ASSERT_TRUE(config2.steps()[0].threshold.has_value());
    EXPECT_DOUBLE_EQ(*config2.steps()[0].threshold, 2.5);
    EXPECT_FALSE(config2.steps()[1].threshold.has_value());
    EXPECT_EQ(config2.steps()[1].window, 5u);
    EXPECT_EQ(config2.steps()[2].max_points, 500u);
    EXPECT_FALSE(config2.steps()[2].preserve_extremes);
    EXPECT_FALSE(config2.steps()[2].enabled);

    ASSERT_EQ(config2.thresholds().size(), 2u);
    const auto& hot = config2.thresholds()[0];
    EXPECT_EQ(hot.id, "overheat");
    EXPECT_EQ(hot.severity, Severity::Critical);
    EXPECT_EQ(hot.op, ThresholdOperator::Gte);
    EXPECT_DOUBLE_EQ(*hot.value, 110.0);
    EXPECT_DOUBLE_EQ(*hot.hysteresis, 1.5);
    EXPECT_FALSE(hot.lower_bound.has_value());

    const auto& band = config2.thresholds()[1];
    EXPECT_EQ(band.kind, ThresholdKind::DynamicPercentile);
    EXPECT_EQ(band.op, ThresholdOperator::OutOfRange);
    EXPECT_DOUBLE_EQ(*band.lower_bound, 60.0);
    EXPECT_DOUBLE_EQ(*band.upper_bound, 95.0);
    EXPECT_EQ(*band.min_data_points, 20u);
    EXPECT_TRUE(band.confidence);
    EXPECT_FALSE(band.value.has_value());
}

TEST(TelemetryConfigSerialize, DeserializeEmpty)
{
    TelemetryConfig config;
    EXPECT_FALSE(config.deserialize(""));
}

TEST(TelemetryConfigSerialize, DeserializeFutureVersionLeavesConfig)
{
    auto config = sample_config();
    EXPECT_FALSE(config.deserialize("{\"version\": 99, \"steps\": []}"));
    EXPECT_EQ(config.steps().size(), 3u);
    EXPECT_EQ(config.name(), "engine_temp");
}

TEST(TelemetryConfigSerialize, DeserializeReplacesContents)
{
    auto config = sample_config();
    EXPECT_TRUE(config.deserialize("{\"version\": 1}"));
    EXPECT_TRUE(config.steps().empty());
    EXPECT_TRUE(config.thresholds().empty());
}

TEST(TelemetryConfigSerialize, HandWrittenJson)
{
    const std::string json = R"({
        "version": 1,
        "name": "rpm",
        "steps": [
            {"kind": "aggregate", "window_ms": 5000, "reducer": "sum"},
            {"method": "simple"},
            {"kind": "smooth"}
        ],
        "thresholds": [
            {"id": "redline", "operator": ">", "value": 6500, "severity": "error"},
            {"id": "weird", "operator": "~="},
            {"operator": "<"}
        ]
    })";

    TelemetryConfig config;
    ASSERT_TRUE(config.deserialize(json));
    EXPECT_EQ(config.name(), "rpm");
    ASSERT_EQ(config.steps().size(), 2u);   // the step without a kind is dropped
    EXPECT_DOUBLE_EQ(config.steps()[0].window_ms, 5000.0);
    EXPECT_EQ(config.steps()[0].reducer, "sum");
    EXPECT_EQ(config.steps()[1].window, 3u);

    ASSERT_EQ(config.thresholds().size(), 1u);
    EXPECT_EQ(config.thresholds()[0].id, "redline");
    EXPECT_EQ(config.thresholds()[0].op, ThresholdOperator::Gt);
    EXPECT_EQ(config.thresholds()[0].severity, Severity::Error);
    EXPECT_TRUE(config.thresholds()[0].enabled);
}

TEST(TelemetryConfigSerialize, SpecialCharacters)
{
    TelemetryConfig config;
    config.set_name("bay \"3\"\tcoolant");
    TelemetryConfig::StepConfig step;
    step.kind = "sanitize";
    step.name = "clean\\up";
    config.add_step(step);

    TelemetryConfig config2;
    ASSERT_TRUE(config2.deserialize(config.serialize()));
    EXPECT_EQ(config2.name(), "bay \"3\"\tcoolant");
    ASSERT_EQ(config2.steps().size(), 1u);
    EXPECT_EQ(config2.steps()[0].name, "clean\\up");
}

TEST(TelemetryConfigSerialize, TrailingBackslash)
{
    TelemetryConfig config;
    config.set_name("C:\\data\\");
    TelemetryConfig::StepConfig step;
    step.kind   = "smooth";
    step.method = "gaussian";
    config.add_step(step);

    TelemetryConfig config2;
    ASSERT_TRUE(config2.deserialize(config.serialize()));
    EXPECT_EQ(config2.name(), "C:\\data\\");
    ASSERT_EQ(config2.steps().size(), 1u);
    EXPECT_EQ(config2.steps()[0].method, "gaussian");
}

TEST(TelemetryConfigSerialize, StringValuesNamedLikeKeys)
{
    TelemetryConfig config;
    config.set_name("steps");
    TelemetryConfig::StepConfig step;
    step.kind   = "smooth";
    step.name   = "window";
    step.method = "simple";
    step.window = 7;
    config.add_step(step);

    ThresholdDefinition t;
    t.id    = "value";
    t.op    = ThresholdOperator::Gt;
    t.value = 42.0;
    config.add_threshold(t);

    TelemetryConfig config2;
    ASSERT_TRUE(config2.deserialize(config.serialize()));
    EXPECT_EQ(config2.name(), "steps");
    ASSERT_EQ(config2.steps().size(), 1u);
    EXPECT_EQ(config2.steps()[0].name, "window");
    EXPECT_EQ(config2.steps()[0].window, 7u);
    ASSERT_EQ(config2.thresholds().size(), 1u);
    EXPECT_EQ(config2.thresholds()[0].id, "value");
    ASSERT_TRUE(config2.thresholds()[0].value.has_value());
    EXPECT_DOUBLE_EQ(*config2.thresholds()[0].value, 42.0);
}

TEST(TelemetryConfigSerialize, NestedKeysDoNotLeakOut)
{
    // The only "name" key belongs to the step.
    const std::string json = R"({"version": 1, "steps": [{"kind": "sanitize", "name": "inner"}]})";

    TelemetryConfig config;
    ASSERT_TRUE(config.deserialize(json));
    EXPECT_EQ(config.name(), "");
    ASSERT_EQ(config.steps().size(), 1u);
    EXPECT_EQ(config.steps()[0].name, "inner");
}

TEST(TelemetryConfigSerialize, ControlCharactersEscaped)
{
    TelemetryConfig config;
    config.set_name(std::string("bell\x07") + "\b|\x1f");

    const std::string json = config.serialize();
    EXPECT_NE(json.find("\\u0007"), std::string::npos);
    EXPECT_NE(json.find("\\u001f"), std::string::npos);
    for (char c : json)
    {
        const auto u = static_cast<unsigned char>(c);
        EXPECT_TRUE(u >= 0x20 || c == '\n') << "raw control character " << static_cast<int>(u);
    }

    TelemetryConfig config2;
    ASSERT_TRUE(config2.deserialize(json));
    EXPECT_EQ(config2.name(), config.name());
}

TEST(TelemetryConfigSerialize, UnicodeEscapesDecoded)
{
    TelemetryConfig config;
    ASSERT_TRUE(config.deserialize(R"({"name": "caf\u00e9 \ud83d\ude80 \u20AC"})"));
    EXPECT_EQ(config.name(), "caf\xC3\xA9 \xF0\x9F\x9A\x80 \xE2\x82\xAC");
}

TEST(TelemetryConfigSerialize, OversizedCountsIgnored)
{
    const std::string json = R"({
        "steps": [{"kind": "smooth", "window": 1e30, "max_points": -4}],
        "thresholds": [{"id": "t", "operator": ">", "value": 1, "min_data_points": 1e30}]
    })";

    TelemetryConfig config;
    ASSERT_TRUE(config.deserialize(json));
    ASSERT_EQ(config.steps().size(), 1u);
    EXPECT_EQ(config.steps()[0].window, TelemetryConfig::StepConfig{}.window);
    EXPECT_EQ(config.steps()[0].max_points, TelemetryConfig::StepConfig{}.max_points);
    ASSERT_EQ(config.thresholds().size(), 1u);
    EXPECT_FALSE(config.thresholds()[0].min_data_points.has_value());
}

// ─── File I/O ────────────────────────────────────────────────────────────────

TEST(TelemetryConfigFile, SaveAndLoad)
{
    auto dir  = std::filesystem::temp_directory_path() / "telechart_test_config";
    auto path = dir / "nested" / "pipeline.json";
    std::filesystem::remove_all(dir);

    auto config = sample_config();
    EXPECT_TRUE(config.save(path.string()));
    EXPECT_TRUE(std::filesystem::exists(path));

    TelemetryConfig config2;
    EXPECT_TRUE(config2.load(path.string()));
    EXPECT_EQ(config2.steps().size(), 3u);
    EXPECT_EQ(config2.thresholds().size(), 2u);

    std::filesystem::remove_all(dir);
}

TEST(TelemetryConfigFile, LoadNonexistent)
{
    TelemetryConfig config;
    EXPECT_FALSE(config.load("/nonexistent/path/telechart.json"));
}

TEST(TelemetryConfigFile, DefaultPath)
{
    auto path = TelemetryConfig::default_path();
    EXPECT_FALSE(path.empty());
    EXPECT_NE(path.find("pipeline.json"), std::string::npos);
}
