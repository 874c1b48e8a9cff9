#pragma once

#include <telechart/pipeline.hpp>
#include <telechart/threshold.hpp>

#include <optional>
#include <string>
#include <vector>

namespace telechart
{

// Persistent dashboard configuration: the transformation steps to run on a
// telemetry stream and the thresholds to evaluate against it, saved to and
// loaded from JSON.
class TelemetryConfig
{
   public:
    static constexpr int VERSION = 1;

    // One pipeline step.  Which fields matter depends on `kind`:
    //   "outliers"     method, threshold
    //   "smooth"       method, window
    //   "interpolate"  method, gap_threshold_ms, interval_ms, max_points_per_gap
    //   "decimate"     max_points, preserve_extremes
    //   "aggregate"    window_ms, reducer
    //   "sanitize"     -
    struct StepConfig
    {
        std::string           kind;
        std::string           name;   // overrides the generated step name when set
        std::string           method;
        size_t                window = 3;
        std::optional<double> threshold;
        size_t                max_points         = 1000;
        bool                  preserve_extremes  = true;
        double                window_ms          = 60'000.0;
        std::string           reducer            = "mean";
        double                gap_threshold_ms   = 60'000.0;
        double                interval_ms        = 30'000.0;
        size_t                max_points_per_gap = 10;
        bool                  enabled            = true;
    };

    const std::string& name() const { return name_; }
    void               set_name(const std::string& n) { name_ = n; }

    void                           add_step(StepConfig step);
    const std::vector<StepConfig>& steps() const { return steps_; }

    void                                    add_threshold(ThresholdDefinition def);
    const std::vector<ThresholdDefinition>& thresholds() const { return thresholds_; }

    void clear();

    // Turns the step list into a pipeline.  Steps with an unknown kind or
    // unusable parameters are logged and left out.
    TransformPipeline build_pipeline() const;

    std::string serialize() const;

    // Replaces the current contents.  Returns false for empty input or a
    // newer format version, leaving the config untouched.
    bool deserialize(const std::string& json);

    // Save to a JSON file, creating parent directories. Returns true on success.
    bool save(const std::string& path) const;

    // Load from a JSON file. Returns true on success.
    bool load(const std::string& path);

    // ~/.config/telechart/pipeline.json
    static std::string default_path();

   private:
    std::string                      name_;
    std::vector<StepConfig>          steps_;
    std::vector<ThresholdDefinition> thresholds_;
};

}   // namespace telechart
