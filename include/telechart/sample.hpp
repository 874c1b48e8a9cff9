#pragma once

#include <map>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace telechart
{

// ─── Metadata ───────────────────────────────────────────────────────────────

using MetadataValue = std::variant<bool, double, std::string>;
using Metadata      = std::map<std::string, MetadataValue>;

// ─── Sample / Series ────────────────────────────────────────────────────────

// One telemetry reading.  `time` is milliseconds since the Unix epoch.
struct Sample
{
    double                     time  = 0.0;
    double                     value = 0.0;
    std::optional<std::string> category;
    Metadata                   metadata;
};

using Series = std::vector<Sample>;

// A sample is usable when both its time and value are finite.
bool is_valid(const Sample& s);

// Drops samples with NaN/inf time or value.  Order is preserved.
[[nodiscard]] Series sanitize(std::span<const Sample> series);

// Stable ascending sort by time.
[[nodiscard]] Series sorted_by_time(std::span<const Sample> series);

// sanitize() followed by sorted_by_time(); the usual entry point for
// anything that depends on chronology.
[[nodiscard]] Series prepare(std::span<const Sample> series);

bool is_sorted_by_time(std::span<const Sample> series);

// Extracts the value column (NaNs included).
std::vector<double> values_of(std::span<const Sample> series);

// Metadata accessors; return std::nullopt when the key is missing or holds
// a different alternative.
std::optional<bool>        metadata_bool(const Sample& s, const std::string& key);
std::optional<double>      metadata_number(const Sample& s, const std::string& key);
std::optional<std::string> metadata_string(const Sample& s, const std::string& key);

}   // namespace telechart
