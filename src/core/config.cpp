#include <telechart/config.hpp>
#include <telechart/logger.hpp>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace telechart
{

// ─── Contents ───────────────────────────────────────────────────────────────

void TelemetryConfig::add_step(StepConfig step)
{
    steps_.push_back(std::move(step));
}

void TelemetryConfig::add_threshold(ThresholdDefinition def)
{
    thresholds_.push_back(std::move(def));
}

void TelemetryConfig::clear()
{
    name_.clear();
    steps_.clear();
    thresholds_.clear();
}

// ─── Pipeline construction ──────────────────────────────────────────────────

static TransformStep make_step(const TelemetryConfig::StepConfig& sc)
{
    if (sc.kind == "outliers")
    {
        auto method = sc.method.empty() ? data::OutlierMethod::Iqr
                                        : data::parse_outlier_method(sc.method);
        return steps::remove_outliers(method, sc.threshold);
    }
    if (sc.kind == "smooth")
    {
        auto method = sc.method.empty() ? data::SmoothingMethod::Simple
                                        : data::parse_smoothing_method(sc.method);
        return steps::smooth(sc.window, method);
    }
    if (sc.kind == "interpolate")
    {
        auto method = sc.method.empty() ? data::InterpolationMethod::Linear
                                        : data::parse_interpolation_method(sc.method);
        data::InterpolationOptions opts;
        opts.gap_threshold_ms   = sc.gap_threshold_ms;
        opts.interval_ms        = sc.interval_ms;
        opts.max_points_per_gap = sc.max_points_per_gap;
        return steps::interpolate(method, opts);
    }
    if (sc.kind == "decimate")
        return steps::decimate(sc.max_points, sc.preserve_extremes);
    if (sc.kind == "aggregate")
        return steps::aggregate(sc.window_ms, data::parse_reducer(sc.reducer));
    if (sc.kind == "sanitize")
        return steps::sanitize();
    throw std::invalid_argument("unknown step kind '" + sc.kind + "'");
}

TransformPipeline TelemetryConfig::build_pipeline() const
{
    TransformPipeline pipeline(name_);
    for (const auto& sc : steps_)
    {
        try
        {
            TransformStep step = make_step(sc);
            if (!sc.name.empty())
                step.name = sc.name;
            step.enabled = sc.enabled;
            pipeline.add_step(std::move(step));
        }
        catch (const std::invalid_argument& e)
        {
            TELECHART_LOG_WARN("config", "Skipping step: {}", e.what());
        }
    }
    return pipeline;
}

// ─── JSON serialization ─────────────────────────────────────────────────────

static std::string escape_json(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s)
    {
        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20)
                {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                }
                else
                {
                    out += c;
                }
                break;
        }
    }
    return out;
}

// Value of the four hex digits at s[pos], or -1.
static long read_hex4(const std::string& s, size_t pos)
{
    if (pos + 4 > s.size())
        return -1;
    long v = 0;
    for (size_t i = pos; i < pos + 4; ++i)
    {
        const char c = s[i];
        v <<= 4;
        if (c >= '0' && c <= '9')
            v |= c - '0';
        else if (c >= 'a' && c <= 'f')
            v |= c - 'a' + 10;
        else if (c >= 'A' && c <= 'F')
            v |= c - 'A' + 10;
        else
            return -1;
    }
    return v;
}

static void append_utf8(std::string& out, unsigned long cp)
{
    if (cp < 0x80)
    {
        out += static_cast<char>(cp);
    }
    else if (cp < 0x800)
    {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else if (cp < 0x10000)
    {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else
    {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

static std::string unescape_json(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i)
    {
        if (s[i] != '\\' || i + 1 == s.size())
        {
            out += s[i];
            continue;
        }
        switch (s[++i])
        {
            case 'n':
                out += '\n';
                break;
            case 'r':
                out += '\r';
                break;
            case 't':
                out += '\t';
                break;
            case 'b':
                out += '\b';
                break;
            case 'f':
                out += '\f';
                break;
            case 'u':
            {
                long cp = read_hex4(s, i + 1);
                if (cp < 0)
                {
                    out += 'u';
                    break;
                }
                i += 4;
                // High surrogate followed by "\uDC00".."\uDFFF"
                if (cp >= 0xD800 && cp < 0xDC00 && i + 2 < s.size() && s[i + 1] == '\\'
                    && s[i + 2] == 'u')
                {
                    const long low = read_hex4(s, i + 3);
                    if (low >= 0xDC00 && low < 0xE000)
                    {
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                        i += 6;
                    }
                }
                append_utf8(out, static_cast<unsigned long>(cp));
                break;
            }
            default:
                out += s[i];
                break;
        }
    }
    return out;
}

static std::string json_number(double v)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", v);
    return buf;
}

std::string TelemetryConfig::serialize() const
{
    std::ostringstream os;
    os << "{\n";
    os << "  \"version\": " << VERSION << ",\n";
    os << "  \"name\": \"" << escape_json(name_) << "\",\n";
    os << "  \"steps\": [\n";
    for (size_t i = 0; i < steps_.size(); ++i)
    {
        const auto& s = steps_[i];
        os << "    {\n";
        os << "      \"kind\": \"" << escape_json(s.kind) << "\",\n";
        os << "      \"name\": \"" << escape_json(s.name) << "\",\n";
        os << "      \"method\": \"" << escape_json(s.method) << "\",\n";
        os << "      \"window\": " << s.window << ",\n";
        if (s.threshold && std::isfinite(*s.threshold))
            os << "      \"threshold\": " << json_number(*s.threshold) << ",\n";
        os << "      \"max_points\": " << s.max_points << ",\n";
        os << "      \"preserve_extremes\": " << (s.preserve_extremes ? "true" : "false") << ",\n";
        os << "      \"window_ms\": " << json_number(s.window_ms) << ",\n";
        os << "      \"reducer\": \"" << escape_json(s.reducer) << "\",\n";
        os << "      \"gap_threshold_ms\": " << json_number(s.gap_threshold_ms) << ",\n";
        os << "      \"interval_ms\": " << json_number(s.interval_ms) << ",\n";
        os << "      \"max_points_per_gap\": " << s.max_points_per_gap << ",\n";
        os << "      \"enabled\": " << (s.enabled ? "true" : "false") << "\n";
        os << "    }";
        if (i + 1 < steps_.size())
            os << ",";
        os << "\n";
    }
    os << "  ],\n";
    os << "  \"thresholds\": [\n";
    for (size_t i = 0; i < thresholds_.size(); ++i)
    {
        const auto& t   = thresholds_[i];
        auto        opt = [&os](const char* key, const std::optional<double>& v)
        {
            if (v && std::isfinite(*v))
                os << "      \"" << key << "\": " << json_number(*v) << ",\n";
        };
        os << "    {\n";
        os << "      \"id\": \"" << escape_json(t.id) << "\",\n";
        os << "      \"kind\": \"" << threshold_kind_name(t.kind) << "\",\n";
        os << "      \"severity\": \"" << severity_name(t.severity) << "\",\n";
        os << "      \"operator\": \"" << threshold_operator_name(t.op) << "\",\n";
        opt("value", t.value);
        opt("lower_bound", t.lower_bound);
        opt("upper_bound", t.upper_bound);
        opt("percentile", t.percentile);
        opt("stddev_multiplier", t.stddev_multiplier);
        if (t.min_data_points)
            os << "      \"min_data_points\": " << *t.min_data_points << ",\n";
        opt("hysteresis", t.hysteresis);
        os << "      \"confidence\": " << (t.confidence ? "true" : "false") << ",\n";
        os << "      \"enabled\": " << (t.enabled ? "true" : "false") << "\n";
        os << "    }";
        if (i + 1 < thresholds_.size())
            os << ",";
        os << "\n";
    }
    os << "  ]\n";
    os << "}\n";
    return os.str();
}

// Minimal JSON reader for the format written above: flat objects inside
// named arrays, looked up key by key.

// Index one past the closing quote of the string opening at json[pos];
// npos when the string is unterminated.
static size_t skip_string(const std::string& json, size_t pos)
{
    size_t i = pos + 1;
    while (i < json.size() && json[i] != '"')
        i += json[i] == '\\' ? 2 : 1;
    return i < json.size() ? i + 1 : std::string::npos;
}

// Position of the value of `key` among the members of the outermost object
// in `json`.  Strings are skipped whole and nested objects or arrays are
// not searched, so neither a string value equal to `key` nor a key of a
// nested object matches.
static size_t find_value(const std::string& json, const std::string& key)
{
    int    depth = 0;
    size_t i     = 0;
    while (i < json.size())
    {
        const char c = json[i];
        if (c == '"')
        {
            const size_t end = skip_string(json, i);
            if (end == std::string::npos)
                return std::string::npos;
            const size_t colon  = json.find_first_not_of(" \t\n\r", end);
            const bool   is_key = depth == 1 && colon != std::string::npos && json[colon] == ':';
            if (is_key && json.compare(i + 1, end - i - 2, key) == 0)
                return json.find_first_not_of(" \t\n\r", colon + 1);
            i = end;
            continue;
        }
        if (c == '{' || c == '[')
            ++depth;
        else if (c == '}' || c == ']')
            --depth;
        ++i;
    }
    return std::string::npos;
}

static std::optional<std::string> read_json_string(const std::string& json, const std::string& key)
{
    auto pos = find_value(json, key);
    if (pos == std::string::npos || json[pos] != '"')
        return std::nullopt;
    const size_t end = skip_string(json, pos);
    if (end == std::string::npos)
        return std::nullopt;
    return unescape_json(json.substr(pos + 1, end - pos - 2));
}

static bool read_json_bool(const std::string& json, const std::string& key, bool def)
{
    auto pos = find_value(json, key);
    if (pos == std::string::npos)
        return def;
    if (json.compare(pos, 4, "true") == 0)
        return true;
    if (json.compare(pos, 5, "false") == 0)
        return false;
    return def;
}

static std::optional<double> read_json_number(const std::string& json, const std::string& key)
{
    auto pos = find_value(json, key);
    if (pos == std::string::npos)
        return std::nullopt;
    const char* begin = json.c_str() + pos;
    char*       end   = nullptr;
    double      v     = std::strtod(begin, &end);
    if (end == begin)
        return std::nullopt;
    return v;
}

static std::optional<size_t> read_json_count(const std::string& json, const std::string& key)
{
    auto v = read_json_number(json, key);
    // 2^64 as a double; anything at or above it has no size_t value.
    constexpr double limit = static_cast<double>(std::numeric_limits<size_t>::max());
    if (!v || !(*v >= 0.0) || !(*v < limit))
        return std::nullopt;
    return static_cast<size_t>(*v);
}

static std::vector<std::string> parse_json_objects(const std::string& json,
                                                   const std::string& array_key)
{
    std::vector<std::string> objects;
    auto                     pos = find_value(json, array_key);
    if (pos == std::string::npos || json[pos] != '[')
        return objects;

    int    depth     = 0;
    size_t obj_start = 0;
    for (size_t i = pos + 1; i < json.size(); ++i)
    {
        if (json[i] == '"')
        {
            const size_t end = skip_string(json, i);
            if (end == std::string::npos)
                break;
            i = end - 1;
        }
        else if (json[i] == '{')
        {
            if (depth == 0)
                obj_start = i;
            ++depth;
        }
        else if (json[i] == '}')
        {
            --depth;
            if (depth == 0)
            {
                objects.push_back(json.substr(obj_start, i - obj_start + 1));
            }
        }
        else if (json[i] == ']' && depth == 0)
        {
            break;
        }
    }
    return objects;
}

static TelemetryConfig::StepConfig parse_step(const std::string& obj)
{
    TelemetryConfig::StepConfig s;
    s.kind      = read_json_string(obj, "kind").value_or("");
    s.name      = read_json_string(obj, "name").value_or("");
    s.method    = read_json_string(obj, "method").value_or("");
    s.window    = read_json_count(obj, "window").value_or(s.window);
    s.threshold = read_json_number(obj, "threshold");
    s.max_points        = read_json_count(obj, "max_points").value_or(s.max_points);
    s.preserve_extremes = read_json_bool(obj, "preserve_extremes", s.preserve_extremes);
    s.window_ms         = read_json_number(obj, "window_ms").value_or(s.window_ms);
    s.reducer           = read_json_string(obj, "reducer").value_or(s.reducer);
    s.gap_threshold_ms  = read_json_number(obj, "gap_threshold_ms").value_or(s.gap_threshold_ms);
    s.interval_ms       = read_json_number(obj, "interval_ms").value_or(s.interval_ms);
    s.max_points_per_gap =
        read_json_count(obj, "max_points_per_gap").value_or(s.max_points_per_gap);
    s.enabled = read_json_bool(obj, "enabled", true);
    return s;
}

// Throws std::invalid_argument on unknown kind/severity/operator names.
static ThresholdDefinition parse_threshold(const std::string& obj)
{
    ThresholdDefinition t;
    t.id = read_json_string(obj, "id").value_or("");
    if (auto kind = read_json_string(obj, "kind"))
        t.kind = parse_threshold_kind(*kind);
    if (auto severity = read_json_string(obj, "severity"))
        t.severity = parse_severity(*severity);
    if (auto op = read_json_string(obj, "operator"))
        t.op = parse_threshold_operator(*op);
    t.value             = read_json_number(obj, "value");
    t.lower_bound       = read_json_number(obj, "lower_bound");
    t.upper_bound       = read_json_number(obj, "upper_bound");
    t.percentile        = read_json_number(obj, "percentile");
    t.stddev_multiplier = read_json_number(obj, "stddev_multiplier");
    t.min_data_points   = read_json_count(obj, "min_data_points");
    t.hysteresis        = read_json_number(obj, "hysteresis");
    t.confidence        = read_json_bool(obj, "confidence", false);
    t.enabled           = read_json_bool(obj, "enabled", true);
    return t;
}

bool TelemetryConfig::deserialize(const std::string& json)
{
    if (json.empty())
        return false;

    // Check version
    if (auto ver = read_json_number(json, "version"); ver && *ver > VERSION)
    {
        TELECHART_LOG_WARN("config",
                           "Config version {} is newer than supported version {}",
                           static_cast<int>(*ver),
                           VERSION);
        return false;
    }

    std::vector<StepConfig> steps;
    for (const auto& obj : parse_json_objects(json, "steps"))
    {
        StepConfig s = parse_step(obj);
        if (!s.kind.empty())
            steps.push_back(std::move(s));
    }

    std::vector<ThresholdDefinition> thresholds;
    for (const auto& obj : parse_json_objects(json, "thresholds"))
    {
        try
        {
            ThresholdDefinition t = parse_threshold(obj);
            if (!t.id.empty())
                thresholds.push_back(std::move(t));
        }
        catch (const std::invalid_argument& e)
        {
            TELECHART_LOG_WARN("config", "Skipping threshold: {}", e.what());
        }
    }

    name_       = read_json_string(json, "name").value_or("");
    steps_      = std::move(steps);
    thresholds_ = std::move(thresholds);
    return true;
}

// ─── File I/O ───────────────────────────────────────────────────────────────

bool TelemetryConfig::save(const std::string& path) const
{
    // Create parent directories; a failure shows up when opening the file.
    try
    {
        auto dir = std::filesystem::path(path).parent_path();
        if (!dir.empty())
        {
            std::filesystem::create_directories(dir);
        }
    }
    catch (const std::filesystem::filesystem_error& e)
    {
        TELECHART_LOG_WARN("config", "Cannot create config directory: {}", e.what());
    }

    std::ofstream f(path);
    if (!f.is_open())
    {
        TELECHART_LOG_ERROR("config", "Cannot write config file '{}'", path);
        return false;
    }
    f << serialize();
    return f.good();
}

bool TelemetryConfig::load(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
    {
        TELECHART_LOG_DEBUG("config", "No config file at '{}'", path);
        return false;
    }
    std::string json((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return deserialize(json);
}

std::string TelemetryConfig::default_path()
{
    const char* home = std::getenv("HOME");
    if (!home)
        home = std::getenv("USERPROFILE");
    if (!home)
        return "pipeline.json";

    std::filesystem::path dir = std::filesystem::path(home) / ".config" / "telechart";
    return (dir / "pipeline.json").string();
}

}   // namespace telechart
