#pragma once

#include <charconv>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace telechart
{

enum class LogLevel : int
{
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5
};

// Case-insensitive; accepts the names level_to_string() produces plus
// "warning".  nullopt for anything else.
std::optional<LogLevel> parse_log_level(std::string_view name);

// Process-wide logger.  Entries below the threshold of their category (or
// the global threshold, for categories without one) are dropped before any
// formatting happens.
class Logger
{
   public:
    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        LogLevel                              level;
        std::string                           category;
        std::string                           message;
        std::string                           file;
        int                                   line;
        std::string                           function;
    };

    using LogSink = std::function<void(const LogEntry&)>;

    static Logger& instance();

    void     set_level(LogLevel level);
    LogLevel get_level() const;

    // Overrides the global level for one category ("scale", "pipeline", ...).
    void set_category_level(std::string_view category, LogLevel level);
    void clear_category_levels();

    void add_sink(LogSink sink);
    void clear_sinks();

    void log(LogLevel         level,
             std::string_view category,
             std::string_view message,
             std::string_view file     = "",
             int              line     = 0,
             std::string_view function = "");

    // "{}" placeholders are replaced left to right; surplus ones stay as is.
    template <typename... Args>
    void log_formatted(LogLevel level, std::string_view category, std::string_view format, Args&&... args);

    bool is_enabled(LogLevel level) const;
    bool is_enabled(LogLevel level, std::string_view category) const;

    static std::string level_to_string(LogLevel level);
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);

   private:
    Logger()                         = default;
    ~Logger()                        = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel threshold_for(std::string_view category) const;

    template <typename T>
    static std::string to_text(const T& v)
    {
        if constexpr (std::is_same_v<T, std::string>)
            return v;
        else if constexpr (std::is_same_v<T, std::string_view>)
            return std::string(v);
        else if constexpr (std::is_same_v<T, const char*> || std::is_same_v<T, char*>)
            return v ? std::string(v) : std::string("(null)");
        else if constexpr (std::is_same_v<T, bool>)
            return v ? "true" : "false";
        else if constexpr (std::is_floating_point_v<T>)
        {
            // Shortest round-trip form: 0.25 rather than 0.250000
            char buf[32];
            auto res = std::to_chars(buf, buf + sizeof(buf), v);
            return std::string(buf, res.ptr);
        }
        else
            return std::to_string(v);
    }

    template <typename... Args>
    static std::string format_message(std::string_view format, const Args&... args)
    {
        std::string out(format);
        size_t      from = 0;
        auto        fill = [&](const std::string& text)
        {
            auto pos = out.find("{}", from);
            if (pos == std::string::npos)
                return;
            out.replace(pos, 2, text);
            from = pos + text.size();
        };
        (fill(to_text<std::decay_t<const Args>>(args)), ...);
        return out;
    }

    mutable std::mutex                           mutex_;
    LogLevel                                     min_level_ = LogLevel::Info;
    std::map<std::string, LogLevel, std::less<>> category_levels_;
    std::vector<LogSink>                         sinks_;
};

template <typename... Args>
void Logger::log_formatted(LogLevel level, std::string_view category, std::string_view format, Args&&... args)
{
    if (!is_enabled(level, category))
        return;

    std::string message;
    try
    {
        message = format_message(format, args...);
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "logger", std::string("Format error: ") + e.what());
        return;
    }
    log(level, category, message);
}

namespace sinks
{
// Colored; Warning and above go to stderr.
Logger::LogSink console_sink();
Logger::LogSink file_sink(const std::string& filename);
Logger::LogSink null_sink();

// Appends every entry to `entries`; used by tests that assert on what was logged.
Logger::LogSink memory_sink(std::shared_ptr<std::vector<Logger::LogEntry>> entries);
}   // namespace sinks

#define TELECHART_LOG(level, category, ...)                                               \
    do                                                                                    \
    {                                                                                     \
        auto& telechart_logger_ = ::telechart::Logger::instance();                        \
        if (telechart_logger_.is_enabled(level, category))                                \
            telechart_logger_.log_formatted(level, category, __VA_ARGS__);                \
    } while (0)

#define TELECHART_LOG_TRACE(category, ...) \
    TELECHART_LOG(::telechart::LogLevel::Trace, category, __VA_ARGS__)
#define TELECHART_LOG_DEBUG(category, ...) \
    TELECHART_LOG(::telechart::LogLevel::Debug, category, __VA_ARGS__)
#define TELECHART_LOG_INFO(category, ...) \
    TELECHART_LOG(::telechart::LogLevel::Info, category, __VA_ARGS__)
#define TELECHART_LOG_WARN(category, ...) \
    TELECHART_LOG(::telechart::LogLevel::Warning, category, __VA_ARGS__)
#define TELECHART_LOG_ERROR(category, ...) \
    TELECHART_LOG(::telechart::LogLevel::Error, category, __VA_ARGS__)
#define TELECHART_LOG_CRITICAL(category, ...) \
    TELECHART_LOG(::telechart::LogLevel::Critical, category, __VA_ARGS__)

}   // namespace telechart
