#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace vellum
{

enum class LogLevel : int
{
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6,
};

// Startup configuration for the process-wide logger.
struct LogConfig
{
    LogLevel    level   = LogLevel::Warning;
    bool        console = true;
    std::string file_path;   // empty = no file sink
};

class Logger
{
   public:
    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        LogLevel                              level;
        std::string                           category;
        std::string                           message;
    };

    using LogSink = std::function<void(const LogEntry&)>;

    static Logger& instance();

    // Replace level and sinks according to `config`.
    void configure(const LogConfig& config);

    void     set_level(LogLevel level);
    LogLevel level() const;

    void   add_sink(LogSink sink);
    void   clear_sinks();
    size_t sink_count() const;

    void log(LogLevel level, std::string_view category, std::string_view message);

    template <typename... Args>
    void log_formatted(LogLevel         level,
                       std::string_view category,
                       std::string_view format,
                       Args&&... args);

    bool is_enabled(LogLevel level) const;

    static const char*             level_name(LogLevel level);
    static std::optional<LogLevel> parse_level(std::string_view name);
    static std::string             format_entry(const LogEntry& entry);

   private:
    Logger()                         = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex   mutex_;
    LogLevel             min_level_ = LogLevel::Warning;
    std::vector<LogSink> sinks_;

    template <typename T>
    static std::string to_text(T&& v)
    {
        using D = std::decay_t<T>;
        if constexpr (std::is_same_v<D, std::string>)
            return v;
        else if constexpr (std::is_same_v<D, std::string_view>)
            return std::string(v);
        else if constexpr (std::is_same_v<D, const char*> || std::is_same_v<D, char*>)
            return v ? std::string(v) : std::string("(null)");
        else if constexpr (std::is_same_v<D, bool>)
            return v ? "true" : "false";
        else
            return std::to_string(v);
    }

    // Substitute each "{}" in order; surplus arguments are dropped.
    static std::string substitute(std::string_view format, auto&&... args)
    {
        std::string result(format);
        size_t      cursor = 0;
        auto        next   = [&](auto&& arg)
        {
            auto pos = result.find("{}", cursor);
            if (pos == std::string::npos)
                return;
            std::string text = to_text(std::forward<decltype(arg)>(arg));
            result.replace(pos, 2, text);
            cursor = pos + text.size();
        };
        (next(std::forward<decltype(args)>(args)), ...);
        return result;
    }
};

template <typename... Args>
void Logger::log_formatted(LogLevel         level,
                           std::string_view category,
                           std::string_view format,
                           Args&&... args)
{
    if (!is_enabled(level))
        return;

    try
    {
        log(level, category, substitute(format, std::forward<Args>(args)...));
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "logger", std::string("format error: ") + e.what());
    }
}

namespace sinks
{
Logger::LogSink console_sink();
Logger::LogSink file_sink(const std::string& filename);
Logger::LogSink null_sink();
}   // namespace sinks

#define VELLUM_LOG_AT(lvl, category, ...)                                         \
    do                                                                            \
    {                                                                             \
        if (::vellum::Logger::instance().is_enabled(lvl))                         \
            ::vellum::Logger::instance().log_formatted(lvl, category, __VA_ARGS__); \
    } while (0)

#define VELLUM_LOG_TRACE(category, ...) VELLUM_LOG_AT(::vellum::LogLevel::Trace, category, __VA_ARGS__)
#define VELLUM_LOG_DEBUG(category, ...) VELLUM_LOG_AT(::vellum::LogLevel::Debug, category, __VA_ARGS__)
#define VELLUM_LOG_INFO(category, ...) VELLUM_LOG_AT(::vellum::LogLevel::Info, category, __VA_ARGS__)
#define VELLUM_LOG_WARN(category, ...) VELLUM_LOG_AT(::vellum::LogLevel::Warning, category, __VA_ARGS__)
#define VELLUM_LOG_ERROR(category, ...) VELLUM_LOG_AT(::vellum::LogLevel::Error, category, __VA_ARGS__)
#define VELLUM_LOG_CRITICAL(category, ...) \
    VELLUM_LOG_AT(::vellum::LogLevel::Critical, category, __VA_ARGS__)

}   // namespace vellum
