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

namespace pulseplot
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

    void     set_level(LogLevel level);
    LogLevel get_level() const;

    void add_sink(LogSink sink);
    void clear_sinks();

    void log(LogLevel level, std::string_view category, std::string_view message);

    template <typename... Args>
    void log_formatted(LogLevel         level,
                       std::string_view category,
                       std::string_view format,
                       Args&&... args);

    bool is_enabled(LogLevel level) const;

    static std::string             level_to_string(LogLevel level);
    static std::optional<LogLevel> level_from_string(std::string_view name);
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);

   private:
    Logger()                         = default;
    ~Logger()                        = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex   mutex_;
    LogLevel             min_level_ = LogLevel::Info;
    std::vector<LogSink> sinks_;

    template <typename T>
    static std::string arg_to_string(T&& v)
    {
        using D = std::decay_t<T>;
        if constexpr (std::is_same_v<D, std::string>)
            return v;
        else if constexpr (std::is_same_v<D, std::string_view>)
            return std::string(v);
        else if constexpr (std::is_same_v<D, const char*> || std::is_same_v<D, char*>)
        {
            const char* p = v;
            return p ? std::string(p) : std::string("(null)");
        }
        else if constexpr (std::is_same_v<D, bool>)
            return v ? "true" : "false";
        else if constexpr (std::is_floating_point_v<D>)
            return format_float(static_cast<double>(v));
        else
            return std::to_string(v);
    }

    static std::string format_float(double v);

    static std::string format_message(std::string_view format, auto&&... args)
    {
        std::string result(format);
        if constexpr (sizeof...(args) > 0)
        {
            size_t search_from  = 0;
            auto   replace_next = [&](auto&& arg)
            {
                auto pos = result.find("{}", search_from);
                if (pos == std::string::npos)
                    return;
                std::string text = arg_to_string(std::forward<decltype(arg)>(arg));
                result.replace(pos, 2, text);
                search_from = pos + text.size();
            };
            (replace_next(std::forward<decltype(args)>(args)), ...);
        }
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
        log(level, category, format_message(format, std::forward<Args>(args)...));
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "logger", std::string("Format error: ") + e.what());
    }
}

namespace sinks
{
Logger::LogSink console_sink();
Logger::LogSink file_sink(const std::string& filename);
}   // namespace sinks

#define PULSEPLOT_LOG_AT(lvl, category, ...)                                         \
    do                                                                               \
    {                                                                                \
        if (::pulseplot::Logger::instance().is_enabled(lvl))                         \
        {                                                                            \
            ::pulseplot::Logger::instance().log_formatted(lvl, category, __VA_ARGS__); \
        }                                                                            \
    } while (0)

#define PULSEPLOT_LOG_TRACE(category, ...) \
    PULSEPLOT_LOG_AT(::pulseplot::LogLevel::Trace, category, __VA_ARGS__)
#define PULSEPLOT_LOG_DEBUG(category, ...) \
    PULSEPLOT_LOG_AT(::pulseplot::LogLevel::Debug, category, __VA_ARGS__)
#define PULSEPLOT_LOG_INFO(category, ...) \
    PULSEPLOT_LOG_AT(::pulseplot::LogLevel::Info, category, __VA_ARGS__)
#define PULSEPLOT_LOG_WARN(category, ...) \
    PULSEPLOT_LOG_AT(::pulseplot::LogLevel::Warning, category, __VA_ARGS__)
#define PULSEPLOT_LOG_ERROR(category, ...) \
    PULSEPLOT_LOG_AT(::pulseplot::LogLevel::Error, category, __VA_ARGS__)
#define PULSEPLOT_LOG_CRITICAL(category, ...) \
    PULSEPLOT_LOG_AT(::pulseplot::LogLevel::Critical, category, __VA_ARGS__)

}   // namespace pulseplot
