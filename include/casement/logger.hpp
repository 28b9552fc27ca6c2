#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace casement
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

    // Per-category threshold, overrides the global level for that category only.
    void set_category_level(std::string_view category, LogLevel level);
    void clear_category_levels();

    void add_sink(LogSink sink);
    void clear_sinks();

    void log(LogLevel level, std::string_view category, std::string_view message);

    template <typename... Args>
    void log_formatted(LogLevel         level,
                       std::string_view category,
                       std::string_view format,
                       Args&&... args);

    bool is_enabled(LogLevel level) const;
    bool is_enabled(LogLevel level, std::string_view category) const;

    // Number of entries emitted at `level` since startup (or the last reset).
    uint64_t count(LogLevel level) const;
    void     reset_counts();

    static std::string             level_to_string(LogLevel level);
    static std::optional<LogLevel> level_from_string(std::string_view name);
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);

   private:
    Logger()                         = default;
    ~Logger()                        = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex                        mutex_;
    LogLevel                                  min_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> category_levels_;
    std::vector<LogSink>                      sinks_;
    std::array<uint64_t, 6>                   counts_{};

    bool enabled_locked(LogLevel level, std::string_view category) const;

    template <typename T>
    static std::string arg_to_string(T&& v)
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
        else if constexpr (std::is_enum_v<D>)
            return std::to_string(static_cast<std::underlying_type_t<D>>(v));
        else
            return std::to_string(v);
    }

    static std::string format_message(std::string_view format, auto&&... args)
    {
        std::string result(format);
        size_t      cursor = 0;
        auto        substitute = [&](auto&& arg)
        {
            auto pos = result.find("{}", cursor);
            if (pos == std::string::npos)
                return;
            std::string text = arg_to_string(std::forward<decltype(arg)>(arg));
            result.replace(pos, 2, text);
            cursor = pos + text.size();
        };
        (substitute(std::forward<decltype(args)>(args)), ...);
        return result;
    }
};

template <typename... Args>
void Logger::log_formatted(LogLevel         level,
                           std::string_view category,
                           std::string_view format,
                           Args&&... args)
{
    if (!is_enabled(level, category))
        return;

    try
    {
        log(level, category, format_message(format, std::forward<Args>(args)...));
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

// Keeps the newest `capacity` entries in memory. Used by diagnostics overlays and tests.
class MemorySink
{
   public:
    explicit MemorySink(size_t capacity = 256);

    Logger::LogSink sink();

    std::vector<Logger::LogEntry> entries() const;
    bool   contains(LogLevel level, std::string_view needle) const;
    size_t size() const;
    void   clear();

   private:
    struct State
    {
        mutable std::mutex           mutex;
        std::deque<Logger::LogEntry> entries;
        size_t                       capacity;
    };
    std::shared_ptr<State> state_;
};
}   // namespace sinks

#define CASEMENT_LOG_AT(level, category, ...)                                                 \
    do                                                                                        \
    {                                                                                         \
        if (::casement::Logger::instance().is_enabled(level, category))                       \
        {                                                                                     \
            ::casement::Logger::instance().log_formatted(level, category, __VA_ARGS__);       \
        }                                                                                     \
    } while (0)

#define CASEMENT_LOG_TRACE(category, ...) \
    CASEMENT_LOG_AT(::casement::LogLevel::Trace, category, __VA_ARGS__)
#define CASEMENT_LOG_DEBUG(category, ...) \
    CASEMENT_LOG_AT(::casement::LogLevel::Debug, category, __VA_ARGS__)
#define CASEMENT_LOG_INFO(category, ...) \
    CASEMENT_LOG_AT(::casement::LogLevel::Info, category, __VA_ARGS__)
#define CASEMENT_LOG_WARN(category, ...) \
    CASEMENT_LOG_AT(::casement::LogLevel::Warning, category, __VA_ARGS__)
#define CASEMENT_LOG_ERROR(category, ...) \
    CASEMENT_LOG_AT(::casement::LogLevel::Error, category, __VA_ARGS__)
#define CASEMENT_LOG_CRITICAL(category, ...) \
    CASEMENT_LOG_AT(::casement::LogLevel::Critical, category, __VA_ARGS__)

}   // namespace casement
