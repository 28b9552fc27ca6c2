#include <algorithm>
#include <casement/logger.hpp>
#include <cctype>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace casement
{

Logger& Logger::instance()
{
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::get_level() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

void Logger::set_category_level(std::string_view category, LogLevel level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    category_levels_[std::string(category)] = level;
}

void Logger::clear_category_levels()
{
    std::lock_guard<std::mutex> lock(mutex_);
    category_levels_.clear();
}

void Logger::add_sink(LogSink sink)
{
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks()
{
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::log(LogLevel level, std::string_view category, std::string_view message)
{
    LogEntry entry{.timestamp = std::chrono::system_clock::now(),
                   .level     = level,
                   .category  = std::string(category),
                   .message   = std::string(message)};

    std::lock_guard<std::mutex> lock(mutex_);
    if (!enabled_locked(level, category))
        return;

    counts_[static_cast<size_t>(level)]++;
    for (const auto& sink : sinks_)
    {
        sink(entry);
    }
}

bool Logger::enabled_locked(LogLevel level, std::string_view category) const
{
    if (!category_levels_.empty())
    {
        auto it = category_levels_.find(std::string(category));
        if (it != category_levels_.end())
            return level >= it->second;
    }
    return level >= min_level_;
}

bool Logger::is_enabled(LogLevel level) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= min_level_;
}

bool Logger::is_enabled(LogLevel level, std::string_view category) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return enabled_locked(level, category);
}

uint64_t Logger::count(LogLevel level) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return counts_[static_cast<size_t>(level)];
}

void Logger::reset_counts()
{
    std::lock_guard<std::mutex> lock(mutex_);
    counts_.fill(0);
}

std::string Logger::level_to_string(LogLevel level)
{
    switch (level)
    {
        case LogLevel::Trace:
            return "TRACE";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warning:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Critical:
            return "CRITICAL";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> Logger::level_from_string(std::string_view name)
{
    std::string lower(name);
    std::transform(lower.begin(),
                   lower.end(),
                   lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace")
        return LogLevel::Trace;
    if (lower == "debug")
        return LogLevel::Debug;
    if (lower == "info")
        return LogLevel::Info;
    if (lower == "warn" || lower == "warning")
        return LogLevel::Warning;
    if (lower == "error")
        return LogLevel::Error;
    if (lower == "critical")
        return LogLevel::Critical;
    return std::nullopt;
}

std::string Logger::timestamp_to_string(const std::chrono::system_clock::time_point& tp)
{
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&time_t, &local);

    std::stringstream ss;
    ss << std::put_time(&local, "%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

namespace sinks
{

namespace
{

const char* level_color(LogLevel level)
{
    switch (level)
    {
        case LogLevel::Trace:
            return "\033[37m";
        case LogLevel::Debug:
            return "\033[36m";
        case LogLevel::Info:
            return "\033[32m";
        case LogLevel::Warning:
            return "\033[33m";
        case LogLevel::Error:
            return "\033[31m";
        case LogLevel::Critical:
            return "\033[35m";
    }
    return "";
}

void write_line(std::ostream& out, const Logger::LogEntry& entry)
{
    out << Logger::timestamp_to_string(entry.timestamp) << " "
        << Logger::level_to_string(entry.level) << " [" << entry.category << "] "
        << entry.message;
}

}   // namespace

Logger::LogSink console_sink()
{
    return [](const Logger::LogEntry& entry)
    {
        std::ostream& out = entry.level >= LogLevel::Warning ? std::cerr : std::cout;
        out << level_color(entry.level);
        write_line(out, entry);
        out << "\033[0m" << std::endl;
    };
}

Logger::LogSink file_sink(const std::string& filename)
{
    auto file = std::make_shared<std::ofstream>(filename, std::ios::app);
    if (!file->is_open())
    {
        std::cerr << "casement: cannot open log file " << filename << std::endl;
    }
    return [file](const Logger::LogEntry& entry)
    {
        if (!file->is_open())
            return;
        write_line(*file, entry);
        *file << std::endl;
    };
}

Logger::LogSink null_sink()
{
    return [](const Logger::LogEntry&) {};
}

MemorySink::MemorySink(size_t capacity) : state_(std::make_shared<State>())
{
    state_->capacity = std::max<size_t>(capacity, 1);
}

Logger::LogSink MemorySink::sink()
{
    std::weak_ptr<State> weak = state_;
    return [weak](const Logger::LogEntry& entry)
    {
        auto state = weak.lock();
        if (!state)
            return;
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->entries.size() >= state->capacity)
            state->entries.pop_front();
        state->entries.push_back(entry);
    };
}

std::vector<Logger::LogEntry> MemorySink::entries() const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    return {state_->entries.begin(), state_->entries.end()};
}

bool MemorySink::contains(LogLevel level, std::string_view needle) const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    return std::any_of(state_->entries.begin(),
                       state_->entries.end(),
                       [&](const Logger::LogEntry& e)
                       { return e.level == level && e.message.find(needle) != std::string::npos; });
}

size_t MemorySink::size() const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->entries.size();
}

void MemorySink::clear()
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->entries.clear();
}

}   // namespace sinks

}   // namespace casement
