#pragma once

#include <string>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5
};

/// @brief Process-wide logger
/// Writes "[timestamp] [LEVEL] message" lines to the console and, optionally,
/// to an append-mode log file. Safe to call from request worker threads.
class Logger {
public:
    Logger();
    ~Logger();

    // Configuration
    void set_log_level(LogLevel level);
    LogLevel get_log_level() const { return min_log_level_; }
    bool is_debug_enabled() const { return min_log_level_ <= LogLevel::DEBUG; }
    void set_log_file(const std::string& filename);
    void set_console_output(bool enable);

    /// @brief Parse a level name ("trace", "debug", "info", "warn", "error", "fatal")
    /// @throws std::invalid_argument on an unknown name
    static LogLevel parse_level(const std::string& name);

    // Logging methods
    void log(LogLevel level, const std::string& message);
    void trace(const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);
    void fatal(const std::string& message);

    // "{}" placeholder formatting, one placeholder per argument
    template<typename... Args>
    void log_fmt(LogLevel level, const std::string& format, Args&&... args);

    // Singleton access
    static Logger& instance();

private:
    LogLevel min_log_level_;
    bool console_output_enabled_;
    bool file_output_enabled_;
    std::unique_ptr<std::ofstream> log_file_;
    std::string log_filename_;
    mutable std::mutex log_mutex_;
    bool is_destructing_ = false;

    std::string get_timestamp() const;
    std::string level_to_string(LogLevel level) const;
    void write_log(LogLevel level, const std::string& message);

    static std::string format_helper(const std::string& format) { return format; }

    template<typename T, typename... Args>
    static std::string format_helper(const std::string& format, T&& value, Args&&... args);
};

template<typename... Args>
void Logger::log_fmt(LogLevel level, const std::string& format, Args&&... args) {
    if (level >= min_log_level_) {
        write_log(level, format_helper(format, std::forward<Args>(args)...));
    }
}

template<typename T, typename... Args>
std::string Logger::format_helper(const std::string& format, T&& value, Args&&... args) {
    size_t pos = format.find("{}");
    if (pos == std::string::npos) {
        return format;
    }
    std::ostringstream oss;
    oss << value;
    std::string partial = format;
    partial.replace(pos, 2, oss.str());
    return format_helper(partial, std::forward<Args>(args)...);
}

// Convenience macros for global logger access
#define LOG_TRACE(msg) Logger::instance().trace(msg)
#define LOG_DEBUG(msg) Logger::instance().debug(msg)
#define LOG_INFO(msg) Logger::instance().info(msg)
#define LOG_WARN(msg) Logger::instance().warn(msg)
#define LOG_ERROR(msg) Logger::instance().error(msg)
#define LOG_FATAL(msg) Logger::instance().fatal(msg)

#define LOG_DEBUG_FMT(fmt, ...) Logger::instance().log_fmt(LogLevel::DEBUG, fmt, __VA_ARGS__)
#define LOG_INFO_FMT(fmt, ...) Logger::instance().log_fmt(LogLevel::INFO, fmt, __VA_ARGS__)
#define LOG_WARN_FMT(fmt, ...) Logger::instance().log_fmt(LogLevel::WARN, fmt, __VA_ARGS__)
#define LOG_ERROR_FMT(fmt, ...) Logger::instance().log_fmt(LogLevel::ERROR, fmt, __VA_ARGS__)
