/*
 * ToolGate C++ - Logger
 *
 * printf-style leveled logging to stderr, optionally mirrored to a file.
 * Safe to call from concurrent dispatcher threads.
 */
#ifndef toolgate_CORE_LOGGER_HPP
#define toolgate_CORE_LOGGER_HPP

#include <string>
#include <utility>
#include <mutex>
#include <cstdio>
#include <ctime>
#include <cstdarg>

namespace toolgate {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Parse "debug", "info", "warn"/"warning", "error" (case-insensitive).
// Unknown strings yield `fallback`.
LogLevel log_level_from_string(const std::string& name, LogLevel fallback = LogLevel::INFO);

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    // Mirror every emitted line (without color codes) to `path`.
    // An empty path closes the current file. Returns false if the file
    // cannot be opened.
    bool set_file(const std::string& path);

    void debug(const char* file, int line, const char* func, const char* fmt, ...);
    void info(const char* file, int line, const char* func, const char* fmt, ...);
    void warn(const char* file, int line, const char* func, const char* fmt, ...);
    void error(const char* file, int line, const char* func, const char* fmt, ...);

private:
    Logger();
    ~Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);

    void log_impl(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args);

    LogLevel level_;
    FILE* file_;
    std::mutex mutex_;
};

// Convenience macros
#define LOG_DEBUG(...) toolgate::Logger::instance().debug(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_INFO(...)  toolgate::Logger::instance().info(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_WARN(...)  toolgate::Logger::instance().warn(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_ERROR(...) toolgate::Logger::instance().error(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)

} // namespace toolgate

#endif // toolgate_CORE_LOGGER_HPP
