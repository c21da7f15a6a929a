/*
 * bashgate C++17 - Logger
 *
 * Leveled printf-style logging to stderr. stdout is reserved for the
 * JSON-RPC channel, so nothing in the process may log there.
 */
#ifndef bashgate_CORE_LOGGER_HPP
#define bashgate_CORE_LOGGER_HPP

#include <string>
#include <utility>
#include <mutex>
#include <cstdio>
#include <ctime>
#include <cstdarg>

namespace bashgate {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Parse "debug" / "info" / "warn" / "error". Unknown names map to INFO.
LogLevel log_level_from_string(const std::string& name);

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    void debug(const char* file, int line, const char* func, const char* fmt, ...)
        __attribute__((format(printf, 5, 6)));
    void info(const char* file, int line, const char* func, const char* fmt, ...)
        __attribute__((format(printf, 5, 6)));
    void warn(const char* file, int line, const char* func, const char* fmt, ...)
        __attribute__((format(printf, 5, 6)));
    void error(const char* file, int line, const char* func, const char* fmt, ...)
        __attribute__((format(printf, 5, 6)));

private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);

    void log_impl(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args);

    LogLevel level_;
    bool color_;
    std::mutex write_mutex_;
};

// Convenience macros
#define LOG_DEBUG(...) bashgate::Logger::instance().debug(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_INFO(...)  bashgate::Logger::instance().info(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_WARN(...)  bashgate::Logger::instance().warn(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_ERROR(...) bashgate::Logger::instance().error(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)

} // namespace bashgate

#endif // bashgate_CORE_LOGGER_HPP
