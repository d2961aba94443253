#ifndef DOCGATE_CORE_LOGGER_HPP
#define DOCGATE_CORE_LOGGER_HPP

#include <string>
#include <cstdio>
#include <cstdarg>
#include <mutex>

namespace docgate {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Parses "debug", "info", "warn"/"warning", "error" (any case).
// Returns false and leaves `out` untouched for anything else.
bool parse_log_level(const std::string& name, LogLevel& out);

// Process-wide logger. Always writes to stderr: stdout carries the
// JSON-RPC stream and must never see a log line.
class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    // Redirect output (tests); NULL restores stderr
    void set_sink(FILE* sink);

    void debug(const char* fmt, ...);
    void info(const char* fmt, ...);
    void warn(const char* fmt, ...);
    void error(const char* fmt, ...);

private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);

    void log_impl(LogLevel level, const char* level_str, const char* fmt, va_list args);

    LogLevel level_;
    FILE* sink_;
    std::mutex mutex_;
};

#define LOG_DEBUG(...) docgate::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...)  docgate::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...)  docgate::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...) docgate::Logger::instance().error(__VA_ARGS__)

} // namespace docgate

#endif // DOCGATE_CORE_LOGGER_HPP
