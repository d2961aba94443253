#include <docgate/core/logger.hpp>
#include <docgate/core/utils.hpp>
#include <ctime>

namespace docgate {

bool parse_log_level(const std::string& name, LogLevel& out) {
    std::string n = to_lower(trim(name));
    if (n == "debug") {
        out = LogLevel::DEBUG;
    } else if (n == "info") {
        out = LogLevel::INFO;
    } else if (n == "warn" || n == "warning") {
        out = LogLevel::WARN;
    } else if (n == "error") {
        out = LogLevel::ERROR;
    } else {
        return false;
    }
    return true;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger() : level_(LogLevel::INFO), sink_(NULL) {}

void Logger::set_level(LogLevel level) { level_ = level; }

LogLevel Logger::level() const { return level_; }

void Logger::set_sink(FILE* sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = sink;
}

void Logger::debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::DEBUG, "DEBUG", fmt, args);
    va_end(args);
}

void Logger::info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::INFO, "INFO", fmt, args);
    va_end(args);
}

void Logger::warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::WARN, "WARN", fmt, args);
    va_end(args);
}

void Logger::error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::ERROR, "ERROR", fmt, args);
    va_end(args);
}

void Logger::log_impl(LogLevel level, const char* level_str, const char* fmt, va_list args) {
    if (level < level_) return;

    time_t now = time(NULL);
    struct tm tm_buf;
    localtime_r(&now, &tm_buf);
    char timestamp[32];
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &tm_buf);

    // Worker threads log concurrently; keep each line whole
    std::lock_guard<std::mutex> lock(mutex_);
    FILE* out = sink_ ? sink_ : stderr;
    fprintf(out, "[%s] [%s] ", timestamp, level_str);
    vfprintf(out, fmt, args);
    fprintf(out, "\n");
    fflush(out);
}

} // namespace docgate
