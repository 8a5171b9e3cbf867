#include <webswarm/core/logger.hpp>
#include <webswarm/core/utils.hpp>

namespace webswarm {

namespace {

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

} // namespace

LogLevel parse_log_level(const std::string& name) {
    std::string n = to_lower(trim(name));
    if (n == "debug") return LogLevel::DEBUG;
    if (n == "warn" || n == "warning") return LogLevel::WARN;
    if (n == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger() : level_(static_cast<int>(LogLevel::INFO)) {}

void Logger::set_level(LogLevel level) {
    level_ = static_cast<int>(level);
}

LogLevel Logger::level() const {
    return static_cast<LogLevel>(level_.load());
}

bool Logger::enabled(LogLevel level) const {
    return static_cast<int>(level) >= level_.load();
}

void Logger::log(LogLevel level, const char* fmt, ...) {
    if (!enabled(level)) return;

    // Format first so the write lock only covers the stderr write
    char message[4096];
    va_list args;
    va_start(args, fmt);
    vsnprintf(message, sizeof(message), fmt, args);
    va_end(args);

    int64_t now_ms = current_timestamp_ms();
    time_t now = static_cast<time_t>(now_ms / 1000);
    struct tm t;
    localtime_r(&now, &t);
    char stamp[32];
    strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &t);

    std::lock_guard<std::mutex> lock(write_mutex_);
    fprintf(stderr, "[%s.%03d] [%s] %s\n", stamp, static_cast<int>(now_ms % 1000),
            level_name(level), message);
    fflush(stderr);
}

} // namespace webswarm
