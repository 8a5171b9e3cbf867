#ifndef WEBSWARM_CORE_LOGGER_HPP
#define WEBSWARM_CORE_LOGGER_HPP

#include <string>
#include <cstdio>
#include <ctime>
#include <cstdarg>
#include <mutex>
#include <atomic>

namespace webswarm {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Parse "debug" / "info" / "warn" / "error" (case-insensitive), INFO otherwise
LogLevel parse_log_level(const std::string& name);

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;
    bool enabled(LogLevel level) const;

    // printf-style; lines longer than 4 KiB are cut
    void log(LogLevel level, const char* fmt, ...);

private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);

    std::atomic<int> level_;
    std::mutex write_mutex_;  // keeps lines from concurrent workers whole
};

#define LOG_DEBUG(...) webswarm::Logger::instance().log(webswarm::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INFO(...)  webswarm::Logger::instance().log(webswarm::LogLevel::INFO, __VA_ARGS__)
#define LOG_WARN(...)  webswarm::Logger::instance().log(webswarm::LogLevel::WARN, __VA_ARGS__)
#define LOG_ERROR(...) webswarm::Logger::instance().log(webswarm::LogLevel::ERROR, __VA_ARGS__)

} // namespace webswarm

#endif // WEBSWARM_CORE_LOGGER_HPP
