#include "hostwatch/util/logger.hpp"

#include <ctime>

namespace hostwatch::util {

/*
    Meyer's Singleton pattern
    static local variable:
        - created on first call
        - lives until program ends
        - thread safe initialization (c++11 guarantee)
*/
Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level) {
    level_.store(level);
}

LogLevel Logger::level() const {
    return level_.load();
}

void Logger::debug(std::string_view message) {
    log(LogLevel::Debug, message);
}

void Logger::info(std::string_view message) {
    log(LogLevel::Info, message);
}

void Logger::warn(std::string_view message) {
    log(LogLevel::Warn, message);
}

void Logger::error(std::string_view message) {
    log(LogLevel::Error, message);
}

void Logger::log(LogLevel level, std::string_view message) {
    if (level < level_.load() || level == LogLevel::None) {
        return;
    }

    // build the whole line first so the lock only covers the write
    std::string line =
        timestamp() + " [" + std::string(level_string(level)) + "] " + std::string(message) + "\n";
    std::lock_guard lock(mutex_);
    std::ostream& out = (level >= LogLevel::Warn) ? std::cerr : std::cout;
    out << line;
    out.flush();
}

std::string Logger::timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    // localtime() returns a pointer to shared static storage; agent and server log from several
    // threads at once
    std::tm tm_buf{};
    localtime_r(&time, &tm_buf);

    std::ostringstream oss;
    // format: "2024-01-15 10:30:45.123"
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::string_view Logger::level_string(LogLevel level) const {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO ";
        case LogLevel::Warn:
            return "WARN ";
        case LogLevel::Error:
            return "ERROR";
        default:
            return "?????";
    }
}

LogLevel parse_log_level(std::string_view s) {
    if (s == "debug") return LogLevel::Debug;
    if (s == "info") return LogLevel::Info;
    if (s == "warn") return LogLevel::Warn;
    if (s == "error") return LogLevel::Error;
    if (s == "none") return LogLevel::None;
    return LogLevel::Info;
}

}  // namespace hostwatch::util
