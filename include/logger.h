#pragma once
#include <sstream>
#include <string>
#include <mutex>
#include <atomic>
#include <ostream>
#include <memory>
#include <iostream>

enum class LogLevel {TRACE, DEBUG, INFO, WARN, ERROR };

// "trace", "debug", "info", "warn"/"warning", "error" (case-insensitive).
// Throws ConfigurationError on anything else.
LogLevel parse_log_level(const std::string& name);
const char* to_string(LogLevel lvl) noexcept;

class Logger {
public:
    // create with component name and optional output stream (defaults to stderr
    // so tool output on stdout stays clean)
    explicit Logger(std::string name, std::ostream& out = std::cerr);

    // non-copyable, movable
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) noexcept;
    Logger& operator=(Logger&&) noexcept;

    void set_level(LogLevel level) noexcept;
    LogLevel level() const noexcept;
    bool enabled(LogLevel lvl) const noexcept;

    const std::string& name() const noexcept { return name_; }

    // Basic logging API (thread-safe)
    void log(LogLevel lvl, const std::string& msg);
    void trace(const std::string& msg);
    void debug(const std::string& msg);
    void info(const std::string& msg);
    void warn(const std::string& msg);
    void error(const std::string& msg);

    // convenience: streams all args into one message, skipped when disabled
    template<typename... Args>
    void debug_fmt(Args&&... args);
    template<typename... Args>
    void info_fmt(Args&&... args);
    template<typename... Args>
    void warn_fmt(Args&&... args);

private:
    std::string name_;
    std::atomic<LogLevel> level_;
    std::ostream* out_;
    std::unique_ptr<std::mutex> mutex_;
    void emit(LogLevel lvl, const std::string& payload);

    template<typename... Args>
    void log_fmt(LogLevel lvl, Args&&... args);
};

template<typename... Args>
inline void Logger::log_fmt(LogLevel lvl, Args&&... args) {
    if (!enabled(lvl)) return;
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    emit(lvl, oss.str());
}

template<typename... Args>
inline void Logger::debug_fmt(Args&&... args) { log_fmt(LogLevel::DEBUG, std::forward<Args>(args)...); }

template<typename... Args>
inline void Logger::info_fmt(Args&&... args) { log_fmt(LogLevel::INFO, std::forward<Args>(args)...); }

template<typename... Args>
inline void Logger::warn_fmt(Args&&... args) { log_fmt(LogLevel::WARN, std::forward<Args>(args)...); }
