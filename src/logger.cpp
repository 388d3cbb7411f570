#include "logger.h"
#include "otp_errors.h"
#include <cctype>
#include <chrono>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <ctime>

LogLevel parse_log_level(const std::string& name) {
    std::string n;
    n.reserve(name.size());
    for (char c : name) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        n.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (n == "trace") return LogLevel::TRACE;
    if (n == "debug") return LogLevel::DEBUG;
    if (n == "info")  return LogLevel::INFO;
    if (n == "warn" || n == "warning") return LogLevel::WARN;
    if (n == "error") return LogLevel::ERROR;
    throw ConfigurationError("Unknown log level: '" + name + "'");
}

const char* to_string(LogLevel lvl) noexcept {
    switch (lvl) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

Logger::Logger(std::string name, std::ostream& out)
  : name_(std::move(name)),
    level_(LogLevel::INFO),
    out_(&out),
    mutex_(std::make_unique<std::mutex>())
{}

Logger::Logger(Logger&& other) noexcept
  : name_(std::move(other.name_)),
    level_(other.level_.load()),
    out_(other.out_),
    mutex_(std::move(other.mutex_))
{}

Logger& Logger::operator=(Logger&& other) noexcept {
    if (this == &other) return *this;
    // either side may already be moved-from (null mutex_)
    std::unique_lock<std::mutex> l1, l2;
    if (mutex_) l1 = std::unique_lock<std::mutex>(*mutex_);
    if (other.mutex_) l2 = std::unique_lock<std::mutex>(*other.mutex_);
    name_ = std::move(other.name_);
    level_.store(other.level_.load());
    out_ = other.out_;
    mutex_.swap(other.mutex_);
    return *this;
}

void Logger::set_level(LogLevel level) noexcept {
    level_.store(level);
}

LogLevel Logger::level() const noexcept {
    return level_.load();
}

bool Logger::enabled(LogLevel lvl) const noexcept {
    return static_cast<int>(lvl) >= static_cast<int>(level_.load());
}

void Logger::emit(LogLevel lvl, const std::string& payload) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream line;
    line << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
         << '.' << std::setw(3) << std::setfill('0') << ms.count()
         << " [" << to_string(lvl) << "] " << name_ << ": " << payload << '\n';

    if (!mutex_) return;  // moved-from
    std::lock_guard<std::mutex> lk(*mutex_);
    (*out_) << line.str();
    out_->flush();
}

void Logger::log(LogLevel lvl, const std::string& msg) {
    if (!enabled(lvl)) return;
    emit(lvl, msg);
}

void Logger::trace(const std::string& msg) { log(LogLevel::TRACE, msg); }
void Logger::debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }
void Logger::info(const std::string& msg)  { log(LogLevel::INFO,  msg); }
void Logger::warn(const std::string& msg)  { log(LogLevel::WARN,  msg); }
void Logger::error(const std::string& msg) { log(LogLevel::ERROR, msg); }
