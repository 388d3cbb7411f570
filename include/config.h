#pragma once
#include "logger.h"
#include <string>
#include <utility>
#include <vector>

class EnvStore;
class ProvisioningSource;

// Settings for otp_tool, loaded from a JSON file:
//   { "log_level": "info", "otp_env_key": "HEROKU_OTP_URI", "otp_uri": "",
//     "window": 1, "env_files": [".env"] }
class AppConfig {
public:
    // Load settings from json file. Throws ConfigurationError.
    static AppConfig load_from_file(const std::string& path);

    // Built-in defaults (no source set yet)
    static AppConfig defaults();

    // Accessors (read-only)
    LogLevel log_level() const {return log_level_; }
    const std::string& otp_env_key() const {return otp_env_key_; }
    const std::string& otp_uri() const {return otp_uri_; }
    int window() const {return window_; }
    const std::vector<std::string>& env_files() const {return env_files_; }

    // Command-line overrides
    void set_log_level(LogLevel lvl) { log_level_ = lvl; }
    void set_otp_env_key(std::string key);   // clears otp_uri
    void set_otp_uri(std::string uri);       // clears otp_env_key
    void set_window(int w);                  // throws ConfigurationError if < 0
    void add_env_file(std::string path) { env_files_.push_back(std::move(path)); }

    // Throws ConfigurationError unless exactly one source is set.
    ProvisioningSource source() const;

    // Load every env file into env (".json" -> JSON, otherwise dotenv).
    void load_env_files(EnvStore& env) const;

private:
    // private ctor enforce factory method
    AppConfig() = default;

    LogLevel log_level_ = LogLevel::INFO;
    std::string otp_env_key_;
    std::string otp_uri_;
    int window_ = 1;
    std::vector<std::string> env_files_;
};
