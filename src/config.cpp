#include "config.h"
#include "env_store.h"
#include "otp_errors.h"
#include "provisioning.h"
#include <nlohmann/json.hpp>
#include <fstream>

using json = nlohmann::json;

AppConfig AppConfig::defaults() {
    return AppConfig();
}

AppConfig AppConfig::load_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError("Config file not found: " + path);
    }

    AppConfig cfg;
    try {
        json j;
        in >> j;
        if (!j.is_object()) {
            throw ConfigurationError("Config file " + path + " must contain a JSON object");
        }

        cfg.log_level_   = parse_log_level(j.value("log_level", std::string("info")));
        cfg.otp_env_key_ = j.value("otp_env_key", std::string());
        cfg.otp_uri_     = j.value("otp_uri", std::string());
        cfg.set_window(j.value("window", 1));
        cfg.env_files_   = j.value("env_files", std::vector<std::string>{});
    } catch (const json::exception& e) {
        throw ConfigurationError("Config file " + path + ": " + e.what());
    }

    if (!cfg.otp_env_key_.empty() && !cfg.otp_uri_.empty()) {
        throw ConfigurationError("Config file " + path + ": set only one of otp_env_key / otp_uri");
    }
    return cfg;
}

void AppConfig::set_otp_env_key(std::string key) {
    otp_env_key_ = std::move(key);
    otp_uri_.clear();
}

void AppConfig::set_otp_uri(std::string uri) {
    otp_uri_ = std::move(uri);
    otp_env_key_.clear();
}

void AppConfig::set_window(int w) {
    if (w < 0) throw ConfigurationError("window must be non-negative");
    window_ = w;
}

ProvisioningSource AppConfig::source() const {
    if (!otp_uri_.empty() && otp_env_key_.empty()) return ProvisioningSource::from_uri(otp_uri_);
    if (!otp_env_key_.empty() && otp_uri_.empty()) return ProvisioningSource::from_env(otp_env_key_);
    throw ConfigurationError("No OTP source configured (need otp_uri or otp_env_key)");
}

void AppConfig::load_env_files(EnvStore& env) const {
    for (const auto& f : env_files_) {
        const bool is_json = f.size() >= 5 && f.compare(f.size() - 5, 5, ".json") == 0;
        if (is_json) env.load_json_file(f);
        else env.load_dotenv_file(f);
    }
}
