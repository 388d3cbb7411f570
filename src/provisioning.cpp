// src/provisioning.cpp
#include "provisioning.h"
#include "env_store.h"
#include "otp_errors.h"

#include <cctype>
#include <utility>

namespace {

std::string trim_copy(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

} // namespace

// ---- ProvisioningSource ----

ProvisioningSource::ProvisioningSource(std::optional<std::string> literal_value,
                                       std::optional<std::string> external_key)
    : literal_(std::move(literal_value)), key_(std::move(external_key))
{
    if (literal_.has_value() == key_.has_value()) {
        throw ConfigurationError("OTP: provide exactly one of a URI or an env key");
    }
}

ProvisioningSource ProvisioningSource::from_uri(std::string uri) {
    return ProvisioningSource(std::move(uri), std::nullopt);
}

ProvisioningSource ProvisioningSource::from_env(std::string env_key) {
    return ProvisioningSource(std::nullopt, std::move(env_key));
}

std::string ProvisioningSource::describe() const {
    if (key_) return "env:" + *key_;
    return "direct";
}

// ---- ConfigResolver ----

ConfigResolver::ConfigResolver(const EnvStore& env) : env_(env) {}

std::string ConfigResolver::resolve(const ProvisioningSource& src) const {
    if (const auto& lit = src.literal_value()) {
        std::string v = trim_copy(*lit);
        if (!v.empty()) return v;
    }
    if (const auto& key = src.external_key()) {
        if (key->empty()) {
            throw ConfigurationError("OTP: empty env key");
        }
        return env_.get_string(*key);
    }
    throw ConfigurationError("OTP: No URI or env key provided");
}
