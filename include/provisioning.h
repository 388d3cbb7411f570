// include/provisioning.h
#pragma once
#include <optional>
#include <string>

class EnvStore;

// Where the otpauth URI comes from: a literal value or an env key.
// Exactly one is set; immutable once built.
class ProvisioningSource {
public:
    static ProvisioningSource from_uri(std::string uri);
    static ProvisioningSource from_env(std::string env_key);

    // Throws ConfigurationError unless exactly one of the two is populated.
    ProvisioningSource(std::optional<std::string> literal_value,
                       std::optional<std::string> external_key);

    const std::optional<std::string>& literal_value() const noexcept { return literal_; }
    const std::optional<std::string>& external_key() const noexcept { return key_; }

    // "env:KEY" or "direct"; safe to log (never the URI itself)
    std::string describe() const;

private:
    std::optional<std::string> literal_;
    std::optional<std::string> key_;
};

// Produces the raw provisioning string on demand. No caching here: every
// call re-reads the store so changes are picked up after an engine refresh.
class ConfigResolver {
public:
    explicit ConfigResolver(const EnvStore& env);

    // Trimmed literal if non-blank, else the (required, trimmed) env value.
    // Throws ConfigurationError when neither yields a non-empty string.
    std::string resolve(const ProvisioningSource& src) const;

private:
    const EnvStore& env_;
};
