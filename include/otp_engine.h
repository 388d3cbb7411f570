// include/otp_engine.h
#pragma once
#include "provisioning.h"
#include "totp.h"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>

class EnvStore;
class Logger;

// Owns one provisioning source and a lazily parsed, cached TOTP for it.
// Safe to share between threads; callers hold and pass the instance.
class OtpEngine {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    // Borrow existing instances; no ownership.
    OtpEngine(ProvisioningSource src, const EnvStore& env, Logger& log);

    OtpEngine(const OtpEngine&) = delete;
    OtpEngine& operator=(const OtpEngine&) = delete;

    // Code for `at` (default: now). `at` is a TimePoint, so it is bounded by
    // TimePoint::min()/max() (about +/-292 years around 1970 on nanosecond clocks).
    // Throws ConfigurationError / MalformedConfigurationError /
    // InvalidSecretError / UnsupportedTypeError if the source is unusable.
    std::string get_code(std::optional<TimePoint> at = std::nullopt);

    // Validation never throws for a bad candidate; only configuration errors propagate.
    VerificationResult verify(const std::string& candidate,
                              int window = 1,
                              std::optional<TimePoint> at = std::nullopt);
    bool verify_bool(const std::string& candidate,
                     int window = 1,
                     std::optional<TimePoint> at = std::nullopt);

    // Drop the cached spec; next call re-resolves and re-parses.
    void refresh();

    // Loaded TOTP (resolving on first use).
    std::shared_ptr<const TOTP> totp();

    bool cached() const;
    std::size_t load_count() const noexcept { return loads_.load(); }
    const ProvisioningSource& source() const noexcept { return src_; }

private:
    const ProvisioningSource src_;
    ConfigResolver resolver_;
    Logger& log_;

    mutable std::shared_mutex mu_;
    std::shared_ptr<const TOTP> cached_;  // guarded by mu_
    std::atomic<std::size_t> loads_{0};

    std::shared_ptr<const TOTP> load_locked();
};
