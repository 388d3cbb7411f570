// src/otp_engine.cpp
#include "otp_engine.h"
#include "otpauth_uri.h"
#include "otp_errors.h"
#include "logger.h"

#include <mutex>
#include <utility>

OtpEngine::OtpEngine(ProvisioningSource src, const EnvStore& env, Logger& log)
    : src_(std::move(src)), resolver_(env), log_(log) {}

std::shared_ptr<const TOTP> OtpEngine::totp() {
    {
        std::shared_lock<std::shared_mutex> lk(mu_);
        if (cached_) return cached_;
    }
    std::unique_lock<std::shared_mutex> lk(mu_);
    if (cached_) return cached_; // another caller won the race
    cached_ = load_locked();
    return cached_;
}

std::shared_ptr<const TOTP> OtpEngine::load_locked() {
    log_.debug_fmt("OTP: resolving provisioning URI (", src_.describe(), ")");
    loads_.fetch_add(1);

    std::string uri = resolver_.resolve(src_);
    TotpSpec spec;
    try {
        spec = parse_otpauth_uri(uri);
    } catch (const OtpError& e) {
        log_.warn_fmt("OTP: unusable provisioning URI (", src_.describe(), "): ", e.what());
        throw;
    }

    auto t = std::make_shared<const TOTP>(std::move(spec));
    const TotpSpec& s = t->spec();
    log_.info_fmt("OTP: loaded ", src_.describe(),
                  " issuer='", s.issuer, "' label='", s.label,
                  "' algorithm=", to_string(s.algorithm),
                  " digits=", s.digits, " period=", s.period.count(), "s");
    return t;
}

std::string OtpEngine::get_code(std::optional<TimePoint> at) {
    auto t = totp();
    return at ? t->code_at(*at) : t->now();
}

VerificationResult OtpEngine::verify(const std::string& candidate,
                                     int window,
                                     std::optional<TimePoint> at) {
    auto t = totp();
    auto res = t->verify(candidate, at.value_or(std::chrono::system_clock::now()), window);
    if (res.ok) {
        log_.debug_fmt("OTP: verify ok (", src_.describe(), ") delta=", *res.delta);
    } else {
        log_.debug_fmt("OTP: verify failed (", src_.describe(), "): ", *res.reason);
    }
    return res;
}

bool OtpEngine::verify_bool(const std::string& candidate,
                            int window,
                            std::optional<TimePoint> at) {
    return verify(candidate, window, at).ok;
}

void OtpEngine::refresh() {
    std::unique_lock<std::shared_mutex> lk(mu_);
    cached_.reset();
    log_.debug_fmt("OTP: cache cleared (", src_.describe(), ")");
}

bool OtpEngine::cached() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    return static_cast<bool>(cached_);
}
