// include/totp.h
#pragma once
#include <string>
#include <cstdint>
#include <chrono>
#include <optional>

enum class TOTPAlgo { SHA1, SHA256, SHA512 };

const char* to_string(TOTPAlgo algo) noexcept;

// Parsed, immutable provisioning parameters.
struct TotpSpec {
    std::string secret;                 // raw bytes after Base32 decode
    TOTPAlgo algorithm = TOTPAlgo::SHA1;
    int digits = 6;                     // [1,10]
    std::chrono::seconds period{30};    // > 0
    std::string label;                  // metadata only
    std::string issuer;                 // metadata only
};

struct VerificationResult {
    bool ok = false;
    std::optional<long long> delta;     // matching step - current step, set when ok
    std::optional<std::string> reason;  // set when !ok
};

class TOTP {
public:
    // Throws std::invalid_argument if the spec breaks its invariants.
    explicit TOTP(TotpSpec spec);

    // Convenience: secret as Base32 text. Throws InvalidSecretError on bad Base32.
    TOTP(const std::string& secret_base32,
         int digits,
         std::chrono::seconds period = std::chrono::seconds(30),
         TOTPAlgo algo = TOTPAlgo::SHA1);

    // tp must be representable: with a nanosecond system_clock that is roughly
    // 1678..2262. Use hotp(counter) for instants outside that range.
    std::string code_at(std::chrono::system_clock::time_point tp) const;

    std::string now() const;

    // Checks steps 0, -1, +1, -2, +2 ... up to +/-window_steps around tp.
    // Never throws for a bad candidate; throws std::invalid_argument if window_steps < 0.
    VerificationResult verify(const std::string& candidate,
                              std::chrono::system_clock::time_point tp,
                              int window_steps = 1) const;

    bool verify_bool(const std::string& candidate,
                     std::chrono::system_clock::time_point tp,
                     int window_steps = 1) const;

    uint64_t counter_at(std::chrono::system_clock::time_point tp) const;
    std::string hotp(uint64_t counter) const;

    const TotpSpec& spec() const noexcept { return spec_; }

private:
    TotpSpec spec_;

    static uint64_t time_counter(std::chrono::system_clock::time_point tp, std::chrono::seconds period);
    static std::string hotp(const std::string& key, uint64_t counter,
                            int digits, TOTPAlgo algo); // HMAC + dynamic truncate
};
