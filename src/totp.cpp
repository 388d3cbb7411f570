#include "totp.h"
#include "base32.h"
#include "otp_errors.h"
#include "token_normalizer.h"

#include <openssl/crypto.h>
#include <openssl/hmac.h>
#include <openssl/evp.h>

#include <array>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace {

constexpr const char* kReasonShape   = "empty or non-numeric-shaped";
constexpr const char* kReasonNoMatch = "no match within window";

const EVP_MD* md_for_algo(TOTPAlgo algo) {
    switch (algo) {
        case TOTPAlgo::SHA1:   return EVP_sha1();
        case TOTPAlgo::SHA256: return EVP_sha256();
        case TOTPAlgo::SHA512: return EVP_sha512();
    }
    return EVP_sha1();
}

std::string left_pad_int(uint32_t val, int digits) {
    uint64_t mod = 1;
    for (int i = 0; i < digits; ++i) mod *= 10;
    const uint64_t code = val % mod;

    std::ostringstream oss;
    oss << std::setw(digits) << std::setfill('0') << code;
    return oss.str();
}

// Constant-time for equal lengths; length itself is not secret.
bool codes_equal(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

TotpSpec spec_from_base32(const std::string& secret_base32, int digits,
                          std::chrono::seconds period, TOTPAlgo algo) {
    auto raw = base32_decode(secret_base32);
    if (!raw) throw InvalidSecretError("TOTP: secret is not valid Base32");
    TotpSpec s;
    s.secret = std::move(*raw);
    s.algorithm = algo;
    s.digits = digits;
    s.period = period;
    return s;
}

} // namespace

const char* to_string(TOTPAlgo algo) noexcept {
    switch (algo) {
        case TOTPAlgo::SHA1:   return "SHA1";
        case TOTPAlgo::SHA256: return "SHA256";
        case TOTPAlgo::SHA512: return "SHA512";
    }
    return "SHA1";
}

// ----------- TOTP public API -----------

TOTP::TOTP(TotpSpec spec)
    : spec_(std::move(spec))
{
    if (spec_.digits < 1 || spec_.digits > 10) {
        throw std::invalid_argument("TOTP: digits must be between 1 and 10");
    }
    if (spec_.period.count() <= 0) {
        throw std::invalid_argument("TOTP: period must be positive");
    }
    if (spec_.secret.empty()) {
        throw std::invalid_argument("TOTP: secret must not be empty");
    }
}

TOTP::TOTP(const std::string& secret_base32,
           int digits,
           std::chrono::seconds period,
           TOTPAlgo algo)
    : TOTP(spec_from_base32(secret_base32, digits, period, algo))
{}

uint64_t TOTP::time_counter(std::chrono::system_clock::time_point tp,
                            std::chrono::seconds period) {
    using namespace std::chrono;
    auto secs = duration_cast<seconds>(tp.time_since_epoch()).count();
    return static_cast<uint64_t>(secs >= 0 ? secs : 0) / static_cast<uint64_t>(period.count());
}

std::string TOTP::hotp(const std::string& key,
                       uint64_t counter,
                       int digits,
                       TOTPAlgo algo)
{
    // counter in big-endian 8 bytes
    std::array<unsigned char, 8> msg{};
    for (int i = 7; i >= 0; --i) {
        msg[i] = static_cast<unsigned char>(counter & 0xFF);
        counter >>= 8;
    }

    const EVP_MD* md = md_for_algo(algo);
    unsigned int len = 0;
    std::array<unsigned char, EVP_MAX_MD_SIZE> mac{};

    if (!HMAC(md,
              key.data(), static_cast<int>(key.size()),
              msg.data(), msg.size(),
              mac.data(), &len) || len < 20) {
        throw std::runtime_error("TOTP: HMAC failed");
    }

    // dynamic truncation (RFC 4226)
    const unsigned int offset = mac[len - 1] & 0x0F;
    const uint32_t bin_code =
        (static_cast<uint32_t>(mac[offset]   & 0x7F) << 24) |
        (static_cast<uint32_t>(mac[offset+1] & 0xFF) << 16) |
        (static_cast<uint32_t>(mac[offset+2] & 0xFF) <<  8) |
        (static_cast<uint32_t>(mac[offset+3] & 0xFF) <<  0);

    return left_pad_int(bin_code, digits);
}

uint64_t TOTP::counter_at(std::chrono::system_clock::time_point tp) const {
    return time_counter(tp, spec_.period);
}

std::string TOTP::hotp(uint64_t counter) const {
    return hotp(spec_.secret, counter, spec_.digits, spec_.algorithm);
}

std::string TOTP::code_at(std::chrono::system_clock::time_point tp) const {
    return hotp(counter_at(tp));
}

std::string TOTP::now() const {
    return code_at(std::chrono::system_clock::now());
}

VerificationResult TOTP::verify(const std::string& candidate,
                                std::chrono::system_clock::time_point tp,
                                int window_steps) const
{
    if (window_steps < 0) {
        throw std::invalid_argument("TOTP: window must be non-negative");
    }

    VerificationResult res;
    const std::string token = normalize_token(candidate);
    if (!is_numeric_token(token)) {
        res.reason = kReasonShape;
        return res;
    }

    const uint64_t ctr = counter_at(tp);
    // 0, -1, +1, -2, +2 ...: nearest step first, ties toward the earlier one
    for (long long w = 0; w <= window_steps; ++w) {
        if (w == 0) {
            if (codes_equal(hotp(ctr), token)) {
                res.ok = true;
                res.delta = 0;
                return res;
            }
            continue;
        }
        const uint64_t uw = static_cast<uint64_t>(w);
        if (ctr >= uw && codes_equal(hotp(ctr - uw), token)) {
            res.ok = true;
            res.delta = -w;
            return res;
        }
        if (codes_equal(hotp(ctr + uw), token)) {
            res.ok = true;
            res.delta = w;
            return res;
        }
    }
    res.reason = kReasonNoMatch;
    return res;
}

bool TOTP::verify_bool(const std::string& candidate,
                       std::chrono::system_clock::time_point tp,
                       int window_steps) const
{
    return verify(candidate, tp, window_steps).ok;
}
