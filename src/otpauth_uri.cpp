// src/otpauth_uri.cpp
#include "otpauth_uri.h"
#include "base32.h"
#include "otp_errors.h"

#include <algorithm>
#include <cctype>
#include <map>
#include <string>

// ---- helpers ---------------------------------------------------------------

static std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static std::string to_upper(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

static int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
}

// Strict positive decimal: digits only, no sign, no overflow past max.
static bool parse_int_field(const std::string& s, long long max, long long& out) {
    if (s.empty() || s.size() > 18) return false;
    long long v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
    }
    if (v > max) return false;
    out = v;
    return true;
}

static TOTPAlgo parse_algorithm(const std::string& raw) {
    std::string a = to_upper(raw);
    a.erase(std::remove(a.begin(), a.end(), '-'), a.end());
    if (a == "SHA1")   return TOTPAlgo::SHA1;
    if (a == "SHA256") return TOTPAlgo::SHA256;
    if (a == "SHA512") return TOTPAlgo::SHA512;
    throw MalformedConfigurationError("otpauth: unsupported algorithm '" + raw + "'");
}

bool percent_decode(const std::string& in, std::string& out) {
    out.clear();
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] != '%') { out.push_back(in[i]); continue; }
        if (i + 2 >= in.size()) return false;
        const int hi = hex_val(in[i + 1]);
        const int lo = hex_val(in[i + 2]);
        if (hi < 0 || lo < 0) return false;
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
    }
    return true;
}

// ---- parser ----------------------------------------------------------------

TotpSpec parse_otpauth_uri(const std::string& uri) {
    static const std::string kScheme = "otpauth://";

    if (uri.size() < kScheme.size() || to_lower(uri.substr(0, kScheme.size())) != kScheme) {
        throw MalformedConfigurationError("otpauth: URI must start with otpauth://");
    }

    // otpauth://TYPE/LABEL?QUERY
    const std::string rest = uri.substr(kScheme.size());
    const auto slash = rest.find('/');
    const auto qmark = rest.find('?');
    if (slash == std::string::npos || (qmark != std::string::npos && qmark < slash)) {
        throw MalformedConfigurationError("otpauth: missing type/label separator");
    }

    const std::string type = to_lower(rest.substr(0, slash));
    if (type.empty()) {
        throw MalformedConfigurationError("otpauth: missing type");
    }
    if (type != "totp") {
        throw UnsupportedTypeError("otpauth: unsupported OTP type '" + type + "' (only totp)");
    }

    const std::string raw_label = qmark == std::string::npos
        ? rest.substr(slash + 1)
        : rest.substr(slash + 1, qmark - slash - 1);
    const std::string raw_query = qmark == std::string::npos ? std::string() : rest.substr(qmark + 1);

    TotpSpec spec;
    if (!percent_decode(raw_label, spec.label)) {
        throw MalformedConfigurationError("otpauth: bad escape in label");
    }

    // query: k=v&k=v
    std::map<std::string, std::string> params;
    std::size_t pos = 0;
    while (pos <= raw_query.size() && !raw_query.empty()) {
        auto amp = raw_query.find('&', pos);
        if (amp == std::string::npos) amp = raw_query.size();
        const std::string pair = raw_query.substr(pos, amp - pos);
        pos = amp + 1;
        if (pair.empty()) continue;

        const auto eq = pair.find('=');
        const std::string key = to_lower(pair.substr(0, eq));
        std::string value;
        if (!percent_decode(eq == std::string::npos ? std::string() : pair.substr(eq + 1), value)) {
            throw MalformedConfigurationError("otpauth: bad escape in parameter '" + key + "'");
        }
        if (!params.emplace(key, std::move(value)).second) {
            throw MalformedConfigurationError("otpauth: duplicate parameter '" + key + "'");
        }
    }

    auto it = params.find("secret");
    if (it == params.end() || it->second.empty()) {
        throw MalformedConfigurationError("otpauth: missing secret");
    }
    auto raw = base32_decode(it->second);
    if (!raw) throw InvalidSecretError("otpauth: secret is not valid Base32");
    if (raw->empty()) throw InvalidSecretError("otpauth: secret decodes to zero bytes");
    spec.secret = std::move(*raw);

    if ((it = params.find("algorithm")) != params.end()) {
        spec.algorithm = parse_algorithm(it->second);
    }

    long long n = 0;
    if ((it = params.find("digits")) != params.end()) {
        if (!parse_int_field(it->second, 10, n) || n < 1) {
            throw MalformedConfigurationError("otpauth: digits must be an integer in [1,10]");
        }
        spec.digits = static_cast<int>(n);
    }
    if ((it = params.find("period")) != params.end()) {
        if (!parse_int_field(it->second, 0x7FFFFFFFLL, n) || n < 1) {
            throw MalformedConfigurationError("otpauth: period must be a positive integer");
        }
        spec.period = std::chrono::seconds(n);
    }

    if ((it = params.find("issuer")) != params.end()) {
        spec.issuer = it->second;
    } else {
        // "Issuer:account" label form
        const auto colon = spec.label.find(':');
        if (colon != std::string::npos) spec.issuer = spec.label.substr(0, colon);
    }

    return spec;
}
