// include/otp_errors.h
#pragma once
#include <stdexcept>
#include <string>

// Base of every error the OTP core throws. Messages name the offending
// field or key, never a secret value.
class OtpError : public std::runtime_error {
public:
    explicit OtpError(const std::string& what) : std::runtime_error(what) {}
};

// No usable provisioning source (missing literal, missing/empty env key),
// or a config file / env value that cannot be read.
class ConfigurationError : public OtpError {
public:
    using OtpError::OtpError;
};

// Provisioning URI present but structurally unusable.
class MalformedConfigurationError : public OtpError {
public:
    using OtpError::OtpError;
};

// Secret parameter is not valid base32.
class InvalidSecretError : public OtpError {
public:
    using OtpError::OtpError;
};

// URI names an OTP type other than totp (e.g. hotp).
class UnsupportedTypeError : public OtpError {
public:
    using OtpError::OtpError;
};
