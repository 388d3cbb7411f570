// include/base32.h
#pragma once
#include <optional>
#include <string>

// RFC 4648 base32 decode.
// Whitespace is ignored and lowercase is accepted. '=' padding is optional but,
// when present, must be a trailing run that completes an 8-char group.
// Returns raw bytes, or nullopt on a bad character, bad padding or a
// truncated final group.
std::optional<std::string> base32_decode(const std::string& b32);

// Encode raw bytes without padding (used by otp_tool and tests).
std::string base32_encode(const std::string& raw);
