// include/token_normalizer.h
#pragma once
#include <string>

// Clean up a user-supplied OTP candidate (UTF-8):
//  - full-width digits U+FF10..U+FF19 become ASCII '0'..'9'
//  - all whitespace is dropped (ASCII, U+00A0, U+3000), which also trims
//  - ASCII letters are upper-cased (base32-shaped candidates)
// Never fails; anything else passes through unchanged.
std::string normalize_token(const std::string& input);

// True if s is non-empty and consists only of ASCII digits.
bool is_numeric_token(const std::string& s) noexcept;
