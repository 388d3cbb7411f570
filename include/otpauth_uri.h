// include/otpauth_uri.h
#pragma once
#include "totp.h"
#include <string>

// Parse an otpauth:// provisioning URI into a TotpSpec, e.g.
//   otpauth://totp/Heroku:alice?secret=JBSWY3DPEHPK3PXP&issuer=Heroku&digits=6&period=30
//
// Throws:
//   UnsupportedTypeError         type is not "totp" (e.g. "hotp")
//   InvalidSecretError           secret is not valid Base32 or decodes to nothing
//   MalformedConfigurationError  anything else (scheme, missing secret, bad digits/period/algorithm)
//
// Pure: the same input always yields the same spec or the same error.
TotpSpec parse_otpauth_uri(const std::string& uri);

// Decode %XX escapes ('+' is kept literally). Returns false on a bad escape.
bool percent_decode(const std::string& in, std::string& out);
