#include "otpauth_uri.h"
#include "otp_errors.h"
#include <cassert>
#include <iostream>
#include <string>

template<typename E, typename F>
static bool throws(F&& f) {
    try { f(); } catch (const E&) { return true; }
    return false;
}

int main() {
    // full URI
    {
        auto s = parse_otpauth_uri(
            "otpauth://totp/Heroku:Dao%20Quyen?secret=JBSWY3DPEHPK3PXP&issuer=Heroku"
            "&algorithm=SHA256&digits=8&period=60");
        assert(s.secret == std::string("Hello!\xde\xad\xbe\xef"));
        assert(s.algorithm == TOTPAlgo::SHA256);
        assert(s.digits == 8);
        assert(s.period.count() == 60);
        assert(s.label == "Heroku:Dao Quyen");
        assert(s.issuer == "Heroku");
    }

    // defaults; issuer taken from the label prefix
    {
        auto s = parse_otpauth_uri("otpauth://totp/ACME%20Co:alice@example.com?secret=JBSWY3DPEHPK3PXP");
        assert(s.algorithm == TOTPAlgo::SHA1);
        assert(s.digits == 6);
        assert(s.period.count() == 30);
        assert(s.issuer == "ACME Co");
        assert(s.label == "ACME Co:alice@example.com");
    }

    // case-insensitive scheme/type/algorithm, "SHA-512" spelling, lowercase secret
    {
        auto s = parse_otpauth_uri("OTPAUTH://TOTP/x?secret=jbswy3dpehpk3pxp&algorithm=sha-512");
        assert(s.algorithm == TOTPAlgo::SHA512);
        assert(s.secret.size() == 10);
        assert(s.issuer.empty());
    }

    // pure: same input, same output
    {
        const std::string uri = "otpauth://totp/a?secret=JBSWY3DPEHPK3PXP&digits=7";
        auto a = parse_otpauth_uri(uri);
        auto b = parse_otpauth_uri(uri);
        assert(a.secret == b.secret && a.digits == b.digits && a.label == b.label);
    }

    // unsupported type
    assert(throws<UnsupportedTypeError>([]{
        parse_otpauth_uri("otpauth://hotp/a?secret=JBSWY3DPEHPK3PXP&counter=0"); }));

    // invalid secret
    assert(throws<InvalidSecretError>([]{
        parse_otpauth_uri("otpauth://totp/a?secret=NOT-BASE32!!"); }));
    assert(throws<InvalidSecretError>([]{
        parse_otpauth_uri("otpauth://totp/a?secret=JBSW%3DY3DP"); }));      // '=' mid-string
    assert(throws<InvalidSecretError>([]{
        parse_otpauth_uri("otpauth://totp/a?secret=%3D%3D%3D%3D%3D%3D%3D%3D"); }));

    // malformed structure
    assert(throws<MalformedConfigurationError>([]{ parse_otpauth_uri(""); }));
    assert(throws<MalformedConfigurationError>([]{ parse_otpauth_uri("JBSWY3DPEHPK3PXP"); }));
    assert(throws<MalformedConfigurationError>([]{ parse_otpauth_uri("https://totp/a?secret=JBSWY3DPEHPK3PXP"); }));
    assert(throws<MalformedConfigurationError>([]{ parse_otpauth_uri("otpauth://totp?secret=JBSWY3DPEHPK3PXP"); }));
    assert(throws<MalformedConfigurationError>([]{ parse_otpauth_uri("otpauth:///a?secret=JBSWY3DPEHPK3PXP"); }));
    assert(throws<MalformedConfigurationError>([]{ parse_otpauth_uri("otpauth://totp/a"); }));
    assert(throws<MalformedConfigurationError>([]{ parse_otpauth_uri("otpauth://totp/a?secret="); }));
    assert(throws<MalformedConfigurationError>([]{
        parse_otpauth_uri("otpauth://totp/a?secret=JBSWY3DPEHPK3PXP&digits=six"); }));
    assert(throws<MalformedConfigurationError>([]{
        parse_otpauth_uri("otpauth://totp/a?secret=JBSWY3DPEHPK3PXP&digits=0"); }));
    assert(throws<MalformedConfigurationError>([]{
        parse_otpauth_uri("otpauth://totp/a?secret=JBSWY3DPEHPK3PXP&digits=11"); }));
    assert(throws<MalformedConfigurationError>([]{
        parse_otpauth_uri("otpauth://totp/a?secret=JBSWY3DPEHPK3PXP&period=-30"); }));
    assert(throws<MalformedConfigurationError>([]{
        parse_otpauth_uri("otpauth://totp/a?secret=JBSWY3DPEHPK3PXP&period=0"); }));
    assert(throws<MalformedConfigurationError>([]{
        parse_otpauth_uri("otpauth://totp/a?secret=JBSWY3DPEHPK3PXP&algorithm=MD5"); }));
    assert(throws<MalformedConfigurationError>([]{
        parse_otpauth_uri("otpauth://totp/a?secret=JBSWY3DPEHPK3PXP&secret=JBSWY3DP"); }));
    assert(throws<MalformedConfigurationError>([]{
        parse_otpauth_uri("otpauth://totp/a%zz?secret=JBSWY3DPEHPK3PXP"); }));

    // every parse error is an OtpError and never echoes the secret
    try {
        parse_otpauth_uri("otpauth://totp/a?secret=SECRETVALUEXYZAB&digits=x");
        assert(false);
    } catch (const OtpError& e) {
        assert(std::string(e.what()).find("SECRETVALUEXYZAB") == std::string::npos);
        assert(std::string(e.what()).find("digits") != std::string::npos);
    }

    std::string out;
    assert(percent_decode("a%20b%3Ac", out) && out == "a b:c");
    assert(!percent_decode("a%2", out));

    std::cout << "OtpauthUri test passed.\n";
    return 0;
}
