#include "env_store.h"
#include "otp_errors.h"
#include <cassert>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#ifndef OTP_TEST_DATA_DIR
#define OTP_TEST_DATA_DIR "../tests"
#endif

using Vars = std::unordered_map<std::string, std::string>;

template<typename E, typename F>
static bool throws(F&& f) {
    try { f(); } catch (const E&) { return true; }
    return false;
}

int main() {
    const std::string dir = OTP_TEST_DATA_DIR;

    EnvStore env(Vars{
        {"PORT", " 8080 "},
        {"RATIO", "0.25"},
        {"BAD_NUM", "12abc"},
        {"FLAG_ON", "On"},
        {"FLAG_OFF", "0"},
        {"FLAG_BAD", "maybe"},
        {"NODE_ENV", "production"},
        {"ORIGINS", "http://a.com, http://b.com,,"},
        {"SENTRY", R"({"dsn":"abc123","tracesSampleRate":0.2})"},
        {"BLANK", "   "},
        {"EMPTY", ""},
    });

    // presence
    assert(env.has("PORT"));
    assert(!env.has("EMPTY"));
    assert(!env.has("NOPE"));
    assert(env.lookup("EMPTY").has_value());
    assert(!env.lookup("NOPE").has_value());

    // strings: trim by default, raw on request
    assert(env.get_string("PORT") == "8080");
    assert(env.get_string("PORT", {true, std::nullopt, false}) == " 8080 ");
    assert(throws<ConfigurationError>([&]{ env.get_string("NOPE"); }));
    assert(throws<ConfigurationError>([&]{ env.get_string("EMPTY"); }));
    assert(throws<ConfigurationError>([&]{ env.get_string("BLANK"); }));
    assert(env.get_string("NOPE", {false, std::string("info")}) == "info");
    assert(env.get_string("NOPE", {false}).empty());

    // numbers
    assert(env.get_int("PORT") == 8080);
    assert(env.get_number("RATIO") == 0.25);
    assert(env.get_int("NOPE", {false, 3000LL}) == 3000);
    assert(throws<ConfigurationError>([&]{ env.get_number("BAD_NUM"); }));
    assert(throws<ConfigurationError>([&]{ env.get_int("RATIO"); }));

    // booleans
    assert(env.get_bool("FLAG_ON"));
    assert(!env.get_bool("FLAG_OFF"));
    assert(!env.get_bool("NOPE", {false, false}));
    assert(env.get_bool("NOPE", {false, true}));
    assert(throws<ConfigurationError>([&]{ env.get_bool("FLAG_BAD"); }));

    // enum
    const std::vector<std::string> modes{"development", "test", "production"};
    assert(env.get_enum("NODE_ENV", modes) == "production");
    assert(env.get_enum("NOPE", modes, {false, std::string("development")}) == "development");
    env.set("NODE_ENV", "staging");
    assert(throws<ConfigurationError>([&]{ env.get_enum("NODE_ENV", modes); }));

    // list
    auto origins = env.get_list("ORIGINS");
    assert(origins.size() == 2 && origins[0] == "http://a.com" && origins[1] == "http://b.com");
    assert(env.get_list("NOPE", ',', {false, std::vector<std::string>{"default-feature"}}).size() == 1);

    // json
    auto sentry = env.get_json("SENTRY");
    assert(sentry.at("dsn") == "abc123");
    env.set("BAD_JSON", "{nope");
    assert(throws<ConfigurationError>([&]{ env.get_json("BAD_JSON"); }));

    // require names every missing key
    env.require({"PORT", "RATIO"});
    try {
        env.require({"PORT", "NOPE", "EMPTY"});
        assert(false);
    } catch (const ConfigurationError& e) {
        const std::string msg = e.what();
        assert(msg.find("NOPE") != std::string::npos);
        assert(msg.find("EMPTY") != std::string::npos);
        assert(msg.find("PORT") == std::string::npos);
    }

    // runtime mutation
    env.set("NOPE", "now here");
    assert(env.get_string("NOPE") == "now here");
    env.erase("NOPE");
    assert(!env.has("NOPE"));

    // files: JSON overwrites, dotenv keeps existing keys
    {
        EnvStore f;
        f.load_json_file(dir + "/env.json");
        f.load_dotenv_file(dir + "/test.env");
        assert(f.get_string("HEROKU_OTP_URI").find("JBSWY3DPEHPK3PXP") != std::string::npos);
        assert(f.get_list("RETRY_CODES").size() == 3);
        assert(f.get_int("CACHE_TTL") == 3000);
        assert(f.get_bool("FEATURE_FLAG"));
        assert(!f.has("EMPTY"));
        assert(f.get_string("HEROKU_USERNAME") == "qa@example.com");
        assert(f.get_string("HEROKU_PWD") == "s3cret pass");
        assert(f.get_string("NODE_ENV") == "test");
        assert(f.get_string("PADDED") == "spaced value");
        assert(!f.has("not a pair"));

        f.load_json_file(dir + "/env.json");
        assert(f.get_int("CACHE_TTL") == 3000);
    }
    assert(throws<ConfigurationError>([&]{ env.load_json_file(dir + "/missing.json"); }));
    assert(throws<ConfigurationError>([&]{ env.load_dotenv_file(dir + "/missing.env"); }));
    assert(throws<ConfigurationError>([&]{ env.load_json_file(dir + "/test.env"); })); // not JSON

    // process environment snapshot
    setenv("OTP_ENGINE_ENV_STORE_TEST", "snap", 1);
    EnvStore proc = EnvStore::from_process_env();
    assert(proc.get_string("OTP_ENGINE_ENV_STORE_TEST") == "snap");
    setenv("OTP_ENGINE_ENV_STORE_TEST", "changed", 1);
    assert(proc.get_string("OTP_ENGINE_ENV_STORE_TEST") == "snap");

    // concurrent readers and a writer
    {
        EnvStore shared(Vars{{"K", "v0"}});
        std::vector<std::thread> th;
        for (int t = 0; t < 4; ++t) {
            th.emplace_back([&shared]{
                for (int i = 0; i < 2000; ++i) {
                    assert(shared.get_string("K").size() >= 2);
                }
            });
        }
        th.emplace_back([&shared]{
            for (int i = 0; i < 2000; ++i) shared.set("K", "v" + std::to_string(i));
        });
        for (auto& x : th) x.join();
    }

    std::cout << "EnvStore test passed.\n";
    return 0;
}
