// include/otp_tool.h
#pragma once
#include "logger.h"
#include "otp_errors.h"
#include <cstdint>
#include <exception>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

class EnvStore;

constexpr int kExitOk = 0;
constexpr int kExitVerifyFailed = 1;
constexpr int kExitConfig = 2;
constexpr int kExitInternal = 3;
constexpr int kExitUsage = 64;

extern const char* const kOtpToolUsage;

// Parsed command line of otp_tool. Empty strings mean "not given".
struct ToolOptions {
    std::string config_path;
    std::string uri;
    std::string env_key;
    std::string log_level;
    std::vector<std::string> env_files;
    std::optional<int> window;
    std::optional<int64_t> at;      // unix seconds
    std::vector<std::string> args;  // command and its operands, e.g. {"verify", "123456"}
};

// Runs one otp_tool command against env. Results go to out, logs and usage
// errors to err. Returns one of the kExit* codes; never throws.
int run_otp_tool(const ToolOptions& opts, EnvStore& env,
                 std::ostream& out, std::ostream& err);

// Maps escaping exceptions to exit codes: OtpError -> kExitConfig,
// any other std::exception -> kExitInternal. Both are logged.
template<typename F>
int run_guarded(Logger& log, F&& body) {
    try {
        return body();
    } catch (const OtpError& e) {
        log.error(e.what());
        return kExitConfig;
    } catch (const std::exception& e) {
        log.error(std::string("internal error: ") + e.what());
        return kExitInternal;
    }
}
