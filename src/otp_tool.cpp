// src/otp_tool.cpp
// Print or check TOTP codes for an otpauth:// provisioning URI.
#include "env_store.h"
#include "otp_tool.h"

#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/flags/usage.h>

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

ABSL_FLAG(std::string, config, "", "JSON config file (log_level, otp_env_key, otp_uri, window, env_files)");
ABSL_FLAG(std::string, uri, "", "otpauth:// provisioning URI");
ABSL_FLAG(std::string, env, "", "environment key holding the provisioning URI");
ABSL_FLAG(std::vector<std::string>, env_file, {}, "comma-separated .env / .json files merged into the environment");
ABSL_FLAG(std::optional<int>, window, std::nullopt, "accepted drift in time steps (default from config, else 1)");
ABSL_FLAG(std::optional<int64_t>, at, std::nullopt, "unix seconds to use instead of now");
ABSL_FLAG(std::string, log_level, "", "trace|debug|info|warn|error");

int main(int argc, char** argv) {
    absl::SetProgramUsageMessage(kOtpToolUsage);
    std::vector<char*> positional = absl::ParseCommandLine(argc, argv);

    ToolOptions opts;
    opts.config_path = absl::GetFlag(FLAGS_config);
    opts.uri = absl::GetFlag(FLAGS_uri);
    opts.env_key = absl::GetFlag(FLAGS_env);
    opts.log_level = absl::GetFlag(FLAGS_log_level);
    opts.env_files = absl::GetFlag(FLAGS_env_file);
    opts.window = absl::GetFlag(FLAGS_window);
    opts.at = absl::GetFlag(FLAGS_at);
    // positional[0] is the program name
    for (std::size_t i = 1; i < positional.size(); ++i) opts.args.emplace_back(positional[i]);

    Logger log("otp_tool");
    return run_guarded(log, [&]() {
        EnvStore env = EnvStore::from_process_env();
        return run_otp_tool(opts, env, std::cout, std::cerr);
    });
}
