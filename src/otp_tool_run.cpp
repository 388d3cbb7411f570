// src/otp_tool_run.cpp
#include "otp_tool.h"
#include "config.h"
#include "env_store.h"
#include "otp_engine.h"

#include <chrono>

const char* const kOtpToolUsage =
    "print or verify TOTP codes\n\n"
    "  otp_tool [flags] code\n"
    "  otp_tool [flags] verify CODE\n"
    "  otp_tool [flags] info\n";

namespace {

bool arity_ok(const std::vector<std::string>& args) {
    if (args.empty()) return false;
    const std::string& cmd = args[0];
    if (cmd == "verify") return args.size() == 2;
    return (cmd == "code" || cmd == "info") && args.size() == 1;
}

// seconds a TimePoint can hold without overflowing its own rep
bool at_in_range(int64_t secs) {
    using std::chrono::duration_cast;
    using std::chrono::seconds;
    const auto lo = duration_cast<seconds>(OtpEngine::TimePoint::min().time_since_epoch()).count();
    const auto hi = duration_cast<seconds>(OtpEngine::TimePoint::max().time_since_epoch()).count();
    return secs >= lo && secs <= hi;
}

} // namespace

int run_otp_tool(const ToolOptions& opts, EnvStore& env,
                 std::ostream& out, std::ostream& err) {
    if (!arity_ok(opts.args)) {
        err << "otp_tool: " << kOtpToolUsage;
        return kExitUsage;
    }
    if (!opts.uri.empty() && !opts.env_key.empty()) {
        err << "otp_tool: use only one of --uri / --env\n";
        return kExitUsage;
    }
    if (opts.at && !at_in_range(*opts.at)) {
        err << "otp_tool: --at=" << *opts.at << " is outside the representable time range\n";
        return kExitUsage;
    }

    Logger log("otp_tool", err);
    return run_guarded(log, [&]() -> int {
        AppConfig cfg = opts.config_path.empty() ? AppConfig::defaults()
                                                 : AppConfig::load_from_file(opts.config_path);

        // flags override the config file
        if (!opts.log_level.empty()) cfg.set_log_level(parse_log_level(opts.log_level));
        if (!opts.uri.empty()) cfg.set_otp_uri(opts.uri);
        if (!opts.env_key.empty()) cfg.set_otp_env_key(opts.env_key);
        if (opts.window) cfg.set_window(*opts.window);
        for (const auto& f : opts.env_files) cfg.add_env_file(f);
        log.set_level(cfg.log_level());

        cfg.load_env_files(env);
        OtpEngine engine(cfg.source(), env, log);

        std::optional<OtpEngine::TimePoint> at;
        if (opts.at) at = OtpEngine::TimePoint(std::chrono::seconds(*opts.at));

        const std::string& command = opts.args[0];
        if (command == "code") {
            out << engine.get_code(at) << "\n";
            return kExitOk;
        }
        if (command == "info") {
            const TotpSpec& s = engine.totp()->spec();
            out << "issuer:    " << s.issuer << "\n"
                << "label:     " << s.label << "\n"
                << "algorithm: " << to_string(s.algorithm) << "\n"
                << "digits:    " << s.digits << "\n"
                << "period:    " << s.period.count() << "\n";
            return kExitOk;
        }

        const VerificationResult r = engine.verify(opts.args[1], cfg.window(), at);
        if (r.ok) {
            out << "ok delta=" << *r.delta << "\n";
            return kExitOk;
        }
        out << "fail reason=" << *r.reason << "\n";
        return kExitVerifyFailed;
    });
}
