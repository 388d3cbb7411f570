#include "logger.h"
#include "otp_errors.h"
#include <cassert>
#include <thread>
#include <vector>
#include <sstream>
#include <iostream>
#include <utility>

static std::size_t count_lines(const std::string& s) {
    std::size_t n = 0;
    for (char c : s) if (c == '\n') ++n;
    return n;
}

int main() {
    // level names
    assert(parse_log_level("trace") == LogLevel::TRACE);
    assert(parse_log_level(" DEBUG ") == LogLevel::DEBUG);
    assert(parse_log_level("Info") == LogLevel::INFO);
    assert(parse_log_level("warning") == LogLevel::WARN);
    assert(parse_log_level("error") == LogLevel::ERROR);
    try {
        parse_log_level("verbose");
        assert(false);
    } catch (const ConfigurationError&) {}

    // filtering
    {
        std::ostringstream out;
        Logger log("logger_test", out);
        assert(log.level() == LogLevel::INFO);
        log.debug("hidden");
        log.info("shown");
        log.warn_fmt("digits=", 6, " period=", 30);
        const std::string s = out.str();
        assert(s.find("hidden") == std::string::npos);
        assert(s.find("[INFO] logger_test: shown") != std::string::npos);
        assert(s.find("[WARN] logger_test: digits=6 period=30") != std::string::npos);
        assert(count_lines(s) == 2);

        log.set_level(LogLevel::ERROR);
        log.warn("dropped");
        assert(count_lines(out.str()) == 2);
    }

    // moved-from keeps working in its new home
    {
        std::ostringstream out;
        Logger a("moved", out);
        Logger b(std::move(a));
        b.info("after move");
        assert(out.str().find("moved: after move") != std::string::npos);
    }

    // move-assign to and from moved-from loggers
    {
        std::ostringstream out;
        Logger a("first", out);
        Logger b(std::move(a));          // a is now moved-from
        Logger c("third", out);
        c = std::move(a);                // from a moved-from logger
        c.info("dropped by moved-from");
        a = std::move(b);                // into a logger that had been moved-from
        a.info("reassigned");
        b = std::move(c);                // c is moved-from again
        const std::string s = out.str();
        assert(s.find("first: reassigned") != std::string::npos);
        assert(s.find("dropped by moved-from") == std::string::npos);
    }

    // concurrent writers never interleave lines
    {
        std::ostringstream out;
        Logger log("logger_test", out);
        log.set_level(LogLevel::DEBUG);

        const int threads = 4;
        const int msgs = 200;

        std::vector<std::thread> th;
        for (int t = 0; t < threads; ++t) {
            th.emplace_back([t, msgs, &log](){
                for (int i = 0; i < msgs; ++i) {
                    log.debug_fmt("thread=", t, " msg=", i);
                }
            });
        }
        for (auto &x : th) x.join();

        std::istringstream in(out.str());
        std::string line;
        std::size_t n = 0;
        while (std::getline(in, line)) {
            assert(line.find("[DEBUG] logger_test: thread=") != std::string::npos);
            ++n;
        }
        assert(n == static_cast<std::size_t>(threads * msgs));
    }

    std::cout << "Logger test passed.\n";
    return 0;
}
