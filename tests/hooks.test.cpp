#include <catch2/catch_all.hpp>
#include "retrykit/core/retry/hooks.hpp"
#include "retrykit/core/retry/retry_loop.hpp"
#include "retrykit/core/clock/recording_clock.hpp"
#include "retrykit/core/util/error_types.hpp"
#include "retrykit/core/util/logger.hpp"
#include <stdexcept>
#include <system_error>

using namespace retrykit;
using namespace std::chrono_literals;

namespace {
    struct CapturedLog {
        std::vector<std::pair<LogLevel, std::string>> lines;
        LogLevel saved = Logger::inst().level();

        CapturedLog() {
            Logger::inst().setLevel(LogLevel::Trace);
            Logger::inst().setSink([this](LogLevel l, const std::string& m) { lines.emplace_back(l, m); });
        }
        ~CapturedLog() {
            Logger::inst().setSink(nullptr);
            Logger::inst().setLevel(saved);
        }
    };
}

TEST_CASE("parseLogLevel accepts any case", "[log]") {
    REQUIRE(parseLogLevel("debug") == LogLevel::Debug);
    REQUIRE(parseLogLevel("ERROR") == LogLevel::Error);
    REQUIRE(parseLogLevel("Warning") == LogLevel::Warn);
    REQUIRE_FALSE(parseLogLevel("verbose").has_value());
    REQUIRE(std::string(logLevelName(LogLevel::Info)) == "INFO");
}

TEST_CASE("logger drops lines below its level", "[log]") {
    CapturedLog log;
    Logger::inst().setLevel(LogLevel::Warn);
    LOG_INFO("hidden");
    LOG_WARN("shown");
    LOG_ERROR("also shown");

    REQUIRE(log.lines.size() == 2);
    REQUIRE(log.lines[0].second == "shown");
    REQUIRE(log.lines[1].first == LogLevel::Error);
}

TEST_CASE("logAttempts logs every failed attempt", "[log][notify]") {
    CapturedLog log;
    auto clock = std::make_shared<RecordingClock>();

    CallArgs args;
    args.func = [] { throw std::runtime_error("connection refused"); };
    args.attempts = AttemptBudget::bounded(3);
    args.delay = 1s;
    args.clock = clock;
    args.notifyFunc = logAttempts("upload", LogLevel::Info);

    REQUIRE_THROWS_AS(call(args), AttemptsExceeded);
    REQUIRE(log.lines.size() == 3);
    REQUIRE(log.lines[0].first == LogLevel::Info);
    REQUIRE(log.lines[0].second == "upload: attempt 1 failed: connection refused");
    REQUIRE(log.lines[2].second == "upload: attempt 3 failed: connection refused");

    auto hook = logAttempts("poll");
    hook(std::make_exception_ptr(std::runtime_error("timeout")), 3000000000);
    REQUIRE(log.lines.back().second == "poll: attempt 3000000000 failed: timeout");
}

TEST_CASE("chainNotify calls both hooks in order", "[notify]") {
    std::vector<std::string> order;
    auto first = [&](const std::exception_ptr&, std::int64_t n) { order.push_back("a" + std::to_string(n)); };
    auto second = [&](const std::exception_ptr&, std::int64_t n) { order.push_back("b" + std::to_string(n)); };

    auto both = chainNotify(first, second);
    both(nullptr, 1);
    both(nullptr, 2);
    REQUIRE(order == std::vector<std::string>{ "a1", "b1", "a2", "b2" });

    REQUIRE(chainNotify(nullptr, second));
    REQUIRE_FALSE(chainNotify(nullptr, nullptr));
}

TEST_CASE("fatalOn matches the type and its subclasses", "[notify]") {
    auto fatal = fatalOn<std::logic_error>();

    REQUIRE(fatal(std::make_exception_ptr(std::logic_error("x"))));
    REQUIRE(fatal(std::make_exception_ptr(std::invalid_argument("x"))));
    REQUIRE_FALSE(fatal(std::make_exception_ptr(std::runtime_error("x"))));
    REQUIRE_FALSE(fatal(std::make_exception_ptr(42)));
    REQUIRE_FALSE(fatal(nullptr));

    auto sysFatal = fatalOn<std::system_error>();
    REQUIRE(sysFatal(std::make_exception_ptr(
        std::system_error(std::make_error_code(std::errc::permission_denied)))));
}
