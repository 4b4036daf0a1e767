#include <catch2/catch_all.hpp>
#include "retrykit/core/retry/call_args.hpp"
#include "retrykit/core/retry/retry_loop.hpp"
#include "retrykit/core/clock/wall_clock.hpp"
#include "retrykit/core/clock/recording_clock.hpp"
#include "retrykit/core/util/error_types.hpp"
#include <cmath>
#include <stdexcept>

using namespace retrykit;
using namespace std::chrono_literals;

static CallArgs validArgs() {
    CallArgs args;
    args.func = [] { throw std::runtime_error("bah"); };
    args.attempts = AttemptBudget::bounded(5);
    args.delay = 1min;
    return args;
}

// Runs validate() and returns the rejected field, failing the test if it passes
static std::string rejectedField(const CallArgs& args, std::string* message = nullptr) {
    try {
        (void)validate(args);
    } catch (const InvalidConfiguration& e) {
        if (message) *message = e.what();
        REQUIRE(e.code() == RetryErr::InvalidConfiguration);
        return e.field();
    }
    FAIL("validate() accepted invalid arguments");
    return {};
}

TEST_CASE("validate fills the defaults", "[config]") {
    auto policy = validate(validArgs());

    REQUIRE(policy.backoffFactor() == 1.0);
    REQUIRE(policy.clock() == wallClock());
    REQUIRE_FALSE(policy.maxDelay().has_value());
    REQUIRE(policy.attempts() == AttemptBudget::bounded(5));
    REQUIRE(policy.delay() == 1min);
    REQUIRE_FALSE(policy.stop().stop_possible());
}

TEST_CASE("validate keeps supplied values", "[config]") {
    auto clock = std::make_shared<RecordingClock>();
    auto args = validArgs();
    args.backoffFactor = 2.5;
    args.maxDelay = 10min;
    args.clock = clock;

    auto policy = validate(args);
    REQUIRE(policy.backoffFactor() == 2.5);
    REQUIRE(policy.maxDelay() == std::optional<std::chrono::nanoseconds>(10min));
    REQUIRE(policy.clock() == clock);
}

TEST_CASE("validate leaves the arguments untouched", "[config]") {
    const auto args = validArgs();
    (void)validate(args);
    REQUIRE_FALSE(args.backoffFactor.has_value());
    REQUIRE(args.clock == nullptr);
}

TEST_CASE("validate accepts a zero delay and unlimited attempts", "[config]") {
    auto args = validArgs();
    args.delay = 0ns;
    args.attempts = UnlimitedAttempts;
    auto policy = validate(args);
    REQUIRE(policy.delay() == 0ns);
    REQUIRE_FALSE(policy.attempts().isBounded());
}

TEST_CASE("missing operation is rejected", "[config]") {
    auto args = validArgs();
    args.func = nullptr;
    std::string msg;
    REQUIRE(rejectedField(args, &msg) == "func");
    REQUIRE(msg == "missing operation");
}

TEST_CASE("missing attempt budget is rejected", "[config]") {
    auto args = validArgs();
    args.attempts.reset();
    std::string msg;
    REQUIRE(rejectedField(args, &msg) == "attempts");
    REQUIRE(msg == "missing attempt budget");

    args.attempts = AttemptBudget::bounded(0);
    REQUIRE(rejectedField(args) == "attempts");
    args.attempts = AttemptBudget::bounded(-3);
    REQUIRE(rejectedField(args) == "attempts");
}

TEST_CASE("missing delay is rejected", "[config]") {
    auto args = validArgs();
    args.delay.reset();
    std::string msg;
    REQUIRE(rejectedField(args, &msg) == "delay");
    REQUIRE(msg == "missing delay");

    args.delay = -5ms;
    REQUIRE(rejectedField(args, &msg) == "delay");
    REQUIRE(msg == "invalid delay of -5ms");
}

TEST_CASE("backoff factors below one are rejected", "[config]") {
    std::string msg;
    auto args = validArgs();

    args.backoffFactor = -2;
    REQUIRE(rejectedField(args, &msg) == "backoffFactor");
    REQUIRE(msg == "invalid backoff factor of -2");

    args.backoffFactor = 0.5;
    REQUIRE(rejectedField(args, &msg) == "backoffFactor");
    REQUIRE(msg == "invalid backoff factor of 0.5");

    args.backoffFactor = std::nan("");
    REQUIRE(rejectedField(args) == "backoffFactor");

    args.backoffFactor = 1.0;
    REQUIRE_NOTHROW(validate(args));
}

TEST_CASE("the first failing check wins", "[config]") {
    CallArgs args;
    args.backoffFactor = 0.1;
    REQUIRE(rejectedField(args) == "func");

    args.func = [] {};
    REQUIRE(rejectedField(args) == "attempts");

    args.attempts = AttemptBudget::bounded(1);
    REQUIRE(rejectedField(args) == "delay");

    args.delay = 1s;
    REQUIRE(rejectedField(args) == "backoffFactor");
}

TEST_CASE("call() never invokes the operation on invalid configuration", "[config]") {
    int calls = 0;
    auto clock = std::make_shared<RecordingClock>();

    CallArgs args;
    args.func = [&] { ++calls; throw std::runtime_error("bah"); };
    args.attempts = AttemptBudget::bounded(3);
    args.delay = 1min;
    args.backoffFactor = 0.5;
    args.clock = clock;

    REQUIRE_THROWS_MATCHES(call(args), InvalidConfiguration,
        Catch::Matchers::Message("invalid backoff factor of 0.5"));
    REQUIRE(calls == 0);
    REQUIRE(clock->delays().empty());
}
