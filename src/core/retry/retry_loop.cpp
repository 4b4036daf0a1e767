#include "retrykit/core/retry/retry_loop.hpp"
#include "retrykit/core/retry/scale_duration.hpp"
#include "retrykit/core/util/error_types.hpp"

namespace retrykit {

    const char* retryStateName(RetryState state) {
        switch (state) {
        case RetryState::Running:           return "Running";
        case RetryState::Succeeded:         return "Succeeded";
        case RetryState::FatalFailed:       return "FatalFailed";
        case RetryState::AttemptsExhausted: return "AttemptsExhausted";
        case RetryState::Stopped:           return "Stopped";
        }
        return "Unknown";
    }

    RetryLoop::RetryLoop(RetryPolicy policy)
        : policy_(std::move(policy)), currentDelay_(policy_.delay()) {}

    RetryOutcome RetryLoop::run() {
        if (finished_) return outcome_;
        finished_ = true;

        const auto maxDelay = policy_.maxDelay().value_or(std::chrono::nanoseconds::zero());

        for (std::int64_t attempt = 1;; ++attempt) {
            outcome_.attempts = attempt;

            std::exception_ptr err;
            try {
                policy_.func()();
            }
            catch (...) {
                err = std::current_exception();
            }

            if (!err) {
                outcome_.state = RetryState::Succeeded;
                outcome_.lastError = nullptr;
                return outcome_;
            }
            outcome_.lastError = err;

            if (policy_.isFatalError() && policy_.isFatalError()(err)) {
                outcome_.state = RetryState::FatalFailed;
                return outcome_;
            }

            if (policy_.notifyFunc())
                policy_.notifyFunc()(err, attempt);

            // Exhaustion is checked first so it wins over a simultaneous stop request
            if (policy_.attempts().isFinal(attempt)) {
                outcome_.state = RetryState::AttemptsExhausted;
                return outcome_;
            }

            if (policy_.stop().stop_requested()) {
                outcome_.state = RetryState::Stopped;
                return outcome_;
            }

            policy_.clock()->after(currentDelay_).get();
            currentDelay_ = scaleDuration(currentDelay_, maxDelay, policy_.backoffFactor());
        }
    }

    void call(const CallArgs& args) {
        RetryLoop loop(validate(args));
        auto outcome = loop.run();

        switch (outcome.state) {
        case RetryState::Succeeded:
            return;
        case RetryState::FatalFailed:
            std::rethrow_exception(outcome.lastError);
        case RetryState::AttemptsExhausted:
            throw AttemptsExceeded(outcome.lastError);
        case RetryState::Stopped:
            throw RetryStopped(outcome.lastError);
        case RetryState::Running:
            break;
        }
        throw std::logic_error(std::string("retry loop ended in state ") + retryStateName(outcome.state));
    }

}
