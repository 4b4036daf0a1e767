/**
 * @file retry_loop.hpp
 * @brief The retry control loop and the call() entry point.
 *
 * A RetryLoop drives one session: invoke the operation, classify the result,
 * wait on the clock, grow the delay, repeat. call() validates the arguments,
 * runs a loop and turns its outcome into a return or a classified exception.
 *
 * @date 2025
 */
#pragma once
#include "retrykit/core/retry/call_args.hpp"
#include <chrono>
#include <cstdint>
#include <exception>

namespace retrykit {

    /**
     * @enum RetryState
     * @brief State of a retry session. Every state but Running is terminal.
     */
    enum class RetryState {
        Running,            ///< Attempts still being made
        Succeeded,          ///< An attempt returned normally
        FatalFailed,        ///< The fatal classifier rejected the last error
        AttemptsExhausted,  ///< The final permitted attempt failed
        Stopped             ///< The stop token was asserted between attempts
    };

    const char* retryStateName(RetryState state);

    /**
     * @struct RetryOutcome
     * @brief Result of RetryLoop::run().
     */
    struct RetryOutcome {
        RetryState state{ RetryState::Running }; ///< Terminal state reached
        std::int64_t attempts{ 0 };              ///< Number of invocations made
        std::exception_ptr lastError;            ///< Error of the last attempt, null on success
    };

    /**
     * @class RetryLoop
     * @brief Runs one retry session over a validated policy.
     *
     * The loop is synchronous and occupies the calling thread, including
     * during delays. The stop token is only polled between attempts: an
     * attempt in flight always completes and its result is still checked,
     * and the first attempt is always made.
     */
    class RetryLoop {
    public:
        explicit RetryLoop(RetryPolicy policy);

        /**
         * @brief Run the session to a terminal state.
         *
         * Errors thrown by the operation are captured into the outcome rather
         * than propagated. Each loop runs once; a second call returns the
         * stored outcome without invoking the operation again.
         *
         * @return The terminal outcome
         */
        RetryOutcome run();

        RetryState state() const { return outcome_.state; }
        std::int64_t attempts() const { return outcome_.attempts; }

        /**
         * @brief The delay that would precede the next attempt.
         */
        std::chrono::nanoseconds currentDelay() const { return currentDelay_; }

    private:
        RetryPolicy policy_;
        RetryOutcome outcome_;
        std::chrono::nanoseconds currentDelay_;
        bool finished_{ false };
    };

    /**
     * @brief Call a function until it succeeds or the policy gives up.
     *
     * @param args Session configuration
     * @throws InvalidConfiguration if validate() rejects @p args; func is not invoked
     * @throws AttemptsExceeded when the attempt budget ran out
     * @throws RetryStopped when the stop token was asserted between attempts
     * @throws The operation's own exception, unchanged, when it was classified fatal
     */
    void call(const CallArgs& args);

}
