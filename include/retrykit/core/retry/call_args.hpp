/**
 * @file call_args.hpp
 * @brief Configuration of a retry session and its validation.
 *
 * CallArgs is the raw, caller-filled configuration. validate() checks it and
 * produces a RetryPolicy with every default resolved; the CallArgs value is
 * never modified, so it can be reused freely.
 *
 * @date 2025
 */
#pragma once
#include "retrykit/core/interfaces/IClock.hpp"
#include "retrykit/core/retry/attempt_budget.hpp"
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>

namespace retrykit {

    /// The operation to retry. Failure is reported by throwing.
    using RetryFunc = std::function<void()>;
    /// Returns true for errors that must not be retried.
    using FatalErrorFunc = std::function<bool(const std::exception_ptr&)>;
    /// Called after every failed attempt with the error and the 1-based attempt number.
    using NotifyFunc = std::function<void(const std::exception_ptr&, std::int64_t)>;

    /**
     * @struct CallArgs
     * @brief Raw configuration of one retry session.
     *
     * func, attempts and delay are required; everything else has a default.
     */
    struct CallArgs {
        RetryFunc func;                               ///< Operation to invoke (required)
        std::optional<AttemptBudget> attempts;        ///< Attempt budget (required)
        std::optional<std::chrono::nanoseconds> delay;///< Delay before the second attempt (required)
        std::optional<double> backoffFactor;          ///< Delay multiplier, >= 1, default 1
        std::chrono::nanoseconds maxDelay{ 0 };       ///< Delay ceiling, zero means none
        FatalErrorFunc isFatalError;                  ///< Optional fatal error classifier
        NotifyFunc notifyFunc;                        ///< Optional failure hook
        std::stop_token stop;                         ///< Optional stop signal, polled between attempts
        std::shared_ptr<IClock> clock;                ///< Time source, default wallClock()
    };

    /**
     * @class RetryPolicy
     * @brief Validated, fully defaulted configuration of one retry session.
     *
     * Only validate() creates policies. A policy is read-only.
     */
    class RetryPolicy {
    public:
        const RetryFunc& func() const { return func_; }
        AttemptBudget attempts() const { return attempts_; }
        std::chrono::nanoseconds delay() const { return delay_; }
        double backoffFactor() const { return backoffFactor_; }

        /**
         * @brief Delay ceiling, or std::nullopt when delays may grow without bound.
         */
        std::optional<std::chrono::nanoseconds> maxDelay() const { return maxDelay_; }

        const FatalErrorFunc& isFatalError() const { return isFatalError_; }
        const NotifyFunc& notifyFunc() const { return notifyFunc_; }
        const std::stop_token& stop() const { return stop_; }
        const std::shared_ptr<IClock>& clock() const { return clock_; }

    private:
        friend RetryPolicy validate(const CallArgs& args);
        RetryPolicy() = default;

        RetryFunc func_;
        AttemptBudget attempts_{ UnlimitedAttempts };
        std::chrono::nanoseconds delay_{ 0 };
        double backoffFactor_{ 1.0 };
        std::optional<std::chrono::nanoseconds> maxDelay_;
        FatalErrorFunc isFatalError_;
        NotifyFunc notifyFunc_;
        std::stop_token stop_;
        std::shared_ptr<IClock> clock_;
    };

    /**
     * @brief Check call arguments and resolve their defaults.
     *
     * Checks run in this order and the first failure is thrown:
     * missing operation, missing attempt budget, missing or negative delay,
     * backoff factor below one. An unset backoff factor becomes 1 and an unset
     * clock becomes wallClock().
     *
     * @throws InvalidConfiguration naming the offending field
     */
    RetryPolicy validate(const CallArgs& args);

}
