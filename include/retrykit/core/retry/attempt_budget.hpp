/**
 * @file attempt_budget.hpp
 * @brief Bounded or unlimited attempt budget.
 *
 * @date 2025
 */
#pragma once
#include <cstdint>
#include <optional>

namespace retrykit {

    /**
     * @class AttemptBudget
     * @brief Maximum number of attempts for a retry session, or unlimited.
     *
     * An explicit discriminated value: unlimited is a distinct state, not a
     * reserved count.
     */
    class AttemptBudget {
    public:
        /**
         * @brief A budget of @p count attempts. Counts below one are rejected by validate().
         */
        static constexpr AttemptBudget bounded(std::int64_t count) { return AttemptBudget(count); }

        static constexpr AttemptBudget unlimited() { return AttemptBudget(); }

        constexpr bool isBounded() const { return limit_.has_value(); }

        /**
         * @brief The attempt limit; only meaningful when isBounded().
         */
        constexpr std::int64_t limit() const { return limit_.value_or(0); }

        /**
         * @brief True if @p attempt (1-based) is the last one the budget permits.
         */
        constexpr bool isFinal(std::int64_t attempt) const { return limit_ && attempt >= *limit_; }

        friend constexpr bool operator==(const AttemptBudget&, const AttemptBudget&) = default;

    private:
        constexpr AttemptBudget() = default;
        constexpr explicit AttemptBudget(std::int64_t count) : limit_(count) {}

        std::optional<std::int64_t> limit_;
    };

    /// Sentinel for retrying until success, a fatal error or a stop request.
    inline constexpr AttemptBudget UnlimitedAttempts = AttemptBudget::unlimited();

}
