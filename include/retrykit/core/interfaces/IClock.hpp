/**
 * @file IClock.hpp
 * @brief Interface for the time source used by retry sessions.
 *
 * The retry loop waits between attempts through this interface only, so a
 * test double can record the requested delays without actually sleeping.
 *
 * @date 2025
 */
#pragma once
#include <chrono>
#include <future>

namespace retrykit {

    /**
     * @class IClock
     * @brief Interface for time sources.
     *
     * Implement this interface to control how inter-attempt delays elapse.
     */
    class IClock {
    public:
        virtual ~IClock() = default;

        /**
         * @brief Current time of this clock.
         *
         * Not consulted by the retry loop; available to callers and tests.
         */
        virtual std::chrono::system_clock::time_point now() const = 0;

        /**
         * @brief Produce a one-shot completion signal.
         * @param delay Duration after which the returned future becomes ready
         * @return Future that is satisfied once the delay has elapsed
         */
        virtual std::future<void> after(std::chrono::nanoseconds delay) = 0;
    };

}
