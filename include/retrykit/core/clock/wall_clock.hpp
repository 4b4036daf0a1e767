/**
 * @file wall_clock.hpp
 * @brief Real time source for retry sessions.
 *
 * @date 2025
 */
#pragma once
#include "retrykit/core/interfaces/IClock.hpp"
#include "retrykit/core/util/timer_queue.hpp"
#include <memory>

namespace retrykit {

    /**
     * @class WallClock
     * @brief IClock implementation backed by the system clock.
     *
     * Delays are served by an owned TimerQueue, so the future returned by
     * after() becomes ready on the timer thread while the caller blocks on it.
     */
    class WallClock : public IClock {
    public:
        WallClock() = default;

        std::chrono::system_clock::time_point now() const override;
        std::future<void> after(std::chrono::nanoseconds delay) override;

    private:
        TimerQueue timers_;
    };

    /**
     * @brief Get the process-wide wall clock.
     *
     * This is the clock validate() fills in when CallArgs::clock is unset.
     * Every call returns the same instance.
     */
    std::shared_ptr<IClock> wallClock();

}
