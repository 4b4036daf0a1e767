/**
 * @file timer_queue.hpp
 * @brief One-shot timer service backing the wall clock.
 *
 * A single worker thread sleeps until the earliest pending deadline and
 * fulfils the promise registered for it. Any number of sessions can wait on
 * timers concurrently without each needing a thread of its own.
 *
 * @date 2025
 */
#pragma once

#include <chrono>
#include <map>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <future>
#include <atomic>

namespace retrykit {

    /**
     * @class TimerQueue
     * @brief Deadline-ordered queue of one-shot timers served by one thread.
     */
    class TimerQueue {
    public:
        using clock = std::chrono::steady_clock;

        /**
         * @brief Start the worker thread.
         */
        TimerQueue();

        /**
         * @brief Stops the queue and joins the worker thread.
         */
        ~TimerQueue();

        TimerQueue(const TimerQueue&) = delete;
        TimerQueue& operator=(const TimerQueue&) = delete;

        /**
         * @brief Register a timer.
         * @param delay Time until the returned future becomes ready. Zero or
         *        negative delays yield an already-ready future.
         * @return Future satisfied when the delay has elapsed or the queue stops
         */
        std::future<void> schedule(std::chrono::nanoseconds delay);

        /**
         * @brief Fire every pending timer and stop the worker thread.
         *
         * Timers scheduled after stop() are ready immediately. Safe to call
         * from several threads; every caller returns after the worker exited.
         */
        void stop();

        /**
         * @brief Get the number of timers that have not fired yet.
         */
        size_t getPendingCount() const;

    private:
        void workerFunction();

        std::thread worker_;                                      ///< Timer thread
        std::multimap<clock::time_point, std::promise<void>> timers_; ///< Pending timers by deadline
        mutable std::mutex mutex_;                                ///< Guards timers_
        std::condition_variable condition_;                       ///< Wakes the worker on new timers
        std::atomic<bool> stop_;                                  ///< Stop flag
        std::once_flag stopOnce_;                                 ///< Joins the worker exactly once
    };

} // namespace retrykit
