/**
 * @file timer_queue.cpp
 * @brief Implementation of the TimerQueue class.
 *
 * @date 2025
 */
#include "retrykit/core/util/timer_queue.hpp"
#include "retrykit/core/util/logger.hpp"

namespace retrykit {

    namespace {
        std::future<void> readyFuture() {
            std::promise<void> p;
            p.set_value();
            return p.get_future();
        }
    }

    TimerQueue::TimerQueue()
        : stop_(false) {
        worker_ = std::thread(&TimerQueue::workerFunction, this);
        LOG_DEBUG("[TimerQueue] started");
    }

    TimerQueue::~TimerQueue() {
        stop();
    }

    std::future<void> TimerQueue::schedule(std::chrono::nanoseconds delay) {
        if (delay <= std::chrono::nanoseconds::zero())
            return readyFuture();

        std::future<void> result;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_)
                return readyFuture();

            // Saturate: a delay near nanoseconds::max() would wrap the deadline into the past
            const auto now = clock::now();
            const auto wait = std::chrono::duration_cast<clock::duration>(delay);
            const auto deadline = wait >= clock::time_point::max() - now
                ? clock::time_point::max()
                : now + wait;
            auto it = timers_.emplace(deadline, std::promise<void>{});
            result = it->second.get_future();
        }

        condition_.notify_one();
        return result;
    }

    void TimerQueue::stop() {
        // Concurrent callers block until the first one has joined the worker
        std::call_once(stopOnce_, [this] {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                stop_ = true;
            }

            condition_.notify_all();

            if (worker_.joinable()) {
                worker_.join();
                LOG_DEBUG("[TimerQueue] stopped");
            }
        });
    }

    size_t TimerQueue::getPendingCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return timers_.size();
    }

    void TimerQueue::workerFunction() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (true) {
            if (stop_) {
                // Nobody may be left waiting on a timer that will never fire
                for (auto& [deadline, promise] : timers_)
                    promise.set_value();
                timers_.clear();
                return;
            }

            if (timers_.empty()) {
                condition_.wait(lock, [this] { return stop_ || !timers_.empty(); });
                continue;
            }

            auto next = timers_.begin()->first;
            if (clock::now() < next) {
                // Woken early by a new, possibly earlier, timer or by stop()
                condition_.wait_until(lock, next);
                continue;
            }

            auto due = timers_.upper_bound(clock::now());
            for (auto it = timers_.begin(); it != due; ++it)
                it->second.set_value();
            timers_.erase(timers_.begin(), due);
        }
    }

} // namespace retrykit
