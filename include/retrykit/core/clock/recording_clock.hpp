/**
 * @file recording_clock.hpp
 * @brief Test double clock that records delays instead of waiting.
 *
 * Useful for testing code that embeds retry sessions: every requested delay
 * is appended to delays() and the returned future is already ready, so a
 * session with minute-long delays finishes immediately.
 *
 * @date 2025
 */
#pragma once
#include "retrykit/core/interfaces/IClock.hpp"
#include <functional>
#include <mutex>
#include <vector>

namespace retrykit {

    /**
     * @class RecordingClock
     * @brief IClock implementation with virtual time.
     *
     * now() starts at the given origin and advances by every delay passed to
     * after(). Thread-safe.
     */
    class RecordingClock : public IClock {
    public:
        using AfterHook = std::function<void(std::chrono::nanoseconds)>;

        explicit RecordingClock(std::chrono::system_clock::time_point origin = {})
            : now_(origin) {}

        std::chrono::system_clock::time_point now() const override {
            std::lock_guard<std::mutex> lk(m_);
            return now_;
        }

        std::future<void> after(std::chrono::nanoseconds delay) override {
            AfterHook hook;
            {
                std::lock_guard<std::mutex> lk(m_);
                delays_.push_back(delay);
                const auto step = std::chrono::duration_cast<std::chrono::system_clock::duration>(delay);
                now_ = step >= std::chrono::system_clock::time_point::max() - now_
                    ? std::chrono::system_clock::time_point::max()
                    : now_ + step;
                hook = onAfter_;
            }
            if (hook) hook(delay);

            std::promise<void> p;
            p.set_value();
            return p.get_future();
        }

        /**
         * @brief Set a callback run on every after() call, before it returns.
         */
        void setOnAfter(AfterHook hook) {
            std::lock_guard<std::mutex> lk(m_);
            onAfter_ = std::move(hook);
        }

        /**
         * @brief Copy of the delays requested so far, in order.
         */
        std::vector<std::chrono::nanoseconds> delays() const {
            std::lock_guard<std::mutex> lk(m_);
            return delays_;
        }

        /**
         * @brief Sum of the delays requested so far.
         */
        std::chrono::nanoseconds totalDelay() const {
            std::lock_guard<std::mutex> lk(m_);
            std::chrono::nanoseconds sum{ 0 };
            for (auto d : delays_) sum += d;
            return sum;
        }

    private:
        mutable std::mutex m_;
        std::chrono::system_clock::time_point now_;
        std::vector<std::chrono::nanoseconds> delays_;
        AfterHook onAfter_;
    };

}
