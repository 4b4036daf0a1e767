#include "retrykit/core/clock/wall_clock.hpp"

namespace retrykit {

    std::chrono::system_clock::time_point WallClock::now() const {
        return std::chrono::system_clock::now();
    }

    std::future<void> WallClock::after(std::chrono::nanoseconds delay) {
        return timers_.schedule(delay);
    }

    std::shared_ptr<IClock> wallClock() {
        static std::shared_ptr<IClock> instance = std::make_shared<WallClock>();
        return instance;
    }

}
