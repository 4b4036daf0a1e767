#include "retrykit/core/retry/call_args.hpp"
#include "retrykit/core/clock/wall_clock.hpp"
#include "retrykit/core/util/error_types.hpp"
#include "retrykit/core/util/time.hpp"
#include <cmath>
#include <sstream>

namespace retrykit {

    namespace {
        std::string formatFactor(double factor) {
            std::ostringstream os;
            os << factor;
            return os.str();
        }
    }

    RetryPolicy validate(const CallArgs& args) {
        if (!args.func)
            throw InvalidConfiguration("func", "missing operation");

        if (!args.attempts || (args.attempts->isBounded() && args.attempts->limit() < 1))
            throw InvalidConfiguration("attempts", "missing attempt budget");

        if (!args.delay)
            throw InvalidConfiguration("delay", "missing delay");
        if (*args.delay < std::chrono::nanoseconds::zero())
            throw InvalidConfiguration("delay", "invalid delay of " + formatDuration(*args.delay));

        // !(x >= 1) also rejects NaN
        if (args.backoffFactor && !(*args.backoffFactor >= 1.0))
            throw InvalidConfiguration("backoffFactor",
                "invalid backoff factor of " + formatFactor(*args.backoffFactor));

        RetryPolicy policy;
        policy.func_ = args.func;
        policy.attempts_ = *args.attempts;
        policy.delay_ = *args.delay;
        policy.backoffFactor_ = args.backoffFactor.value_or(1.0);
        if (args.maxDelay > std::chrono::nanoseconds::zero())
            policy.maxDelay_ = args.maxDelay;
        policy.isFatalError_ = args.isFatalError;
        policy.notifyFunc_ = args.notifyFunc;
        policy.stop_ = args.stop;
        policy.clock_ = args.clock ? args.clock : wallClock();
        return policy;
    }

}
