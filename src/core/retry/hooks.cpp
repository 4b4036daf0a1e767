#include "retrykit/core/retry/hooks.hpp"
#include "retrykit/core/util/error_types.hpp"

namespace retrykit {

    NotifyFunc logAttempts(std::string label, LogLevel level) {
        return [label = std::move(label), level](const std::exception_ptr& err, std::int64_t attempt) {
            Logger::inst().log(level, label + ": attempt " + std::to_string(attempt)
                                      + " failed: " + describeError(err));
        };
    }

    NotifyFunc chainNotify(NotifyFunc first, NotifyFunc second) {
        if (!first) return second;
        if (!second) return first;
        return [first = std::move(first), second = std::move(second)](const std::exception_ptr& err, std::int64_t attempt) {
            first(err, attempt);
            second(err, attempt);
        };
    }

}
