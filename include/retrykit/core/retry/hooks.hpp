/**
 * @file hooks.hpp
 * @brief Ready-made fatal classifiers and notify hooks.
 *
 * @date 2025
 */
#pragma once
#include "retrykit/core/retry/call_args.hpp"
#include "retrykit/core/util/logger.hpp"
#include <string>

namespace retrykit {

    /**
     * @brief Build a fatal classifier matching errors of type E or derived types.
     *
     * @code
     * args.isFatalError = fatalOn<std::invalid_argument>();
     * @endcode
     */
    template<typename E>
    FatalErrorFunc fatalOn() {
        return [](const std::exception_ptr& err) {
            if (!err) return false;
            try {
                std::rethrow_exception(err);
            }
            catch (const E&) {
                return true;
            }
            catch (...) {
                return false;
            }
        };
    }

    /**
     * @brief Build a notify hook that logs every failed attempt.
     *
     * Lines read "<label>: attempt <n> failed: <error text>".
     *
     * @param label Prefix identifying the session in the log
     * @param level Level the lines are logged at
     */
    NotifyFunc logAttempts(std::string label, LogLevel level = LogLevel::Warn);

    /**
     * @brief Combine two notify hooks; either may be empty.
     */
    NotifyFunc chainNotify(NotifyFunc first, NotifyFunc second);

}
