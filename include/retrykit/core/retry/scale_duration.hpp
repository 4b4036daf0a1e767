/**
 * @file scale_duration.hpp
 * @brief Backoff delay scaling.
 *
 * @date 2025
 */
#pragma once
#include <chrono>

namespace retrykit {

    /**
     * @brief Compute the next backoff delay.
     *
     * The factor's sign is ignored, so -2 behaves like 2. The product is
     * computed in floating point and truncated to nanoseconds, which lets
     * fractional factors work (1min * 2.5 = 2min30s). Factors below one shrink
     * the delay and a factor of zero yields zero.
     *
     * @param current Current delay
     * @param max Ceiling for the result; zero or negative means no ceiling
     * @param factor Multiplier applied to @p current
     * @return The scaled delay, clamped to @p max when one is set
     */
    std::chrono::nanoseconds scaleDuration(std::chrono::nanoseconds current,
                                           std::chrono::nanoseconds max,
                                           double factor);

}
