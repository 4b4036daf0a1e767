/**
 * @file time.hpp
 * @brief Time utility functions for retrykit.
 *
 * Provides helpers for turning durations into short human readable text
 * for log lines and error messages.
 *
 * @date 2025
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace retrykit {

    namespace detail {
        // Fixed-point value/scale with trailing zeros removed, e.g. (1500, 1000) -> "1.5"
        inline std::string trimmedRatio(std::uint64_t value, std::uint64_t scale) {
            std::string out = std::to_string(value / scale);
            std::uint64_t frac = value % scale;
            if (frac == 0) return out;

            std::string digits;
            for (std::uint64_t s = scale / 10; s > 0; s /= 10) {
                digits += static_cast<char>('0' + (frac / s) % 10);
            }
            while (!digits.empty() && digits.back() == '0') digits.pop_back();
            return out + "." + digits;
        }
    }

    /**
     * @brief Format a duration the way log lines show it.
     *
     * Sub-second values use one unit ("250ms", "1.5us", "42ns"); longer values
     * use hours, minutes and seconds ("2m30s", "1h0m0.5s").
     *
     * @param d Duration to format
     * @return Text such as "2m30s" or "-5ms"
     */
    inline std::string formatDuration(std::chrono::nanoseconds d)
    {
        if (d == std::chrono::nanoseconds::zero()) return "0s";

        const std::int64_t n = d.count();
        const std::string sign = n < 0 ? "-" : "";
        const std::uint64_t u = n < 0 ? 0 - static_cast<std::uint64_t>(n) : static_cast<std::uint64_t>(n);

        constexpr std::uint64_t us = 1'000, ms = 1'000'000, sec = 1'000'000'000;
        if (u < us) return sign + std::to_string(u) + "ns";
        if (u < ms) return sign + detail::trimmedRatio(u, us) + "us";
        if (u < sec) return sign + detail::trimmedRatio(u, ms) + "ms";

        const std::uint64_t hours = u / (3600 * sec);
        const std::uint64_t minutes = (u / (60 * sec)) % 60;
        const std::uint64_t rest = u % (60 * sec);

        std::string out = sign;
        if (hours > 0) out += std::to_string(hours) + "h";
        if (hours > 0 || minutes > 0) out += std::to_string(minutes) + "m";
        out += detail::trimmedRatio(rest, sec) + "s";
        return out;
    }

}
