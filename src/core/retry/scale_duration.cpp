#include "retrykit/core/retry/scale_duration.hpp"
#include <cmath>
#include <limits>

namespace retrykit {

    std::chrono::nanoseconds scaleDuration(std::chrono::nanoseconds current,
                                           std::chrono::nanoseconds max,
                                           double factor)
    {
        using ns = std::chrono::nanoseconds;

        const double scaled = static_cast<double>(current.count()) * std::fabs(factor);
        const bool hasMax = max > ns::zero();

        // NaN factor, or zero times an infinite one
        if (std::isnan(scaled)) return ns::zero();

        if (hasMax && scaled > static_cast<double>(max.count()))
            return max;

        // Saturate instead of overflowing the integer representation
        constexpr auto hi = std::numeric_limits<ns::rep>::max();
        constexpr auto lo = std::numeric_limits<ns::rep>::min();
        if (!(scaled < static_cast<double>(hi))) return ns(hi);
        if (scaled <= static_cast<double>(lo)) return ns(lo);

        return ns(static_cast<ns::rep>(scaled));
    }

}
