#include "cozytouch_backoff.h"

#include <algorithm>
#include <cstdint>

namespace phicore::cozytouch {

int BackoffPolicy::delayFor(int consecutiveFailures) const
{
    const int base = std::max(1, baseMs);
    const int cap = std::max(base, maxDelayMs);
    if (consecutiveFailures <= 0)
        return base;

    const int exponent = std::clamp(consecutiveFailures, 0, std::clamp(maxExponent, 0, 30));
    const std::int64_t delay = static_cast<std::int64_t>(base) << exponent;
    return static_cast<int>(std::min<std::int64_t>(delay, cap));
}

} // namespace phicore::cozytouch
