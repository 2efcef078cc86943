#pragma once

namespace phicore::cozytouch {

// Retry cadence shared by the discovery coordinator and the event tracker:
// min(base * 2^min(failures, maxExponent), maxDelay). No failures means the
// regular interval.
struct BackoffPolicy {
    int baseMs = 30000;
    int maxDelayMs = 900000;
    int maxExponent = 10;

    int delayFor(int consecutiveFailures) const;
};

} // namespace phicore::cozytouch
