#pragma once
/**
 * @file backoff.h
 * @brief Exponential backoff policy shared by reconnection and resync
 */

#include "nightfall/core/types.h"
#include <limits>

namespace nightfall::core {

/**
 * @brief Delay before a 1-based attempt: min(base * 2^(attempt-1), cap)
 *
 * Attempt 0 yields no delay.
 */
inline Duration compute_backoff_delay(UInt32 attempt, Duration base, Duration cap) {
    if (attempt == 0) {
        return Duration(0);
    }
    if (base.count() <= 0) {
        return Duration(0);
    }
    // Anything that would not fit in 63 bits is past every cap
    UInt32 exponent = attempt - 1;
    if (exponent >= 62 || base.count() > (std::numeric_limits<Int64>::max() >> exponent)) {
        return cap;
    }
    Int64 delay = base.count() << exponent;
    if (delay > cap.count()) {
        return cap;
    }
    return Duration(delay);
}

} // namespace nightfall::core
