/**
 * @file clock.h
 * @brief Injectable wall clock
 *
 * Services take a Clock instead of calling time() so tests can move time
 * forward (expiry, key rotation, CRL refresh).
 */

#pragma once

#include <ctime>
#include <functional>

namespace common {

/// @brief Returns the current time as Unix seconds
using Clock = std::function<std::time_t()>;

inline Clock systemClock() {
    return [] { return std::time(nullptr); };
}

} // namespace common
