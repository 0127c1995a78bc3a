#pragma once

#include <chrono>

namespace fleet {

using Clock = std::chrono::system_clock;

// Wall-clock instant recorded when a handler starts or completes
using Timestamp = Clock::time_point;

/**
 * @brief Seconds since the Unix epoch with sub-second precision
 */
inline double toEpochSeconds(Timestamp ts) {
    return std::chrono::duration<double>(ts.time_since_epoch()).count();
}

inline Timestamp fromEpochSeconds(double seconds) {
    return Timestamp(std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds)));
}

} // namespace fleet
