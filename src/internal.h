/**
 * @file internal.h
 * @brief Shared internal utilities
 *
 * Internal header - not part of public API.
 */

#ifndef MKDEV_INTERNAL_H
#define MKDEV_INTERNAL_H

#include <cstdint>
#include <time.h>

namespace mkdev::detail {

/**
 * Get monotonic time in nanoseconds.
 *
 * Uses CLOCK_MONOTONIC for consistent timing that is immune to
 * system clock adjustments.
 *
 * @return Current time in nanoseconds
 */
inline int64_t get_time_ns() noexcept {
    struct timespec ts;
    if (clock_gettime(CLOCK_MONOTONIC, &ts) != 0) {
        return 0; // Should never happen for CLOCK_MONOTONIC on Linux
    }
    return static_cast<int64_t>(ts.tv_sec) * 1000000000LL + ts.tv_nsec;
}

inline double ns_to_seconds(int64_t ns) noexcept {
    return static_cast<double>(ns) / 1e9;
}

} // namespace mkdev::detail

#endif // MKDEV_INTERNAL_H
