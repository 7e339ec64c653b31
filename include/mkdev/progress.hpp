// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 mkdev Contributors


/**
 * @file progress.hpp
 * @brief Progress computation and formatting
 *
 * Pure functions: the copy loop owns a ProgressState value and hands
 * a copy to these functions on every throttle tick.
 */

#ifndef MKDEV_PROGRESS_HPP
#define MKDEV_PROGRESS_HPP

#include <mkdev/fwd.hpp>

#include <cstdint>
#include <string>

namespace mkdev {

/// Transfer state threaded through the copy loop
struct ProgressState {
    uint64_t bytes_copied = 0;
    uint64_t total_size = 0;
    int64_t start_ns = 0;     ///< Monotonic start time
    int64_t last_emit_ns = 0; ///< Monotonic time of the previous emission
};

/// Snapshot handed to progress handlers
struct CopyProgress {
    uint64_t bytes_copied = 0;
    uint64_t total_size = 0;
    double percent = 0.0;   ///< 0-100
    double elapsed_s = 0.0; ///< Since start
    double speed_bps = 0.0; ///< Average since start
    double eta_s = 0.0;     ///< Remaining bytes / speed, 0 if speed is 0
};

/**
 * Check whether a progress emission is due
 * @param state Current state
 * @param now_ns Monotonic time
 * @param interval_ns Throttle interval
 */
[[nodiscard]] bool progress_due(ProgressState state, int64_t now_ns, int64_t interval_ns) noexcept;

/**
 * Compute a progress snapshot
 * @param state Current state
 * @param now_ns Monotonic time
 */
[[nodiscard]] CopyProgress compute_progress(ProgressState state, int64_t now_ns) noexcept;

/**
 * Render a progress line (no carriage return, no newline)
 *
 * Intermediate lines end with the ETA, the final line with the
 * total elapsed time.
 */
[[nodiscard]] std::string format_progress(const CopyProgress &progress, bool final);

/// Format a byte count with binary units ("9.5 MiB")
[[nodiscard]] std::string format_bytes(double bytes);

/// Format a rate with binary units ("812.3 MiB/s")
[[nodiscard]] std::string format_rate(double bytes_per_sec);

} // namespace mkdev

#endif // MKDEV_PROGRESS_HPP
