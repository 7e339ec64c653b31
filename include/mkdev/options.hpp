// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 mkdev Contributors


/**
 * @file options.hpp
 * @brief Options builder class for mkdev
 */

#ifndef MKDEV_OPTIONS_HPP
#define MKDEV_OPTIONS_HPP

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace mkdev {

inline constexpr size_t MiB = 1024 * 1024;

/** Alignment boundary for direct I/O buffers and transfer sizes */
inline constexpr size_t DEFAULT_ALIGNMENT = 4096;

/** Buffer size used when no override is given and the benchmark fails */
inline constexpr size_t DEFAULT_BUFFER_SIZE = 16 * MiB;

/** Upper bound on bytes read per benchmark candidate */
inline constexpr uint64_t DEFAULT_MAX_SAMPLE_SIZE = 64 * MiB;

/** Stop benchmarking once a candidate falls below this share of the best */
inline constexpr double DEFAULT_REGRESSION_THRESHOLD = 0.95;

/** Minimum time between two progress emissions */
inline constexpr int DEFAULT_PROGRESS_INTERVAL_MS = 100;

/**
 * Copy and benchmark configuration
 *
 * Uses builder pattern for fluent configuration.
 *
 * Example:
 * @code
 * mkdev::Options opts;
 * opts.regression_threshold(0.90)
 *     .progress_interval_ms(250)
 *     .direct_io(false);
 * @endcode
 */
class Options {
  public:
    /**
     * Initialize with default options
     */
    Options() : candidates_{2 * MiB, 4 * MiB, 8 * MiB, 16 * MiB, 32 * MiB, 64 * MiB} {}

    /**
     * Set alignment boundary
     * @param bytes Alignment in bytes (default: 4096, must be a power of two)
     * @return Reference to this for chaining
     */
    Options &alignment(size_t bytes) noexcept {
        alignment_ = bytes;
        return *this;
    }

    /**
     * Set fallback buffer size
     * @param bytes Buffer size used when benchmarking is skipped or fails (default: 16 MiB)
     * @return Reference to this for chaining
     */
    Options &default_buffer_size(size_t bytes) noexcept {
        default_buffer_size_ = bytes;
        return *this;
    }

    /**
     * Set benchmark candidate sizes
     * @param sizes Buffer sizes to test, ascending
     * @return Reference to this for chaining
     */
    Options &candidates(std::vector<size_t> sizes) {
        candidates_ = std::move(sizes);
        return *this;
    }

    /**
     * Set benchmark sample cap
     * @param bytes Maximum bytes read per candidate (default: 64 MiB)
     * @return Reference to this for chaining
     */
    Options &max_sample_size(uint64_t bytes) noexcept {
        max_sample_size_ = bytes;
        return *this;
    }

    /**
     * Set early-stop threshold
     * @param ratio Share of the best throughput below which testing stops (default: 0.95)
     * @return Reference to this for chaining
     */
    Options &regression_threshold(double ratio) noexcept {
        regression_threshold_ = ratio;
        return *this;
    }

    /**
     * Set progress throttle
     * @param ms Minimum milliseconds between progress emissions (0 = every transfer)
     * @return Reference to this for chaining
     */
    Options &progress_interval_ms(int ms) noexcept {
        progress_interval_ms_ = ms;
        return *this;
    }

    /**
     * Allow direct I/O on the target
     * @param enable False to open the target in buffered mode only
     * @return Reference to this for chaining
     */
    Options &direct_io(bool enable) noexcept {
        direct_io_ = enable;
        return *this;
    }

    // Getters
    [[nodiscard]] size_t alignment() const noexcept { return alignment_; }
    [[nodiscard]] size_t default_buffer_size() const noexcept { return default_buffer_size_; }
    [[nodiscard]] const std::vector<size_t> &candidates() const noexcept { return candidates_; }
    [[nodiscard]] uint64_t max_sample_size() const noexcept { return max_sample_size_; }
    [[nodiscard]] double regression_threshold() const noexcept { return regression_threshold_; }
    [[nodiscard]] int progress_interval_ms() const noexcept { return progress_interval_ms_; }
    [[nodiscard]] bool direct_io() const noexcept { return direct_io_; }

  private:
    size_t alignment_ = DEFAULT_ALIGNMENT;
    size_t default_buffer_size_ = DEFAULT_BUFFER_SIZE;
    std::vector<size_t> candidates_;
    uint64_t max_sample_size_ = DEFAULT_MAX_SAMPLE_SIZE;
    double regression_threshold_ = DEFAULT_REGRESSION_THRESHOLD;
    int progress_interval_ms_ = DEFAULT_PROGRESS_INTERVAL_MS;
    bool direct_io_ = true;
};

} // namespace mkdev

#endif // MKDEV_OPTIONS_HPP
