// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 mkdev Contributors


/**
 * @file selector.hpp
 * @brief Transfer buffer size selection
 *
 * Picks a buffer size by timing sequential reads of the source with
 * each candidate size in ascending order. Only the source is touched:
 * measuring writes would need aligned scratch space on the target and
 * would interact with O_DIRECT, so the result optimizes source read
 * throughput, which is used as an approximation of the whole copy.
 *
 * Candidates are tested until one measures below
 * regression_threshold() of the best seen so far; larger sizes are
 * assumed not to do better. This is a greedy heuristic and may miss
 * a better size past a local dip.
 */

#ifndef MKDEV_SELECTOR_HPP
#define MKDEV_SELECTOR_HPP

#include <mkdev/fwd.hpp>
#include <mkdev/options.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace mkdev {

/// One measured candidate
struct BenchmarkResult {
    size_t buffer_size = 0;
    double throughput_bps = 0.0; ///< Bytes per second
};

/**
 * Read-only buffer size benchmark
 *
 * Example:
 * @code
 * mkdev::BufferSizeSelector selector(*io, opts);
 * size_t buffer_size;
 * try {
 *     buffer_size = selector.select(source.file.get(), source.size);
 * } catch (const mkdev::BenchmarkError &e) {
 *     buffer_size = opts.default_buffer_size();
 * }
 * @endcode
 */
class BufferSizeSelector {
  public:
    BufferSizeSelector(IoBackend &io, const Options &opts) : io_(io), opts_(opts) {}

    /**
     * Run the benchmark
     *
     * The source position is 0 when this returns or throws.
     *
     * @param source_fd Source descriptor (read and lseek only)
     * @param total_size Source size in bytes
     * @return Fastest measured buffer size, or the default size for an
     *         empty source
     * @throws BenchmarkError on any read or seek error
     */
    [[nodiscard]] size_t select(int source_fd, uint64_t total_size);

    /// Candidates measured by the last select() call, in test order
    [[nodiscard]] const std::vector<BenchmarkResult> &results() const noexcept {
        return results_;
    }

  private:
    double measure(int source_fd, size_t buffer_size, uint64_t sample_size);
    void rewind(int source_fd);

    IoBackend &io_;
    const Options &opts_;
    std::vector<BenchmarkResult> results_;
};

} // namespace mkdev

#endif // MKDEV_SELECTOR_HPP
