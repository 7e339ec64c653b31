// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 mkdev Contributors


/**
 * @file copy.hpp
 * @brief Streaming copy engine
 */

#ifndef MKDEV_COPY_HPP
#define MKDEV_COPY_HPP

#include <mkdev/fwd.hpp>
#include <mkdev/device.hpp>
#include <mkdev/options.hpp>
#include <mkdev/progress.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>

namespace mkdev {

/// One invocation's transfer parameters, fixed once created
struct CopyTask {
    const std::string source;
    const std::string target;
    const uint64_t total_size;
    const size_t buffer_size;
};

/// Result of a successful copy
struct CopySummary {
    uint64_t bytes_copied = 0;
    double elapsed_s = 0.0;
    double average_bps = 0.0;
    size_t buffer_size = 0;
};

/**
 * Progress handler callback type
 *
 * Called on the copying thread. Anything it throws is caught and
 * logged at Debug level; it never fails the copy.
 */
using ProgressHandler = std::function<void(const CopyProgress &, bool final)>;

/**
 * Single-threaded source to target copier
 *
 * One aligned buffer is reused for every transfer. Every byte read is
 * written before the next read; the target is synced exactly once,
 * after the last write, and a copy only returns once that sync
 * succeeded.
 *
 * Example:
 * @code
 * mkdev::CopyEngine engine(*io, opts);
 * engine.on_progress([](const mkdev::CopyProgress &p, bool final) { ... });
 * auto summary = engine.copy(source.file.get(), target.file.get(), source.size,
 *                            buffer_size, target.mode);
 * @endcode
 */
class CopyEngine {
  public:
    CopyEngine(IoBackend &io, const Options &opts) : io_(io), opts_(opts) {}

    /// Install a progress handler (replaces any previous one)
    void on_progress(ProgressHandler handler) { progress_ = std::move(handler); }

    /**
     * Copy total_size bytes from source_fd to target_fd
     *
     * Reads stop early when the source reports end of file.
     *
     * @param source_fd Source descriptor, positioned at 0
     * @param target_fd Target descriptor, positioned at 0
     * @param total_size Bytes to copy
     * @param buffer_size Bytes per read (> 0)
     * @param mode Target open mode; in Direct mode an unaligned tail
     *             is written after clearing O_DIRECT on target_fd
     * @return Summary of the transfer
     * @throws CopyError on read, write (including short write) or sync failure
     * @throws Error if buffer_size is 0 or the buffer cannot be allocated
     */
    CopySummary copy(int source_fd, int target_fd, uint64_t total_size, size_t buffer_size,
                     OpenMode mode = OpenMode::Buffered);

  private:
    void emit(const ProgressState &state, int64_t now_ns, bool final);

    IoBackend &io_;
    const Options &opts_;
    ProgressHandler progress_;
};

} // namespace mkdev

#endif // MKDEV_COPY_HPP
