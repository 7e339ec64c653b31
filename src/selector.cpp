// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 mkdev Contributors

/**
 * @file selector.cpp
 * @brief Transfer buffer size benchmark
 */

#include <mkdev/selector.hpp>
#include <mkdev/buffer.hpp>
#include <mkdev/error.hpp>
#include <mkdev/io.hpp>
#include <mkdev/progress.hpp>

#include "internal.h"
#include "log.h"

#include <algorithm>
#include <cerrno>
#include <unistd.h>

namespace mkdev {

size_t BufferSizeSelector::select(int source_fd, uint64_t total_size) {
    results_.clear();

    uint64_t sample_size = std::min(total_size, opts_.max_sample_size());
    if (sample_size == 0 || opts_.candidates().empty()) {
        detail::log_fmt(LogLevel::Info, "Nothing to benchmark, using default buffer size");
        rewind(source_fd);
        return opts_.default_buffer_size();
    }

    detail::log_fmt(LogLevel::Info, "Testing buffer sizes with %s of data...",
                    format_bytes(static_cast<double>(sample_size)).c_str());

    size_t best_size = opts_.default_buffer_size();
    double best_speed = 0.0;

    try {
        for (size_t buffer_size : opts_.candidates()) {
            double speed = measure(source_fd, buffer_size, sample_size);
            results_.push_back({buffer_size, speed});

            if (speed > best_speed) {
                best_speed = speed;
                best_size = buffer_size;
                detail::log_fmt(LogLevel::Info, "  %s: %s (best so far)",
                                format_bytes(static_cast<double>(buffer_size)).c_str(),
                                format_rate(speed).c_str());
                continue;
            }

            detail::log_fmt(LogLevel::Info, "  %s: %s",
                            format_bytes(static_cast<double>(buffer_size)).c_str(),
                            format_rate(speed).c_str());

            // Throughput is assumed not to recover past a regression
            if (speed < best_speed * opts_.regression_threshold()) {
                break;
            }
        }
    } catch (const BenchmarkError &) {
        if (lseek(source_fd, 0, SEEK_SET) < 0) {
            detail::log_fmt(LogLevel::Warning, "cannot rewind source after failed benchmark");
        }
        throw;
    }

    rewind(source_fd);
    return best_size;
}

double BufferSizeSelector::measure(int source_fd, size_t buffer_size, uint64_t sample_size) {
    rewind(source_fd);

    AlignedBuffer buffer;
    try {
        buffer = AlignedBuffer(buffer_size, opts_.alignment());
    } catch (const Error &e) {
        throw BenchmarkError(e.code(), "benchmark buffer allocation");
    }

    uint64_t done = 0;
    int64_t start = detail::get_time_ns();
    while (done < sample_size) {
        size_t to_read = static_cast<size_t>(std::min<uint64_t>(buffer_size, sample_size - done));
        ssize_t n = io_.read(source_fd, buffer.data(), to_read);
        if (n < 0) {
            throw BenchmarkError(static_cast<int>(-n), "benchmark read");
        }
        if (n == 0) break;
        done += static_cast<uint64_t>(n);
    }
    int64_t elapsed = std::max<int64_t>(detail::get_time_ns() - start, 1);

    return static_cast<double>(done) / detail::ns_to_seconds(elapsed);
}

void BufferSizeSelector::rewind(int source_fd) {
    if (lseek(source_fd, 0, SEEK_SET) < 0) {
        throw BenchmarkError(errno, "benchmark rewind");
    }
}

} // namespace mkdev
