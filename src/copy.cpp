// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 mkdev Contributors

/**
 * @file copy.cpp
 * @brief Streaming copy engine
 */

#include <mkdev/copy.hpp>
#include <mkdev/buffer.hpp>
#include <mkdev/error.hpp>
#include <mkdev/io.hpp>

#include "internal.h"
#include "log.h"

#include <algorithm>
#include <cerrno>
#include <exception>
#include <fcntl.h>
#include <string>

namespace mkdev {

namespace {

// O_DIRECT transfers must be a multiple of the logical block size. Drop
// O_DIRECT (keeping O_SYNC) so an unaligned tail can still be written.
void clear_direct(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags < 0 || fcntl(fd, F_SETFL, flags & ~O_DIRECT) < 0) {
        throw_errno("fcntl");
    }
}

} // namespace

CopySummary CopyEngine::copy(int source_fd, int target_fd, uint64_t total_size,
                             size_t buffer_size, OpenMode mode) {
    if (buffer_size == 0) {
        throw Error(EINVAL, "buffer size must be positive");
    }

    AlignedBuffer buffer(buffer_size, opts_.alignment());
    bool direct = (mode == OpenMode::Direct);
    const int64_t interval_ns = static_cast<int64_t>(opts_.progress_interval_ms()) * 1000000LL;

    ProgressState state;
    state.total_size = total_size;
    state.start_ns = detail::get_time_ns();
    state.last_emit_ns = state.start_ns;

    while (state.bytes_copied < total_size) {
        size_t to_read =
            static_cast<size_t>(std::min<uint64_t>(buffer_size, total_size - state.bytes_copied));

        ssize_t n = io_.read(source_fd, buffer.data(), to_read);
        if (n < 0) {
            throw CopyError(CopyStage::Read, static_cast<int>(-n), "read from source",
                            state.bytes_copied);
        }
        if (n == 0) {
            detail::log_fmt(LogLevel::Warning,
                            "source ended after %llu of %llu bytes",
                            static_cast<unsigned long long>(state.bytes_copied),
                            static_cast<unsigned long long>(total_size));
            break;
        }

        size_t len = static_cast<size_t>(n);
        if (direct && !is_aligned(len, opts_.alignment())) {
            try {
                clear_direct(target_fd);
            } catch (const Error &e) {
                throw CopyError(CopyStage::Write, e.code(), "clear O_DIRECT on target",
                                state.bytes_copied);
            }
            direct = false;
            detail::log_fmt(LogLevel::Debug, "unaligned transfer of %zu bytes, O_DIRECT cleared",
                            len);
        }

        ssize_t written = io_.write(target_fd, buffer.data(), len);
        if (written < 0) {
            throw CopyError(CopyStage::Write, static_cast<int>(-written), "write to target",
                            state.bytes_copied);
        }
        if (static_cast<size_t>(written) != len) {
            throw CopyError(CopyStage::Write, EIO,
                            "short write to target (" + std::to_string(written) + " of " +
                                std::to_string(len) + " bytes)",
                            state.bytes_copied);
        }

        state.bytes_copied += len;

        int64_t now = detail::get_time_ns();
        if (progress_due(state, now, interval_ns)) {
            emit(state, now, false);
            state.last_emit_ns = now;
        }
    }

    // Every byte was written straight from the transfer buffer, so there
    // is nothing left to flush in-process; sync commits it to the device.
    int rc = io_.sync(target_fd);
    if (rc < 0) {
        throw CopyError(CopyStage::Sync, -rc, "sync target", state.bytes_copied);
    }

    int64_t end = detail::get_time_ns();
    emit(state, end, true);

    CopySummary summary;
    summary.bytes_copied = state.bytes_copied;
    summary.elapsed_s = detail::ns_to_seconds(end - state.start_ns);
    summary.average_bps =
        summary.elapsed_s > 0 ? static_cast<double>(summary.bytes_copied) / summary.elapsed_s : 0;
    summary.buffer_size = buffer_size;
    return summary;
}

void CopyEngine::emit(const ProgressState &state, int64_t now_ns, bool final) {
    if (!progress_) return;

    try {
        progress_(compute_progress(state, now_ns), final);
    } catch (const std::exception &e) {
        // Reporting must never fail the transfer
        detail::log_fmt(LogLevel::Debug, "progress handler failed: %s", e.what());
    } catch (...) {
        detail::log_fmt(LogLevel::Debug, "progress handler failed: unknown exception");
    }
}

} // namespace mkdev
