// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 mkdev Contributors

/**
 * @file progress.cpp
 * @brief Progress computation and formatting
 */

#include <mkdev/progress.hpp>

#include "internal.h"

#include <cstdio>

namespace mkdev {

namespace {

constexpr int BAR_WIDTH = 30;

std::string format_duration(double seconds) {
    if (seconds < 0) seconds = 0;
    int mins = static_cast<int>(seconds / 60.0);
    int secs = static_cast<int>(seconds) % 60;
    char buf[32];
    snprintf(buf, sizeof(buf), "%d:%02d", mins, secs);
    return buf;
}

} // namespace

std::string format_bytes(double bytes) {
    char buf[32];
    if (bytes >= 1024.0 * 1024.0 * 1024.0)
        snprintf(buf, sizeof(buf), "%.1f GiB", bytes / (1024.0 * 1024.0 * 1024.0));
    else if (bytes >= 1024.0 * 1024.0) snprintf(buf, sizeof(buf), "%.1f MiB", bytes / (1024.0 * 1024.0));
    else if (bytes >= 1024.0) snprintf(buf, sizeof(buf), "%.1f KiB", bytes / 1024.0);
    else snprintf(buf, sizeof(buf), "%.0f B", bytes);
    return buf;
}

std::string format_rate(double bps) {
    char buf[32];
    if (bps >= 1024.0 * 1024.0 * 1024.0)
        snprintf(buf, sizeof(buf), "%.1f GiB/s", bps / (1024.0 * 1024.0 * 1024.0));
    else if (bps >= 1024.0 * 1024.0) snprintf(buf, sizeof(buf), "%.1f MiB/s", bps / (1024.0 * 1024.0));
    else if (bps >= 1024.0) snprintf(buf, sizeof(buf), "%.1f KiB/s", bps / 1024.0);
    else snprintf(buf, sizeof(buf), "%.0f B/s", bps);
    return buf;
}

bool progress_due(ProgressState state, int64_t now_ns, int64_t interval_ns) noexcept {
    return now_ns - state.last_emit_ns >= interval_ns;
}

CopyProgress compute_progress(ProgressState state, int64_t now_ns) noexcept {
    CopyProgress p;
    p.bytes_copied = state.bytes_copied;
    p.total_size = state.total_size;
    p.elapsed_s = detail::ns_to_seconds(now_ns - state.start_ns);

    double done = static_cast<double>(state.bytes_copied);
    double total = static_cast<double>(state.total_size);
    p.percent = (total > 0) ? done / total * 100.0 : 100.0;
    p.speed_bps = (p.elapsed_s > 0) ? done / p.elapsed_s : 0.0;

    if (p.speed_bps > 0 && total > done) {
        p.eta_s = (total - done) / p.speed_bps;
    }
    return p;
}

std::string format_progress(const CopyProgress &progress, bool final) {
    int filled = static_cast<int>(progress.percent / 100.0 * BAR_WIDTH);
    if (filled > BAR_WIDTH) filled = BAR_WIDTH;
    if (filled < 0) filled = 0;

    std::string bar(static_cast<size_t>(filled), '=');
    if (filled < BAR_WIDTH) {
        bar += '>';
        bar.append(static_cast<size_t>(BAR_WIDTH - filled - 1), ' ');
    }

    std::string tail;
    if (final) {
        char secs[32];
        snprintf(secs, sizeof(secs), "%.1fs", progress.elapsed_s);
        tail = "avg " + format_rate(progress.speed_bps) + "  in " + secs;
    } else {
        tail = format_rate(progress.speed_bps) + "  ETA " + format_duration(progress.eta_s);
    }

    char line[192];
    snprintf(line, sizeof(line), "  %s / %s  [%s]  %3.0f%%  %s   ",
             format_bytes(static_cast<double>(progress.bytes_copied)).c_str(),
             format_bytes(static_cast<double>(progress.total_size)).c_str(), bar.c_str(),
             progress.percent, tail.c_str());
    return line;
}

} // namespace mkdev
