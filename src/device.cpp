// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 mkdev Contributors

/**
 * @file device.cpp
 * @brief Source and target opening
 */

#include <mkdev/device.hpp>
#include <mkdev/io.hpp>

#include "log.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <linux/fs.h>
#include <sys/ioctl.h>
#include <sys/stat.h>

namespace mkdev {

namespace {

constexpr int DIRECT_FLAGS = O_WRONLY | O_DIRECT | O_SYNC | O_EXCL;
constexpr int BUFFERED_FLAGS = O_WRONLY;

} // namespace

SourceFile open_source(const std::string &path, IoBackend &io) {
    int fd = io.open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        throw OpenError(-fd, path, "cannot open source file");
    }

    SourceFile source;
    source.file.reset(fd);

    struct stat st;
    if (fstat(fd, &st) != 0) {
        throw OpenError(errno, path, "cannot read source metadata");
    }

    if (S_ISDIR(st.st_mode)) {
        throw OpenError(EISDIR, path, "source is a directory");
    }

    if (S_ISBLK(st.st_mode)) {
        uint64_t bytes = 0;
        if (ioctl(fd, BLKGETSIZE64, &bytes) != 0) {
            throw OpenError(errno, path, "cannot read source device size");
        }
        source.size = bytes;
    } else {
        source.size = static_cast<uint64_t>(st.st_size);
    }

    return source;
}

TargetDevice open_target(const std::string &path, IoBackend &io, const Options &opts) {
    TargetDevice target;

    if (opts.direct_io()) {
        int fd = io.open(path.c_str(), DIRECT_FLAGS);
        if (fd >= 0) {
            target.file.reset(fd);
            target.mode = OpenMode::Direct;
            detail::log_fmt(LogLevel::Notice, "Using %s I/O mode for '%s'",
                            open_mode_name(target.mode), path.c_str());
            return target;
        }
        detail::log_fmt(LogLevel::Debug, "direct open of '%s' failed: %s", path.c_str(),
                        strerror(-fd));
    }

    int fd = io.open(path.c_str(), BUFFERED_FLAGS);
    if (fd < 0) {
        throw OpenError(-fd, path, "cannot open target device");
    }
    target.file.reset(fd);
    target.mode = OpenMode::Buffered;

    detail::log_fmt(LogLevel::Notice, "Using %s I/O mode for '%s'%s", open_mode_name(target.mode),
                    path.c_str(), opts.direct_io() ? " (direct I/O not available)" : "");
    return target;
}

} // namespace mkdev
