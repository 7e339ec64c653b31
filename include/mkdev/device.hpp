// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 mkdev Contributors


/**
 * @file device.hpp
 * @brief Source and target opening
 */

#ifndef MKDEV_DEVICE_HPP
#define MKDEV_DEVICE_HPP

#include <mkdev/fwd.hpp>
#include <mkdev/error.hpp>
#include <mkdev/options.hpp>

#include <cstdint>
#include <string>
#include <unistd.h>

namespace mkdev {

/**
 * Owning file descriptor
 *
 * Closes the descriptor on destruction. Move-only (cannot be copied).
 */
class FileHandle {
  public:
    FileHandle() noexcept = default;
    explicit FileHandle(int fd) noexcept : fd_(fd) {}

    FileHandle(FileHandle &&other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

    FileHandle &operator=(FileHandle &&other) noexcept {
        if (this != &other) {
            reset(other.fd_);
            other.fd_ = -1;
        }
        return *this;
    }

    // Non-copyable
    FileHandle(const FileHandle &) = delete;
    FileHandle &operator=(const FileHandle &) = delete;

    ~FileHandle() { reset(); }

    /// Raw descriptor (-1 if empty)
    [[nodiscard]] int get() const noexcept { return fd_; }

    /// Give up ownership without closing
    [[nodiscard]] int release() noexcept {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    /// Close the current descriptor and take ownership of another
    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

    [[nodiscard]] explicit operator bool() const noexcept { return fd_ >= 0; }

  private:
    int fd_ = -1;
};

/// How the target was opened
enum class OpenMode {
    Direct,  ///< O_DIRECT | O_SYNC, page cache bypassed
    Buffered ///< Plain buffered writes
};

/// Return a short name for the given mode ("direct", "buffered")
[[nodiscard]] inline const char *open_mode_name(OpenMode mode) noexcept {
    return mode == OpenMode::Direct ? "direct" : "buffered";
}

/// Opened source with its size fixed at open time
struct SourceFile {
    FileHandle file;
    uint64_t size = 0;
};

/// Opened target
struct TargetDevice {
    FileHandle file;
    OpenMode mode = OpenMode::Buffered;
};

/**
 * Open the source for reading
 *
 * Regular files are sized with fstat(), block devices with the
 * BLKGETSIZE64 ioctl.
 *
 * @param path Source path
 * @param io Backend performing the open
 * @throws OpenError if the path cannot be opened or sized, or is a directory
 */
[[nodiscard]] SourceFile open_source(const std::string &path, IoBackend &io);

/**
 * Open the target for writing
 *
 * Tries an exclusive O_DIRECT | O_SYNC open first (unless disabled in
 * the options) and falls back to a plain O_WRONLY open on any failure.
 * The target is never created. The selected mode is logged at Notice
 * level.
 *
 * @param path Target path (device node or existing file)
 * @param io Backend performing the open
 * @param opts direct_io() controls the first attempt
 * @throws OpenError if the buffered open fails as well
 */
[[nodiscard]] TargetDevice open_target(const std::string &path, IoBackend &io,
                                       const Options &opts = Options());

} // namespace mkdev

#endif // MKDEV_DEVICE_HPP
