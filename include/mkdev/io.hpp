// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 mkdev Contributors


/**
 * @file io.hpp
 * @brief Blocking I/O backends
 *
 * Every open, read, write and sync performed by mkdev goes through an
 * IoBackend. Two implementations ship with the library:
 *
 * - system calls (open/read/write/fsync), the default
 * - io_uring, one request in flight at a time, each call blocking
 *   until its completion is reaped
 *
 * Results follow the io_uring completion convention: a non-negative
 * value on success, a negated errno value on failure. Backends never
 * throw from I/O calls and never retry.
 */

#ifndef MKDEV_IO_HPP
#define MKDEV_IO_HPP

#include <mkdev/fwd.hpp>

#include <cstddef>
#include <memory>
#include <sys/types.h>

namespace mkdev {

/**
 * Blocking I/O interface
 *
 * Reads and writes use and advance the descriptor's file position.
 */
class IoBackend {
  public:
    virtual ~IoBackend() = default;

    /**
     * Open a path
     * @return File descriptor, or -errno
     */
    [[nodiscard]] virtual int open(const char *path, int flags, mode_t mode = 0) = 0;

    /**
     * Read up to len bytes at the current file position
     * @return Bytes read (0 at end of file), or -errno
     */
    [[nodiscard]] virtual ssize_t read(int fd, void *buf, size_t len) = 0;

    /**
     * Write up to len bytes at the current file position
     * @return Bytes accepted (may be short), or -errno
     */
    [[nodiscard]] virtual ssize_t write(int fd, const void *buf, size_t len) = 0;

    /**
     * Flush file data and metadata to stable storage
     * @return 0, or -errno
     */
    [[nodiscard]] virtual int sync(int fd) = 0;

    /// Backend name for diagnostics ("syscall", "io_uring")
    [[nodiscard]] virtual const char *name() const noexcept = 0;
};

/**
 * Create the system-call backend
 */
[[nodiscard]] std::unique_ptr<IoBackend> make_syscall_backend();

/**
 * Create the io_uring backend
 *
 * @param queue_depth Submission queue entries (only one is used at a time)
 * @throws Error if the ring cannot be set up (ENOSYS on kernels without
 *         io_uring, EPERM where it is disabled)
 */
[[nodiscard]] std::unique_ptr<IoBackend> make_uring_backend(unsigned queue_depth = 4);

} // namespace mkdev

#endif // MKDEV_IO_HPP
