// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 mkdev Contributors

/**
 * @file syscall_backend.cpp
 * @brief IoBackend over plain POSIX system calls
 */

#include <mkdev/io.hpp>

#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

namespace mkdev {

namespace {

class SyscallBackend final : public IoBackend {
  public:
    int open(const char *path, int flags, mode_t mode) override {
        int fd = ::open(path, flags | O_CLOEXEC, mode);
        return fd < 0 ? -errno : fd;
    }

    ssize_t read(int fd, void *buf, size_t len) override {
        ssize_t n = ::read(fd, buf, len);
        return n < 0 ? -errno : n;
    }

    ssize_t write(int fd, const void *buf, size_t len) override {
        ssize_t n = ::write(fd, buf, len);
        return n < 0 ? -errno : n;
    }

    int sync(int fd) override { return ::fsync(fd) < 0 ? -errno : 0; }

    const char *name() const noexcept override { return "syscall"; }
};

} // namespace

std::unique_ptr<IoBackend> make_syscall_backend() {
    return std::make_unique<SyscallBackend>();
}

} // namespace mkdev
