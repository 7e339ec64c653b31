// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 mkdev Contributors

/**
 * @file uring_backend.cpp
 * @brief IoBackend over io_uring, one request at a time
 *
 * Each call prepares a single SQE, submits it and blocks until its CQE
 * arrives, so callers see the same synchronous semantics as the
 * system-call backend. Reads and writes pass offset -1, which makes the
 * kernel use and advance the file position (Linux 5.6+).
 */

#include <mkdev/io.hpp>
#include <mkdev/error.hpp>

#include "log.h"

#include <cerrno>
#include <cstdint>
#include <fcntl.h>
#include <liburing.h>

namespace mkdev {

namespace {

/** Use-and-advance-file-position offset for IORING_OP_READ/WRITE */
constexpr uint64_t CURRENT_POSITION = static_cast<uint64_t>(-1);

class UringBackend final : public IoBackend {
  public:
    explicit UringBackend(unsigned queue_depth) : queue_depth_(queue_depth) {
        int ret = io_uring_queue_init(queue_depth, &ring_, 0);
        if (ret < 0) {
            throw Error(-ret, "io_uring_queue_init");
        }
        detail::log_fmt(LogLevel::Debug, "io_uring backend ready (depth %u)", queue_depth);
    }

    ~UringBackend() override {
        if (ring_ready_) io_uring_queue_exit(&ring_);
    }

    UringBackend(const UringBackend &) = delete;
    UringBackend &operator=(const UringBackend &) = delete;

    int open(const char *path, int flags, mode_t mode) override {
        struct io_uring_sqe *sqe = next_sqe();
        if (!sqe) return ring_ready_ ? -EAGAIN : -EIO;
        io_uring_prep_openat(sqe, AT_FDCWD, path, flags | O_CLOEXEC, mode);
        return static_cast<int>(submit_and_reap());
    }

    ssize_t read(int fd, void *buf, size_t len) override {
        struct io_uring_sqe *sqe = next_sqe();
        if (!sqe) return ring_ready_ ? -EAGAIN : -EIO;
        io_uring_prep_read(sqe, fd, buf, static_cast<unsigned>(len), CURRENT_POSITION);
        return submit_and_reap();
    }

    ssize_t write(int fd, const void *buf, size_t len) override {
        struct io_uring_sqe *sqe = next_sqe();
        if (!sqe) return ring_ready_ ? -EAGAIN : -EIO;
        io_uring_prep_write(sqe, fd, buf, static_cast<unsigned>(len), CURRENT_POSITION);
        return submit_and_reap();
    }

    int sync(int fd) override {
        struct io_uring_sqe *sqe = next_sqe();
        if (!sqe) return ring_ready_ ? -EAGAIN : -EIO;
        io_uring_prep_fsync(sqe, fd, 0);
        return static_cast<int>(submit_and_reap());
    }

    const char *name() const noexcept override { return "io_uring"; }

  private:
    struct io_uring_sqe *next_sqe() {
        if (!ring_ready_) return nullptr;
        return io_uring_get_sqe(&ring_);
    }

    // Submit the single prepared SQE and wait for its completion.
    ssize_t submit_and_reap() {
        int ret = io_uring_submit_and_wait(&ring_, 1);
        if (ret < 0) {
            reset_ring();
            return ret;
        }

        struct io_uring_cqe *cqe = nullptr;
        ret = io_uring_wait_cqe(&ring_, &cqe);
        if (ret < 0) {
            reset_ring();
            return ret;
        }

        ssize_t res = cqe->res;
        io_uring_cqe_seen(&ring_, cqe);
        return res;
    }

    // A failed submit or wait can leave the request queued or in flight.
    // Replace the ring so a later call never submits or reaps it.
    void reset_ring() {
        io_uring_queue_exit(&ring_);
        int ret = io_uring_queue_init(queue_depth_, &ring_, 0);
        ring_ready_ = (ret == 0);
        if (!ring_ready_) {
            detail::log_fmt(LogLevel::Warning, "io_uring ring could not be recreated (%d)", ret);
        } else {
            detail::log_fmt(LogLevel::Debug, "io_uring ring recreated after failed request");
        }
    }

    unsigned queue_depth_;
    bool ring_ready_ = true;
    struct io_uring ring_;
};

} // namespace

std::unique_ptr<IoBackend> make_uring_backend(unsigned queue_depth) {
    return std::make_unique<UringBackend>(queue_depth);
}

} // namespace mkdev
