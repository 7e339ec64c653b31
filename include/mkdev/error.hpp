// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 mkdev Contributors


/**
 * @file error.hpp
 * @brief Exception classes for mkdev
 */

#ifndef MKDEV_ERROR_HPP
#define MKDEV_ERROR_HPP

#include <cerrno>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace mkdev {

/**
 * Base exception for mkdev errors
 *
 * Inherits from std::system_error so callers can catch either
 * mkdev::Error or std::system_error. Uses std::generic_category
 * for POSIX errno values.
 */
class Error : public std::system_error {
  public:
    /**
     * Construct error from errno value
     *
     * @param err Error code (positive errno value)
     * @param context Optional context message (path, operation)
     */
    explicit Error(int err, std::string_view context = {})
        : std::system_error(err, std::generic_category(), std::string(context)) {}

    /**
     * Get the error code
     * @return Positive errno value
     */
    [[nodiscard]] int code() const noexcept { return std::system_error::code().value(); }

    // Convenience predicates
    [[nodiscard]] bool is_not_found() const noexcept { return code() == ENOENT; }
    [[nodiscard]] bool is_permission_denied() const noexcept {
        return code() == EACCES || code() == EPERM;
    }
};

/// Why a source or target could not be opened
enum class OpenFailure {
    PermissionDenied, ///< EACCES / EPERM
    NotFound,         ///< ENOENT / ENODEV / ENXIO
    Other             ///< Anything else
};

/**
 * Source or target could not be opened
 *
 * Fatal for the run. The message names the path and the system error.
 */
class OpenError : public Error {
  public:
    OpenError(int err, std::string path, std::string_view context)
        : Error(err, std::string(context) + " '" + path + "'"), path_(std::move(path)) {}

    /// Path that failed to open
    [[nodiscard]] const std::string &path() const noexcept { return path_; }

    /// Failure classification derived from the errno value
    [[nodiscard]] OpenFailure kind() const noexcept {
        if (is_permission_denied() || code() == EROFS) return OpenFailure::PermissionDenied;
        if (is_not_found() || code() == ENODEV || code() == ENXIO) return OpenFailure::NotFound;
        return OpenFailure::Other;
    }

  private:
    std::string path_;
};

/**
 * Buffer-size benchmark aborted
 *
 * Never fatal: callers fall back to the default buffer size.
 */
class BenchmarkError : public Error {
  public:
    using Error::Error;
};

/// Copy phase in which a CopyError occurred
enum class CopyStage {
    Read,  ///< Source read failed
    Write, ///< Target write failed or was short
    Sync   ///< Durable sync of the target failed
};

/// Return a short name for the given stage ("read", "write", "sync")
[[nodiscard]] inline const char *copy_stage_name(CopyStage stage) noexcept {
    switch (stage) {
    case CopyStage::Read:
        return "read";
    case CopyStage::Write:
        return "write";
    case CopyStage::Sync:
        return "sync";
    default:
        return "???";
    }
}

/**
 * Copy aborted
 *
 * The target holds whatever was written before the failure and must
 * not be trusted.
 */
class CopyError : public Error {
  public:
    CopyError(CopyStage stage, int err, std::string_view context, uint64_t bytes_copied = 0)
        : Error(err, context), stage_(stage), bytes_copied_(bytes_copied) {}

    [[nodiscard]] CopyStage stage() const noexcept { return stage_; }

    /// Bytes successfully transferred before the failure
    [[nodiscard]] uint64_t bytes_copied() const noexcept { return bytes_copied_; }

  private:
    CopyStage stage_;
    uint64_t bytes_copied_;
};

/**
 * Throw Error from current errno
 *
 * @param context Error context message
 * @throws Error with current errno
 */
[[noreturn]] inline void throw_errno(std::string_view context = {}) {
    throw Error(errno, context);
}

} // namespace mkdev

#endif // MKDEV_ERROR_HPP
