/**
 * @file mkdev.hpp
 * @brief Main header for mkdev
 *
 * This is the single header you need to include to use the mkdev
 * copy library from C++.
 *
 * Example:
 * @code
 * #include <mkdev.hpp>
 *
 * int main() {
 *     mkdev::Options opts;
 *     auto io = mkdev::make_syscall_backend();
 *
 *     auto source = mkdev::open_source("ubuntu.iso", *io);
 *     auto target = mkdev::open_target("/dev/sdc", *io, opts);
 *
 *     mkdev::BufferSizeSelector selector(*io, opts);
 *     size_t buffer_size = selector.select(source.file.get(), source.size);
 *
 *     mkdev::CopyEngine engine(*io, opts);
 *     engine.copy(source.file.get(), target.file.get(), source.size, buffer_size, target.mode);
 * }
 * @endcode
 */

#ifndef MKDEV_HPP
#define MKDEV_HPP

// order matters for dependencies
#include <mkdev/fwd.hpp>
#include <mkdev/error.hpp>
#include <mkdev/log.hpp>
#include <mkdev/options.hpp>
#include <mkdev/buffer.hpp>
#include <mkdev/io.hpp>
#include <mkdev/device.hpp>
#include <mkdev/selector.hpp>
#include <mkdev/progress.hpp>
#include <mkdev/copy.hpp>

#endif // MKDEV_HPP
