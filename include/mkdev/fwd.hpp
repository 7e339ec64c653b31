// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 mkdev Contributors


/**
 * @file fwd.hpp
 * @brief Forward declarations for mkdev
 */

#ifndef MKDEV_FWD_HPP
#define MKDEV_FWD_HPP

namespace mkdev {

class Error;
class OpenError;
class BenchmarkError;
class CopyError;
class Options;
class AlignedBuffer;
class FileHandle;
class IoBackend;
class BufferSizeSelector;
class CopyEngine;

struct SourceFile;
struct TargetDevice;
struct CopyTask;
struct CopySummary;
struct CopyProgress;
struct ProgressState;
struct BenchmarkResult;

} // namespace mkdev

#endif // MKDEV_FWD_HPP
