/**
 * @file buffer.hpp
 * @brief Aligned transfer buffer for mkdev
 */

#ifndef MKDEV_BUFFER_HPP
#define MKDEV_BUFFER_HPP

#include <mkdev/fwd.hpp>
#include <mkdev/error.hpp>
#include <mkdev/options.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>

namespace mkdev {

/**
 * Round a size up to the next multiple of an alignment
 * @param size Size in bytes
 * @param align Alignment (power of two)
 * @return Smallest multiple of align that is >= size
 */
[[nodiscard]] constexpr size_t align_up(size_t size, size_t align) noexcept {
    return (size + align - 1) & ~(align - 1);
}

/**
 * Check whether a size is a multiple of an alignment
 */
[[nodiscard]] constexpr bool is_aligned(size_t size, size_t align) noexcept {
    return (size & (align - 1)) == 0;
}

/**
 * RAII page-aligned buffer
 *
 * Both the start address and the capacity are multiples of the
 * alignment, so any prefix of the buffer can be handed to a
 * read or write on an O_DIRECT descriptor.
 * Move-only (cannot be copied).
 *
 * Example:
 * @code
 * mkdev::AlignedBuffer buffer(10 * 1000 * 1000);  // capacity 10002432
 * ssize_t n = ::read(fd, buffer.data(), buffer.size());
 * @endcode
 */
class AlignedBuffer {
  public:
    /**
     * Default constructor - creates empty buffer
     */
    AlignedBuffer() noexcept = default;

    /**
     * Allocate a buffer
     *
     * @param size Requested size in bytes (rounded up to alignment)
     * @param alignment Address and size alignment (default: 4096)
     * @throws Error on invalid size or allocation failure
     */
    explicit AlignedBuffer(size_t size, size_t alignment = DEFAULT_ALIGNMENT) {
        if (size == 0 || alignment == 0 || (alignment & (alignment - 1)) != 0) {
            throw Error(EINVAL, "aligned buffer size");
        }
        size_t capacity = align_up(size, alignment);
        void *ptr = nullptr;
        int rc = posix_memalign(&ptr, alignment, capacity);
        if (rc != 0) {
            throw Error(rc, "posix_memalign");
        }
        ptr_ = ptr;
        size_ = capacity;
    }

    /**
     * Move constructor
     */
    AlignedBuffer(AlignedBuffer &&other) noexcept : ptr_(other.ptr_), size_(other.size_) {
        other.ptr_ = nullptr;
        other.size_ = 0;
    }

    /**
     * Move assignment
     */
    AlignedBuffer &operator=(AlignedBuffer &&other) noexcept {
        if (this != &other) {
            free(ptr_);
            ptr_ = other.ptr_;
            size_ = other.size_;
            other.ptr_ = nullptr;
            other.size_ = 0;
        }
        return *this;
    }

    // Non-copyable
    AlignedBuffer(const AlignedBuffer &) = delete;
    AlignedBuffer &operator=(const AlignedBuffer &) = delete;

    ~AlignedBuffer() { free(ptr_); }

    /**
     * Get buffer data pointer
     * @return Pointer to buffer data
     */
    [[nodiscard]] void *data() noexcept { return ptr_; }
    [[nodiscard]] const void *data() const noexcept { return ptr_; }

    /**
     * Get buffer capacity
     * @return Size in bytes (a multiple of the alignment)
     */
    [[nodiscard]] size_t size() const noexcept { return size_; }

    /**
     * Get buffer as span of bytes
     * @throws Error if buffer is null
     */
    [[nodiscard]] std::span<std::byte> span() {
        if (!ptr_) {
            throw Error(EINVAL, "Buffer is null");
        }
        return {static_cast<std::byte *>(ptr_), size_};
    }

    /**
     * Check if buffer is valid (non-null)
     */
    [[nodiscard]] explicit operator bool() const noexcept { return ptr_ != nullptr; }

  private:
    void *ptr_ = nullptr;
    size_t size_ = 0;
};

} // namespace mkdev

#endif // MKDEV_BUFFER_HPP
