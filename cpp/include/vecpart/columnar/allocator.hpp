#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>

namespace vecpart {
namespace columnar {

constexpr size_t kDefaultAllocatorLimit = std::numeric_limits<size_t>::max();

class BufferAllocator;

/**
 * Zero-initialized block of native memory charged to a BufferAllocator.
 * The charge is returned when the buffer is destroyed or reset, so a
 * vector that goes out of scope on an error path leaks nothing.
 */
class Buffer {
public:
    Buffer() = default;
    ~Buffer();

    Buffer(const Buffer&) = delete;
    Buffer& operator=(const Buffer&) = delete;

    Buffer(Buffer&& other) noexcept;
    Buffer& operator=(Buffer&& other) noexcept;

    uint8_t* data() { return data_.get(); }
    const uint8_t* data() const { return data_.get(); }
    size_t size() const { return size_; }

    template<typename T>
    T* as() { return reinterpret_cast<T*>(data_.get()); }

    template<typename T>
    const T* as() const { return reinterpret_cast<const T*>(data_.get()); }

    void reset();

private:
    friend class BufferAllocator;

    Buffer(std::shared_ptr<BufferAllocator> owner, std::unique_ptr<uint8_t[]> data, size_t size);

    std::shared_ptr<BufferAllocator> owner_;
    std::unique_ptr<uint8_t[]> data_;
    size_t size_ = 0;
};

/**
 * Capacity-bounded source of vector memory
 *
 * Tracks every byte handed out through Buffer. Requests that would take
 * the total above the limit fail with Error(ALLOCATION_FAILURE) and
 * leave the accounting untouched. Accounting is atomic, so tasks on
 * different threads may share one allocator.
 */
class BufferAllocator : public std::enable_shared_from_this<BufferAllocator> {
public:
    static std::shared_ptr<BufferAllocator> create(
        std::string name = "root",
        size_t limit = kDefaultAllocatorLimit
    );

    BufferAllocator(const BufferAllocator&) = delete;
    BufferAllocator& operator=(const BufferAllocator&) = delete;

    Buffer allocate(size_t size);

    // Returns a buffer of new_size holding the old contents as prefix
    Buffer reallocate(Buffer&& buffer, size_t new_size);

    size_t allocated_bytes() const { return allocated_.load(); }
    size_t peak_bytes() const { return peak_.load(); }
    size_t limit() const { return limit_; }
    const std::string& name() const { return name_; }

private:
    friend class Buffer;

    BufferAllocator(std::string name, size_t limit);

    void reserve(size_t size);
    void release(size_t size) noexcept;

    std::string name_;
    size_t limit_;
    std::atomic<size_t> allocated_{0};
    std::atomic<size_t> peak_{0};
};

} // namespace columnar
} // namespace vecpart
