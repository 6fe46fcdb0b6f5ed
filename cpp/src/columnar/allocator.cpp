#include "vecpart/columnar/allocator.hpp"
#include "vecpart/common/error.hpp"

#include <algorithm>
#include <cstring>
#include <new>
#include <utility>

namespace vecpart {
namespace columnar {

// Buffer implementation

Buffer::Buffer(std::shared_ptr<BufferAllocator> owner, std::unique_ptr<uint8_t[]> data, size_t size)
    : owner_(std::move(owner))
    , data_(std::move(data))
    , size_(size) {}

Buffer::~Buffer() {
    reset();
}

Buffer::Buffer(Buffer&& other) noexcept
    : owner_(std::move(other.owner_))
    , data_(std::move(other.data_))
    , size_(std::exchange(other.size_, 0)) {}

Buffer& Buffer::operator=(Buffer&& other) noexcept {
    if (this != &other) {
        reset();
        owner_ = std::move(other.owner_);
        data_ = std::move(other.data_);
        size_ = std::exchange(other.size_, 0);
    }
    return *this;
}

void Buffer::reset() {
    if (owner_) {
        owner_->release(size_);
    }
    data_.reset();
    owner_.reset();
    size_ = 0;
}

// BufferAllocator implementation

BufferAllocator::BufferAllocator(std::string name, size_t limit)
    : name_(std::move(name))
    , limit_(limit) {}

std::shared_ptr<BufferAllocator> BufferAllocator::create(std::string name, size_t limit) {
    return std::shared_ptr<BufferAllocator>(new BufferAllocator(std::move(name), limit));
}

void BufferAllocator::reserve(size_t size) {
    size_t current = allocated_.load();
    do {
        if (size > limit_ - current) {
            throw Error(
                ErrorKind::ALLOCATION_FAILURE,
                "Allocator '" + name_ + "' cannot allocate " + std::to_string(size) +
                " bytes (allocated " + std::to_string(current) +
                ", limit " + std::to_string(limit_) + ")"
            );
        }
    } while (!allocated_.compare_exchange_weak(current, current + size));

    size_t now = current + size;
    size_t peak = peak_.load();
    while (now > peak && !peak_.compare_exchange_weak(peak, now)) {
    }
}

void BufferAllocator::release(size_t size) noexcept {
    allocated_.fetch_sub(size);
}

Buffer BufferAllocator::allocate(size_t size) {
    reserve(size);

    std::unique_ptr<uint8_t[]> data(new (std::nothrow) uint8_t[size]());
    if (!data) {
        release(size);
        throw Error(
            ErrorKind::ALLOCATION_FAILURE,
            "Allocator '" + name_ + "' failed to obtain " + std::to_string(size) + " bytes"
        );
    }

    return Buffer(shared_from_this(), std::move(data), size);
}

Buffer BufferAllocator::reallocate(Buffer&& buffer, size_t new_size) {
    Buffer grown = allocate(new_size);
    size_t keep = std::min(buffer.size(), new_size);
    if (keep > 0) {
        std::memcpy(grown.data(), buffer.data(), keep);
    }
    buffer.reset();
    return grown;
}

} // namespace columnar
} // namespace vecpart
