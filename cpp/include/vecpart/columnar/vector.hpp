#pragma once

#include "allocator.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#ifdef VECPART_USE_ARROW
#include <arrow/array.h>
#include <arrow/type.h>
#endif

namespace vecpart {
namespace columnar {

/**
 * Closed set of element encodings a vector can hold.
 * The numeric values are the tags written on the wire.
 */
enum class MinorType : uint8_t {
    INT = 1,        // 32-bit signed integer
    BIGINT = 2,     // 64-bit signed integer
    VARBINARY = 3,  // variable-width bytes
    VARCHAR = 4     // variable-width UTF-8 string
};

const char* minor_type_name(MinorType type);

using Bytes = std::vector<uint8_t>;

/**
 * Type-erased columnar vector backed by allocator memory
 *
 * Slots [0, value_count) are populated; reading beyond that throws
 * std::out_of_range. Vectors own native buffers and are neither
 * copyable nor movable; hand them around through std::unique_ptr.
 */
class ValueVector {
public:
    ValueVector(std::string name, std::shared_ptr<BufferAllocator> allocator);
    virtual ~ValueVector() = default;

    ValueVector(const ValueVector&) = delete;
    ValueVector& operator=(const ValueVector&) = delete;

    virtual MinorType minor_type() const = 0;

    size_t value_count() const { return value_count_; }
    virtual void set_value_count(size_t count) = 0;

    // Number of slots that can be set without reallocating
    virtual size_t value_capacity() const = 0;

    // Drops current contents and reserves room for `capacity` values
    virtual void allocate_new(size_t capacity) = 0;

    // Releases all buffers back to the allocator
    virtual void clear() = 0;

    virtual size_t buffer_size() const = 0;

    // Copies slot `from_index` of `from` into slot `this_index`, growing if needed
    virtual void copy_from_safe(size_t from_index, size_t this_index, const ValueVector& from) = 0;

    // Copy of [offset, offset + length) in a new vector on the same allocator
    virtual std::unique_ptr<ValueVector> slice(size_t offset, size_t length) const = 0;

    virtual std::string value_to_string(size_t index) const = 0;

    const std::string& name() const { return name_; }
    const std::shared_ptr<BufferAllocator>& allocator() const { return allocator_; }

#ifdef VECPART_USE_ARROW
    virtual std::shared_ptr<arrow::Array> to_arrow() const = 0;
#endif

protected:
    void check_index(size_t index) const;
    void check_same_type(const ValueVector& other) const;

    std::string name_;
    std::shared_ptr<BufferAllocator> allocator_;
    size_t value_count_ = 0;
};

/**
 * Fixed-width vector: one contiguous values buffer
 */
template<typename T, MinorType kType>
class FixedWidthVector : public ValueVector {
public:
    using value_type = T;
    static constexpr MinorType TYPE = kType;

    explicit FixedWidthVector(
        std::string name,
        std::shared_ptr<BufferAllocator> allocator
    );

    MinorType minor_type() const override { return kType; }

    void set_value_count(size_t count) override;
    size_t value_capacity() const override { return values_.size() / sizeof(T); }
    void allocate_new(size_t capacity) override;
    void clear() override;
    size_t buffer_size() const override { return value_count_ * sizeof(T); }

    void copy_from_safe(size_t from_index, size_t this_index, const ValueVector& from) override;
    std::unique_ptr<ValueVector> slice(size_t offset, size_t length) const override;
    std::string value_to_string(size_t index) const override;

    // Typed access
    T get(size_t index) const;

    // Requires index < value_capacity()
    void set(size_t index, T value);

    // Grows the buffer when index is beyond capacity
    void set_safe(size_t index, T value);

    const T* data() const { return values_.as<T>(); }

#ifdef VECPART_USE_ARROW
    std::shared_ptr<arrow::Array> to_arrow() const override;
#endif

private:
    void ensure_capacity(size_t capacity);

    Buffer values_;
};

/**
 * Variable-width vector: int32 offsets plus a data buffer
 *
 * Slots are written in increasing order. Skipped slots are filled with
 * empty values, the way set_value_count fills trailing holes.
 */
template<typename T, MinorType kType>
class VariableWidthVector : public ValueVector {
public:
    using value_type = T;
    static constexpr MinorType TYPE = kType;

    explicit VariableWidthVector(
        std::string name,
        std::shared_ptr<BufferAllocator> allocator
    );

    MinorType minor_type() const override { return kType; }

    void set_value_count(size_t count) override;
    size_t value_capacity() const override;
    void allocate_new(size_t capacity) override;
    void clear() override;
    size_t buffer_size() const override;

    void copy_from_safe(size_t from_index, size_t this_index, const ValueVector& from) override;
    std::unique_ptr<ValueVector> slice(size_t offset, size_t length) const override;
    std::string value_to_string(size_t index) const override;

    // Typed access
    T get(size_t index) const;
    std::string_view get_view(size_t index) const;
    size_t value_length(size_t index) const;

    void set_safe(size_t index, const void* data, size_t length);
    void set_safe(size_t index, const T& value);
    void set_safe(size_t index, std::string_view value);

#ifdef VECPART_USE_ARROW
    std::shared_ptr<arrow::Array> to_arrow() const override;
#endif

private:
    const int32_t* offsets() const { return offsets_.as<int32_t>(); }
    int32_t* offsets() { return offsets_.as<int32_t>(); }

    void ensure_offset_capacity(size_t slots);
    void ensure_data_capacity(size_t bytes);
    void fill_holes(size_t up_to);

    Buffer offsets_;
    Buffer data_;
    int64_t last_set_ = -1;
};

// Common type aliases
using IntVector = FixedWidthVector<int32_t, MinorType::INT>;
using BigIntVector = FixedWidthVector<int64_t, MinorType::BIGINT>;
using VarBinaryVector = VariableWidthVector<Bytes, MinorType::VARBINARY>;
using VarCharVector = VariableWidthVector<std::string, MinorType::VARCHAR>;

#ifdef VECPART_USE_ARROW
// Copies an Arrow array of a supported type into a new vector
std::unique_ptr<ValueVector> from_arrow(
    const arrow::Array& array,
    std::shared_ptr<BufferAllocator> allocator,
    const std::string& name = "vector"
);
#endif

} // namespace columnar
} // namespace vecpart
