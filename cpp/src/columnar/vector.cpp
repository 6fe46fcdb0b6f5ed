#include "vecpart/columnar/vector.hpp"
#include "vecpart/common/error.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <type_traits>

namespace vecpart {
namespace columnar {

namespace {

// Initial data bytes reserved per slot by VariableWidthVector::allocate_new
constexpr size_t kInitialBytesPerValue = 8;

size_t checked_bytes(size_t count, size_t width) {
    if (width != 0 && count > std::numeric_limits<size_t>::max() / width) {
        throw Error(
            ErrorKind::ALLOCATION_FAILURE,
            "Requested " + std::to_string(count) + " slots of " +
            std::to_string(width) + " bytes overflows"
        );
    }
    return count * width;
}

void check_range(size_t offset, size_t length, size_t value_count) {
    if (offset > value_count || length > value_count - offset) {
        throw std::out_of_range(
            "Slice [" + std::to_string(offset) + ", " + std::to_string(offset + length) +
            ") out of range for " + std::to_string(value_count) + " values"
        );
    }
}

#ifdef VECPART_USE_ARROW
void throw_if_not_ok(const arrow::Status& status) {
    if (!status.ok()) {
        throw std::runtime_error("Arrow conversion failed: " + status.ToString());
    }
}

template<typename Builder>
std::shared_ptr<arrow::Array> finish(Builder& builder) {
    std::shared_ptr<arrow::Array> out;
    throw_if_not_ok(builder.Finish(&out));
    return out;
}
#endif

} // namespace

const char* minor_type_name(MinorType type) {
    switch (type) {
        case MinorType::INT: return "INT";
        case MinorType::BIGINT: return "BIGINT";
        case MinorType::VARBINARY: return "VARBINARY";
        case MinorType::VARCHAR: return "VARCHAR";
    }
    return "UNKNOWN";
}

// ValueVector implementation

ValueVector::ValueVector(std::string name, std::shared_ptr<BufferAllocator> allocator)
    : name_(std::move(name))
    , allocator_(std::move(allocator)) {
    if (!allocator_) {
        throw std::invalid_argument("Vector '" + name_ + "' requires an allocator");
    }
}

void ValueVector::check_index(size_t index) const {
    if (index >= value_count_) {
        throw std::out_of_range(
            "Index " + std::to_string(index) + " out of range for vector '" + name_ +
            "' with " + std::to_string(value_count_) + " values"
        );
    }
}

void ValueVector::check_same_type(const ValueVector& other) const {
    if (other.minor_type() != minor_type()) {
        throw Error(
            ErrorKind::TYPE_MISMATCH,
            std::string("Cannot copy ") + minor_type_name(other.minor_type()) +
            " value into " + minor_type_name(minor_type()) + " vector '" + name_ + "'"
        );
    }
}

// FixedWidthVector implementation

template<typename T, MinorType kType>
FixedWidthVector<T, kType>::FixedWidthVector(std::string name, std::shared_ptr<BufferAllocator> allocator)
    : ValueVector(std::move(name), std::move(allocator)) {}

template<typename T, MinorType kType>
void FixedWidthVector<T, kType>::allocate_new(size_t capacity) {
    clear();
    values_ = allocator_->allocate(checked_bytes(capacity, sizeof(T)));
}

template<typename T, MinorType kType>
void FixedWidthVector<T, kType>::clear() {
    values_.reset();
    value_count_ = 0;
}

template<typename T, MinorType kType>
void FixedWidthVector<T, kType>::ensure_capacity(size_t capacity) {
    size_t current = value_capacity();
    if (capacity <= current) {
        return;
    }
    size_t target = std::max(capacity, current * 2);
    values_ = allocator_->reallocate(std::move(values_), checked_bytes(target, sizeof(T)));
}

template<typename T, MinorType kType>
void FixedWidthVector<T, kType>::set_value_count(size_t count) {
    ensure_capacity(count);
    value_count_ = count;
}

template<typename T, MinorType kType>
T FixedWidthVector<T, kType>::get(size_t index) const {
    check_index(index);
    return values_.as<T>()[index];
}

template<typename T, MinorType kType>
void FixedWidthVector<T, kType>::set(size_t index, T value) {
    if (index >= value_capacity()) {
        throw std::out_of_range(
            "Index " + std::to_string(index) + " beyond capacity " +
            std::to_string(value_capacity()) + " of vector '" + name_ + "'"
        );
    }
    values_.as<T>()[index] = value;
}

template<typename T, MinorType kType>
void FixedWidthVector<T, kType>::set_safe(size_t index, T value) {
    ensure_capacity(index + 1);
    set(index, value);
}

template<typename T, MinorType kType>
void FixedWidthVector<T, kType>::copy_from_safe(size_t from_index, size_t this_index, const ValueVector& from) {
    check_same_type(from);
    const auto& source = static_cast<const FixedWidthVector<T, kType>&>(from);
    set_safe(this_index, source.get(from_index));
}

template<typename T, MinorType kType>
std::unique_ptr<ValueVector> FixedWidthVector<T, kType>::slice(size_t offset, size_t length) const {
    check_range(offset, length, value_count_);

    auto out = std::make_unique<FixedWidthVector<T, kType>>(name_, allocator_);
    out->allocate_new(length);
    if (length > 0) {
        std::memcpy(out->values_.data(), values_.as<T>() + offset, length * sizeof(T));
    }
    out->set_value_count(length);
    return out;
}

template<typename T, MinorType kType>
std::string FixedWidthVector<T, kType>::value_to_string(size_t index) const {
    return std::to_string(get(index));
}

// VariableWidthVector implementation

template<typename T, MinorType kType>
VariableWidthVector<T, kType>::VariableWidthVector(std::string name, std::shared_ptr<BufferAllocator> allocator)
    : ValueVector(std::move(name), std::move(allocator)) {}

template<typename T, MinorType kType>
size_t VariableWidthVector<T, kType>::value_capacity() const {
    size_t slots = offsets_.size() / sizeof(int32_t);
    return slots == 0 ? 0 : slots - 1;
}

template<typename T, MinorType kType>
size_t VariableWidthVector<T, kType>::buffer_size() const {
    if (value_count_ == 0) {
        return 0;
    }
    return (value_count_ + 1) * sizeof(int32_t) + static_cast<size_t>(offsets()[value_count_]);
}

template<typename T, MinorType kType>
void VariableWidthVector<T, kType>::allocate_new(size_t capacity) {
    clear();
    offsets_ = allocator_->allocate(checked_bytes(capacity + 1, sizeof(int32_t)));
    data_ = allocator_->allocate(checked_bytes(capacity, kInitialBytesPerValue));
}

template<typename T, MinorType kType>
void VariableWidthVector<T, kType>::clear() {
    offsets_.reset();
    data_.reset();
    last_set_ = -1;
    value_count_ = 0;
}

template<typename T, MinorType kType>
void VariableWidthVector<T, kType>::ensure_offset_capacity(size_t slots) {
    size_t current = value_capacity();
    if (slots <= current) {
        return;
    }
    size_t target = std::max(slots, current * 2);
    offsets_ = allocator_->reallocate(
        std::move(offsets_), checked_bytes(target + 1, sizeof(int32_t))
    );
}

template<typename T, MinorType kType>
void VariableWidthVector<T, kType>::ensure_data_capacity(size_t bytes) {
    if (bytes <= data_.size()) {
        return;
    }
    size_t target = std::max(bytes, data_.size() * 2);
    data_ = allocator_->reallocate(std::move(data_), target);
}

template<typename T, MinorType kType>
void VariableWidthVector<T, kType>::fill_holes(size_t up_to) {
    size_t first = static_cast<size_t>(last_set_ + 1);
    if (up_to <= first) {
        return;
    }
    ensure_offset_capacity(up_to);
    int32_t* off = offsets();
    for (size_t j = first; j < up_to; ++j) {
        off[j + 1] = off[j];
    }
    last_set_ = static_cast<int64_t>(up_to) - 1;
}

template<typename T, MinorType kType>
void VariableWidthVector<T, kType>::set_value_count(size_t count) {
    if (static_cast<int64_t>(count) > last_set_ + 1) {
        fill_holes(count);
    } else {
        last_set_ = static_cast<int64_t>(count) - 1;
    }
    value_count_ = count;
}

template<typename T, MinorType kType>
void VariableWidthVector<T, kType>::set_safe(size_t index, const void* data, size_t length) {
    if (static_cast<int64_t>(index) <= last_set_) {
        throw std::invalid_argument(
            "Slot " + std::to_string(index) + " of vector '" + name_ +
            "' already written; variable-width slots are written in increasing order"
        );
    }

    ensure_offset_capacity(index + 1);
    fill_holes(index);

    size_t start = static_cast<size_t>(offsets()[index]);
    size_t end = start + length;
    if (end > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        throw Error(
            ErrorKind::ALLOCATION_FAILURE,
            "Vector '" + name_ + "' data exceeds the 32-bit offset range"
        );
    }

    ensure_data_capacity(end);
    if (length > 0) {
        std::memcpy(data_.data() + start, data, length);
    }
    offsets()[index + 1] = static_cast<int32_t>(end);
    last_set_ = static_cast<int64_t>(index);
}

template<typename T, MinorType kType>
void VariableWidthVector<T, kType>::set_safe(size_t index, const T& value) {
    set_safe(index, value.data(), value.size());
}

template<typename T, MinorType kType>
void VariableWidthVector<T, kType>::set_safe(size_t index, std::string_view value) {
    set_safe(index, value.data(), value.size());
}

template<typename T, MinorType kType>
std::string_view VariableWidthVector<T, kType>::get_view(size_t index) const {
    check_index(index);
    const int32_t* off = offsets();
    const char* base = data_.as<char>();
    return std::string_view(base + off[index], static_cast<size_t>(off[index + 1] - off[index]));
}

template<typename T, MinorType kType>
T VariableWidthVector<T, kType>::get(size_t index) const {
    std::string_view view = get_view(index);
    return T(view.begin(), view.end());
}

template<typename T, MinorType kType>
size_t VariableWidthVector<T, kType>::value_length(size_t index) const {
    return get_view(index).size();
}

template<typename T, MinorType kType>
void VariableWidthVector<T, kType>::copy_from_safe(size_t from_index, size_t this_index, const ValueVector& from) {
    check_same_type(from);
    const auto& source = static_cast<const VariableWidthVector<T, kType>&>(from);
    set_safe(this_index, source.get_view(from_index));
}

template<typename T, MinorType kType>
std::unique_ptr<ValueVector> VariableWidthVector<T, kType>::slice(size_t offset, size_t length) const {
    check_range(offset, length, value_count_);

    auto out = std::make_unique<VariableWidthVector<T, kType>>(name_, allocator_);
    out->allocate_new(length);
    for (size_t i = 0; i < length; ++i) {
        out->set_safe(i, get_view(offset + i));
    }
    out->set_value_count(length);
    return out;
}

template<typename T, MinorType kType>
std::string VariableWidthVector<T, kType>::value_to_string(size_t index) const {
    std::string_view view = get_view(index);
    if constexpr (std::is_same_v<T, std::string>) {
        return std::string(view);
    } else {
        static const char* digits = "0123456789abcdef";
        std::string out = "0x";
        for (char c : view) {
            auto byte = static_cast<uint8_t>(c);
            out.push_back(digits[byte >> 4]);
            out.push_back(digits[byte & 0x0f]);
        }
        return out;
    }
}

#ifdef VECPART_USE_ARROW
template<typename T, MinorType kType>
std::shared_ptr<arrow::Array> FixedWidthVector<T, kType>::to_arrow() const {
    using Builder = std::conditional_t<std::is_same_v<T, int32_t>, arrow::Int32Builder, arrow::Int64Builder>;
    Builder builder;
    throw_if_not_ok(builder.Reserve(static_cast<int64_t>(value_count_)));
    throw_if_not_ok(builder.AppendValues(values_.as<T>(), static_cast<int64_t>(value_count_)));
    return finish(builder);
}

template<typename T, MinorType kType>
std::shared_ptr<arrow::Array> VariableWidthVector<T, kType>::to_arrow() const {
    using Builder = std::conditional_t<std::is_same_v<T, std::string>, arrow::StringBuilder, arrow::BinaryBuilder>;
    Builder builder;
    throw_if_not_ok(builder.Reserve(static_cast<int64_t>(value_count_)));
    for (size_t i = 0; i < value_count_; ++i) {
        throw_if_not_ok(builder.Append(get_view(i)));
    }
    return finish(builder);
}

namespace {

template<typename VectorT, typename ArrayT>
std::unique_ptr<ValueVector> copy_fixed(
    const arrow::Array& array,
    std::shared_ptr<BufferAllocator> allocator,
    const std::string& name
) {
    const auto& typed = static_cast<const ArrayT&>(array);
    auto out = std::make_unique<VectorT>(name, std::move(allocator));
    out->allocate_new(static_cast<size_t>(typed.length()));
    for (int64_t i = 0; i < typed.length(); ++i) {
        out->set(static_cast<size_t>(i), typed.Value(i));
    }
    out->set_value_count(static_cast<size_t>(typed.length()));
    return out;
}

template<typename VectorT, typename ArrayT>
std::unique_ptr<ValueVector> copy_variable(
    const arrow::Array& array,
    std::shared_ptr<BufferAllocator> allocator,
    const std::string& name
) {
    const auto& typed = static_cast<const ArrayT&>(array);
    auto out = std::make_unique<VectorT>(name, std::move(allocator));
    out->allocate_new(static_cast<size_t>(typed.length()));
    for (int64_t i = 0; i < typed.length(); ++i) {
        int32_t length = 0;
        const uint8_t* value = typed.GetValue(i, &length);
        out->set_safe(static_cast<size_t>(i), value, static_cast<size_t>(length));
    }
    out->set_value_count(static_cast<size_t>(typed.length()));
    return out;
}

} // namespace

std::unique_ptr<ValueVector> from_arrow(
    const arrow::Array& array,
    std::shared_ptr<BufferAllocator> allocator,
    const std::string& name
) {
    if (array.null_count() > 0) {
        throw std::invalid_argument(
            "Arrow array with " + std::to_string(array.null_count()) + " nulls cannot be converted"
        );
    }

    switch (array.type_id()) {
        case arrow::Type::INT32:
            return copy_fixed<IntVector, arrow::Int32Array>(array, std::move(allocator), name);
        case arrow::Type::INT64:
            return copy_fixed<BigIntVector, arrow::Int64Array>(array, std::move(allocator), name);
        case arrow::Type::BINARY:
            return copy_variable<VarBinaryVector, arrow::BinaryArray>(array, std::move(allocator), name);
        case arrow::Type::STRING:
            return copy_variable<VarCharVector, arrow::StringArray>(array, std::move(allocator), name);
        default:
            throw Error(
                ErrorKind::UNSUPPORTED_TYPE,
                "Arrow type " + array.type()->ToString() + " has no vector counterpart"
            );
    }
}
#endif

// Explicit template instantiations
template class FixedWidthVector<int32_t, MinorType::INT>;
template class FixedWidthVector<int64_t, MinorType::BIGINT>;
template class VariableWidthVector<Bytes, MinorType::VARBINARY>;
template class VariableWidthVector<std::string, MinorType::VARCHAR>;

} // namespace columnar
} // namespace vecpart
