#include "vecpart/io/byte_stream.hpp"
#include "vecpart/common/error.hpp"

#include <cstring>
#include <limits>
#include <stdexcept>

namespace vecpart {
namespace io {

namespace {

template<typename U>
void put_le(std::vector<uint8_t>& out, U value) {
    for (size_t i = 0; i < sizeof(U); ++i) {
        out.push_back(static_cast<uint8_t>(value >> (8 * i)));
    }
}

template<typename U>
U get_le(const uint8_t* in) {
    U value = 0;
    for (size_t i = 0; i < sizeof(U); ++i) {
        value |= static_cast<U>(in[i]) << (8 * i);
    }
    return value;
}

} // namespace

// ByteWriter

ByteWriter::ByteWriter(size_t reserve_bytes) {
    buffer_.reserve(reserve_bytes);
}

void ByteWriter::write_u8(uint8_t value) {
    buffer_.push_back(value);
}

void ByteWriter::write_i32(int32_t value) {
    put_le(buffer_, static_cast<uint32_t>(value));
}

void ByteWriter::write_u32(uint32_t value) {
    put_le(buffer_, value);
}

void ByteWriter::write_i64(int64_t value) {
    put_le(buffer_, static_cast<uint64_t>(value));
}

void ByteWriter::write_bytes(const void* data, size_t length) {
    if (length > std::numeric_limits<uint32_t>::max()) {
        throw std::invalid_argument(
            "Element of " + std::to_string(length) + " bytes exceeds the 32-bit length prefix"
        );
    }
    write_u32(static_cast<uint32_t>(length));
    size_t offset = buffer_.size();
    buffer_.resize(offset + length);
    if (length > 0) {
        std::memcpy(buffer_.data() + offset, data, length);
    }
}

void ByteWriter::write_string(const std::string& value) {
    write_bytes(value.data(), value.size());
}

std::vector<uint8_t> ByteWriter::release() {
    std::vector<uint8_t> out;
    out.swap(buffer_);
    return out;
}

// ByteReader

ByteReader::ByteReader(const uint8_t* data, size_t size)
    : data_(data), size_(size) {
    if (data_ == nullptr && size_ != 0) {
        throw std::invalid_argument("ByteReader over null data");
    }
}

ByteReader::ByteReader(const std::vector<uint8_t>& bytes)
    : ByteReader(bytes.data(), bytes.size()) {}

void ByteReader::require(size_t length) const {
    if (length > remaining()) {
        throw Error(
            ErrorKind::STREAM_CORRUPTION,
            "Unexpected end of stream at offset " + std::to_string(pos_) +
            ": need " + std::to_string(length) + " bytes, " +
            std::to_string(remaining()) + " left"
        );
    }
}

uint8_t ByteReader::read_u8() {
    require(1);
    return data_[pos_++];
}

int32_t ByteReader::read_i32() {
    return static_cast<int32_t>(read_u32());
}

uint32_t ByteReader::read_u32() {
    require(sizeof(uint32_t));
    uint32_t value = get_le<uint32_t>(data_ + pos_);
    pos_ += sizeof(uint32_t);
    return value;
}

int64_t ByteReader::read_i64() {
    require(sizeof(uint64_t));
    uint64_t value = get_le<uint64_t>(data_ + pos_);
    pos_ += sizeof(uint64_t);
    return static_cast<int64_t>(value);
}

uint32_t ByteReader::read_length(uint32_t max_length) {
    require(sizeof(uint32_t));
    uint32_t length = get_le<uint32_t>(data_ + pos_);
    if (length > max_length) {
        throw Error(
            ErrorKind::STREAM_CORRUPTION,
            "Length prefix " + std::to_string(length) + " at offset " +
            std::to_string(pos_) + " exceeds limit " + std::to_string(max_length)
        );
    }
    if (length > remaining() - sizeof(uint32_t)) {
        throw Error(
            ErrorKind::STREAM_CORRUPTION,
            "Length prefix " + std::to_string(length) + " at offset " +
            std::to_string(pos_) + " runs past end of stream"
        );
    }
    pos_ += sizeof(uint32_t);
    return length;
}

const uint8_t* ByteReader::read_raw(size_t length) {
    require(length);
    const uint8_t* out = data_ + pos_;
    pos_ += length;
    return out;
}

} // namespace io
} // namespace vecpart
