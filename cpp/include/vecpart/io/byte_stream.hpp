#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace vecpart {
namespace io {

/**
 * Append-only little-endian writer over a growable byte buffer.
 * Variable-width payloads are written with a uint32 length prefix.
 */
class ByteWriter {
public:
    ByteWriter() = default;
    explicit ByteWriter(size_t reserve_bytes);

    void write_u8(uint8_t value);
    void write_i32(int32_t value);
    void write_u32(uint32_t value);
    void write_i64(int64_t value);

    // uint32 length followed by the raw bytes
    void write_bytes(const void* data, size_t length);
    void write_string(const std::string& value);

    size_t size() const { return buffer_.size(); }
    const std::vector<uint8_t>& buffer() const { return buffer_; }
    std::vector<uint8_t> release();

private:
    std::vector<uint8_t> buffer_;
};

/**
 * Reader over a borrowed byte range.
 * Any read past the end throws Error(STREAM_CORRUPTION); a failed read
 * does not advance the position.
 */
class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size);
    explicit ByteReader(const std::vector<uint8_t>& bytes);

    uint8_t read_u8();
    int32_t read_i32();
    uint32_t read_u32();
    int64_t read_i64();

    // Reads a uint32 length prefix; rejects lengths above max_length
    uint32_t read_length(uint32_t max_length);

    // Pointer to the next `length` bytes, then skips them
    const uint8_t* read_raw(size_t length);

    size_t position() const { return pos_; }
    size_t remaining() const { return size_ - pos_; }
    bool at_end() const { return pos_ == size_; }

private:
    void require(size_t length) const;

    const uint8_t* data_;
    size_t size_;
    size_t pos_ = 0;
};

} // namespace io
} // namespace vecpart
