#pragma once

#include "vector.hpp"
#include "../io/byte_stream.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace vecpart {
namespace columnar {

/**
 * How one MinorType is allocated, read from and written to a stream
 */
struct TypeEntry {
    MinorType type;
    const char* name;

    // Smallest encoded size of one element, used to bound declared counts
    size_t min_encoded_bytes;

    std::unique_ptr<ValueVector> (*allocate)(
        std::shared_ptr<BufferAllocator> allocator,
        const std::string& name,
        size_t capacity
    );

    // Reads one element and stores it in `slot`
    void (*read_element)(
        io::ByteReader& in,
        ValueVector& vector,
        size_t slot,
        uint32_t max_element_bytes
    );

    void (*write_element)(io::ByteWriter& out, const ValueVector& vector, size_t slot);
};

/**
 * Closed registry with exactly one entry per MinorType
 */
class VectorTypeRegistry {
public:
    // Throws Error(UNSUPPORTED_TYPE) for unknown tags
    static const TypeEntry& lookup(uint8_t tag);
    static const TypeEntry& lookup(MinorType type);

    static const std::vector<TypeEntry>& entries();
};

} // namespace columnar
} // namespace vecpart
