#pragma once

#include "../io/byte_stream.hpp"

#include <cstddef>
#include <cstdint>

namespace vecpart {
namespace partition {

/**
 * Engine-side view of a unit of distributed work.
 * index() is stable for the partition's life; equality and hash are used
 * as scheduling and cache keys.
 */
class Partition {
public:
    virtual ~Partition() = default;

    virtual int32_t index() const = 0;
    virtual size_t hash() const = 0;
    virtual bool equals(const Partition& other) const = 0;
};

/**
 * Explicit byte-level persistence, invoked by the engine whenever a
 * partition crosses a process or worker boundary
 */
class Externalizable {
public:
    virtual ~Externalizable() = default;

    virtual void write_external(io::ByteWriter& out) const = 0;
    virtual void read_external(io::ByteReader& in) = 0;
};

} // namespace partition
} // namespace vecpart
