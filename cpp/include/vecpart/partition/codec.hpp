#pragma once

#include "vector_partition.hpp"
#include "../columnar/allocator.hpp"
#include "../common/config.hpp"
#include "../io/byte_stream.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace vecpart {
namespace partition {

/**
 * Partition externalization
 *
 * Layout, little-endian:
 *   int64 collection_id | int32 index | int32 value_count | uint8 minor type tag
 *   then value_count elements; INT as int32, BIGINT as int64,
 *   VARBINARY and VARCHAR as uint32 length + bytes.
 *
 * A partition without a vector is written as zero INT values.
 */
void encode_partition(const VectorPartition& partition, io::ByteWriter& out);

// Reads one partition; failures leave no memory charged to `allocator`
VectorPartition decode_partition(
    io::ByteReader& in,
    std::shared_ptr<columnar::BufferAllocator> allocator,
    const CodecOptions& options = CodecOptions()
);

std::vector<uint8_t> serialize_partition(const VectorPartition& partition);

// Like decode_partition, but the payload must hold exactly one partition
VectorPartition deserialize_partition(
    const std::vector<uint8_t>& bytes,
    std::shared_ptr<columnar::BufferAllocator> allocator,
    const CodecOptions& options = CodecOptions()
);

} // namespace partition
} // namespace vecpart
