#include "vecpart/partition/codec.hpp"
#include "vecpart/columnar/type_registry.hpp"
#include "vecpart/common/error.hpp"

#include <glog/logging.h>

#include <limits>
#include <stdexcept>
#include <string>

namespace vecpart {
namespace partition {

namespace {

// collection_id + index + value_count + tag
constexpr size_t kHeaderBytes = 8 + 4 + 4 + 1;

std::string context(int64_t collection_id, int32_t index) {
    return " (decoding partition " + std::to_string(index) +
           " of collection " + std::to_string(collection_id) + ")";
}

} // namespace

void encode_partition(const VectorPartition& partition, io::ByteWriter& out) {
    out.write_i64(partition.collection_id());
    out.write_i32(partition.index());

    if (!partition.has_vector()) {
        out.write_i32(0);
        out.write_u8(static_cast<uint8_t>(columnar::MinorType::INT));
        return;
    }

    const columnar::ValueVector& vector = partition.vector();
    const columnar::TypeEntry& entry = columnar::VectorTypeRegistry::lookup(vector.minor_type());

    size_t count = vector.value_count();
    if (count > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        throw std::invalid_argument(
            partition.describe() + " holds " + std::to_string(count) +
            " values, more than a 32-bit count can describe"
        );
    }

    out.write_i32(static_cast<int32_t>(count));
    out.write_u8(static_cast<uint8_t>(entry.type));
    for (size_t i = 0; i < count; ++i) {
        entry.write_element(out, vector, i);
    }

    VLOG(1) << "Encoded " << partition.describe() << ": " << count << " "
            << entry.name << " values";
}

VectorPartition decode_partition(
    io::ByteReader& in,
    std::shared_ptr<columnar::BufferAllocator> allocator,
    const CodecOptions& options
) {
    if (!allocator) {
        throw std::invalid_argument("decode_partition requires an allocator");
    }

    int64_t collection_id = in.read_i64();
    int32_t index = in.read_i32();
    int32_t count = in.read_i32();
    uint8_t tag = in.read_u8();

    try {
        const columnar::TypeEntry& entry = columnar::VectorTypeRegistry::lookup(tag);

        if (index < 0) {
            throw Error(ErrorKind::STREAM_CORRUPTION, "Negative partition index " + std::to_string(index));
        }
        if (count < 0 || count > options.max_value_count) {
            throw Error(
                ErrorKind::STREAM_CORRUPTION,
                "Declared value count " + std::to_string(count) + " outside [0, " +
                std::to_string(options.max_value_count) + "]"
            );
        }

        // Reject counts the remaining bytes cannot possibly hold before allocating
        size_t value_count = static_cast<size_t>(count);
        if (value_count > in.remaining() / entry.min_encoded_bytes) {
            throw Error(
                ErrorKind::STREAM_CORRUPTION,
                "Declared " + std::to_string(value_count) + " " + entry.name +
                " values but only " + std::to_string(in.remaining()) + " bytes remain"
            );
        }

        std::unique_ptr<columnar::ValueVector> vector =
            entry.allocate(allocator, options.vector_name, value_count);
        for (size_t i = 0; i < value_count; ++i) {
            entry.read_element(in, *vector, i, options.max_element_bytes);
        }
        vector->set_value_count(value_count);

        VLOG(1) << "Decoded partition " << index << " of collection " << collection_id
                << ": " << value_count << " " << entry.name << " values";

        return VectorPartition(collection_id, index, std::move(vector));
    } catch (const Error& e) {
        throw Error(e.kind(), e.message() + context(collection_id, index));
    }
}

std::vector<uint8_t> serialize_partition(const VectorPartition& partition) {
    size_t estimate = kHeaderBytes;
    if (partition.has_vector()) {
        estimate += partition.vector().buffer_size();
    }

    io::ByteWriter out(estimate);
    encode_partition(partition, out);
    return out.release();
}

VectorPartition deserialize_partition(
    const std::vector<uint8_t>& bytes,
    std::shared_ptr<columnar::BufferAllocator> allocator,
    const CodecOptions& options
) {
    io::ByteReader in(bytes);
    VectorPartition result = decode_partition(in, std::move(allocator), options);
    if (!in.at_end()) {
        throw Error(
            ErrorKind::STREAM_CORRUPTION,
            std::to_string(in.remaining()) + " trailing bytes after " + result.describe()
        );
    }
    return result;
}

} // namespace partition
} // namespace vecpart
