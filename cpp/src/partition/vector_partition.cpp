#include "vecpart/partition/vector_partition.hpp"
#include "vecpart/partition/codec.hpp"

#include <stdexcept>

namespace vecpart {
namespace partition {

VectorPartition::VectorPartition(
    int64_t collection_id,
    int32_t index,
    std::unique_ptr<columnar::ValueVector> vector
) : collection_id_(collection_id)
  , index_(index)
  , vector_(std::move(vector)) {
    if (index_ < 0) {
        throw std::invalid_argument(
            "Partition index must be non-negative, got " + std::to_string(index_)
        );
    }
    if (vector_) {
        allocator_ = vector_->allocator();
    }
}

VectorPartition::VectorPartition(
    std::shared_ptr<columnar::BufferAllocator> allocator,
    CodecOptions options
) : allocator_(std::move(allocator))
  , options_(std::move(options)) {
    if (!allocator_) {
        throw std::invalid_argument("VectorPartition requires an allocator");
    }
}

const columnar::ValueVector& VectorPartition::vector() const {
    if (!vector_) {
        throw std::logic_error(describe() + " holds no vector");
    }
    return *vector_;
}

columnar::ValueVector& VectorPartition::vector() {
    if (!vector_) {
        throw std::logic_error(describe() + " holds no vector");
    }
    return *vector_;
}

size_t VectorPartition::value_count() const {
    return vector_ ? vector_->value_count() : 0;
}

std::unique_ptr<columnar::ValueVector> VectorPartition::release_vector() {
    return std::move(vector_);
}

size_t VectorPartition::hash() const {
    uint64_t h = 43u * (43u + static_cast<uint64_t>(collection_id_)) + static_cast<uint64_t>(index_);
    return static_cast<size_t>(h);
}

bool VectorPartition::equals(const Partition& other) const {
    auto that = dynamic_cast<const VectorPartition*>(&other);
    return that != nullptr && *this == *that;
}

bool VectorPartition::operator==(const VectorPartition& other) const {
    return collection_id_ == other.collection_id_ && index_ == other.index_;
}

void VectorPartition::write_external(io::ByteWriter& out) const {
    encode_partition(*this, out);
}

void VectorPartition::read_external(io::ByteReader& in) {
    auto allocator = allocator_ ? allocator_ : columnar::BufferAllocator::create();
    VectorPartition decoded = decode_partition(in, allocator, options_);

    // Replace the whole partition; a failed decode leaves *this untouched
    decoded.options_ = options_;
    *this = std::move(decoded);
}

std::string VectorPartition::describe() const {
    return "partition " + std::to_string(index_) + " of collection " + std::to_string(collection_id_);
}

} // namespace partition
} // namespace vecpart
