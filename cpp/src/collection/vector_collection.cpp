#include "vecpart/collection/vector_collection.hpp"
#include "vecpart/columnar/type_registry.hpp"
#include "vecpart/common/error.hpp"
#include "vecpart/partition/codec.hpp"

#include <glog/logging.h>

#include <atomic>
#include <limits>
#include <stdexcept>
#include <string>

namespace vecpart {
namespace collection {

int64_t VectorCollection::next_collection_id() {
    static std::atomic<int64_t> next_id{0};
    return next_id.fetch_add(1);
}

VectorCollection::VectorCollection(
    std::vector<std::unique_ptr<columnar::ValueVector>> vectors,
    size_t num_partitions,
    std::shared_ptr<columnar::BufferAllocator> allocator,
    CollectionOptions options
) : id_(next_collection_id())
  , allocator_(std::move(allocator))
  , options_(std::move(options)) {
    if (!allocator_) {
        throw std::invalid_argument("VectorCollection requires an allocator");
    }
    if (num_partitions == 0) {
        throw std::invalid_argument("Number of partitions must be positive");
    }
    if (num_partitions > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        throw std::invalid_argument(
            "Number of partitions " + std::to_string(num_partitions) + " exceeds the index range"
        );
    }
    if (vectors.empty()) {
        throw std::invalid_argument("VectorCollection requires at least one vector");
    }

    for (const auto& vector : vectors) {
        if (!vector) {
            throw std::invalid_argument("Cannot build a collection from a null vector");
        }
    }

    minor_type_ = vectors.front()->minor_type();
    for (const auto& vector : vectors) {
        if (vector->minor_type() != minor_type_) {
            throw std::invalid_argument(
                std::string("Mixed vector types: ") + columnar::minor_type_name(minor_type_) +
                " and " + columnar::minor_type_name(vector->minor_type())
            );
        }
        total_values_ += vector->value_count();
    }

    slice_into_partitions(vectors, num_partitions);

    LOG(INFO) << "Created collection " << id_ << ": " << total_values_ << " "
              << columnar::minor_type_name(minor_type_) << " values in "
              << partitions_.size() << " partitions";
}

void VectorCollection::slice_into_partitions(
    const std::vector<std::unique_ptr<columnar::ValueVector>>& vectors,
    size_t num_partitions
) {
    const columnar::TypeEntry& entry = columnar::VectorTypeRegistry::lookup(minor_type_);
    const std::string& name = vectors.front()->name();

    // A lone input on the collection's allocator is sliced directly
    const bool direct = vectors.size() == 1 && vectors.front()->allocator() == allocator_;

    // Cursor over the concatenated input
    size_t source = 0;
    size_t source_offset = 0;

    partitions_.reserve(num_partitions);
    for (size_t i = 0; i < num_partitions; ++i) {
        size_t start = i * total_values_ / num_partitions;
        size_t end = (i + 1) * total_values_ / num_partitions;
        size_t length = end - start;

        std::unique_ptr<columnar::ValueVector> part;
        if (direct) {
            part = vectors.front()->slice(start, length);
        } else {
            part = entry.allocate(allocator_, name, length);
            for (size_t slot = 0; slot < length; ++slot) {
                while (source_offset >= vectors[source]->value_count()) {
                    ++source;
                    source_offset = 0;
                }
                part->copy_from_safe(source_offset++, slot, *vectors[source]);
            }
            part->set_value_count(length);
        }

        VLOG(1) << "Collection " << id_ << " partition " << i << " covers ["
                << start << ", " << end << ")";

        partitions_.emplace_back(id_, static_cast<int32_t>(i), std::move(part));
    }
}

const partition::VectorPartition& VectorCollection::get_partition(size_t index) const {
    if (index >= partitions_.size()) {
        throw std::out_of_range(
            "Partition " + std::to_string(index) + " out of range for collection " +
            std::to_string(id_) + " with " + std::to_string(partitions_.size()) + " partitions"
        );
    }
    return partitions_[index];
}

std::vector<uint8_t> VectorCollection::ship(size_t index) const {
    const partition::VectorPartition& p = get_partition(index);
    std::vector<uint8_t> bytes = partition::serialize_partition(p);

    if (options_.verify_on_ship) {
        partition::VectorPartition check =
            partition::deserialize_partition(bytes, allocator_, options_.codec);
        if (check != p || check.value_count() != p.value_count()) {
            throw std::logic_error("Encoded " + p.describe() + " does not decode to itself");
        }
    }
    return bytes;
}

partition::VectorPartition VectorCollection::receive(const std::vector<uint8_t>& bytes) const {
    try {
        partition::VectorPartition p =
            partition::deserialize_partition(bytes, allocator_, options_.codec);
        if (p.collection_id() != id_) {
            throw std::invalid_argument(
                p.describe() + " was shipped to collection " + std::to_string(id_)
            );
        }
        return p;
    } catch (const Error& e) {
        LOG(WARNING) << "Collection " << id_ << " failed to receive partition ("
                     << bytes.size() << " bytes): " << e.what();
        throw;
    }
}

std::optional<int64_t> VectorCollection::aggregate(ops::AggregateFunction function) const {
    std::optional<int64_t> result;
    if (function == ops::AggregateFunction::SUM || function == ops::AggregateFunction::COUNT) {
        result = 0;
    }
    for (const auto& p : partitions_) {
        result = ops::combine(function, result, ops::aggregate(p, function));
    }
    return result;
}

} // namespace collection
} // namespace vecpart
