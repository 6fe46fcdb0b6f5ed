#pragma once

#include "../columnar/allocator.hpp"
#include "../columnar/vector.hpp"
#include "../common/config.hpp"
#include "../ops/aggregate.hpp"
#include "../partition/vector_partition.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace vecpart {
namespace collection {

/**
 * Distributed collection built from an array of vectors
 *
 * The values of all input vectors, taken in order, are cut into
 * num_partitions contiguous slices; slice i covers positions
 * [i * n / N, (i + 1) * n / N). Each slice is copied into a vector owned
 * by partition i, and the input vectors are released.
 */
class VectorCollection {
public:
    VectorCollection(
        std::vector<std::unique_ptr<columnar::ValueVector>> vectors,
        size_t num_partitions,
        std::shared_ptr<columnar::BufferAllocator> allocator,
        CollectionOptions options = CollectionOptions()
    );

    int64_t id() const { return id_; }
    columnar::MinorType minor_type() const { return minor_type_; }
    size_t num_partitions() const { return partitions_.size(); }
    size_t total_values() const { return total_values_; }

    const partition::VectorPartition& get_partition(size_t index) const;
    const std::vector<partition::VectorPartition>& partitions() const { return partitions_; }

    // Encoded form of partition `index`, ready for dispatch to a worker
    std::vector<uint8_t> ship(size_t index) const;

    // Rebuilds a shipped partition; it must belong to this collection
    partition::VectorPartition receive(const std::vector<uint8_t>& bytes) const;

    // All elements, concatenated in ascending partition index
    template<typename T>
    std::vector<T> collect() const;

    std::optional<int64_t> aggregate(ops::AggregateFunction function) const;

    // Process-wide, monotonically increasing
    static int64_t next_collection_id();

private:
    void slice_into_partitions(
        const std::vector<std::unique_ptr<columnar::ValueVector>>& vectors,
        size_t num_partitions
    );

    int64_t id_;
    columnar::MinorType minor_type_ = columnar::MinorType::INT;
    size_t total_values_ = 0;
    std::shared_ptr<columnar::BufferAllocator> allocator_;
    CollectionOptions options_;
    std::vector<partition::VectorPartition> partitions_;
};

template<typename T>
std::vector<T> VectorCollection::collect() const {
    std::vector<T> out;
    out.reserve(total_values_);
    for (const auto& p : partitions_) {
        auto it = p.iterator<T>();
        while (it.has_next()) {
            out.push_back(it.next());
        }
    }
    return out;
}

} // namespace collection
} // namespace vecpart
