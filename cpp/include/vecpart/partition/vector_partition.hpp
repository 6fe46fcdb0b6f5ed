#pragma once

#include "iterator.hpp"
#include "partition.hpp"
#include "../columnar/allocator.hpp"
#include "../columnar/type_traits.hpp"
#include "../columnar/vector.hpp"
#include "../common/config.hpp"
#include "../common/error.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace vecpart {
namespace partition {

/**
 * Partition that owns exactly one columnar vector
 *
 * Identity is positional: two partitions are equal when collection id
 * and index match, whatever their vectors hold. The vector itself never
 * leaves the process as raw memory; write_external/read_external go
 * through the value-by-value codec.
 */
class VectorPartition : public Partition, public Externalizable {
public:
    VectorPartition(
        int64_t collection_id,
        int32_t index,
        std::unique_ptr<columnar::ValueVector> vector
    );

    // Empty target for read_external; decoded vectors use `allocator`
    explicit VectorPartition(
        std::shared_ptr<columnar::BufferAllocator> allocator,
        CodecOptions options = CodecOptions()
    );

    VectorPartition(VectorPartition&&) noexcept = default;
    VectorPartition& operator=(VectorPartition&&) noexcept = default;

    int64_t collection_id() const { return collection_id_; }
    int32_t index() const override { return index_; }

    bool has_vector() const { return vector_ != nullptr; }

    // Throws std::logic_error when no vector is held
    const columnar::ValueVector& vector() const;
    columnar::ValueVector& vector();

    // 0 when no vector is held
    size_t value_count() const;

    // Typed view; the element type must match the vector's minor type
    template<typename T>
    VectorIterator<T> iterator() const;

    // Calls f(const VectorType&) with the concrete vector
    template<typename F>
    decltype(auto) visit(F&& f) const;

    std::unique_ptr<columnar::ValueVector> release_vector();

    // Partition contract
    size_t hash() const override;
    bool equals(const Partition& other) const override;

    bool operator==(const VectorPartition& other) const;
    bool operator!=(const VectorPartition& other) const { return !(*this == other); }

    // Externalizable contract
    void write_external(io::ByteWriter& out) const override;
    void read_external(io::ByteReader& in) override;

    // "partition <index> of collection <id>"
    std::string describe() const;

private:
    int64_t collection_id_ = 0;
    int32_t index_ = 0;
    std::unique_ptr<columnar::ValueVector> vector_;

    // Used by read_external
    std::shared_ptr<columnar::BufferAllocator> allocator_;
    CodecOptions options_;
};

template<typename T>
VectorIterator<T> VectorPartition::iterator() const {
    using Traits = columnar::ElementTraits<T>;
    using VectorType = typename Traits::VectorType;

    if (!vector_) {
        return VectorIterator<T>(nullptr);
    }
    if (vector_->minor_type() != Traits::TYPE) {
        throw Error(
            ErrorKind::TYPE_MISMATCH,
            std::string("Requested ") + columnar::minor_type_name(Traits::TYPE) +
            " elements from " + columnar::minor_type_name(vector_->minor_type()) +
            " vector in " + describe()
        );
    }
    return VectorIterator<T>(static_cast<const VectorType*>(vector_.get()));
}

template<typename F>
decltype(auto) VectorPartition::visit(F&& f) const {
    const columnar::ValueVector& base = vector();
    return columnar::dispatch_minor_type(base.minor_type(), [&](auto traits) -> decltype(auto) {
        using VectorType = typename decltype(traits)::VectorType;
        return f(static_cast<const VectorType&>(base));
    });
}

} // namespace partition
} // namespace vecpart

namespace std {

template<>
struct hash<vecpart::partition::VectorPartition> {
    size_t operator()(const vecpart::partition::VectorPartition& p) const {
        return p.hash();
    }
};

} // namespace std
