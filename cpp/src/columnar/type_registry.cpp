#include "vecpart/columnar/type_registry.hpp"
#include "vecpart/columnar/type_traits.hpp"
#include "vecpart/common/error.hpp"

#include <type_traits>

namespace vecpart {
namespace columnar {

namespace {

template<MinorType kType>
std::unique_ptr<ValueVector> allocate_vector(
    std::shared_ptr<BufferAllocator> allocator,
    const std::string& name,
    size_t capacity
) {
    using VectorType = typename MinorTypeTraits<kType>::VectorType;
    auto vector = std::make_unique<VectorType>(name, std::move(allocator));
    vector->allocate_new(capacity);
    return vector;
}

template<MinorType kType>
void read_element(io::ByteReader& in, ValueVector& vector, size_t slot, uint32_t max_element_bytes) {
    using Traits = MinorTypeTraits<kType>;
    auto& typed = static_cast<typename Traits::VectorType&>(vector);

    if constexpr (std::is_same_v<typename Traits::ValueType, int32_t>) {
        typed.set_safe(slot, in.read_i32());
    } else if constexpr (std::is_same_v<typename Traits::ValueType, int64_t>) {
        typed.set_safe(slot, in.read_i64());
    } else {
        uint32_t length = in.read_length(max_element_bytes);
        typed.set_safe(slot, in.read_raw(length), length);
    }
}

template<MinorType kType>
void write_element(io::ByteWriter& out, const ValueVector& vector, size_t slot) {
    using Traits = MinorTypeTraits<kType>;
    const auto& typed = static_cast<const typename Traits::VectorType&>(vector);

    if constexpr (std::is_same_v<typename Traits::ValueType, int32_t>) {
        out.write_i32(typed.get(slot));
    } else if constexpr (std::is_same_v<typename Traits::ValueType, int64_t>) {
        out.write_i64(typed.get(slot));
    } else {
        std::string_view view = typed.get_view(slot);
        out.write_bytes(view.data(), view.size());
    }
}

template<MinorType kType>
TypeEntry make_entry() {
    using Traits = MinorTypeTraits<kType>;
    constexpr size_t min_bytes = Traits::FIXED_WIDTH
        ? sizeof(typename Traits::ValueType)
        : sizeof(uint32_t);

    return TypeEntry{
        kType,
        minor_type_name(kType),
        min_bytes,
        &allocate_vector<kType>,
        &read_element<kType>,
        &write_element<kType>
    };
}

} // namespace

const std::vector<TypeEntry>& VectorTypeRegistry::entries() {
    static const std::vector<TypeEntry> registry = {
        make_entry<MinorType::INT>(),
        make_entry<MinorType::BIGINT>(),
        make_entry<MinorType::VARBINARY>(),
        make_entry<MinorType::VARCHAR>(),
    };
    return registry;
}

const TypeEntry& VectorTypeRegistry::lookup(uint8_t tag) {
    for (const auto& entry : entries()) {
        if (static_cast<uint8_t>(entry.type) == tag) {
            return entry;
        }
    }
    throw Error(
        ErrorKind::UNSUPPORTED_TYPE,
        "No vector type registered for tag " + std::to_string(static_cast<int>(tag))
    );
}

const TypeEntry& VectorTypeRegistry::lookup(MinorType type) {
    return lookup(static_cast<uint8_t>(type));
}

} // namespace columnar
} // namespace vecpart
