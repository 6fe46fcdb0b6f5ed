#pragma once

#include "vector.hpp"
#include "../common/error.hpp"

#include <cstdint>
#include <string>
#include <utility>

namespace vecpart {
namespace columnar {

/**
 * Compile-time description of each MinorType.
 * Only the specializations below exist; there is no generic fallback.
 */
template<MinorType kType>
struct MinorTypeTraits;

template<>
struct MinorTypeTraits<MinorType::INT> {
    using VectorType = IntVector;
    using ValueType = int32_t;
    static constexpr MinorType TYPE = MinorType::INT;
    static constexpr bool FIXED_WIDTH = true;
};

template<>
struct MinorTypeTraits<MinorType::BIGINT> {
    using VectorType = BigIntVector;
    using ValueType = int64_t;
    static constexpr MinorType TYPE = MinorType::BIGINT;
    static constexpr bool FIXED_WIDTH = true;
};

template<>
struct MinorTypeTraits<MinorType::VARBINARY> {
    using VectorType = VarBinaryVector;
    using ValueType = Bytes;
    static constexpr MinorType TYPE = MinorType::VARBINARY;
    static constexpr bool FIXED_WIDTH = false;
};

template<>
struct MinorTypeTraits<MinorType::VARCHAR> {
    using VectorType = VarCharVector;
    using ValueType = std::string;
    static constexpr MinorType TYPE = MinorType::VARCHAR;
    static constexpr bool FIXED_WIDTH = false;
};

/**
 * Element type -> MinorType. Instantiating with any other element
 * type fails to compile, which is how typed iteration is checked
 * statically.
 */
template<typename T>
struct ElementTraits;

template<>
struct ElementTraits<int32_t> : MinorTypeTraits<MinorType::INT> {};

template<>
struct ElementTraits<int64_t> : MinorTypeTraits<MinorType::BIGINT> {};

template<>
struct ElementTraits<Bytes> : MinorTypeTraits<MinorType::VARBINARY> {};

template<>
struct ElementTraits<std::string> : MinorTypeTraits<MinorType::VARCHAR> {};

/**
 * Calls f(MinorTypeTraits<type>{}) for the runtime type.
 * Every MinorType has a case; anything else is UNSUPPORTED_TYPE.
 */
template<typename F>
decltype(auto) dispatch_minor_type(MinorType type, F&& f) {
    switch (type) {
        case MinorType::INT:
            return std::forward<F>(f)(MinorTypeTraits<MinorType::INT>{});
        case MinorType::BIGINT:
            return std::forward<F>(f)(MinorTypeTraits<MinorType::BIGINT>{});
        case MinorType::VARBINARY:
            return std::forward<F>(f)(MinorTypeTraits<MinorType::VARBINARY>{});
        case MinorType::VARCHAR:
            return std::forward<F>(f)(MinorTypeTraits<MinorType::VARCHAR>{});
    }
    throw Error(
        ErrorKind::UNSUPPORTED_TYPE,
        "Minor type tag " + std::to_string(static_cast<int>(type)) + " is not supported"
    );
}

} // namespace columnar
} // namespace vecpart
