#pragma once

#include "vecpart/columnar/allocator.hpp"
#include "vecpart/columnar/type_traits.hpp"
#include "vecpart/columnar/vector.hpp"
#include "vecpart/common/error.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

namespace vecpart {
namespace test {

/// Builds a populated vector of the type matching element type T.
template<typename T>
std::unique_ptr<typename columnar::ElementTraits<T>::VectorType> makeVector(
        const std::shared_ptr<columnar::BufferAllocator>& allocator,
        const std::vector<T>& values,
        const std::string& name = "vector") {
    using VectorType = typename columnar::ElementTraits<T>::VectorType;
    auto vector = std::make_unique<VectorType>(name, allocator);
    vector->allocate_new(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        vector->set_safe(i, values[i]);
    }
    vector->set_value_count(values.size());
    return vector;
}

inline columnar::Bytes toBytes(const std::string& s) {
    return columnar::Bytes(s.begin(), s.end());
}

} // namespace test
} // namespace vecpart

/// Asserts that `statement` throws vecpart::Error of the given kind.
#define VECPART_ASSERT_THROWS_KIND(statement, expectedKind)      \
    do {                                                         \
        try {                                                    \
            statement;                                           \
            FAIL() << "Expected vecpart::Error of kind "         \
                   << ::vecpart::error_kind_name(expectedKind);  \
        } catch (const ::vecpart::Error& e) {                    \
            EXPECT_EQ(e.kind(), expectedKind) << e.what();       \
        }                                                        \
    } while (false)
