#include "vecpart/columnar/type_registry.hpp"
#include "vecpart/columnar/type_traits.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <set>

using namespace vecpart;
using namespace vecpart::columnar;

TEST(VectorTypeRegistryTest, oneEntryPerMinorType) {
    std::set<MinorType> seen;
    for (const auto& entry : VectorTypeRegistry::entries()) {
        EXPECT_TRUE(seen.insert(entry.type).second) << entry.name;
    }
    EXPECT_EQ(seen.size(), 4u);

    EXPECT_EQ(VectorTypeRegistry::lookup(MinorType::VARCHAR).type, MinorType::VARCHAR);
    EXPECT_STREQ(VectorTypeRegistry::lookup(uint8_t{2}).name, "BIGINT");
}

TEST(VectorTypeRegistryTest, unknownTagIsUnsupported) {
    VECPART_ASSERT_THROWS_KIND(VectorTypeRegistry::lookup(uint8_t{0}), ErrorKind::UNSUPPORTED_TYPE);
    VECPART_ASSERT_THROWS_KIND(VectorTypeRegistry::lookup(uint8_t{42}), ErrorKind::UNSUPPORTED_TYPE);
}

TEST(VectorTypeRegistryTest, allocateGivesEmptyVectorOfType) {
    auto allocator = BufferAllocator::create();
    for (const auto& entry : VectorTypeRegistry::entries()) {
        auto vector = entry.allocate(allocator, "v", 8);
        EXPECT_EQ(vector->minor_type(), entry.type);
        EXPECT_EQ(vector->value_count(), 0u);
        EXPECT_GE(vector->value_capacity(), 8u);
    }
    EXPECT_EQ(allocator->allocated_bytes(), 0u);
}

TEST(VectorTypeRegistryTest, writeThenReadElement) {
    auto allocator = BufferAllocator::create();
    auto source = test::makeVector<std::string>(allocator, {"xy"});
    const auto& entry = VectorTypeRegistry::lookup(MinorType::VARCHAR);

    io::ByteWriter out;
    entry.write_element(out, *source, 0);
    EXPECT_EQ(out.size(), 4u + 2u);

    auto target = entry.allocate(allocator, "t", 1);
    io::ByteReader in(out.buffer());
    entry.read_element(in, *target, 0, 1024);
    target->set_value_count(1);
    EXPECT_EQ(static_cast<VarCharVector&>(*target).get(0), "xy");
}

TEST(VectorTypeRegistryTest, dispatchCoversEveryType) {
    for (const auto& entry : VectorTypeRegistry::entries()) {
        MinorType seen = dispatch_minor_type(entry.type, [](auto traits) { return decltype(traits)::TYPE; });
        EXPECT_EQ(seen, entry.type);
    }
    VECPART_ASSERT_THROWS_KIND(
            dispatch_minor_type(static_cast<MinorType>(9), [](auto) { return 0; }),
            ErrorKind::UNSUPPORTED_TYPE);
}
