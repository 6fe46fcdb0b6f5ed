#include "vecpart/partition/vector_partition.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <unordered_set>

using namespace vecpart;
using namespace vecpart::columnar;
using namespace vecpart::partition;
using vecpart::test::makeVector;

class VectorPartitionTest : public testing::Test {
protected:
    std::shared_ptr<BufferAllocator> allocator_ = BufferAllocator::create("partition-test");
};

TEST_F(VectorPartitionTest, iteratorYieldsValuesInOrderThenStops) {
    VectorPartition p(1, 0, makeVector<int32_t>(allocator_, {5, 6, 7}));

    auto it = p.iterator<int32_t>();
    std::vector<int32_t> seen;
    while (it.has_next()) {
        seen.push_back(it.next());
    }
    EXPECT_EQ(seen, (std::vector<int32_t>{5, 6, 7}));
    EXPECT_FALSE(it.has_next());
    EXPECT_THROW(it.next(), std::out_of_range);

    // A fresh iterator starts over
    auto again = p.iterator<int32_t>();
    ASSERT_TRUE(again.has_next());
    EXPECT_EQ(again.next(), 5);
}

TEST_F(VectorPartitionTest, iteratorTypeMismatchFailsFast) {
    VectorPartition p(1, 3, makeVector<int64_t>(allocator_, {1}));
    VECPART_ASSERT_THROWS_KIND(p.iterator<int32_t>(), ErrorKind::TYPE_MISMATCH);
    VECPART_ASSERT_THROWS_KIND(p.iterator<std::string>(), ErrorKind::TYPE_MISMATCH);

    try {
        p.iterator<Bytes>();
        FAIL();
    } catch (const Error& e) {
        EXPECT_NE(std::string(e.what()).find("partition 3 of collection 1"), std::string::npos);
    }
}

TEST_F(VectorPartitionTest, identityIgnoresPayload) {
    VectorPartition a(7, 2, makeVector<int32_t>(allocator_, {1, 2, 3}));
    VectorPartition b(7, 2, makeVector<std::string>(allocator_, {"x"}));
    VectorPartition c(7, 3, makeVector<int32_t>(allocator_, {1, 2, 3}));
    VectorPartition d(8, 2, makeVector<int32_t>(allocator_, {1, 2, 3}));

    EXPECT_EQ(a, b);
    EXPECT_TRUE(a.equals(b));
    EXPECT_EQ(a.hash(), b.hash());
    EXPECT_EQ(std::hash<VectorPartition>()(a), std::hash<VectorPartition>()(b));
    EXPECT_NE(a, c);
    EXPECT_NE(a, d);
    EXPECT_EQ(a.hash(), 43u * (43u + 7u) + 2u);

    std::unordered_set<size_t> keys = {a.hash(), b.hash(), c.hash(), d.hash()};
    EXPECT_EQ(keys.size(), 3u);
}

TEST_F(VectorPartitionTest, negativeIndexRejected) {
    EXPECT_THROW(VectorPartition(1, -1, makeVector<int32_t>(allocator_, {})), std::invalid_argument);
}

TEST_F(VectorPartitionTest, absentVectorIteratesEmpty) {
    VectorPartition p(4, 0, nullptr);
    EXPECT_FALSE(p.has_vector());
    EXPECT_EQ(p.value_count(), 0u);
    EXPECT_FALSE(p.iterator<std::string>().has_next());
    EXPECT_THROW(p.vector(), std::logic_error);
}

TEST_F(VectorPartitionTest, visitSeesConcreteVector) {
    VectorPartition p(1, 0, makeVector<std::string>(allocator_, {"a", "bb"}));
    size_t total = p.visit([](const auto& vector) {
        size_t bytes = 0;
        for (size_t i = 0; i < vector.value_count(); ++i) {
            bytes += vector.value_to_string(i).size();
        }
        return bytes;
    });
    EXPECT_EQ(total, 3u);
}

TEST_F(VectorPartitionTest, externalizeThroughEngineContract) {
    VectorPartition source(11, 4, makeVector<int64_t>(allocator_, {-1, 0, 1}));

    io::ByteWriter out;
    const Externalizable& writable = source;
    writable.write_external(out);

    auto remote = BufferAllocator::create("remote");
    VectorPartition target(remote);
    io::ByteReader in(out.buffer());
    target.read_external(in);

    EXPECT_EQ(target, source);
    EXPECT_EQ(target.index(), 4);
    EXPECT_EQ(target.vector().allocator(), remote);
    EXPECT_GT(remote->allocated_bytes(), 0u);

    auto it = target.iterator<int64_t>();
    EXPECT_EQ(it.next(), -1);
    EXPECT_EQ(it.next(), 0);
    EXPECT_EQ(it.next(), 1);
    EXPECT_FALSE(it.has_next());
}

TEST_F(VectorPartitionTest, failedReadExternalLeavesPartitionUntouched) {
    VectorPartition p(2, 1, makeVector<int32_t>(allocator_, {9}));
    std::vector<uint8_t> garbage = {1, 2, 3};
    io::ByteReader in(garbage);
    VECPART_ASSERT_THROWS_KIND(p.read_external(in), ErrorKind::STREAM_CORRUPTION);
    EXPECT_EQ(p.index(), 1);
    EXPECT_EQ(p.iterator<int32_t>().next(), 9);
}

TEST_F(VectorPartitionTest, releasingVectorReturnsOwnership) {
    VectorPartition p(2, 1, makeVector<int32_t>(allocator_, {9, 10}));
    auto vector = p.release_vector();
    ASSERT_NE(vector, nullptr);
    EXPECT_EQ(vector->value_count(), 2u);
    EXPECT_FALSE(p.has_vector());
}
