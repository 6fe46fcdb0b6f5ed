#include "vecpart/columnar/allocator.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <cstring>

using namespace vecpart;
using namespace vecpart::columnar;

TEST(BufferAllocatorTest, tracksAndReleases) {
    auto allocator = BufferAllocator::create("test");
    {
        Buffer a = allocator->allocate(64);
        Buffer b = allocator->allocate(32);
        EXPECT_EQ(allocator->allocated_bytes(), 96u);
        EXPECT_EQ(a.size(), 64u);
        for (size_t i = 0; i < a.size(); ++i) {
            EXPECT_EQ(a.data()[i], 0);
        }
    }
    EXPECT_EQ(allocator->allocated_bytes(), 0u);
    EXPECT_EQ(allocator->peak_bytes(), 96u);
}

TEST(BufferAllocatorTest, limitIsEnforced) {
    auto allocator = BufferAllocator::create("small", 100);
    Buffer a = allocator->allocate(60);
    VECPART_ASSERT_THROWS_KIND(allocator->allocate(41), ErrorKind::ALLOCATION_FAILURE);
    EXPECT_EQ(allocator->allocated_bytes(), 60u);

    Buffer b = allocator->allocate(40);
    EXPECT_EQ(allocator->allocated_bytes(), 100u);
}

TEST(BufferAllocatorTest, reallocateKeepsPrefix) {
    auto allocator = BufferAllocator::create();
    Buffer buffer = allocator->allocate(4);
    std::memcpy(buffer.data(), "abcd", 4);

    buffer = allocator->reallocate(std::move(buffer), 8);
    EXPECT_EQ(buffer.size(), 8u);
    EXPECT_EQ(std::memcmp(buffer.data(), "abcd", 4), 0);
    EXPECT_EQ(buffer.data()[7], 0);
    EXPECT_EQ(allocator->allocated_bytes(), 8u);
}

TEST(BufferAllocatorTest, moveTransfersCharge) {
    auto allocator = BufferAllocator::create();
    Buffer a = allocator->allocate(16);
    Buffer b = std::move(a);
    EXPECT_EQ(a.size(), 0u);
    EXPECT_EQ(allocator->allocated_bytes(), 16u);
    b.reset();
    EXPECT_EQ(allocator->allocated_bytes(), 0u);
}
