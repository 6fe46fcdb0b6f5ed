#ifdef VECPART_USE_ARROW

#include "vecpart/columnar/vector.hpp"
#include "test_utils.hpp"

#include <arrow/api.h>
#include <gtest/gtest.h>

using namespace vecpart;
using namespace vecpart::columnar;
using vecpart::test::makeVector;

class ArrowInteropTest : public testing::Test {
protected:
    std::shared_ptr<BufferAllocator> allocator_ = BufferAllocator::create("arrow-test");
};

TEST_F(ArrowInteropTest, intVectorToArrowAndBack) {
    auto vector = makeVector<int32_t>(allocator_, {3, 1, 2});
    auto array = vector->to_arrow();
    ASSERT_EQ(array->type_id(), arrow::Type::INT32);
    ASSERT_EQ(array->length(), 3);

    auto back = from_arrow(*array, allocator_);
    ASSERT_EQ(back->minor_type(), MinorType::INT);
    EXPECT_EQ(static_cast<IntVector&>(*back).get(0), 3);
    EXPECT_EQ(static_cast<IntVector&>(*back).get(2), 2);
}

TEST_F(ArrowInteropTest, stringVectorToArrowAndBack) {
    auto vector = makeVector<std::string>(allocator_, {"a", "", "ccc"});
    auto array = vector->to_arrow();
    ASSERT_EQ(array->type_id(), arrow::Type::STRING);

    auto back = from_arrow(*array, allocator_);
    auto& typed = static_cast<VarCharVector&>(*back);
    EXPECT_EQ(typed.get(0), "a");
    EXPECT_EQ(typed.get(1), "");
    EXPECT_EQ(typed.get(2), "ccc");
}

TEST_F(ArrowInteropTest, nullsAreRejected) {
    arrow::Int64Builder builder;
    ASSERT_TRUE(builder.Append(1).ok());
    ASSERT_TRUE(builder.AppendNull().ok());
    std::shared_ptr<arrow::Array> array;
    ASSERT_TRUE(builder.Finish(&array).ok());

    EXPECT_THROW(from_arrow(*array, allocator_), std::invalid_argument);
}

TEST_F(ArrowInteropTest, unsupportedArrowType) {
    arrow::DoubleBuilder builder;
    ASSERT_TRUE(builder.Append(1.5).ok());
    std::shared_ptr<arrow::Array> array;
    ASSERT_TRUE(builder.Finish(&array).ok());

    VECPART_ASSERT_THROWS_KIND(from_arrow(*array, allocator_), ErrorKind::UNSUPPORTED_TYPE);
}

#endif
