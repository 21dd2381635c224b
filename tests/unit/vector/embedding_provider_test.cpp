#include <gtest/gtest.h>
#include <ragrank/vector/embedding_provider.h>

using namespace ragrank;
using namespace ragrank::vector;

TEST(EmbeddingDimensionTest, AcceptsExpectedDimension) {
    EXPECT_TRUE(checkEmbeddingDimension(std::vector<float>(384, 0.1f), 384));
}

TEST(EmbeddingDimensionTest, RejectsMismatchAndEmpty) {
    auto wrong = checkEmbeddingDimension(std::vector<float>(768, 0.1f), 384);
    ASSERT_FALSE(wrong);
    EXPECT_EQ(wrong.error().code, ErrorCode::DimensionMismatch);

    auto empty = checkEmbeddingDimension({}, 384);
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().code, ErrorCode::DimensionMismatch);
}
