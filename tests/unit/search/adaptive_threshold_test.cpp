#include <gtest/gtest.h>
#include <ragrank/search/adaptive_threshold.h>

#include "../../common/fakes.h"

using namespace ragrank;
using namespace ragrank::search;
using ragrank::test::makeScored;

class AdaptiveThresholdTest : public ::testing::Test {
protected:
    AdaptiveThreshold threshold;
};

TEST_F(AdaptiveThresholdTest, HighConfidenceUsesStrictThreshold) {
    EXPECT_DOUBLE_EQ(threshold.compute({0.9, 0.6, 0.45}), 0.5);

    auto result = threshold.apply({makeScored(1, 0.9), makeScored(2, 0.6), makeScored(3, 0.45)});
    EXPECT_DOUBLE_EQ(result.threshold, 0.5);
    EXPECT_EQ(ragrank::test::idsOf(result.kept), (std::vector<ChunkId>{1, 2}));
    EXPECT_EQ(result.dropped, 1u);
}

TEST_F(AdaptiveThresholdTest, LowConfidenceUsesLenientThreshold) {
    EXPECT_DOUBLE_EQ(threshold.compute({0.35, 0.25, 0.1}), 0.2);

    auto result = threshold.apply({makeScored(1, 0.35), makeScored(2, 0.25), makeScored(3, 0.1)});
    EXPECT_EQ(ragrank::test::idsOf(result.kept), (std::vector<ChunkId>{1, 2}));
}

TEST_F(AdaptiveThresholdTest, MediumConfidenceUsesBase) {
    EXPECT_DOUBLE_EQ(threshold.compute({0.55, 0.31, 0.29}), 0.3);
    EXPECT_DOUBLE_EQ(threshold.compute({0.55}, 0.45), 0.45);

    auto result = threshold.apply({makeScored(1, 0.55), makeScored(2, 0.31), makeScored(3, 0.29)});
    EXPECT_EQ(ragrank::test::idsOf(result.kept), (std::vector<ChunkId>{1, 2}));
}

TEST_F(AdaptiveThresholdTest, BoundariesBelongToMediumBand) {
    EXPECT_DOUBLE_EQ(threshold.compute({0.7}), 0.3);
    EXPECT_DOUBLE_EQ(threshold.compute({0.4}), 0.3);
}

TEST_F(AdaptiveThresholdTest, ScoreEqualToThresholdIsKept) {
    auto result = threshold.apply({makeScored(1, 0.9), makeScored(2, 0.5)});
    EXPECT_EQ(result.kept.size(), 2u);
}

TEST_F(AdaptiveThresholdTest, EmptyBatchReturnsBase) {
    EXPECT_DOUBLE_EQ(threshold.compute({}, 0.3), 0.3);
    auto result = threshold.apply({}, 0.25);
    EXPECT_DOUBLE_EQ(result.threshold, 0.25);
    EXPECT_TRUE(result.kept.empty());
    EXPECT_EQ(result.dropped, 0u);
}
