#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

#include "Session/ProgressAccumulator.hpp"

using Result = ProgressAccumulator::AdvanceResult;

TEST(ProgressAccumulatorTest, StartsEmpty) {
  ProgressAccumulator progress;
  EXPECT_EQ(progress.downloadedBytes(), 0u);
  EXPECT_EQ(progress.totalBytes(), 0u);
  EXPECT_FALSE(progress.totalKnown());
  EXPECT_FALSE(progress.emptyResource());
  EXPECT_EQ(progress.percentage(), 0u);
}

TEST(ProgressAccumulatorTest, PercentageIsFloorOfRatio) {
  ProgressAccumulator progress;
  ASSERT_TRUE(progress.setTotal(3000));
  EXPECT_EQ(progress.advance(1000), Result::Ok);
  EXPECT_EQ(progress.percentage(), 33u);
  EXPECT_EQ(progress.advance(500), Result::Ok);
  EXPECT_EQ(progress.percentage(), 50u);
  EXPECT_EQ(progress.advance(1499), Result::Ok);
  EXPECT_EQ(progress.percentage(), 99u);
  EXPECT_EQ(progress.advance(1), Result::Ok);
  EXPECT_EQ(progress.percentage(), 100u);
}

TEST(ProgressAccumulatorTest, ZeroTotalNeverDivides) {
  ProgressAccumulator progress;
  ASSERT_TRUE(progress.setTotal(0));
  EXPECT_TRUE(progress.emptyResource());
  EXPECT_EQ(progress.percentage(), 0u);
}

TEST(ProgressAccumulatorTest, AdvancePastTotalIsRejected) {
  ProgressAccumulator progress;
  ASSERT_TRUE(progress.setTotal(100));
  EXPECT_EQ(progress.advance(60), Result::Ok);
  EXPECT_EQ(progress.advance(41), Result::ExceedsTotal);
  EXPECT_EQ(progress.downloadedBytes(), 60u);
  EXPECT_EQ(progress.advance(40), Result::Ok);
  EXPECT_EQ(progress.advance(1), Result::ExceedsTotal);
  EXPECT_EQ(progress.downloadedBytes(), 100u);
}

TEST(ProgressAccumulatorTest, AdvanceAfterZeroTotalIsRejected) {
  ProgressAccumulator progress;
  ASSERT_TRUE(progress.setTotal(0));
  EXPECT_EQ(progress.advance(1), Result::ExceedsTotal);
  EXPECT_EQ(progress.advance(0), Result::Ok);
  EXPECT_EQ(progress.downloadedBytes(), 0u);
}

TEST(ProgressAccumulatorTest, TotalIsSetOnce) {
  ProgressAccumulator progress;
  EXPECT_TRUE(progress.setTotal(10));
  EXPECT_FALSE(progress.setTotal(20));
  EXPECT_EQ(progress.totalBytes(), 10u);
}

TEST(ProgressAccumulatorTest, TotalBelowCountedBytesIsRejected) {
  ProgressAccumulator progress;
  EXPECT_EQ(progress.advance(50), Result::Ok);
  EXPECT_FALSE(progress.setTotal(49));
  EXPECT_FALSE(progress.totalKnown());
  EXPECT_TRUE(progress.setTotal(50));
  EXPECT_EQ(progress.percentage(), 100u);
}

TEST(ProgressAccumulatorTest, HugeTotalsDoNotOverflow) {
  const uint64_t max = std::numeric_limits<uint64_t>::max();
  ProgressAccumulator progress;
  ASSERT_TRUE(progress.setTotal(max));
  EXPECT_EQ(progress.advance(max / 2), Result::Ok);
  EXPECT_EQ(progress.percentage(), 50u);
  EXPECT_EQ(progress.advance(max - max / 2), Result::Ok);
  EXPECT_EQ(progress.percentage(), 100u);
}

TEST(ProgressAccumulatorTest, UnknownTotalGuardsAgainstWrap) {
  ProgressAccumulator progress;
  EXPECT_EQ(progress.advance(std::numeric_limits<uint64_t>::max()), Result::Ok);
  EXPECT_EQ(progress.advance(1), Result::ExceedsTotal);
}
