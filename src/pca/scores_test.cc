#include "gtest/gtest.h"

#include <cmath>

#include <pca/scores.hpp>

namespace mousepca {
namespace {

ScoreMatrix MakeScores(long rows) {
  ScoreMatrix scores;
  scores.session_key = "session";
  scores.scores.resize(rows, 2);
  scores.frame_index.resize(rows);
  for (long row = 0; row < rows; ++row) {
    scores.scores(row, 0) = row;
    scores.scores(row, 1) = -row;
    scores.frame_index(row) = row;
  }
  return scores;
}

class InsertDroppedFramesTest : public ::testing::Test {};

TEST_F(InsertDroppedFramesTest, FillsOneMissingFrame) {
  // 30 fps: 33333 usec per frame, the third frame comes two intervals late.
  const ScoreMatrix filled =
      InsertDroppedFrames(MakeScores(3), {0, 33333, 100000}, 30);
  ASSERT_EQ(filled.rows(), 4);
  EXPECT_DOUBLE_EQ(filled.scores(1, 0), 1.0);
  EXPECT_TRUE(IsSentinelRow(filled, 2));
  EXPECT_TRUE(std::isnan(filled.frame_index(2)));
  EXPECT_DOUBLE_EQ(filled.scores(3, 0), 2.0);
  EXPECT_DOUBLE_EQ(filled.frame_index(3), 2.0);
}

TEST_F(InsertDroppedFramesTest, FillsSeveralGaps) {
  // Gaps of 3 and 5 intervals.
  const ScoreMatrix filled =
      InsertDroppedFrames(MakeScores(3), {0, 100000, 266667}, 30);
  ASSERT_EQ(filled.rows(), 3 + 2 + 4);
  EXPECT_FALSE(IsSentinelRow(filled, 0));
  EXPECT_TRUE(IsSentinelRow(filled, 1));
  EXPECT_TRUE(IsSentinelRow(filled, 2));
  EXPECT_DOUBLE_EQ(filled.frame_index(3), 1.0);
  for (long row = 4; row < 8; ++row) {
    EXPECT_TRUE(IsSentinelRow(filled, row)) << row;
  }
  EXPECT_DOUBLE_EQ(filled.frame_index(8), 2.0);
}

TEST_F(InsertDroppedFramesTest, SmallJitterIsNotAGap) {
  const ScoreMatrix filled =
      InsertDroppedFrames(MakeScores(3), {0, 40000, 80000}, 30);
  EXPECT_EQ(filled.rows(), 3);
}

TEST_F(InsertDroppedFramesTest, NoTimestamps) {
  EXPECT_EQ(InsertDroppedFrames(MakeScores(3), {}, 30).rows(), 3);
}

TEST_F(InsertDroppedFramesTest, NonIncreasingTimestampsDie) {
  // A frame without a timestamp must never be mistaken for a gap.
  EXPECT_DEATH(InsertDroppedFrames(MakeScores(3), {33333, 0, 66667}, 30),
               "do not increase at frame 1");
}

class ClipScoresTest : public ::testing::Test {};

TEST_F(ClipScoresTest, FromStart) {
  const ScoreMatrix clipped = ClipScores(MakeScores(5), 2, false);
  ASSERT_EQ(clipped.rows(), 3);
  EXPECT_DOUBLE_EQ(clipped.scores(0, 0), 2.0);
  EXPECT_DOUBLE_EQ(clipped.frame_index(0), 2.0);
  EXPECT_EQ(clipped.session_key, "session");
}

TEST_F(ClipScoresTest, FromEnd) {
  const ScoreMatrix clipped = ClipScores(MakeScores(5), 2, true);
  ASSERT_EQ(clipped.rows(), 3);
  EXPECT_DOUBLE_EQ(clipped.scores(2, 0), 2.0);
  EXPECT_DOUBLE_EQ(clipped.frame_index(2), 2.0);
}

TEST_F(ClipScoresTest, ClipMoreThanAvailable) {
  const ScoreMatrix clipped = ClipScores(MakeScores(3), 10, false);
  EXPECT_EQ(clipped.rows(), 0);
  EXPECT_EQ(clipped.frame_index.size(), 0);
}

TEST_F(ClipScoresTest, ClipNothing) {
  EXPECT_EQ(ClipScores(MakeScores(3), 0, true).rows(), 3);
}

} // namespace
} // namespace mousepca
