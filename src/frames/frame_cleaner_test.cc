#include "gtest/gtest.h"

#include <frames/frame_cleaner.hpp>

namespace mousepca {
namespace {

Session MakeConstantSession(const std::vector<float> &values,
                            const std::vector<bool> &valid) {
  Session session;
  session.key = "cleaning";
  for (size_t idx = 0; idx < values.size(); ++idx) {
    session.frames.push_back(valid.at(idx) ? cv::Mat(4, 5, CV_32F,
                                                     cv::Scalar(values.at(idx)))
                                           : cv::Mat());
  }
  session.valid = valid;
  return session;
}

float Pixel(const Session &session, size_t frame_idx) {
  return session.frames.at(frame_idx).at<float>(2, 3);
}

class FrameCleanerTest : public ::testing::Test {};

TEST_F(FrameCleanerTest, ClipHeightsZeroesOutOfRange) {
  Session session;
  cv::Mat frame = (cv::Mat_<float>(1, 4) << 5, 10, 60, 121);
  session.frames = {frame, cv::Mat()};
  session.valid = {true, false};
  CleaningParams params;
  const Session clipped = ClipHeights(session, params);
  EXPECT_FLOAT_EQ(clipped.frames.at(0).at<float>(0, 0), 0);
  EXPECT_FLOAT_EQ(clipped.frames.at(0).at<float>(0, 1), 10);
  EXPECT_FLOAT_EQ(clipped.frames.at(0).at<float>(0, 2), 60);
  EXPECT_FLOAT_EQ(clipped.frames.at(0).at<float>(0, 3), 0);
  EXPECT_TRUE(clipped.frames.at(1).empty());
  // The input is not modified.
  EXPECT_FLOAT_EQ(frame.at<float>(0, 0), 5);
}

TEST_F(FrameCleanerTest, TailFilterRemovesThinStructures) {
  cv::Mat frame = cv::Mat::zeros(30, 30, CV_32F);
  // Body: a solid block. Tail: a one pixel wide line.
  frame(cv::Rect(5, 5, 15, 15)).setTo(50);
  frame(cv::Rect(20, 12, 8, 1)).setTo(50);
  CleaningParams params;
  params.gaussfilter_space_x = 0;
  const cv::Mat cleaned =
      CleanFrameSpatial(frame, params, MakeTailFilter(params));
  EXPECT_FLOAT_EQ(cleaned.at<float>(12, 12), 50);
  EXPECT_FLOAT_EQ(cleaned.at<float>(12, 25), 0);
}

TEST_F(FrameCleanerTest, DisabledTailFilterIsEmpty) {
  CleaningParams params;
  params.tailfilter_width = 0;
  EXPECT_TRUE(MakeTailFilter(params).empty());
  params.tailfilter_width = 5;
  params.tailfilter_height = 3;
  params.tailfilter_shape = "rect";
  const cv::Mat element = MakeTailFilter(params);
  EXPECT_EQ(element.size(), cv::Size(5, 3));
  EXPECT_EQ(cv::countNonZero(element), 15);
}

TEST_F(FrameCleanerTest, SpatialMedianRemovesSpeckle) {
  cv::Mat frame = cv::Mat(9, 9, CV_32F, cv::Scalar(20));
  frame.at<float>(4, 4) = 100;
  CleaningParams params;
  params.tailfilter_width = 0;
  params.gaussfilter_space_x = 0;
  params.medfilter_space = {3};
  const cv::Mat cleaned =
      CleanFrameSpatial(frame, params, MakeTailFilter(params));
  EXPECT_FLOAT_EQ(cleaned.at<float>(4, 4), 20);
}

TEST_F(FrameCleanerTest, SpatialGaussianPreservesConstantFrames) {
  const cv::Mat frame = cv::Mat(25, 25, CV_32F, cv::Scalar(42));
  CleaningParams params;
  params.tailfilter_width = 0;
  const cv::Mat cleaned =
      CleanFrameSpatial(frame, params, MakeTailFilter(params));
  EXPECT_NEAR(cleaned.at<float>(12, 12), 42, 1e-4);
}

TEST_F(FrameCleanerTest, MedianFilterTimeSkipsInvalidFrames) {
  // Valid frames in order: 1, 100, 3, 4. The outlier is replaced by the
  // median of its valid neighbors.
  const Session session = MakeConstantSession(
      {1, 0, 100, 3, 0, 4}, {true, false, true, true, false, true});
  const Session filtered = MedianFilterTime(session, 3);
  EXPECT_FLOAT_EQ(Pixel(filtered, 2), 3);
  EXPECT_FLOAT_EQ(Pixel(filtered, 3), 4);
  EXPECT_TRUE(filtered.frames.at(1).empty());
  EXPECT_FALSE(filtered.valid.at(4));
}

TEST_F(FrameCleanerTest, GaussianFilterTimeRenormalizesAtBoundaries) {
  const Session constant = MakeConstantSession({7, 7, 7}, {true, true, true});
  const Session filtered = GaussianFilterTime(constant, 1.0);
  for (size_t idx = 0; idx < 3; ++idx) {
    EXPECT_NEAR(Pixel(filtered, idx), 7, 1e-5);
  }

  const Session step =
      MakeConstantSession({0, 0, 10, 10}, {true, true, true, true});
  const Session smoothed = GaussianFilterTime(step, 1.0);
  EXPECT_GT(Pixel(smoothed, 1), 0);
  EXPECT_LT(Pixel(smoothed, 2), 10);
  EXPECT_LT(Pixel(smoothed, 1), Pixel(smoothed, 2));
}

TEST_F(FrameCleanerTest, FftMagnitudeCentresZeroFrequency) {
  const cv::Mat frame = cv::Mat(4, 6, CV_32F, cv::Scalar(2));
  const cv::Mat magnitude = FftMagnitude(frame);
  ASSERT_EQ(magnitude.size(), frame.size());
  // All energy of a constant frame is at zero frequency, moved to the centre.
  EXPECT_NEAR(magnitude.at<float>(2, 3), 2 * 4 * 6, 1e-3);
  EXPECT_NEAR(cv::sum(magnitude)[0], 2 * 4 * 6, 1e-3);
}

TEST_F(FrameCleanerTest, InvalidParametersDie) {
  CleaningParams params;
  params.medfilter_space = {7};
  EXPECT_DEATH(CheckCleaningParams(params), "");
  params.medfilter_space = {0};
  params.medfilter_time = {4};
  EXPECT_DEATH(CheckCleaningParams(params), "");
  params.medfilter_time = {0};
  params.tailfilter_shape = "triangle";
  EXPECT_DEATH(CheckCleaningParams(params), "");
}

} // namespace
} // namespace mousepca
