#include "gtest/gtest.h"

#include <algorithm>
#include <cstdlib>

#include <pca/sufficient_statistics.hpp>

namespace mousepca {
namespace {

class SufficientStatisticsTest : public ::testing::Test {
protected:
  void SetUp() override {
    std::srand(17);
    data_ = Eigen::MatrixXd::Random(60, 5);
    // Offset so that the mean is far from zero.
    data_.rowwise() += Eigen::RowVectorXd::LinSpaced(5, 100.0, 140.0);
  }

  SufficientStatistics FromRows(long first, long count) const {
    SufficientStatistics stats;
    AccumulateChunk(data_.middleRows(first, count), &stats);
    return stats;
  }

  Eigen::MatrixXd data_;
};

TEST_F(SufficientStatisticsTest, MatchesDirectComputation) {
  const SufficientStatistics stats = FromRows(0, data_.rows());
  EXPECT_EQ(stats.count, 60);
  EXPECT_EQ(stats.dimension(), 5);

  const Eigen::RowVectorXd mean = data_.colwise().mean();
  const Eigen::MatrixXd centered = data_.rowwise() - mean;
  const Eigen::MatrixXd covariance =
      centered.transpose() * centered / (data_.rows() - 1);
  EXPECT_TRUE(stats.mean.transpose().isApprox(mean, 1e-12));
  EXPECT_TRUE(Covariance(stats).isApprox(covariance, 1e-10));
  EXPECT_NEAR(TotalVariance(stats), covariance.trace(), 1e-10);
}

TEST_F(SufficientStatisticsTest, ChunkingDoesNotMatter) {
  const SufficientStatistics single = FromRows(0, data_.rows());
  for (const long chunk_size : {1L, 7L, 13L, 59L}) {
    SufficientStatistics chunked;
    for (long first = 0; first < data_.rows(); first += chunk_size) {
      const long count = std::min(chunk_size, data_.rows() - first);
      AccumulateChunk(data_.middleRows(first, count), &chunked);
    }
    EXPECT_EQ(chunked.count, single.count);
    EXPECT_TRUE(chunked.mean.isApprox(single.mean, 1e-12)) << chunk_size;
    EXPECT_TRUE(Covariance(chunked).isApprox(Covariance(single), 1e-10))
        << chunk_size;
  }
}

TEST_F(SufficientStatisticsTest, MergeIsCommutative) {
  const SufficientStatistics a = FromRows(0, 10);
  const SufficientStatistics b = FromRows(10, 35);
  const SufficientStatistics ab = Merge(a, b);
  const SufficientStatistics ba = Merge(b, a);
  EXPECT_EQ(ab.count, 45);
  EXPECT_TRUE(ab.mean.isApprox(ba.mean, 1e-12));
  EXPECT_TRUE(Covariance(ab).isApprox(Covariance(ba), 1e-10));
}

TEST_F(SufficientStatisticsTest, MergeIsAssociative) {
  const SufficientStatistics a = FromRows(0, 20);
  const SufficientStatistics b = FromRows(20, 3);
  const SufficientStatistics c = FromRows(23, 37);
  const SufficientStatistics left = Merge(Merge(a, b), c);
  const SufficientStatistics right = Merge(a, Merge(b, c));
  EXPECT_TRUE(left.mean.isApprox(right.mean, 1e-12));
  EXPECT_TRUE(Covariance(left).isApprox(Covariance(right), 1e-10));
  EXPECT_TRUE(
      Covariance(left).isApprox(Covariance(FromRows(0, 60)), 1e-10));
}

TEST_F(SufficientStatisticsTest, EmptyIsMergeIdentity) {
  const SufficientStatistics a = FromRows(0, 30);
  const SufficientStatistics empty;
  for (const SufficientStatistics &merged : {Merge(a, empty), Merge(empty, a)}) {
    EXPECT_EQ(merged.count, a.count);
    EXPECT_TRUE(merged.mean.isApprox(a.mean));
    EXPECT_TRUE(Covariance(merged).isApprox(Covariance(a)));
  }
  EXPECT_TRUE(Merge(empty, empty).empty());
}

TEST_F(SufficientStatisticsTest, MergeIntoMatchesMerge) {
  SufficientStatistics stats = FromRows(0, 25);
  MergeInto(FromRows(25, 35), &stats);
  const SufficientStatistics expected = Merge(FromRows(0, 25), FromRows(25, 35));
  EXPECT_EQ(stats.count, expected.count);
  EXPECT_TRUE(Covariance(stats).isApprox(Covariance(expected), 1e-12));
}

TEST_F(SufficientStatisticsTest, MismatchedDimensionDies) {
  SufficientStatistics stats = FromRows(0, 10);
  EXPECT_DEATH(AccumulateChunk(Eigen::MatrixXd::Zero(3, 4), &stats), "");
}

} // namespace
} // namespace mousepca
