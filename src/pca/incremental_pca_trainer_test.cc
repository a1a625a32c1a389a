#include "gtest/gtest.h"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <pca/incremental_pca_trainer.hpp>

namespace mousepca {
namespace {

// Random observations with decreasing per-column scales, so that the
// covariance eigenvalues are well separated.
Eigen::MatrixXd MakeObservations(long rows, long cols, unsigned int seed) {
  std::srand(seed);
  Eigen::MatrixXd result = Eigen::MatrixXd::Random(rows, cols);
  for (long col = 0; col < cols; ++col) {
    result.col(col) *= 3.0 * (cols - col);
    result.col(col).array() += 50.0;
  }
  return result;
}

void ExpectOrthonormalRows(const Eigen::MatrixXd &components) {
  const Eigen::MatrixXd gram = components * components.transpose();
  EXPECT_TRUE(gram.isApprox(
      Eigen::MatrixXd::Identity(components.rows(), components.rows()), 1e-9))
      << gram;
}

class IncrementalPcaTrainerTest : public ::testing::Test {};

TEST_F(IncrementalPcaTrainerTest, StateTransitions) {
  IncrementalPcaTrainer trainer;
  EXPECT_EQ(trainer.state(), TrainerState::kEmpty);
  PipelineError error;
  ASSERT_TRUE(trainer.Observe(MakeObservations(20, 6, 1), &error));
  EXPECT_EQ(trainer.state(), TrainerState::kAccumulating);
  EXPECT_EQ(trainer.observation_count(), 20);
  EXPECT_EQ(trainer.dimension(), 6);

  PcaBasis basis;
  ASSERT_TRUE(trainer.Finalize(3, &basis, &error));
  EXPECT_EQ(trainer.state(), TrainerState::kFinalized);
}

TEST_F(IncrementalPcaTrainerTest, ObserveAfterFinalizeIsInvalidState) {
  IncrementalPcaTrainer trainer;
  PipelineError error;
  ASSERT_TRUE(trainer.Observe(MakeObservations(20, 6, 2), &error));
  PcaBasis basis;
  ASSERT_TRUE(trainer.Finalize(3, &basis, &error));

  EXPECT_FALSE(trainer.Observe(MakeObservations(5, 6, 3), &error));
  EXPECT_EQ(error.kind, ErrorKind::kInvalidState);
  EXPECT_EQ(trainer.observation_count(), 20);

  SufficientStatistics partial;
  AccumulateChunk(MakeObservations(5, 6, 4), &partial);
  EXPECT_FALSE(trainer.MergeStatistics(partial, &error));
  EXPECT_EQ(error.kind, ErrorKind::kInvalidState);
}

TEST_F(IncrementalPcaTrainerTest, SecondFinalizeIsInvalidState) {
  IncrementalPcaTrainer trainer;
  PipelineError error;
  ASSERT_TRUE(trainer.Observe(MakeObservations(20, 6, 5), &error));
  PcaBasis basis;
  ASSERT_TRUE(trainer.Finalize(3, &basis, &error));
  EXPECT_FALSE(trainer.Finalize(3, &basis, &error));
  EXPECT_EQ(error.kind, ErrorKind::kInvalidState);
}

TEST_F(IncrementalPcaTrainerTest, FinalizeWithoutDataIsInvalidState) {
  IncrementalPcaTrainer trainer;
  PcaBasis basis;
  PipelineError error;
  EXPECT_FALSE(trainer.Finalize(3, &basis, &error));
  EXPECT_EQ(error.kind, ErrorKind::kInvalidState);
  EXPECT_EQ(trainer.state(), TrainerState::kEmpty);
}

TEST_F(IncrementalPcaTrainerTest, ShapeMismatchLeavesTrainerUnchanged) {
  IncrementalPcaTrainer trainer;
  PipelineError error;
  ASSERT_TRUE(trainer.Observe(MakeObservations(10, 6, 6), &error));
  EXPECT_FALSE(trainer.Observe(MakeObservations(10, 7, 7), &error));
  EXPECT_EQ(error.kind, ErrorKind::kShapeMismatch);
  EXPECT_NE(error.message.find("7"), std::string::npos);
  EXPECT_EQ(trainer.observation_count(), 10);
  EXPECT_EQ(trainer.dimension(), 6);
  EXPECT_EQ(trainer.state(), TrainerState::kAccumulating);
}

TEST_F(IncrementalPcaTrainerTest, ThreeSessionsOfHundredFrames) {
  IncrementalPcaTrainer trainer;
  PipelineError error;
  for (unsigned int session = 0; session < 3; ++session) {
    ASSERT_TRUE(
        trainer.Observe(MakeObservations(100, 64, 10 + session), &error));
  }
  PcaBasis basis;
  ASSERT_TRUE(trainer.Finalize(10, &basis, &error)) << error;
  EXPECT_EQ(basis.num_components(), 10);
  EXPECT_EQ(basis.dimension(), 64);
  EXPECT_EQ(basis.n_observations, 300);
  ExpectOrthonormalRows(basis.components);
  for (long component = 1; component < 10; ++component) {
    EXPECT_GE(basis.explained_variance(component - 1),
              basis.explained_variance(component));
  }
  EXPECT_GT(basis.explained_variance_ratio.sum(), 0.0);
  EXPECT_LE(basis.explained_variance_ratio.sum(), 1.0 + 1e-12);
}

TEST_F(IncrementalPcaTrainerTest, TooFewFramesIsInsufficientData) {
  IncrementalPcaTrainer trainer;
  PipelineError error;
  ASSERT_TRUE(trainer.Observe(MakeObservations(5, 64, 20), &error));
  PcaBasis basis;
  EXPECT_FALSE(trainer.Finalize(10, &basis, &error));
  EXPECT_EQ(error.kind, ErrorKind::kInsufficientData);
  EXPECT_EQ(trainer.state(), TrainerState::kAccumulating);

  // More data makes the same request succeed.
  ASSERT_TRUE(trainer.Observe(MakeObservations(20, 64, 21), &error));
  EXPECT_TRUE(trainer.Finalize(10, &basis, &error));
}

TEST_F(IncrementalPcaTrainerTest, ExactlyKFramesIsInsufficientData) {
  IncrementalPcaTrainer trainer;
  PipelineError error;
  ASSERT_TRUE(trainer.Observe(MakeObservations(4, 8, 22), &error));
  PcaBasis basis;
  EXPECT_FALSE(trainer.Finalize(4, &basis, &error));
  EXPECT_EQ(error.kind, ErrorKind::kInsufficientData);
  EXPECT_TRUE(trainer.Finalize(3, &basis, &error));
}

TEST_F(IncrementalPcaTrainerTest, MoreComponentsThanDimensions) {
  IncrementalPcaTrainer trainer;
  PipelineError error;
  ASSERT_TRUE(trainer.Observe(MakeObservations(50, 4, 23), &error));
  PcaBasis basis;
  EXPECT_FALSE(trainer.Finalize(6, &basis, &error));
  EXPECT_EQ(error.kind, ErrorKind::kInsufficientData);
}

TEST_F(IncrementalPcaTrainerTest, BasisDoesNotDependOnChunking) {
  const Eigen::MatrixXd data = MakeObservations(200, 8, 30);
  IncrementalPcaTrainer single;
  IncrementalPcaTrainer chunked;
  PipelineError error;
  ASSERT_TRUE(single.Observe(data, &error));
  for (long first = 0; first < data.rows(); first += 30) {
    const long count = std::min(30L, data.rows() - first);
    ASSERT_TRUE(chunked.Observe(data.middleRows(first, count), &error));
  }
  PcaBasis single_basis;
  PcaBasis chunked_basis;
  ASSERT_TRUE(single.Finalize(5, &single_basis, &error));
  ASSERT_TRUE(chunked.Finalize(5, &chunked_basis, &error));
  EXPECT_TRUE(single_basis.mean.isApprox(chunked_basis.mean, 1e-12));
  EXPECT_TRUE(
      single_basis.components.isApprox(chunked_basis.components, 1e-8));
  EXPECT_TRUE(single_basis.explained_variance.isApprox(
      chunked_basis.explained_variance, 1e-10));
}

TEST_F(IncrementalPcaTrainerTest, MergedPartialsMatchObserve) {
  const Eigen::MatrixXd data = MakeObservations(90, 6, 31);
  IncrementalPcaTrainer observed;
  IncrementalPcaTrainer merged;
  PipelineError error;
  ASSERT_TRUE(observed.Observe(data, &error));
  SufficientStatistics first;
  SufficientStatistics second;
  AccumulateChunk(data.topRows(40), &first);
  AccumulateChunk(data.bottomRows(50), &second);
  ASSERT_TRUE(merged.MergeStatistics(second, &error));
  ASSERT_TRUE(merged.MergeStatistics(first, &error));
  EXPECT_EQ(merged.observation_count(), 90);

  PcaBasis observed_basis;
  PcaBasis merged_basis;
  ASSERT_TRUE(observed.Finalize(4, &observed_basis, &error));
  ASSERT_TRUE(merged.Finalize(4, &merged_basis, &error));
  EXPECT_TRUE(
      observed_basis.components.isApprox(merged_basis.components, 1e-8));
}

TEST_F(IncrementalPcaTrainerTest, MatchesDirectEigendecomposition) {
  const Eigen::MatrixXd data = MakeObservations(120, 5, 32);
  IncrementalPcaTrainer trainer;
  PipelineError error;
  ASSERT_TRUE(trainer.Observe(data, &error));
  PcaBasis basis;
  ASSERT_TRUE(trainer.Finalize(2, &basis, &error));

  const Eigen::MatrixXd centered = data.rowwise() - data.colwise().mean();
  const Eigen::MatrixXd covariance =
      centered.transpose() * centered / (data.rows() - 1);
  const Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(covariance);
  EXPECT_NEAR(basis.explained_variance(0), solver.eigenvalues()(4), 1e-8);
  EXPECT_NEAR(basis.explained_variance(1), solver.eigenvalues()(3), 1e-8);
  EXPECT_NEAR(basis.total_variance, covariance.trace(), 1e-8);
  EXPECT_NEAR(basis.singular_values(0),
              std::sqrt(solver.eigenvalues()(4) * (data.rows() - 1)), 1e-6);
  // Same direction as the direct solution, up to sign.
  EXPECT_NEAR(std::abs(basis.components.row(0).dot(
                  solver.eigenvectors().col(4).transpose())),
              1.0, 1e-9);
}

TEST_F(IncrementalPcaTrainerTest, NonFiniteChunkIsRejected) {
  IncrementalPcaTrainer trainer;
  PipelineError error;
  ASSERT_TRUE(trainer.Observe(MakeObservations(100, 16, 34), &error));
  Eigen::MatrixXd bad = MakeObservations(100, 16, 35);
  bad(5, 3) = std::numeric_limits<double>::quiet_NaN();
  EXPECT_FALSE(trainer.Observe(bad, &error));
  EXPECT_EQ(error.kind, ErrorKind::kIOFailure);
  EXPECT_EQ(trainer.observation_count(), 100);

  SufficientStatistics partial;
  bad(5, 3) = std::numeric_limits<double>::infinity();
  AccumulateChunk(bad, &partial);
  EXPECT_FALSE(trainer.MergeStatistics(partial, &error));
  EXPECT_EQ(error.kind, ErrorKind::kIOFailure);
  EXPECT_EQ(trainer.observation_count(), 100);

  PcaBasis basis;
  ASSERT_TRUE(trainer.Finalize(4, &basis, &error)) << error;
  EXPECT_TRUE(basis.components.allFinite());
  EXPECT_TRUE(basis.mean.allFinite());
}

TEST_F(IncrementalPcaTrainerTest, ConcurrentObserveMatchesSerial) {
  constexpr int kNumThreads = 4;
  constexpr int kChunksPerThread = 5;
  std::vector<Eigen::MatrixXd> chunks;
  for (int chunk = 0; chunk < kNumThreads * kChunksPerThread; ++chunk) {
    chunks.push_back(MakeObservations(25, 12, 40 + chunk));
  }

  IncrementalPcaTrainer serial;
  PipelineError error;
  for (const Eigen::MatrixXd &chunk : chunks) {
    ASSERT_TRUE(serial.Observe(chunk, &error));
  }

  IncrementalPcaTrainer concurrent;
  std::atomic<int> failures(0);
  std::vector<std::unique_ptr<std::thread>> threads;
  for (int thread_idx = 0; thread_idx < kNumThreads; ++thread_idx) {
    threads.emplace_back(new std::thread([&, thread_idx]() {
      for (int chunk = thread_idx; chunk < static_cast<int>(chunks.size());
           chunk += kNumThreads) {
        PipelineError thread_error;
        // Alternate between the two entry points.
        bool accepted = false;
        if (chunk % 2 == 0) {
          accepted = concurrent.Observe(chunks.at(chunk), &thread_error);
        } else {
          SufficientStatistics partial;
          AccumulateChunk(chunks.at(chunk), &partial);
          accepted = concurrent.MergeStatistics(partial, &thread_error);
        }
        if (!accepted) {
          ++failures;
        }
      }
    }));
  }
  for (std::unique_ptr<std::thread> &thread : threads) {
    thread->join();
  }
  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(concurrent.observation_count(), serial.observation_count());

  PcaBasis serial_basis;
  PcaBasis concurrent_basis;
  ASSERT_TRUE(serial.Finalize(5, &serial_basis, &error));
  ASSERT_TRUE(concurrent.Finalize(5, &concurrent_basis, &error));
  EXPECT_TRUE(serial_basis.mean.isApprox(concurrent_basis.mean, 1e-12));
  EXPECT_TRUE(
      serial_basis.components.isApprox(concurrent_basis.components, 1e-8));
  EXPECT_TRUE(serial_basis.explained_variance.isApprox(
      concurrent_basis.explained_variance, 1e-10));
}

TEST_F(IncrementalPcaTrainerTest, ZeroComponentsDies) {
  IncrementalPcaTrainer trainer;
  PipelineError error;
  ASSERT_TRUE(trainer.Observe(MakeObservations(10, 4, 33), &error));
  PcaBasis basis;
  EXPECT_DEATH(trainer.Finalize(0, &basis, &error), "");
}

} // namespace
} // namespace mousepca
