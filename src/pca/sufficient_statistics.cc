#include <pca/sufficient_statistics.hpp>

#include <glog/logging.h>

namespace mousepca {
namespace {
// Compensated (Kahan) sum of the diagonal.
double CompensatedTrace(const Eigen::MatrixXd &matrix) {
  double sum = 0;
  double compensation = 0;
  for (long i = 0; i < matrix.rows(); ++i) {
    const double corrected = matrix(i, i) - compensation;
    const double updated = sum + corrected;
    compensation = (updated - sum) - corrected;
    sum = updated;
  }
  return sum;
}
} // namespace

void AccumulateChunk(const Eigen::MatrixXd &chunk,
                     SufficientStatistics *stats) {
  CHECK_NOTNULL(stats);
  const long chunk_count = static_cast<long>(chunk.rows());
  if (chunk_count == 0) {
    return;
  }
  if (stats->empty()) {
    stats->mean = Eigen::VectorXd::Zero(chunk.cols());
    stats->scatter = Eigen::MatrixXd::Zero(chunk.cols(), chunk.cols());
  }
  CHECK_EQ(chunk.cols(), stats->mean.size());

  const Eigen::VectorXd chunk_mean = chunk.colwise().mean().transpose();
  const Eigen::MatrixXd centered = chunk.rowwise() - chunk_mean.transpose();

  const double prev_count = static_cast<double>(stats->count);
  const double total_count = prev_count + static_cast<double>(chunk_count);
  const Eigen::VectorXd delta = chunk_mean - stats->mean;

  // Within-chunk scatter: (D x c) * (c x D).
  stats->scatter.selfadjointView<Eigen::Lower>().rankUpdate(
      centered.transpose());
  // Between-means correction; vanishes for the very first chunk.
  if (stats->count > 0) {
    stats->scatter.selfadjointView<Eigen::Lower>().rankUpdate(
        delta, prev_count * static_cast<double>(chunk_count) / total_count);
  }
  stats->mean += delta * (static_cast<double>(chunk_count) / total_count);
  stats->count += chunk_count;
}

SufficientStatistics Merge(const SufficientStatistics &a,
                           const SufficientStatistics &b) {
  if (a.empty()) {
    return b;
  }
  if (b.empty()) {
    return a;
  }
  CHECK_EQ(a.dimension(), b.dimension());

  const double count_a = static_cast<double>(a.count);
  const double count_b = static_cast<double>(b.count);
  const double total_count = count_a + count_b;
  const Eigen::VectorXd delta = b.mean - a.mean;

  SufficientStatistics result;
  result.count = a.count + b.count;
  // Symmetric in a and b.
  result.mean = (count_a * a.mean + count_b * b.mean) / total_count;
  result.scatter = a.scatter + b.scatter;
  result.scatter.selfadjointView<Eigen::Lower>().rankUpdate(
      delta, count_a * count_b / total_count);
  return result;
}

void MergeInto(const SufficientStatistics &other, SufficientStatistics *stats) {
  CHECK_NOTNULL(stats);
  if (other.empty()) {
    return;
  }
  if (stats->empty()) {
    *stats = other;
    return;
  }
  *stats = Merge(*stats, other);
}

Eigen::MatrixXd Covariance(const SufficientStatistics &stats) {
  CHECK_GE(stats.count, 2);
  Eigen::MatrixXd result = stats.scatter.selfadjointView<Eigen::Lower>();
  result /= static_cast<double>(stats.count - 1);
  return result;
}

double TotalVariance(const SufficientStatistics &stats) {
  CHECK_GE(stats.count, 2);
  return CompensatedTrace(stats.scatter) /
         static_cast<double>(stats.count - 1);
}

} // namespace mousepca
