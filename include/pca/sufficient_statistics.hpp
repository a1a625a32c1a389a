#ifndef MOUSEPCA_PCA_SUFFICIENT_STATISTICS_HPP_
#define MOUSEPCA_PCA_SUFFICIENT_STATISTICS_HPP_

#include <Eigen/Dense>

namespace mousepca {

// Streaming summary of a set of D-dimensional observations: enough to
// recover their mean and covariance exactly without keeping the observations.
//
// The scatter matrix is the sum over observations of (x - mean)(x - mean)^T.
// Only its lower triangle is maintained; use Covariance() to get the full
// symmetric matrix. Memory is D * D doubles, e.g. ~330MB for 80x80 frames.
struct SufficientStatistics {
  long count = 0;
  Eigen::VectorXd mean;
  Eigen::MatrixXd scatter;

  bool empty() const { return count == 0; }
  long dimension() const { return static_cast<long>(mean.size()); }
};

// Folds every row of chunk (one observation per row) into *stats. An empty
// stats takes the chunk width as its dimension; otherwise the widths must
// match.
//
// Uses the pairwise update of Chan, Golub and LeVeque, so the result does not
// depend on how the observations are split into chunks (up to rounding).
void AccumulateChunk(const Eigen::MatrixXd &chunk,
                     SufficientStatistics *stats);

// Combined statistics of the union of the observations summarized by a and b.
// Commutative and associative up to rounding, with empty statistics as the
// identity.
SufficientStatistics Merge(const SufficientStatistics &a,
                           const SufficientStatistics &b);

void MergeInto(const SufficientStatistics &other, SufficientStatistics *stats);

// Unbiased (count - 1 normalized) full symmetric covariance matrix.
// Requires at least 2 observations.
Eigen::MatrixXd Covariance(const SufficientStatistics &stats);

// Trace of Covariance(), i.e. the sum of per-dimension variances.
double TotalVariance(const SufficientStatistics &stats);

} // namespace mousepca

#endif // MOUSEPCA_PCA_SUFFICIENT_STATISTICS_HPP_
