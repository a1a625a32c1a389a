#ifndef MOUSEPCA_PCA_PCA_BASIS_HPP_
#define MOUSEPCA_PCA_PCA_BASIS_HPP_

#include <Eigen/Dense>

namespace mousepca {

// Trained principal component basis. Immutable once produced by
// IncrementalPcaTrainer::Finalize(); safe to share read-only across threads.
struct PcaBasis {
  // 1 x D, mean of the training observations.
  Eigen::RowVectorXd mean;
  // k x D, one unit-norm component per row, mutually orthogonal, ordered by
  // decreasing explained variance.
  Eigen::MatrixXd components;
  // Per-component variance (covariance eigenvalues), size k.
  Eigen::VectorXd explained_variance;
  // explained_variance / total_variance, size k.
  Eigen::VectorXd explained_variance_ratio;
  // Singular values of the centered data matrix, size k.
  Eigen::VectorXd singular_values;
  // Sum of per-dimension variances of the training data.
  double total_variance = 0;
  long n_observations = 0;
  // Frame geometry the basis was trained on; 0 when unknown.
  int frame_height = 0;
  int frame_width = 0;

  long dimension() const { return static_cast<long>(mean.size()); }
  long num_components() const { return static_cast<long>(components.rows()); }
};

// Flips the sign of every row so that its largest-magnitude entry is positive
// (the first such entry on ties). Eigenvector signs are arbitrary otherwise.
void ApplySignConvention(Eigen::MatrixXd *components);

// mean + scores * components for every row of scores (n x k), giving n x D.
Eigen::MatrixXd Reconstruct(const PcaBasis &basis,
                            const Eigen::MatrixXd &scores);

} // namespace mousepca

#endif // MOUSEPCA_PCA_PCA_BASIS_HPP_
