#include <pca/pca_basis.hpp>

#include <glog/logging.h>

namespace mousepca {

void ApplySignConvention(Eigen::MatrixXd *components) {
  CHECK_NOTNULL(components);
  for (long row = 0; row < components->rows(); ++row) {
    Eigen::Index max_idx = 0;
    components->row(row).cwiseAbs().maxCoeff(&max_idx);
    if ((*components)(row, max_idx) < 0) {
      components->row(row) *= -1.0;
    }
  }
}

Eigen::MatrixXd Reconstruct(const PcaBasis &basis,
                            const Eigen::MatrixXd &scores) {
  CHECK_EQ(scores.cols(), basis.components.rows());
  Eigen::MatrixXd result = scores * basis.components;
  result.rowwise() += basis.mean;
  return result;
}

} // namespace mousepca
