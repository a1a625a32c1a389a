#include <pca/incremental_pca_trainer.hpp>

#include <algorithm>
#include <cmath>
#include <sstream>

#include <glog/logging.h>

namespace mousepca {

const char *TrainerStateName(TrainerState state) {
  switch (state) {
  case TrainerState::kEmpty:
    return "Empty";
  case TrainerState::kAccumulating:
    return "Accumulating";
  case TrainerState::kFinalized:
    return "Finalized";
  }
  return "Unknown";
}

bool IncrementalPcaTrainer::CheckAcceptsData(long data_dimension,
                                             PipelineError *error) const {
  if (state_ == TrainerState::kFinalized) {
    return SetError(error, ErrorKind::kInvalidState, "",
                    "cannot add data to a trainer in state Finalized");
  }
  if (!statistics_.empty() && data_dimension != statistics_.dimension()) {
    std::ostringstream message;
    message << "observation dimension " << data_dimension
            << " does not match trainer dimension "
            << statistics_.dimension();
    return SetError(error, ErrorKind::kShapeMismatch, "", message.str());
  }
  return true;
}

bool IncrementalPcaTrainer::Observe(const Eigen::MatrixXd &chunk,
                                    PipelineError *error) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!CheckAcceptsData(chunk.cols(), error)) {
    return false;
  }
  if (!chunk.allFinite()) {
    return SetError(error, ErrorKind::kIOFailure, "",
                    "observation chunk contains NaN or infinite values");
  }
  AccumulateChunk(chunk, &statistics_);
  state_ = TrainerState::kAccumulating;
  return true;
}

bool IncrementalPcaTrainer::MergeStatistics(const SufficientStatistics &partial,
                                            PipelineError *error) {
  std::unique_lock<std::mutex> lock(mutex_);
  const long partial_dimension =
      partial.empty() ? statistics_.dimension() : partial.dimension();
  if (!CheckAcceptsData(partial_dimension, error)) {
    return false;
  }
  if (!partial.empty() &&
      !(partial.mean.allFinite() && partial.scatter.allFinite())) {
    return SetError(error, ErrorKind::kIOFailure, "",
                    "merged statistics contain NaN or infinite values");
  }
  MergeInto(partial, &statistics_);
  state_ = TrainerState::kAccumulating;
  return true;
}

bool IncrementalPcaTrainer::Finalize(int num_components, PcaBasis *basis,
                                     PipelineError *error) {
  CHECK_NOTNULL(basis);
  CHECK_GT(num_components, 0);
  std::unique_lock<std::mutex> lock(mutex_);

  if (state_ != TrainerState::kAccumulating) {
    std::ostringstream message;
    message << "Finalize requires state Accumulating, trainer is in state "
            << TrainerStateName(state_);
    return SetError(error, ErrorKind::kInvalidState, "", message.str());
  }
  if (statistics_.count <= num_components) {
    std::ostringstream message;
    message << "observed " << statistics_.count
            << " frames, need more than " << num_components
            << " to compute " << num_components << " components";
    return SetError(error, ErrorKind::kInsufficientData, "", message.str());
  }
  if (statistics_.dimension() < num_components) {
    std::ostringstream message;
    message << "frame dimension " << statistics_.dimension()
            << " is smaller than the requested " << num_components
            << " components";
    return SetError(error, ErrorKind::kInsufficientData, "", message.str());
  }

  const long dimension = statistics_.dimension();
  const double normalizer = static_cast<double>(statistics_.count - 1);
  LOG(INFO) << "Computing eigendecomposition of " << dimension << "x"
            << dimension << " covariance from " << statistics_.count
            << " frames.";
  // The solver only reads the lower triangle, which is exactly the part of the
  // scatter matrix that is kept up to date. Eigenvalues come in increasing
  // order.
  const Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(
      statistics_.scatter);
  if (solver.info() != Eigen::Success) {
    return SetError(error, ErrorKind::kInsufficientData, "",
                    "covariance eigendecomposition did not converge");
  }

  PcaBasis result;
  result.mean = statistics_.mean.transpose();
  result.components.resize(num_components, dimension);
  result.explained_variance.resize(num_components);
  result.singular_values.resize(num_components);
  for (int component = 0; component < num_components; ++component) {
    const long source_idx = dimension - 1 - component;
    result.components.row(component) =
        solver.eigenvectors().col(source_idx).transpose();
    // Rank deficient data can produce tiny negative eigenvalues.
    const double scatter_eigenvalue =
        std::max(solver.eigenvalues()(source_idx), 0.0);
    result.explained_variance(component) = scatter_eigenvalue / normalizer;
    result.singular_values(component) = std::sqrt(scatter_eigenvalue);
  }
  ApplySignConvention(&result.components);

  result.total_variance = TotalVariance(statistics_);
  if (result.total_variance > 0) {
    result.explained_variance_ratio =
        result.explained_variance / result.total_variance;
  } else {
    result.explained_variance_ratio =
        Eigen::VectorXd::Zero(result.explained_variance.size());
  }
  result.n_observations = statistics_.count;

  *basis = result;
  state_ = TrainerState::kFinalized;
  LOG(INFO) << "PCA finalized: " << num_components << " components explain "
            << result.explained_variance_ratio.sum() * 100.0
            << "% of the variance.";
  return true;
}

TrainerState IncrementalPcaTrainer::state() const {
  std::unique_lock<std::mutex> lock(mutex_);
  return state_;
}

long IncrementalPcaTrainer::observation_count() const {
  std::unique_lock<std::mutex> lock(mutex_);
  return statistics_.count;
}

long IncrementalPcaTrainer::dimension() const {
  std::unique_lock<std::mutex> lock(mutex_);
  return statistics_.dimension();
}

} // namespace mousepca
