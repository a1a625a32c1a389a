#ifndef MOUSEPCA_PCA_INCREMENTAL_PCA_TRAINER_HPP_
#define MOUSEPCA_PCA_INCREMENTAL_PCA_TRAINER_HPP_

#include <mutex>

#include <Eigen/Dense>

#include <pca/errors.hpp>
#include <pca/pca_basis.hpp>
#include <pca/sufficient_statistics.hpp>

namespace mousepca {

enum class TrainerState { kEmpty, kAccumulating, kFinalized };

const char *TrainerStateName(TrainerState state);

// Accumulates PCA sufficient statistics over many chunks of flattened frames
// and produces a single basis at the end.
//
// State machine: Empty -> Accumulating (first Observe/MergeStatistics) ->
// Finalized (successful Finalize). Data cannot be added after Finalize, and
// Finalize succeeds at most once. All methods are thread safe; concurrent
// Observe calls are serialized.
//
// Chunks must only contain valid, already orientation-corrected frames.
class IncrementalPcaTrainer {
public:
  // Folds the rows of chunk (one flattened frame per row) into the running
  // statistics. Fails with kShapeMismatch if the chunk width differs from
  // previously observed data, with kIOFailure if it holds NaN or infinite
  // values, with kInvalidState after Finalize. On failure the trainer is
  // unchanged.
  bool Observe(const Eigen::MatrixXd &chunk, PipelineError *error);

  // Same as Observe, for statistics accumulated independently (e.g. by a
  // worker thread).
  bool MergeStatistics(const SufficientStatistics &partial,
                       PipelineError *error);

  // Computes the top num_components principal components. Fails with
  // kInsufficientData if at most num_components frames were observed or the
  // dimension is below num_components (the trainer then stays in
  // Accumulating and may observe more data) or the eigensolver does not
  // converge, and with kInvalidState if called before any data or a second
  // time.
  bool Finalize(int num_components, PcaBasis *basis, PipelineError *error);

  TrainerState state() const;
  long observation_count() const;
  long dimension() const;

private:
  // Requires mutex_ to be held.
  bool CheckAcceptsData(long data_dimension, PipelineError *error) const;

  mutable std::mutex mutex_;
  TrainerState state_ = TrainerState::kEmpty;
  SufficientStatistics statistics_;
};

} // namespace mousepca

#endif // MOUSEPCA_PCA_INCREMENTAL_PCA_TRAINER_HPP_
