#ifndef MOUSEPCA_PIPELINE_BATCH_HPP_
#define MOUSEPCA_PIPELINE_BATCH_HPP_

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <flip/flip_classifier.hpp>
#include <frames/frame_source.hpp>
#include <io/scores_writer.hpp>
#include <pca/errors.hpp>
#include <pca/pca_basis.hpp>
#include <pipeline/pipeline_config.hpp>

namespace mousepca {

// Process exit statuses of the batch binaries.
constexpr int kExitSuccess = 0;
constexpr int kExitFatal = 1;
constexpr int kExitPartialFailure = 2;

// Per-session outcome of a batch run.
struct BatchReport {
  int sessions_total = 0;
  int sessions_succeeded = 0;
  std::vector<PipelineError> failures;

  // Logs the error and records it.
  void AddFailure(const PipelineError &error);
  void AddSuccess() { ++sessions_succeeded; }
  // kExitSuccess if every session succeeded, kExitPartialFailure if some
  // failed, kExitFatal if none succeeded.
  int ExitStatus() const;
  void LogSummary(const std::string &run_name) const;
};

// Calls body(worker, index) for every index in [0, count). Index i is handled
// by worker i % num_workers; each worker processes its indices in increasing
// order on its own thread. Runs inline for a single worker.
void ParallelForEach(size_t count, int num_workers,
                     const std::function<void(int, size_t)> &body);

// Most common valid frame size over the sources, ties broken by worklist
// order. Sources whose frame size cannot be read are reported and marked in
// *size_failed. Returns false if no source has a valid frame.
bool FindCorpusFrameSize(
    const std::vector<std::unique_ptr<FrameSource>> &sources,
    cv::Size *frame_size, std::vector<bool> *size_failed,
    BatchReport *report);

// Trains a basis over all sources. Sessions that cannot be loaded, do not
// have the corpus frame size or fail preprocessing (including non-finite
// pixels) are reported and excluded. In missing data mode the corpus is read
// config.missing_data.iters times; every pass after the first re-imputes the
// missing pixels from the basis of the pass before. Returns false (with
// *error set) if no basis could be produced.
bool TrainBasis(const std::vector<std::unique_ptr<FrameSource>> &sources,
                const PipelineConfig &config,
                const FlipClassifier *flip_classifier, PcaBasis *basis,
                BatchReport *report, PipelineError *error);

// Projects every source onto basis and hands the scores to sink in worklist
// order. In missing data mode missing pixels are imputed from all components
// of basis before projection. Failing sessions are reported and skipped.
// Returns false (with *error set) only if the sink fails.
bool ApplyBasis(const std::vector<std::unique_ptr<FrameSource>> &sources,
                const PipelineConfig &config,
                const FlipClassifier *flip_classifier, const PcaBasis &basis,
                ScoresSink *sink, BatchReport *report, PipelineError *error);

} // namespace mousepca

#endif // MOUSEPCA_PIPELINE_BATCH_HPP_
