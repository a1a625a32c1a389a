#include <pipeline/batch.hpp>

#include <algorithm>
#include <map>
#include <thread>

#include <glog/logging.h>

#include <logging/strings.hpp>
#include <pca/incremental_pca_trainer.hpp>
#include <pca/missing_data.hpp>
#include <pca/projector.hpp>
#include <pca/scores.hpp>
#include <pca/sufficient_statistics.hpp>
#include <pipeline/session_preprocessor.hpp>

namespace mousepca {

void BatchReport::AddFailure(const PipelineError &error) {
  LOG(ERROR) << "Session failed: " << error;
  failures.push_back(error);
}

int BatchReport::ExitStatus() const {
  if (sessions_succeeded == 0) {
    return kExitFatal;
  }
  return failures.empty() ? kExitSuccess : kExitPartialFailure;
}

void BatchReport::LogSummary(const std::string &run_name) const {
  LOG(INFO) << run_name << ": " << sessions_succeeded << " of "
            << sessions_total << " sessions succeeded, " << failures.size()
            << " failed.";
  for (const PipelineError &failure : failures) {
    LOG(WARNING) << run_name << " skipped " << failure;
  }
}

void ParallelForEach(size_t count, int num_workers,
                     const std::function<void(int, size_t)> &body) {
  CHECK_GT(num_workers, 0);
  const auto worker_loop = [count, num_workers, &body](int worker) {
    for (size_t index = worker; index < count; index += num_workers) {
      body(worker, index);
    }
  };
  if (num_workers == 1) {
    worker_loop(0);
    return;
  }
  std::vector<std::unique_ptr<std::thread>> threads;
  for (int worker = 0; worker < num_workers; ++worker) {
    threads.emplace_back(new std::thread(worker_loop, worker));
  }
  for (std::unique_ptr<std::thread> &thread : threads) {
    thread->join();
  }
}

namespace {
// Result slot of one session, written by exactly one worker.
struct SessionOutcome {
  bool succeeded = false;
  PipelineError error;
};

bool LoadAndPreprocess(FrameSource *source,
                       const SessionPreprocessor &preprocessor,
                       const cv::Size &expected_frame_size, Session *session,
                       PipelineError *error) {
  Session raw;
  if (!source->Load(&raw, error)) {
    if (error != nullptr && error->session_key.empty()) {
      error->session_key = source->description();
    }
    return false;
  }
  if (raw.num_valid() == 0) {
    LOG(WARNING) << "Session " << raw.key << " has no valid frames.";
  } else if (expected_frame_size != cv::Size() &&
             raw.frame_size() != expected_frame_size) {
    return SetError(error, ErrorKind::kShapeMismatch, raw.key,
                    "frames are " + FrameSizeString(raw.frame_size()) +
                        ", expected " + FrameSizeString(expected_frame_size));
  }
  if (!preprocessor.Process(raw, session, error)) {
    if (error != nullptr && error->session_key.empty()) {
      error->session_key = raw.key;
    }
    return false;
  }
  return true;
}

void CollectOutcomes(const std::vector<SessionOutcome> &outcomes,
                     const std::vector<bool> &skipped, BatchReport *report) {
  for (size_t idx = 0; idx < outcomes.size(); ++idx) {
    if (skipped.at(idx)) {
      continue;
    }
    if (outcomes.at(idx).succeeded) {
      report->AddSuccess();
    } else {
      report->AddFailure(outcomes.at(idx).error);
    }
  }
}
} // namespace

bool FindCorpusFrameSize(
    const std::vector<std::unique_ptr<FrameSource>> &sources,
    cv::Size *frame_size, std::vector<bool> *size_failed,
    BatchReport *report) {
  CHECK_NOTNULL(frame_size);
  CHECK_NOTNULL(size_failed);
  CHECK_NOTNULL(report);
  size_failed->assign(sources.size(), false);
  std::vector<cv::Size> sizes;
  std::map<std::pair<int, int>, int> size_counts;
  for (size_t idx = 0; idx < sources.size(); ++idx) {
    cv::Size size;
    PipelineError error;
    if (!sources.at(idx)->ReadFrameSize(&size, &error)) {
      if (error.session_key.empty()) {
        error.session_key = sources.at(idx)->description();
      }
      report->AddFailure(error);
      size_failed->at(idx) = true;
      continue;
    }
    if (size != cv::Size()) {
      sizes.push_back(size);
      ++size_counts[std::make_pair(size.height, size.width)];
    }
  }
  if (sizes.empty()) {
    return false;
  }
  int best_count = 0;
  for (const cv::Size &size : sizes) {
    const int count = size_counts[std::make_pair(size.height, size.width)];
    if (count > best_count) {
      best_count = count;
      *frame_size = size;
    }
  }
  if (best_count < static_cast<int>(sizes.size())) {
    LOG(WARNING) << "Sessions have different frame sizes, using "
                 << FrameSizeString(*frame_size) << " shared by " << best_count
                 << " of " << sizes.size() << " sessions.";
  }
  return true;
}

namespace {
// Statistics of the valid frames of one session, chunk by chunk. In passes
// after the first, missing pixels take the values imputed in the previous
// pass (previous_values, empty in the second pass) and are then re-imputed
// from previous_basis; the new values are appended to *next_values.
SufficientStatistics AccumulateSession(
    const Session &session, const PipelineConfig &config, int pass,
    const PcaBasis &previous_basis, const std::vector<double> &previous_values,
    std::vector<double> *next_values) {
  const std::vector<size_t> valid_indices = ValidFrameIndices(session);
  const size_t chunk_size = static_cast<size_t>(config.chunk_size);
  const bool impute = pass > 0 && !session.missing.empty();
  SufficientStatistics session_statistics;
  size_t cursor = 0;
  for (size_t chunk_start = 0; chunk_start < valid_indices.size();
       chunk_start += chunk_size) {
    const size_t chunk_end =
        std::min(chunk_start + chunk_size, valid_indices.size());
    const std::vector<size_t> chunk_indices(valid_indices.begin() + chunk_start,
                                            valid_indices.begin() + chunk_end);
    Eigen::MatrixXd chunk = FlattenFrames(session, chunk_indices);
    if (impute) {
      const Eigen::MatrixXd missing = FlattenMissing(session, chunk_indices);
      if (pass > 1) {
        RestoreMissing(missing, previous_values, &cursor, &chunk);
      }
      ImputeMissing(previous_basis, config.missing_data.recon_pcs,
                    config.cleaning.min_height, config.cleaning.max_height,
                    missing, &chunk);
      StoreMissing(missing, chunk, next_values);
    }
    AccumulateChunk(chunk, &session_statistics);
  }
  return session_statistics;
}
} // namespace

bool TrainBasis(const std::vector<std::unique_ptr<FrameSource>> &sources,
                const PipelineConfig &config,
                const FlipClassifier *flip_classifier, PcaBasis *basis,
                BatchReport *report, PipelineError *error) {
  CHECK_NOTNULL(basis);
  CHECK_NOTNULL(report);
  CheckPipelineConfig(config);
  report->sessions_total = static_cast<int>(sources.size());

  cv::Size frame_size;
  std::vector<bool> size_failed;
  if (!FindCorpusFrameSize(sources, &frame_size, &size_failed, report)) {
    return SetError(error, ErrorKind::kInsufficientData, "",
                    "no session has a readable valid frame");
  }

  const SessionPreprocessor preprocessor(config.cleaning, flip_classifier,
                                         config.missing_data);
  const int num_passes =
      config.missing_data.enabled ? config.missing_data.iters : 1;
  std::vector<SessionOutcome> outcomes(sources.size());
  // Imputed values of the missing pixels of every session.
  std::vector<std::vector<double>> missing_values(sources.size());
  PcaBasis pass_basis;
  for (int pass = 0; pass < num_passes; ++pass) {
    std::vector<SufficientStatistics> worker_statistics(config.workers);
    ParallelForEach(sources.size(), config.workers, [&](int worker,
                                                        size_t idx) {
      SessionOutcome &outcome = outcomes.at(idx);
      if (size_failed.at(idx) || (pass > 0 && !outcome.succeeded)) {
        return;
      }
      outcome.succeeded = false;
      Session session;
      if (!LoadAndPreprocess(sources.at(idx).get(), preprocessor, frame_size,
                             &session, &outcome.error)) {
        return;
      }
      std::vector<double> next_values;
      // Statistics of this session only, so that a failing session leaves
      // the worker statistics untouched.
      const SufficientStatistics session_statistics =
          AccumulateSession(session, config, pass, pass_basis,
                            missing_values.at(idx), &next_values);
      missing_values.at(idx).swap(next_values);
      MergeInto(session_statistics, &worker_statistics.at(worker));
      LOG(INFO) << "Observed " << session_statistics.count
                << " frames of session " << session.key;
      outcome.succeeded = true;
    });

    IncrementalPcaTrainer trainer;
    bool finalized = true;
    for (const SufficientStatistics &statistics : worker_statistics) {
      finalized = finalized && trainer.MergeStatistics(statistics, error);
    }
    finalized = finalized && trainer.Finalize(config.rank, &pass_basis, error);
    if (!finalized) {
      CollectOutcomes(outcomes, size_failed, report);
      return false;
    }
    if (num_passes > 1) {
      LOG(INFO) << "Missing data pass " << pass + 1 << " of " << num_passes
                << " done.";
    }
  }
  CollectOutcomes(outcomes, size_failed, report);

  *basis = pass_basis;
  basis->frame_height = frame_size.height;
  basis->frame_width = frame_size.width;
  return true;
}

bool ApplyBasis(const std::vector<std::unique_ptr<FrameSource>> &sources,
                const PipelineConfig &config,
                const FlipClassifier *flip_classifier, const PcaBasis &basis,
                ScoresSink *sink, BatchReport *report, PipelineError *error) {
  CHECK_NOTNULL(sink);
  CHECK_NOTNULL(report);
  CheckPipelineConfig(config);
  report->sessions_total = static_cast<int>(sources.size());

  const cv::Size basis_frame_size(basis.frame_width, basis.frame_height);
  const SessionPreprocessor preprocessor(config.cleaning, flip_classifier,
                                         config.missing_data);
  std::vector<SessionOutcome> outcomes(sources.size());
  std::vector<ScoreMatrix> slots(sources.size());
  ParallelForEach(sources.size(), config.workers, [&](int worker,
                                                      size_t idx) {
    SessionOutcome &outcome = outcomes.at(idx);
    Session session;
    if (!LoadAndPreprocess(sources.at(idx).get(), preprocessor,
                           basis_frame_size, &session, &outcome.error)) {
      return;
    }
    if (config.missing_data.enabled &&
        static_cast<long>(session.frame_size().area()) == basis.dimension()) {
      session = ImputeSession(session, basis, config.cleaning.min_height,
                              config.cleaning.max_height);
    }
    ScoreMatrix scores;
    if (!Project(session, basis, static_cast<size_t>(config.chunk_size),
                 &scores, &outcome.error)) {
      return;
    }
    if (config.fill_gaps) {
      scores = InsertDroppedFrames(scores, session.times_usec, config.fps);
    }
    slots.at(idx) = scores;
    outcome.succeeded = true;
  });

  const std::vector<bool> skipped(sources.size(), false);
  CollectOutcomes(outcomes, skipped, report);
  for (size_t idx = 0; idx < sources.size(); ++idx) {
    if (outcomes.at(idx).succeeded && !sink->Consume(slots.at(idx), error)) {
      return false;
    }
  }
  return true;
}

} // namespace mousepca
