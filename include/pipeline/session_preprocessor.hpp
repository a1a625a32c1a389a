#ifndef MOUSEPCA_PIPELINE_SESSION_PREPROCESSOR_HPP_
#define MOUSEPCA_PIPELINE_SESSION_PREPROCESSOR_HPP_

#include <memory>
#include <string>

#include <flip/flip_classifier.hpp>
#include <frames/frame_cleaner.hpp>
#include <frames/session.hpp>
#include <pca/errors.hpp>
#include <pca/missing_data.hpp>

namespace mousepca {

// Turns raw sessions into the frames the trainer and the projector see:
// missing pixel masking (in missing data mode), height clipping, flip
// correction, spatial and temporal cleaning, and the optional Fourier
// magnitude. Training and projection must use identical preprocessors.
class SessionPreprocessor {
public:
  // flip_classifier is optional (no correction if null) and not owned; it must
  // outlive the preprocessor.
  SessionPreprocessor(
      const CleaningParams &params, const FlipClassifier *flip_classifier,
      const MissingDataParams &missing_data = MissingDataParams());

  // Fails with kShapeMismatch on inconsistent sessions or frames not matching
  // the flip model, and with kIOFailure on NaN or infinite pixels. Safe to
  // call concurrently.
  bool Process(const Session &raw, Session *processed,
               PipelineError *error) const;

private:
  const CleaningParams params_;
  const FlipClassifier *flip_classifier_;
  const MissingDataParams missing_data_;
};

// Leaves *classifier null if model_file is empty. Fails if the model cannot
// be loaded.
bool LoadOptionalFlipClassifier(const std::string &model_file,
                                std::unique_ptr<FlipClassifier> *classifier,
                                PipelineError *error);

} // namespace mousepca

#endif // MOUSEPCA_PIPELINE_SESSION_PREPROCESSOR_HPP_
