#include <pipeline/session_preprocessor.hpp>

#include <glog/logging.h>

namespace mousepca {

SessionPreprocessor::SessionPreprocessor(
    const CleaningParams &params, const FlipClassifier *flip_classifier,
    const MissingDataParams &missing_data)
    : params_(params), flip_classifier_(flip_classifier),
      missing_data_(missing_data) {
  CheckCleaningParams(params_);
  CHECK(!(missing_data_.enabled && params_.use_fft));
}

bool SessionPreprocessor::Process(const Session &raw, Session *processed,
                                  PipelineError *error) const {
  CHECK_NOTNULL(processed);
  if (!CheckSessionShape(raw, error) || !CheckFiniteFrames(raw, error)) {
    return false;
  }
  Session result = raw;
  if (missing_data_.enabled) {
    if (raw.mask_scores.empty()) {
      LOG(WARNING) << "Session " << raw.key
                   << " has no pixel masks, no pixels are treated as missing.";
    }
    result = MaskMissingPixels(result, missing_data_);
  } else {
    result.missing.clear();
  }
  result = ClipHeights(result, params_);
  if (flip_classifier_ != nullptr) {
    Session corrected;
    if (!flip_classifier_->Apply(result, &corrected, error)) {
      return false;
    }
    result = corrected;
  }
  result = CleanFrames(result, params_);
  if (params_.use_fft) {
    for (size_t frame_idx = 0; frame_idx < result.size(); ++frame_idx) {
      if (result.valid.at(frame_idx)) {
        result.frames.at(frame_idx) = FftMagnitude(result.frames.at(frame_idx));
      }
    }
  }
  *processed = result;
  return true;
}

bool LoadOptionalFlipClassifier(const std::string &model_file,
                                std::unique_ptr<FlipClassifier> *classifier,
                                PipelineError *error) {
  CHECK_NOTNULL(classifier);
  classifier->reset();
  if (model_file.empty()) {
    LOG(INFO) << "No flip model, frame orientation is not corrected.";
    return true;
  }
  FlipModel model;
  if (!LoadFlipModel(model_file, &model, error)) {
    return false;
  }
  classifier->reset(new FlipClassifier(model));
  return true;
}

} // namespace mousepca
