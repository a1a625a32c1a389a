#include <flip/flip_classifier.hpp>

#include <cmath>
#include <sstream>

#include <opencv2/core/eigen.hpp>

#include <glog/logging.h>

namespace mousepca {
namespace {
double Sigmoid(double logit) { return 1.0 / (1.0 + std::exp(-logit)); }
} // namespace

bool LoadFlipModel(const std::string &filename, FlipModel *model,
                   PipelineError *error) {
  CHECK_NOTNULL(model);
  try {
    cv::FileStorage storage(filename, cv::FileStorage::READ);
    if (!storage.isOpened()) {
      return SetError(error, ErrorKind::kIOFailure, "",
                      "cannot open flip model file " + filename);
    }
    if (storage["weights"].empty() || storage["frame_height"].empty() ||
        storage["frame_width"].empty()) {
      return SetError(error, ErrorKind::kIOFailure, "",
                      "flip model file " + filename +
                          " lacks weights or frame size");
    }
    FlipModel result;
    storage["frame_height"] >> result.frame_height;
    storage["frame_width"] >> result.frame_width;
    storage["bias"] >> result.bias;
    cv::Mat weights;
    storage["weights"] >> weights;
    weights = weights.reshape(1, 1);
    cv::Mat weights_double;
    weights.convertTo(weights_double, CV_64F);
    cv::cv2eigen(weights_double, result.weights);

    if (result.weights.size() !=
        static_cast<long>(result.frame_height) * result.frame_width) {
      std::ostringstream message;
      message << "flip model " << filename << " has " << result.weights.size()
              << " weights for " << result.frame_height << "x"
              << result.frame_width << " frames";
      return SetError(error, ErrorKind::kShapeMismatch, "", message.str());
    }
    *model = result;
  } catch (const cv::Exception &e) {
    return SetError(error, ErrorKind::kIOFailure, "",
                    "failed to parse flip model " + filename + ": " +
                        e.what());
  }
  LOG(INFO) << "Loaded flip model for " << model->frame_height << "x"
            << model->frame_width << " frames from " << filename;
  return true;
}

FlipClassifier::FlipClassifier(const FlipModel &model)
    : model_(model), reversed_weights_(model.weights.reverse()) {
  CHECK_GT(model_.frame_height, 0);
  CHECK_GT(model_.frame_width, 0);
  CHECK_EQ(model_.weights.size(),
           static_cast<long>(model_.frame_height) * model_.frame_width);
}

bool FlipClassifier::CheckFrameSize(const cv::Mat &frame,
                                    PipelineError *error) const {
  if (frame.rows != model_.frame_height || frame.cols != model_.frame_width ||
      frame.channels() != 1) {
    std::ostringstream message;
    message << "flip model expects " << model_.frame_height << "x"
            << model_.frame_width << " frames, got " << frame.rows << "x"
            << frame.cols << " with " << frame.channels() << " channel(s)";
    return SetError(error, ErrorKind::kShapeMismatch, "", message.str());
  }
  return true;
}

bool FlipClassifier::FlipProbability(const cv::Mat &frame,
                                     double *probability,
                                     PipelineError *error) const {
  CHECK_NOTNULL(probability);
  if (!CheckFrameSize(frame, error)) {
    return false;
  }
  *probability = Sigmoid(model_.weights.dot(FlattenFrame(frame)) + model_.bias);
  return true;
}

bool FlipClassifier::Predict(const cv::Mat &frame, FlipDecision *decision,
                             PipelineError *error) const {
  CHECK_NOTNULL(decision);
  if (!CheckFrameSize(frame, error)) {
    return false;
  }
  const Eigen::RowVectorXd pixels = FlattenFrame(frame);
  // The sigmoid is monotonic and the bias is shared, so comparing the linear
  // terms is the same as comparing the probabilities.
  const double as_given = model_.weights.dot(pixels);
  const double rotated = reversed_weights_.dot(pixels);
  *decision = as_given > rotated ? FlipDecision::kFlip : FlipDecision::kKeep;
  return true;
}

bool FlipClassifier::Apply(const Session &session, Session *corrected,
                           PipelineError *error) const {
  CHECK_NOTNULL(corrected);
  CHECK_EQ(session.frames.size(), session.valid.size());
  Session result = session;

  size_t num_flipped = 0;
  double probability_sum = 0;
  for (size_t frame_idx = 0; frame_idx < session.size(); ++frame_idx) {
    if (!session.valid.at(frame_idx)) {
      continue;
    }
    const cv::Mat &frame = session.frames.at(frame_idx);
    FlipDecision decision = FlipDecision::kKeep;
    double probability = 0;
    if (!Predict(frame, &decision, error) ||
        !FlipProbability(frame, &probability, error)) {
      if (error != nullptr) {
        error->session_key = session.key;
        error->message =
            "frame " + std::to_string(frame_idx) + ": " + error->message;
      }
      return false;
    }
    probability_sum += probability;
    if (decision == FlipDecision::kFlip) {
      result.frames.at(frame_idx) = Rotate180(frame);
      // Pixel masks stay aligned with the rotated frame.
      if (!session.mask_scores.empty()) {
        result.mask_scores.at(frame_idx) =
            Rotate180(session.mask_scores.at(frame_idx));
      }
      if (!session.missing.empty()) {
        result.missing.at(frame_idx) = Rotate180(session.missing.at(frame_idx));
      }
      ++num_flipped;
    }
  }

  const size_t num_valid = session.num_valid();
  LOG(INFO) << "Session " << session.key << ": flipped " << num_flipped
            << " of " << num_valid << " valid frames, mean flip probability "
            << (num_valid > 0 ? probability_sum / num_valid : 0.0);
  *corrected = result;
  return true;
}

} // namespace mousepca
