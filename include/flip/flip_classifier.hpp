#ifndef MOUSEPCA_FLIP_FLIP_CLASSIFIER_HPP_
#define MOUSEPCA_FLIP_FLIP_CLASSIFIER_HPP_

#include <string>

#include <Eigen/Dense>

#include <opencv2/core/core.hpp>

#include <frames/session.hpp>
#include <pca/errors.hpp>

namespace mousepca {

// Pre-trained logistic model over flattened frame pixels:
// p(frame) = sigmoid(weights . frame + bias) is the probability that the mouse
// in the frame faces the wrong way.
struct FlipModel {
  int frame_height = 0;
  int frame_width = 0;
  Eigen::RowVectorXd weights;
  double bias = 0;
};

// Reads a model written with cv::FileStorage (nodes frame_height,
// frame_width, weights, bias).
bool LoadFlipModel(const std::string &filename, FlipModel *model,
                   PipelineError *error);

enum class FlipDecision { kKeep, kFlip };

// Decides per frame whether the mouse orientation has to be rotated by 180
// degrees before feature extraction.
//
// A frame is flipped iff the model rates it as more likely reversed than its
// own 180 degrees rotation. Rotating a frame swaps the two ratings, so a
// corrected frame is always predicted kKeep and correcting twice is the same
// as correcting once.
//
// Immutable after construction, can be shared across threads.
class FlipClassifier {
public:
  explicit FlipClassifier(const FlipModel &model);

  bool FlipProbability(const cv::Mat &frame, double *probability,
                       PipelineError *error) const;

  // Fails with kShapeMismatch if the frame size differs from the model input.
  bool Predict(const cv::Mat &frame, FlipDecision *decision,
               PipelineError *error) const;

  // Returns a copy of session with every valid frame predicted kFlip rotated
  // by 180 degrees. Invalid frames are passed through untouched. Fails (and
  // leaves *corrected untouched) on the first frame with a wrong size.
  bool Apply(const Session &session, Session *corrected,
             PipelineError *error) const;

  const FlipModel &model() const { return model_; }

private:
  bool CheckFrameSize(const cv::Mat &frame, PipelineError *error) const;

  const FlipModel model_;
  // Weights in 180 degrees rotated pixel order, so that
  // weights . Rotate180(frame) == reversed_weights_ . frame.
  const Eigen::RowVectorXd reversed_weights_;
};

} // namespace mousepca

#endif // MOUSEPCA_FLIP_FLIP_CLASSIFIER_HPP_
