#ifndef MOUSEPCA_FRAMES_SESSION_HPP_
#define MOUSEPCA_FRAMES_SESSION_HPP_

#include <string>
#include <vector>

#include <Eigen/Dense>

#include <opencv2/core/core.hpp>

#include <pca/errors.hpp>

namespace mousepca {

// One recording of depth frames. Frames are single channel CV_32F images of
// the same size; frames with valid[i] == false may be empty and must not be
// read. times_usec is either empty or has one strictly increasing entry per
// frame.
//
// mask_scores optionally holds, per frame, the per-pixel log-likelihood of
// the extraction mouse model (CV_32F, frame sized). missing is derived from it
// during preprocessing: CV_8U, non-zero where the pixel is treated as missing.
// Both are either empty or have one entry per frame.
struct Session {
  std::string key;
  std::vector<cv::Mat> frames;
  std::vector<bool> valid;
  std::vector<long> times_usec;
  std::vector<cv::Mat> mask_scores;
  std::vector<cv::Mat> missing;

  size_t size() const { return frames.size(); }
  size_t num_valid() const;
  // Size of the first valid frame; empty if there is none.
  cv::Size frame_size() const;
};

// Checks that the validity mask, timestamps and pixel masks line up with the
// frames, that timestamps increase, and that all valid frames (and their
// masks) are non-empty single channel images of one size. Fails with
// kShapeMismatch otherwise.
bool CheckSessionShape(const Session &session, PipelineError *error);

// Fails with kIOFailure naming the first valid frame and pixel that is NaN or
// infinite.
bool CheckFiniteFrames(const Session &session, PipelineError *error);

// Indices of valid frames, in order.
std::vector<size_t> ValidFrameIndices(const Session &session);

// 180 degrees in-plane rotation (row and column reversal). Returns a new
// image, the input is not modified.
cv::Mat Rotate180(const cv::Mat &frame);

// Row-major flattening of a single channel frame.
Eigen::RowVectorXd FlattenFrame(const cv::Mat &frame);

// Flattens the missing pixel masks of the given frames, 1 for missing pixels
// and 0 otherwise. Requires session.missing to be non-empty.
Eigen::MatrixXd FlattenMissing(const Session &session,
                               const std::vector<size_t> &frame_indices);

// Flattens the given frames of session into the rows of a matrix. All frames
// must be valid and have the same size.
Eigen::MatrixXd FlattenFrames(const Session &session,
                              const std::vector<size_t> &frame_indices);

} // namespace mousepca

#endif // MOUSEPCA_FRAMES_SESSION_HPP_
