#include <frames/session.hpp>

#include <sstream>

#include <glog/logging.h>

#include <logging/strings.hpp>

namespace mousepca {

size_t Session::num_valid() const {
  size_t result = 0;
  for (const bool is_valid : valid) {
    result += is_valid;
  }
  return result;
}

cv::Size Session::frame_size() const {
  for (size_t frame_idx = 0; frame_idx < frames.size(); ++frame_idx) {
    if (valid.at(frame_idx)) {
      return frames.at(frame_idx).size();
    }
  }
  return cv::Size();
}

namespace {
bool CheckPerFrameCount(const Session &session, size_t count,
                        const std::string &what, PipelineError *error) {
  if (count != session.frames.size()) {
    std::ostringstream message;
    message << count << " " << what << " for " << session.frames.size()
            << " frames";
    return SetError(error, ErrorKind::kShapeMismatch, session.key,
                    message.str());
  }
  return true;
}

bool CheckFrameImage(const Session &session, size_t frame_idx,
                     const cv::Mat &image, const std::string &what,
                     const cv::Size &expected_size, PipelineError *error) {
  if (image.empty() || image.channels() != 1 ||
      image.size() != expected_size) {
    std::ostringstream message;
    message << what << " " << frame_idx << " is "
            << FrameSizeString(image.rows, image.cols) << " with "
            << image.channels() << " channel(s), expected single channel "
            << FrameSizeString(expected_size);
    return SetError(error, ErrorKind::kShapeMismatch, session.key,
                    message.str());
  }
  return true;
}
} // namespace

bool CheckSessionShape(const Session &session, PipelineError *error) {
  if (!CheckPerFrameCount(session, session.valid.size(),
                          "validity mask entries", error)) {
    return false;
  }
  if (!session.times_usec.empty()) {
    if (!CheckPerFrameCount(session, session.times_usec.size(), "timestamps",
                            error)) {
      return false;
    }
    for (size_t frame_idx = 1; frame_idx < session.times_usec.size();
         ++frame_idx) {
      if (session.times_usec.at(frame_idx) <=
          session.times_usec.at(frame_idx - 1)) {
        std::ostringstream message;
        message << "timestamp of frame " << frame_idx << " ("
                << session.times_usec.at(frame_idx)
                << " usec) does not follow frame " << frame_idx - 1 << " ("
                << session.times_usec.at(frame_idx - 1) << " usec)";
        return SetError(error, ErrorKind::kShapeMismatch, session.key,
                        message.str());
      }
    }
  }
  if (!session.mask_scores.empty() &&
      !CheckPerFrameCount(session, session.mask_scores.size(), "mask scores",
                          error)) {
    return false;
  }
  if (!session.missing.empty() &&
      !CheckPerFrameCount(session, session.missing.size(), "missing masks",
                          error)) {
    return false;
  }
  const cv::Size expected_size = session.frame_size();
  for (size_t frame_idx = 0; frame_idx < session.size(); ++frame_idx) {
    if (!session.valid.at(frame_idx)) {
      continue;
    }
    if (!CheckFrameImage(session, frame_idx, session.frames.at(frame_idx),
                         "frame", expected_size, error)) {
      return false;
    }
    if (!session.mask_scores.empty() &&
        !CheckFrameImage(session, frame_idx,
                         session.mask_scores.at(frame_idx), "mask of frame",
                         expected_size, error)) {
      return false;
    }
    if (!session.missing.empty() &&
        !CheckFrameImage(session, frame_idx, session.missing.at(frame_idx),
                         "missing mask of frame", expected_size, error)) {
      return false;
    }
  }
  return true;
}

bool CheckFiniteFrames(const Session &session, PipelineError *error) {
  for (size_t frame_idx = 0; frame_idx < session.size(); ++frame_idx) {
    if (!session.valid.at(frame_idx)) {
      continue;
    }
    cv::Point bad_pixel;
    if (!cv::checkRange(session.frames.at(frame_idx), true, &bad_pixel)) {
      std::ostringstream message;
      message << "frame " << frame_idx << " has a non-finite value at row "
              << bad_pixel.y << ", column " << bad_pixel.x;
      return SetError(error, ErrorKind::kIOFailure, session.key,
                      message.str());
    }
  }
  return true;
}

std::vector<size_t> ValidFrameIndices(const Session &session) {
  CHECK_EQ(session.frames.size(), session.valid.size());
  std::vector<size_t> result;
  for (size_t frame_idx = 0; frame_idx < session.size(); ++frame_idx) {
    if (session.valid.at(frame_idx)) {
      result.push_back(frame_idx);
    }
  }
  return result;
}

cv::Mat Rotate180(const cv::Mat &frame) {
  // 180 degrees rotation corresponds to flipping around both x and y axes.
  cv::Mat result;
  cv::flip(frame, result, -1);
  return result;
}

Eigen::RowVectorXd FlattenFrame(const cv::Mat &frame) {
  CHECK_EQ(frame.channels(), 1);
  cv::Mat frame_double;
  frame.convertTo(frame_double, CV_64F);
  Eigen::RowVectorXd result(frame_double.rows * frame_double.cols);
  for (int row = 0; row < frame_double.rows; ++row) {
    const double *src = frame_double.ptr<double>(row);
    for (int col = 0; col < frame_double.cols; ++col) {
      result(row * frame_double.cols + col) = src[col];
    }
  }
  return result;
}

Eigen::MatrixXd FlattenMissing(const Session &session,
                               const std::vector<size_t> &frame_indices) {
  CHECK_EQ(session.missing.size(), session.frames.size());
  if (frame_indices.empty()) {
    return Eigen::MatrixXd();
  }
  const cv::Mat &first = session.missing.at(frame_indices.front());
  Eigen::MatrixXd result(frame_indices.size(), first.rows * first.cols);
  for (size_t row = 0; row < frame_indices.size(); ++row) {
    cv::Mat indicator;
    cv::compare(session.missing.at(frame_indices.at(row)), 0, indicator,
                cv::CMP_NE);
    // compare() yields 255 for true.
    result.row(row) = FlattenFrame(indicator) / 255.0;
  }
  return result;
}

Eigen::MatrixXd FlattenFrames(const Session &session,
                              const std::vector<size_t> &frame_indices) {
  if (frame_indices.empty()) {
    return Eigen::MatrixXd();
  }
  const cv::Mat &first = session.frames.at(frame_indices.front());
  Eigen::MatrixXd result(frame_indices.size(), first.rows * first.cols);
  for (size_t row = 0; row < frame_indices.size(); ++row) {
    const size_t frame_idx = frame_indices.at(row);
    CHECK(session.valid.at(frame_idx));
    const cv::Mat &frame = session.frames.at(frame_idx);
    CHECK_EQ(frame.rows, first.rows);
    CHECK_EQ(frame.cols, first.cols);
    result.row(row) = FlattenFrame(frame);
  }
  return result;
}

} // namespace mousepca
