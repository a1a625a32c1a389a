#include <pca/missing_data.hpp>

#include <glog/logging.h>

namespace mousepca {

cv::Mat MissingPixelMask(const cv::Mat &frame, const cv::Mat &mask_scores,
                         const MissingDataParams &params) {
  CHECK_EQ(frame.size(), mask_scores.size());
  const cv::Mat missing = (mask_scores < params.mask_threshold) &
                          (frame > params.mask_height_threshold);
  // Comparisons yield 255 for true.
  return missing / 255;
}

Session MaskMissingPixels(const Session &session,
                          const MissingDataParams &params) {
  Session result = session;
  result.missing.clear();
  if (session.mask_scores.empty()) {
    return result;
  }
  CHECK_EQ(session.mask_scores.size(), session.frames.size());
  result.missing.resize(session.size());
  size_t num_missing = 0;
  for (size_t frame_idx = 0; frame_idx < session.size(); ++frame_idx) {
    if (!session.valid.at(frame_idx)) {
      continue;
    }
    const cv::Mat &frame = session.frames.at(frame_idx);
    cv::Mat &missing = result.missing.at(frame_idx);
    missing = MissingPixelMask(frame, session.mask_scores.at(frame_idx),
                               params);
    cv::Mat masked = frame.clone();
    masked.setTo(0, missing);
    result.frames.at(frame_idx) = masked;
    num_missing += cv::countNonZero(missing);
  }
  VLOG(1) << "Session " << session.key << ": " << num_missing
          << " missing pixels.";
  return result;
}

void ImputeMissing(const PcaBasis &basis, int num_components, double min_value,
                   double max_value, const Eigen::MatrixXd &missing,
                   Eigen::MatrixXd *chunk) {
  CHECK_NOTNULL(chunk);
  CHECK_GT(num_components, 0);
  CHECK_LE(num_components, basis.num_components());
  CHECK_EQ(chunk->cols(), basis.dimension());
  CHECK_EQ(chunk->rows(), missing.rows());
  CHECK_EQ(chunk->cols(), missing.cols());
  const Eigen::MatrixXd components = basis.components.topRows(num_components);
  const Eigen::MatrixXd scores =
      (chunk->rowwise() - basis.mean) * components.transpose();
  const Eigen::MatrixXd reconstruction =
      (scores * components).rowwise() + basis.mean;
  const Eigen::ArrayXXd clipped =
      ((reconstruction.array() < min_value) ||
       (reconstruction.array() > max_value))
          .select(0.0, reconstruction.array());
  chunk->array() = (missing.array() != 0).select(clipped, chunk->array());
}

Session ImputeSession(const Session &session, const PcaBasis &basis,
                      double min_value, double max_value) {
  if (session.missing.empty()) {
    return session;
  }
  CHECK_EQ(session.missing.size(), session.frames.size());
  Session result = session;
  for (size_t frame_idx = 0; frame_idx < session.size(); ++frame_idx) {
    if (!session.valid.at(frame_idx) ||
        cv::countNonZero(session.missing.at(frame_idx)) == 0) {
      continue;
    }
    const std::vector<size_t> frame_indices = {frame_idx};
    Eigen::MatrixXd pixels = FlattenFrames(session, frame_indices);
    ImputeMissing(basis, static_cast<int>(basis.num_components()), min_value,
                  max_value, FlattenMissing(session, frame_indices), &pixels);
    const cv::Mat &frame = session.frames.at(frame_idx);
    cv::Mat imputed(frame.rows, frame.cols, CV_32F);
    for (int row = 0; row < frame.rows; ++row) {
      float *dst = imputed.ptr<float>(row);
      for (int col = 0; col < frame.cols; ++col) {
        dst[col] = static_cast<float>(pixels(0, row * frame.cols + col));
      }
    }
    result.frames.at(frame_idx) = imputed;
  }
  return result;
}

void StoreMissing(const Eigen::MatrixXd &missing, const Eigen::MatrixXd &chunk,
                  std::vector<double> *values) {
  CHECK_NOTNULL(values);
  CHECK_EQ(missing.rows(), chunk.rows());
  CHECK_EQ(missing.cols(), chunk.cols());
  for (long row = 0; row < chunk.rows(); ++row) {
    for (long col = 0; col < chunk.cols(); ++col) {
      if (missing(row, col) != 0) {
        values->push_back(chunk(row, col));
      }
    }
  }
}

void RestoreMissing(const Eigen::MatrixXd &missing,
                    const std::vector<double> &values, size_t *cursor,
                    Eigen::MatrixXd *chunk) {
  CHECK_NOTNULL(cursor);
  CHECK_NOTNULL(chunk);
  CHECK_EQ(missing.rows(), chunk->rows());
  CHECK_EQ(missing.cols(), chunk->cols());
  for (long row = 0; row < chunk->rows(); ++row) {
    for (long col = 0; col < chunk->cols(); ++col) {
      if (missing(row, col) != 0) {
        (*chunk)(row, col) = values.at((*cursor)++);
      }
    }
  }
}

} // namespace mousepca
