#include <pca/projector.hpp>

#include <algorithm>
#include <limits>
#include <sstream>

#include <glog/logging.h>

namespace mousepca {

bool Project(const Session &session, const PcaBasis &basis,
             size_t chunk_size, ScoreMatrix *scores, PipelineError *error) {
  CHECK_NOTNULL(scores);
  CHECK_GT(chunk_size, 0);
  if (!CheckSessionShape(session, error)) {
    return false;
  }
  const std::vector<size_t> valid_indices = ValidFrameIndices(session);
  if (!valid_indices.empty()) {
    const cv::Size frame_size = session.frame_size();
    const long frame_dimension =
        static_cast<long>(frame_size.height) * frame_size.width;
    if (frame_dimension != basis.dimension()) {
      std::ostringstream message;
      message << "flattened " << frame_size.height << "x" << frame_size.width
              << " frames have dimension " << frame_dimension
              << ", basis mean has dimension " << basis.dimension();
      return SetError(error, ErrorKind::kShapeMismatch, session.key,
                      message.str());
    }
  }

  const double nan = std::numeric_limits<double>::quiet_NaN();
  ScoreMatrix result;
  result.session_key = session.key;
  result.scores = Eigen::MatrixXd::Constant(session.size(),
                                            basis.num_components(), nan);
  result.frame_index.resize(session.size());
  for (size_t frame_idx = 0; frame_idx < session.size(); ++frame_idx) {
    result.frame_index(frame_idx) = static_cast<double>(frame_idx);
  }

  for (size_t chunk_start = 0; chunk_start < valid_indices.size();
       chunk_start += chunk_size) {
    const size_t chunk_end =
        std::min(chunk_start + chunk_size, valid_indices.size());
    const std::vector<size_t> chunk_indices(
        valid_indices.begin() + chunk_start,
        valid_indices.begin() + chunk_end);
    Eigen::MatrixXd centered = FlattenFrames(session, chunk_indices);
    centered.rowwise() -= basis.mean;
    // (c x D) * (D x k) = (c x k)
    const Eigen::MatrixXd chunk_scores =
        centered * basis.components.transpose();
    for (size_t row = 0; row < chunk_indices.size(); ++row) {
      result.scores.row(chunk_indices.at(row)) = chunk_scores.row(row);
    }
  }

  *scores = result;
  return true;
}

} // namespace mousepca
