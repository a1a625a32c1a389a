#ifndef MOUSEPCA_PCA_SCORES_HPP_
#define MOUSEPCA_PCA_SCORES_HPP_

#include <string>
#include <vector>

#include <Eigen/Dense>

namespace mousepca {

// Per-session PCA scores, one row per frame in recording order. Frames
// without a score (invalid or dropped) are all-NaN sentinel rows, so row
// indices stay aligned with the recording.
struct ScoreMatrix {
  std::string session_key;
  // rows x k.
  Eigen::MatrixXd scores;
  // Source frame index of every row; NaN for rows inserted for dropped
  // frames.
  Eigen::RowVectorXd frame_index;

  long rows() const { return static_cast<long>(scores.rows()); }
};

bool IsSentinelRow(const ScoreMatrix &scores, long row);

// Inserts sentinel rows wherever consecutive timestamps are more than 1.5
// frame intervals (1 / fps) apart, one row per missing frame interval.
// Returns the input unchanged when timestamps are absent. Timestamps must be
// strictly increasing (see CheckSessionShape).
ScoreMatrix InsertDroppedFrames(const ScoreMatrix &scores,
                                const std::vector<long> &times_usec,
                                double fps);

// Removes clip_samples rows from the start (or the end if from_end) of the
// scores. Clipping more rows than there are leaves an empty matrix.
ScoreMatrix ClipScores(const ScoreMatrix &scores, long clip_samples,
                       bool from_end);

} // namespace mousepca

#endif // MOUSEPCA_PCA_SCORES_HPP_
