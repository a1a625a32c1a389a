#include <pca/scores.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

#include <glog/logging.h>

namespace mousepca {

bool IsSentinelRow(const ScoreMatrix &scores, long row) {
  CHECK_GE(row, 0);
  CHECK_LT(row, scores.rows());
  for (long col = 0; col < scores.scores.cols(); ++col) {
    if (!std::isnan(scores.scores(row, col))) {
      return false;
    }
  }
  return true;
}

ScoreMatrix InsertDroppedFrames(const ScoreMatrix &scores,
                                const std::vector<long> &times_usec,
                                double fps) {
  CHECK_GT(fps, 0);
  if (times_usec.empty()) {
    return scores;
  }
  CHECK_EQ(static_cast<long>(times_usec.size()), scores.rows());
  for (size_t idx = 1; idx < times_usec.size(); ++idx) {
    CHECK_GT(times_usec.at(idx), times_usec.at(idx - 1))
        << "Timestamps of session " << scores.session_key
        << " do not increase at frame " << idx;
  }

  const double frame_interval_usec = 1e6 / fps;
  // Number of rows to insert after every source row.
  std::vector<long> gaps_after(times_usec.size(), 0);
  long total_inserted = 0;
  for (size_t idx = 0; idx + 1 < times_usec.size(); ++idx) {
    const double gap_usec =
        static_cast<double>(times_usec.at(idx + 1) - times_usec.at(idx));
    if (gap_usec > 1.5 * frame_interval_usec) {
      gaps_after.at(idx) =
          std::lround(gap_usec / frame_interval_usec) - 1;
      total_inserted += gaps_after.at(idx);
    }
  }
  if (total_inserted == 0) {
    return scores;
  }

  const double nan = std::numeric_limits<double>::quiet_NaN();
  ScoreMatrix result;
  result.session_key = scores.session_key;
  result.scores.resize(scores.rows() + total_inserted, scores.scores.cols());
  result.frame_index.resize(scores.rows() + total_inserted);
  long out_row = 0;
  for (long row = 0; row < scores.rows(); ++row) {
    result.scores.row(out_row) = scores.scores.row(row);
    result.frame_index(out_row) = scores.frame_index(row);
    ++out_row;
    for (long inserted = 0; inserted < gaps_after.at(row); ++inserted) {
      result.scores.row(out_row).setConstant(nan);
      result.frame_index(out_row) = nan;
      ++out_row;
    }
  }
  CHECK_EQ(out_row, result.rows());
  LOG(INFO) << "Session " << scores.session_key << ": inserted "
            << total_inserted << " rows for dropped frames.";
  return result;
}

ScoreMatrix ClipScores(const ScoreMatrix &scores, long clip_samples,
                       bool from_end) {
  CHECK_GE(clip_samples, 0);
  const long kept = std::max(scores.rows() - clip_samples, 0L);
  const long first = from_end ? 0 : scores.rows() - kept;
  ScoreMatrix result;
  result.session_key = scores.session_key;
  result.scores = scores.scores.middleRows(first, kept);
  result.frame_index = scores.frame_index.segment(first, kept);
  return result;
}

} // namespace mousepca
