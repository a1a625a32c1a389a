#include <io/scores_writer.hpp>

#include <glog/logging.h>

#include <io/file_storage_utils.hpp>
#include <io/json_constants.hpp>

namespace mousepca {

bool FileStorageScoresSink::Open(const std::string &filename,
                                 const std::string &pca_path,
                                 PipelineError *error) {
  CHECK(storage_ == nullptr) << "Sink is already open.";
  filename_ = filename;
  temporary_path_ = TemporaryPathFor(filename);
  try {
    std::unique_ptr<cv::FileStorage> storage(
        new cv::FileStorage(temporary_path_, cv::FileStorage::WRITE));
    if (!storage->isOpened()) {
      return SetError(error, ErrorKind::kIOFailure, filename,
                      "cannot open " + temporary_path_ + " for writing");
    }
    *storage << kPcaPath << pca_path;
    *storage << kSessions << "[";
    storage_ = std::move(storage);
  } catch (const cv::Exception &e) {
    return SetError(error, ErrorKind::kIOFailure, filename,
                    std::string("cannot start scores file: ") + e.what());
  }
  sessions_written_ = 0;
  return true;
}

bool FileStorageScoresSink::Consume(const ScoreMatrix &scores,
                                    PipelineError *error) {
  CHECK(storage_ != nullptr) << "Sink is not open.";
  CHECK_EQ(scores.frame_index.size(), scores.scores.rows());
  try {
    *storage_ << "{";
    *storage_ << kUuid << scores.session_key;
    WriteMatrix(storage_.get(), kScores, scores.scores);
    WriteMatrix(storage_.get(), kScoresIdx, scores.frame_index);
    *storage_ << "}";
  } catch (const cv::Exception &e) {
    return SetError(error, ErrorKind::kIOFailure, scores.session_key,
                    "cannot write scores to " + filename_ + ": " + e.what());
  }
  ++sessions_written_;
  return true;
}

bool FileStorageScoresSink::Close(PipelineError *error) {
  CHECK(storage_ != nullptr) << "Sink is not open.";
  try {
    *storage_ << "]";
    storage_->release();
  } catch (const cv::Exception &e) {
    storage_.reset();
    return SetError(error, ErrorKind::kIOFailure, filename_,
                    std::string("cannot finish scores file: ") + e.what());
  }
  storage_.reset();
  if (!CommitTemporaryFile(temporary_path_, filename_, error)) {
    return false;
  }
  LOG(INFO) << "Wrote scores of " << sessions_written_ << " sessions to "
            << filename_;
  return true;
}

bool InMemoryScoresSink::Consume(const ScoreMatrix &scores,
                                 PipelineError *error) {
  scores_.push_back(scores);
  return true;
}

bool ReadScoresFile(const std::string &filename,
                    std::vector<ScoreMatrix> *sessions, PipelineError *error) {
  CHECK_NOTNULL(sessions);
  std::vector<ScoreMatrix> result;
  try {
    cv::FileStorage storage(filename, cv::FileStorage::READ);
    if (!storage.isOpened()) {
      return SetError(error, ErrorKind::kIOFailure, filename,
                      "cannot open scores file");
    }
    const cv::FileNode sessions_node = storage[kSessions];
    if (!sessions_node.isSeq()) {
      return SetError(error, ErrorKind::kIOFailure, filename,
                      "no sessions sequence");
    }
    for (cv::FileNodeIterator it = sessions_node.begin();
         it != sessions_node.end(); ++it) {
      const cv::FileNode session_node = *it;
      ScoreMatrix scores;
      scores.session_key = static_cast<std::string>(session_node[kUuid]);
      if (!ReadMatrix(session_node[kScores], &scores.scores) ||
          !ReadRowVector(session_node[kScoresIdx], &scores.frame_index)) {
        return SetError(error, ErrorKind::kIOFailure, filename,
                        "session " + scores.session_key +
                            " is missing scores arrays");
      }
      if (scores.frame_index.size() != scores.scores.rows()) {
        return SetError(error, ErrorKind::kShapeMismatch, scores.session_key,
                        std::to_string(scores.scores.rows()) +
                            " score rows but " +
                            std::to_string(scores.frame_index.size()) +
                            " frame indices in " + filename);
      }
      result.push_back(scores);
    }
  } catch (const cv::Exception &e) {
    return SetError(error, ErrorKind::kIOFailure, filename,
                    std::string("cannot read scores: ") + e.what());
  }
  *sessions = result;
  return true;
}

} // namespace mousepca
