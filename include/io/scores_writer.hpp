#ifndef MOUSEPCA_IO_SCORES_WRITER_HPP_
#define MOUSEPCA_IO_SCORES_WRITER_HPP_

#include <memory>
#include <string>
#include <vector>

#include <opencv2/core/core.hpp>

#include <pca/errors.hpp>
#include <pca/scores.hpp>

namespace mousepca {

constexpr char kDefaultScoresName[] = "pca_scores";

constexpr char kSessions[] = "sessions";
constexpr char kScores[] = "scores";
constexpr char kScoresIdx[] = "scores_idx";
constexpr char kPcaPath[] = "pca_path";

// Receives the score matrices of a run, one session at a time.
class ScoresSink {
public:
  virtual ~ScoresSink() {}
  virtual bool Consume(const ScoreMatrix &scores, PipelineError *error) = 0;
};

// Writes a cv::FileStorage container with a "sessions" sequence, one
// {uuid, scores, scores_idx} map per session, in Consume order. The container
// appears under its final name on a successful Close().
class FileStorageScoresSink : public ScoresSink {
public:
  // pca_path is recorded in the container for provenance; may be empty.
  bool Open(const std::string &filename, const std::string &pca_path,
            PipelineError *error);
  bool Consume(const ScoreMatrix &scores, PipelineError *error) override;
  bool Close(PipelineError *error);

  int sessions_written() const { return sessions_written_; }

private:
  std::string filename_;
  std::string temporary_path_;
  std::unique_ptr<cv::FileStorage> storage_;
  int sessions_written_ = 0;
};

// Keeps everything consumed, in order.
class InMemoryScoresSink : public ScoresSink {
public:
  bool Consume(const ScoreMatrix &scores, PipelineError *error) override;
  const std::vector<ScoreMatrix> &scores() const { return scores_; }

private:
  std::vector<ScoreMatrix> scores_;
};

bool ReadScoresFile(const std::string &filename,
                    std::vector<ScoreMatrix> *sessions, PipelineError *error);

} // namespace mousepca

#endif // MOUSEPCA_IO_SCORES_WRITER_HPP_
