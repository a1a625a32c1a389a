// Removes the first (or last) --clip_samples rows of every session in a
// scores file, writing <name>_clip.yml.gz beside it.

#include <cstdlib>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <io/file_storage_utils.hpp>
#include <io/scores_writer.hpp>
#include <pca/scores.hpp>
#include <pipeline/batch.hpp>

DEFINE_string(scores_file, "", "Scores file written by apply_pca.");
DEFINE_int64(clip_samples, 15, "Number of rows to remove per session.");
DEFINE_bool(from_end, false, "Clip from the end instead of the start.");

int main(int argc, char **argv) {
  google::InitGoogleLogging(argv[0]);
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InstallFailureSignalHandler();

  CHECK(!FLAGS_scores_file.empty());
  CHECK_GE(FLAGS_clip_samples, 0);

  mousepca::PipelineError error;
  std::vector<mousepca::ScoreMatrix> sessions;
  if (!mousepca::ReadScoresFile(FLAGS_scores_file, &sessions, &error)) {
    LOG(ERROR) << error;
    return mousepca::kExitFatal;
  }

  const std::string clipped_path =
      mousepca::StripContainerExtension(FLAGS_scores_file) + "_clip" +
      mousepca::kContainerExtension;

  mousepca::FileStorageScoresSink sink;
  if (!sink.Open(clipped_path, "", &error)) {
    LOG(ERROR) << error;
    return mousepca::kExitFatal;
  }
  for (const mousepca::ScoreMatrix &scores : sessions) {
    const mousepca::ScoreMatrix clipped =
        mousepca::ClipScores(scores, FLAGS_clip_samples, FLAGS_from_end);
    if (clipped.rows() == 0) {
      LOG(WARNING) << "Session " << scores.session_key << " has only "
                   << scores.rows() << " rows, nothing left after clipping.";
    }
    if (!sink.Consume(clipped, &error)) {
      LOG(ERROR) << error;
      return mousepca::kExitFatal;
    }
  }
  if (!sink.Close(&error)) {
    LOG(ERROR) << error;
    return mousepca::kExitFatal;
  }
  return EXIT_SUCCESS;
}
