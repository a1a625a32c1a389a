// Projects every session under --input_dir onto a trained basis and writes
// the per-frame scores to <output_dir>/<output_file>.yml.gz. Preprocessing
// follows the config stored with the basis.

#include <cstdlib>
#include <memory>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <frames/frame_source.hpp>
#include <io/basis_storage.hpp>
#include <io/file_storage_utils.hpp>
#include <io/json_converters.hpp>
#include <io/scores_writer.hpp>
#include <pipeline/batch.hpp>
#include <pipeline/run_setup.hpp>
#include <pipeline/session_preprocessor.hpp>

DEFINE_string(input_dir, "", "Directory searched recursively for sessions.");
DEFINE_string(output_dir, "", "Directory for the scores and the logs.");
DEFINE_string(pca_file, "",
              "Basis file. Defaults to <output_dir>/pca.yml.gz.");
DEFINE_string(output_file, mousepca::kDefaultScoresName,
              "Scores file name, without extension.");
DEFINE_bool(fill_gaps, true, "Insert NaN rows for dropped frames.");
DEFINE_double(fps, 30, "Camera frame rate, used to detect dropped frames.");
DEFINE_int32(workers, 1, "Worker threads.");
DEFINE_int32(chunk_size, 4000, "Frames per projection chunk.");

int main(int argc, char **argv) {
  google::ParseCommandLineFlags(&argc, &argv, true);
  mousepca::PrepareOutputDir(FLAGS_output_dir);
  google::InitGoogleLogging(argv[0]);
  google::InstallFailureSignalHandler();

  CHECK(!FLAGS_input_dir.empty());
  CHECK(!FLAGS_output_file.empty());
  const std::string pca_path =
      FLAGS_pca_file.empty()
          ? mousepca::JoinPath(FLAGS_output_dir,
                               std::string(mousepca::kDefaultBasisName) +
                                   mousepca::kContainerExtension)
          : FLAGS_pca_file;

  mousepca::PipelineError error;
  mousepca::PipelineConfig config;
  mousepca::PcaBasis basis;
  if (!mousepca::ReadRunConfig(mousepca::RunConfigPathFor(pca_path), &config,
                               &error) ||
      !mousepca::ReadBasis(pca_path, &basis, &error)) {
    LOG(ERROR) << "Cannot load basis: " << error;
    return mousepca::kExitFatal;
  }
  config.fill_gaps = FLAGS_fill_gaps;
  config.fps = FLAGS_fps;
  config.workers = FLAGS_workers;
  config.chunk_size = FLAGS_chunk_size;
  mousepca::CheckPipelineConfig(config);

  mousepca::LogPipelineConfig(config);

  std::unique_ptr<mousepca::FlipClassifier> flip_classifier;
  if (!mousepca::LoadOptionalFlipClassifier(config.flip_model_file,
                                            &flip_classifier, &error)) {
    LOG(ERROR) << "Cannot load flip model: " << error;
    return mousepca::kExitFatal;
  }

  const std::vector<std::unique_ptr<mousepca::FrameSource>> sources =
      mousepca::MakeManifestFrameSources(
          mousepca::FindSessionManifests(FLAGS_input_dir));

  const std::string scores_path = mousepca::JoinPath(
      FLAGS_output_dir, FLAGS_output_file + mousepca::kContainerExtension);
  mousepca::FileStorageScoresSink sink;
  if (!sink.Open(scores_path, pca_path, &error)) {
    LOG(ERROR) << error;
    return mousepca::kExitFatal;
  }
  mousepca::BatchReport report;
  const bool applied = mousepca::ApplyBasis(
      sources, config, flip_classifier.get(), basis, &sink, &report, &error);
  report.LogSummary("apply_pca");
  if (!applied || !sink.Close(&error)) {
    LOG(ERROR) << "Cannot write scores: " << error;
    return mousepca::kExitFatal;
  }
  return report.ExitStatus();
}
