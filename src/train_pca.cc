// Trains a PCA basis over all sessions found under --input_dir and writes it
// to <output_dir>/<output_file>.yml.gz, together with the run config in
// <output_dir>/<output_file>.json.

#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <frames/frame_source.hpp>
#include <io/basis_storage.hpp>
#include <io/file_storage_utils.hpp>
#include <io/json_converters.hpp>
#include <pipeline/batch.hpp>
#include <pipeline/run_setup.hpp>
#include <pipeline/session_preprocessor.hpp>

DEFINE_string(input_dir, "", "Directory searched recursively for sessions.");
DEFINE_string(output_dir, "", "Directory for the basis and the logs.");
DEFINE_string(output_file, mousepca::kDefaultBasisName,
              "Basis file name, without extension.");
DEFINE_string(camera_type, mousepca::kCameraKinect, "kinect or azure.");
DEFINE_double(min_height, 10, "Heights below this are zeroed (mm).");
DEFINE_double(max_height, 120, "Heights above this are zeroed (mm).");
DEFINE_string(gaussfilter_space, "1.5,1",
              "Spatial Gaussian sigmas x,y. 0 disables.");
DEFINE_double(gaussfilter_time, 0, "Temporal Gaussian sigma. 0 disables.");
DEFINE_string(medfilter_space, "0",
              "Comma separated spatial median filter sizes (3 or 5).");
DEFINE_string(medfilter_time, "0",
              "Comma separated temporal median filter sizes (odd).");
DEFINE_string(tailfilter_size, "9,9", "Tail filter width,height.");
DEFINE_string(tailfilter_shape, "ellipse", "ellipse, rect or cross.");
DEFINE_bool(use_fft, false, "Train on the 2D Fourier magnitude of frames.");
DEFINE_string(flip_model_file, "",
              "Flip classifier model. Empty disables flip correction.");
DEFINE_bool(missing_data, false,
            "Missing data PCA: impute pixels flagged by the session masks.");
DEFINE_int32(missing_data_iters, 10, "Missing data PCA passes.");
DEFINE_double(mask_threshold, -16,
              "Pixels with a mask score below this may be missing.");
DEFINE_double(mask_height_threshold, 5,
              "Pixels at most this high (mm) are never missing.");
DEFINE_int32(recon_pcs, 10,
             "Components used to reconstruct missing pixels between passes.");
DEFINE_int32(rank, 25, "Number of principal components.");
DEFINE_int32(chunk_size, 4000, "Frames per accumulation chunk.");
DEFINE_int32(workers, 1, "Worker threads.");

namespace {
mousepca::PipelineConfig ConfigFromFlags() {
  mousepca::PipelineConfig config;
  mousepca::CleaningParams &cleaning = config.cleaning;
  cleaning.min_height = FLAGS_min_height;
  cleaning.max_height = FLAGS_max_height;
  const std::vector<double> sigmas =
      mousepca::ParseDoubleList(FLAGS_gaussfilter_space);
  CHECK_EQ(sigmas.size(), 2u);
  cleaning.gaussfilter_space_x = sigmas.at(0);
  cleaning.gaussfilter_space_y = sigmas.at(1);
  cleaning.gaussfilter_time = FLAGS_gaussfilter_time;
  cleaning.medfilter_space = mousepca::ParseIntList(FLAGS_medfilter_space);
  cleaning.medfilter_time = mousepca::ParseIntList(FLAGS_medfilter_time);
  const std::vector<int> tail_size =
      mousepca::ParseIntList(FLAGS_tailfilter_size);
  CHECK_EQ(tail_size.size(), 2u);
  cleaning.tailfilter_width = tail_size.at(0);
  cleaning.tailfilter_height = tail_size.at(1);
  cleaning.tailfilter_shape = FLAGS_tailfilter_shape;
  cleaning.use_fft = FLAGS_use_fft;
  config.flip_model_file = FLAGS_flip_model_file;
  config.missing_data.enabled = FLAGS_missing_data;
  config.missing_data.iters = FLAGS_missing_data_iters;
  config.missing_data.mask_threshold = FLAGS_mask_threshold;
  config.missing_data.mask_height_threshold = FLAGS_mask_height_threshold;
  config.missing_data.recon_pcs = FLAGS_recon_pcs;
  config.rank = FLAGS_rank;
  config.chunk_size = FLAGS_chunk_size;
  config.workers = FLAGS_workers;
  mousepca::ApplyCameraDefaults(FLAGS_camera_type, &config);
  mousepca::CheckPipelineConfig(config);
  return config;
}
} // namespace

int main(int argc, char **argv) {
  google::ParseCommandLineFlags(&argc, &argv, true);
  mousepca::PrepareOutputDir(FLAGS_output_dir);
  google::InitGoogleLogging(argv[0]);
  google::InstallFailureSignalHandler();

  CHECK(!FLAGS_input_dir.empty());
  CHECK(!FLAGS_output_file.empty());
  const std::string start_time = mousepca::CurrentTimeString();
  const mousepca::PipelineConfig config = ConfigFromFlags();

  mousepca::LogPipelineConfig(config);

  std::unique_ptr<mousepca::FlipClassifier> flip_classifier;
  mousepca::PipelineError error;
  if (!mousepca::LoadOptionalFlipClassifier(config.flip_model_file,
                                            &flip_classifier, &error)) {
    LOG(ERROR) << "Cannot load flip model: " << error;
    return mousepca::kExitFatal;
  }

  const std::vector<std::string> manifests =
      mousepca::FindSessionManifests(FLAGS_input_dir);
  const std::vector<std::unique_ptr<mousepca::FrameSource>> sources =
      mousepca::MakeManifestFrameSources(manifests);

  mousepca::PcaBasis basis;
  mousepca::BatchReport report;
  const bool trained = mousepca::TrainBasis(
      sources, config, flip_classifier.get(), &basis, &report, &error);
  report.LogSummary("train_pca");
  if (!trained) {
    LOG(ERROR) << "No basis produced: " << error;
    return mousepca::kExitFatal;
  }

  const std::string basis_path = mousepca::JoinPath(
      FLAGS_output_dir, FLAGS_output_file + mousepca::kContainerExtension);
  if (!mousepca::WriteRunConfig(mousepca::RunConfigPathFor(basis_path), config,
                                start_time, manifests, &error) ||
      !mousepca::WriteBasis(basis_path, basis, &error)) {
    LOG(ERROR) << error;
    return mousepca::kExitFatal;
  }
  return report.ExitStatus();
}
