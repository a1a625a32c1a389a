#include <pipeline/pipeline_config.hpp>

#include <sstream>

#include <glog/logging.h>

#include <logging/strings.hpp>

namespace mousepca {

void CheckPipelineConfig(const PipelineConfig &config) {
  CheckCleaningParams(config.cleaning);
  CHECK_GT(config.rank, 0);
  CHECK_GT(config.chunk_size, 0);
  CHECK_GT(config.workers, 0);
  CHECK_GT(config.fps, 0);
  const MissingDataParams &missing_data = config.missing_data;
  if (missing_data.enabled) {
    CHECK_GT(missing_data.iters, 0);
    CHECK_GT(missing_data.recon_pcs, 0);
    CHECK_LE(missing_data.recon_pcs, config.rank)
        << "Cannot reconstruct missing pixels from more components than the "
           "basis has.";
    CHECK(!config.cleaning.use_fft)
        << "Missing data imputation works on pixels, not on the Fourier "
           "magnitude.";
  }
}

void LogPipelineConfig(const PipelineConfig &config) {
  const CleaningParams &cleaning = config.cleaning;
  LOG(INFO) << "Heights clipped to [" << cleaning.min_height << ", "
            << cleaning.max_height << "]";
  LOG(INFO) << "Tail filter " << cleaning.tailfilter_shape << " "
            << cleaning.tailfilter_width << "x" << cleaning.tailfilter_height
            << ", spatial medians " << ListToString(cleaning.medfilter_space)
            << ", spatial Gaussian (" << cleaning.gaussfilter_space_x << ", "
            << cleaning.gaussfilter_space_y << ")";
  LOG(INFO) << "Temporal medians " << ListToString(cleaning.medfilter_time)
            << ", temporal Gaussian " << cleaning.gaussfilter_time
            << ", fft " << cleaning.use_fft;
  LOG(INFO) << "Flip model: "
            << (config.flip_model_file.empty() ? "none"
                                               : config.flip_model_file);
  const MissingDataParams &missing_data = config.missing_data;
  if (missing_data.enabled) {
    LOG(INFO) << "Missing data PCA: " << missing_data.iters
              << " passes, mask threshold " << missing_data.mask_threshold
              << ", mask height threshold "
              << missing_data.mask_height_threshold << ", reconstruction from "
              << missing_data.recon_pcs << " components";
  }
  LOG(INFO) << "Rank " << config.rank << ", chunk size " << config.chunk_size
            << ", workers " << config.workers;
}

void ApplyCameraDefaults(const std::string &camera_type,
                         PipelineConfig *config) {
  CHECK_NOTNULL(config);
  CHECK(camera_type == kCameraKinect || camera_type == kCameraAzure)
      << "Unknown camera type: " << camera_type;
  if (camera_type != kCameraAzure) {
    return;
  }
  CleaningParams &cleaning = config->cleaning;
  const CleaningParams kinect_defaults;
  if (cleaning.gaussfilter_space_x == kinect_defaults.gaussfilter_space_x &&
      cleaning.gaussfilter_space_y == kinect_defaults.gaussfilter_space_y) {
    cleaning.gaussfilter_space_x = 2.25;
    cleaning.gaussfilter_space_y = 1.5;
  }
  if (cleaning.tailfilter_width == kinect_defaults.tailfilter_width &&
      cleaning.tailfilter_height == kinect_defaults.tailfilter_height) {
    cleaning.tailfilter_width = 13;
    cleaning.tailfilter_height = 13;
  }
}

namespace {
template <typename T> std::vector<T> ParseList(const std::string &text) {
  std::vector<T> result;
  std::stringstream text_stream(text);
  std::string item;
  while (std::getline(text_stream, item, ',')) {
    std::stringstream item_stream(item);
    T value;
    item_stream >> value;
    CHECK(!item_stream.fail()) << "Cannot parse '" << item << "' in '" << text
                               << "'";
    item_stream >> std::ws;
    CHECK(item_stream.eof()) << "Trailing characters in '" << item << "'";
    result.push_back(value);
  }
  return result;
}
} // namespace

std::vector<int> ParseIntList(const std::string &text) {
  return ParseList<int>(text);
}

std::vector<double> ParseDoubleList(const std::string &text) {
  return ParseList<double>(text);
}

} // namespace mousepca
