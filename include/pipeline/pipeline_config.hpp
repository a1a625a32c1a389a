#ifndef MOUSEPCA_PIPELINE_PIPELINE_CONFIG_HPP_
#define MOUSEPCA_PIPELINE_PIPELINE_CONFIG_HPP_

#include <string>
#include <vector>

#include <frames/frame_cleaner.hpp>
#include <pca/missing_data.hpp>

namespace mousepca {

constexpr char kCameraKinect[] = "kinect";
constexpr char kCameraAzure[] = "azure";

// All numeric parameters of a train or apply run.
struct PipelineConfig {
  CleaningParams cleaning;
  MissingDataParams missing_data;
  // Empty means no flip correction.
  std::string flip_model_file;
  // Number of principal components.
  int rank = 25;
  // Frames per trainer/projector chunk.
  int chunk_size = 4000;
  int workers = 1;
  // Insert sentinel rows for dropped frames when writing scores.
  bool fill_gaps = true;
  double fps = 30;
};

// Dies on invalid parameters.
void CheckPipelineConfig(const PipelineConfig &config);

void LogPipelineConfig(const PipelineConfig &config);

// Azure cameras have a different pixel footprint: the spatial Gaussian and
// the tail filter are enlarged unless they were changed from the Kinect
// defaults.
void ApplyCameraDefaults(const std::string &camera_type,
                         PipelineConfig *config);

// Parse comma separated flag values, e.g. "3,5". Die on malformed input.
std::vector<int> ParseIntList(const std::string &text);
std::vector<double> ParseDoubleList(const std::string &text);

} // namespace mousepca

#endif // MOUSEPCA_PIPELINE_PIPELINE_CONFIG_HPP_
