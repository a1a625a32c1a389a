#include <io/json_converters.hpp>

#include <fstream>

#include <glog/logging.h>

#include <io/json_constants.hpp>

namespace mousepca {

bool ReadJsonFile(const std::string &filename,
                  std::unique_ptr<nlohmann::json> *result,
                  PipelineError *error) {
  CHECK_NOTNULL(result);
  std::ifstream file_stream(filename);
  if (!file_stream.is_open()) {
    return SetError(error, ErrorKind::kIOFailure, filename,
                    "cannot open for reading");
  }
  std::unique_ptr<nlohmann::json> json(new nlohmann::json());
  try {
    file_stream >> *json;
  } catch (const nlohmann::json::exception &e) {
    return SetError(error, ErrorKind::kIOFailure, filename,
                    std::string("invalid json: ") + e.what());
  }
  *result = std::move(json);
  return true;
}

bool WriteJsonFile(const std::string &filename, const nlohmann::json &json,
                   PipelineError *error) {
  std::ofstream file_stream(filename);
  file_stream << json.dump(2) << std::endl;
  if (!file_stream.good()) {
    return SetError(error, ErrorKind::kIOFailure, filename, "write failed");
  }
  return true;
}

nlohmann::json PipelineConfigToJson(const PipelineConfig &config) {
  const CleaningParams &cleaning = config.cleaning;
  nlohmann::json result;
  result[kMinHeight] = cleaning.min_height;
  result[kMaxHeight] = cleaning.max_height;
  result[kGaussfilterSpace] = {cleaning.gaussfilter_space_x,
                               cleaning.gaussfilter_space_y};
  result[kGaussfilterTime] = cleaning.gaussfilter_time;
  result[kMedfilterSpace] = cleaning.medfilter_space;
  result[kMedfilterTime] = cleaning.medfilter_time;
  result[kTailfilterSize] = {cleaning.tailfilter_width,
                             cleaning.tailfilter_height};
  result[kTailfilterShape] = cleaning.tailfilter_shape;
  result[kUseFft] = cleaning.use_fft;
  result[kFlipModelFile] = config.flip_model_file;
  result[kRank] = config.rank;
  result[kChunkSize] = config.chunk_size;
  result[kWorkers] = config.workers;
  result[kFillGaps] = config.fill_gaps;
  result[kFps] = config.fps;
  result[kMissingData] = config.missing_data.enabled;
  result[kMissingDataIters] = config.missing_data.iters;
  result[kMaskThreshold] = config.missing_data.mask_threshold;
  result[kMaskHeightThreshold] = config.missing_data.mask_height_threshold;
  result[kReconPcs] = config.missing_data.recon_pcs;
  return result;
}

namespace {
template <typename T>
void ReadIfPresent(const nlohmann::json &json, const char *key, T *value) {
  if (json.count(key) > 0) {
    *value = json.at(key).get<T>();
  }
}
} // namespace

bool JsonToPipelineConfig(const nlohmann::json &config_json,
                          PipelineConfig *config, PipelineError *error) {
  CHECK_NOTNULL(config);
  PipelineConfig result = *config;
  CleaningParams &cleaning = result.cleaning;
  try {
    ReadIfPresent(config_json, kMinHeight, &cleaning.min_height);
    ReadIfPresent(config_json, kMaxHeight, &cleaning.max_height);
    if (config_json.count(kGaussfilterSpace) > 0) {
      const nlohmann::json &sigmas = config_json.at(kGaussfilterSpace);
      cleaning.gaussfilter_space_x = sigmas.at(0).get<double>();
      cleaning.gaussfilter_space_y = sigmas.at(1).get<double>();
    }
    ReadIfPresent(config_json, kGaussfilterTime, &cleaning.gaussfilter_time);
    ReadIfPresent(config_json, kMedfilterSpace, &cleaning.medfilter_space);
    ReadIfPresent(config_json, kMedfilterTime, &cleaning.medfilter_time);
    if (config_json.count(kTailfilterSize) > 0) {
      const nlohmann::json &size = config_json.at(kTailfilterSize);
      cleaning.tailfilter_width = size.at(0).get<int>();
      cleaning.tailfilter_height = size.at(1).get<int>();
    }
    ReadIfPresent(config_json, kTailfilterShape, &cleaning.tailfilter_shape);
    ReadIfPresent(config_json, kUseFft, &cleaning.use_fft);
    ReadIfPresent(config_json, kFlipModelFile, &result.flip_model_file);
    ReadIfPresent(config_json, kRank, &result.rank);
    ReadIfPresent(config_json, kChunkSize, &result.chunk_size);
    ReadIfPresent(config_json, kWorkers, &result.workers);
    ReadIfPresent(config_json, kFillGaps, &result.fill_gaps);
    ReadIfPresent(config_json, kFps, &result.fps);
    MissingDataParams &missing_data = result.missing_data;
    ReadIfPresent(config_json, kMissingData, &missing_data.enabled);
    ReadIfPresent(config_json, kMissingDataIters, &missing_data.iters);
    ReadIfPresent(config_json, kMaskThreshold, &missing_data.mask_threshold);
    ReadIfPresent(config_json, kMaskHeightThreshold,
                  &missing_data.mask_height_threshold);
    ReadIfPresent(config_json, kReconPcs, &missing_data.recon_pcs);
  } catch (const nlohmann::json::exception &e) {
    return SetError(error, ErrorKind::kIOFailure, "",
                    std::string("malformed pipeline config: ") + e.what());
  }
  *config = result;
  return true;
}

bool WriteRunConfig(const std::string &filename, const PipelineConfig &config,
                    const std::string &start_time,
                    const std::vector<std::string> &inputs,
                    PipelineError *error) {
  nlohmann::json run_json = PipelineConfigToJson(config);
  run_json[kStartTime] = start_time;
  run_json[kInputs] = inputs;
  return WriteJsonFile(filename, run_json, error);
}

bool ReadRunConfig(const std::string &filename, PipelineConfig *config,
                   PipelineError *error) {
  std::unique_ptr<nlohmann::json> run_json;
  if (!ReadJsonFile(filename, &run_json, error)) {
    return false;
  }
  if (!JsonToPipelineConfig(*run_json, config, error)) {
    if (error != nullptr) {
      error->session_key = filename;
    }
    return false;
  }
  return true;
}

} // namespace mousepca
