#ifndef MOUSEPCA_IO_JSON_CONVERTERS_HPP_
#define MOUSEPCA_IO_JSON_CONVERTERS_HPP_

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <pca/errors.hpp>
#include <pipeline/pipeline_config.hpp>

namespace mousepca {

// Both fail with kIOFailure; the error session key is the file name.
bool ReadJsonFile(const std::string &filename,
                  std::unique_ptr<nlohmann::json> *result,
                  PipelineError *error);
bool WriteJsonFile(const std::string &filename, const nlohmann::json &json,
                   PipelineError *error);

nlohmann::json PipelineConfigToJson(const PipelineConfig &config);
// Keys missing from config_json keep the values already in *config.
bool JsonToPipelineConfig(const nlohmann::json &config_json,
                          PipelineConfig *config, PipelineError *error);

// Config of a training run, stored next to the basis so that apply runs use
// the same preprocessing.
bool WriteRunConfig(const std::string &filename, const PipelineConfig &config,
                    const std::string &start_time,
                    const std::vector<std::string> &inputs,
                    PipelineError *error);
bool ReadRunConfig(const std::string &filename, PipelineConfig *config,
                   PipelineError *error);

} // namespace mousepca

#endif // MOUSEPCA_IO_JSON_CONVERTERS_HPP_
