#ifndef MOUSEPCA_PIPELINE_RUN_SETUP_HPP_
#define MOUSEPCA_PIPELINE_RUN_SETUP_HPP_

#include <string>

namespace mousepca {

// Creates output_dir if needed and, unless --log_dir was given, points the
// glog log files there. Call before google::InitGoogleLogging().
void PrepareOutputDir(const std::string &output_dir);

// Local time as "YYYY-MM-DDTHH:MM:SS".
std::string CurrentTimeString();

std::string JoinPath(const std::string &dir, const std::string &name);

} // namespace mousepca

#endif // MOUSEPCA_PIPELINE_RUN_SETUP_HPP_
