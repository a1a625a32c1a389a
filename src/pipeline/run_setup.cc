#include <pipeline/run_setup.hpp>

#include <ctime>

#include <boost/filesystem.hpp>
#include <gflags/gflags.h>
#include <glog/logging.h>

namespace mousepca {

void PrepareOutputDir(const std::string &output_dir) {
  CHECK(!output_dir.empty());
  boost::filesystem::create_directories(output_dir);
  if (FLAGS_log_dir.empty()) {
    FLAGS_log_dir = output_dir;
  }
}

std::string CurrentTimeString() {
  const std::time_t now = std::time(nullptr);
  char buffer[32];
  CHECK_GT(std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S",
                         std::localtime(&now)),
           0);
  return buffer;
}

std::string JoinPath(const std::string &dir, const std::string &name) {
  return (boost::filesystem::path(dir) / name).string();
}

} // namespace mousepca
