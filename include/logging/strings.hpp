#ifndef MOUSEPCA_LOGGING_STRINGS_HPP_
#define MOUSEPCA_LOGGING_STRINGS_HPP_

#include <sstream>
#include <string>
#include <vector>

#include <opencv2/core/core.hpp>

namespace mousepca {

// Comma separated values, in the format the list flags accept ("3,5").
template <typename T> std::string ListToString(const std::vector<T> &values) {
  std::ostringstream result;
  for (size_t idx = 0; idx < values.size(); ++idx) {
    if (idx > 0) {
      result << ",";
    }
    result << values.at(idx);
  }
  return result.str();
}

// Frame sizes are reported as height x width, matching the pixel row-major
// flattening.
inline std::string FrameSizeString(int height, int width) {
  return std::to_string(height) + "x" + std::to_string(width);
}

inline std::string FrameSizeString(const cv::Size &size) {
  return FrameSizeString(size.height, size.width);
}

} // namespace mousepca

#endif // MOUSEPCA_LOGGING_STRINGS_HPP_
