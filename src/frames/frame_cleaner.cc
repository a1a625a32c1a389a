#include <frames/frame_cleaner.hpp>

#include <algorithm>
#include <cmath>

#include <opencv2/imgproc/imgproc.hpp>

#include <glog/logging.h>

namespace mousepca {
namespace {
// Spatial Gaussian kernel size, independent of the sigmas.
constexpr int kGaussianKernelSize = 21;

// Session with the same metadata and frames replaced by the result of
// transform applied to each valid frame.
template <typename Transform>
Session TransformValidFrames(const Session &session, Transform transform) {
  Session result;
  result.key = session.key;
  result.valid = session.valid;
  result.times_usec = session.times_usec;
  result.mask_scores = session.mask_scores;
  result.missing = session.missing;
  result.frames.resize(session.size());
  for (size_t frame_idx = 0; frame_idx < session.size(); ++frame_idx) {
    if (session.valid.at(frame_idx)) {
      result.frames.at(frame_idx) = transform(session.frames.at(frame_idx));
    }
  }
  return result;
}
} // namespace

void CheckCleaningParams(const CleaningParams &params) {
  CHECK_LE(params.min_height, params.max_height);
  CHECK_GE(params.gaussfilter_space_x, 0);
  CHECK_GE(params.gaussfilter_space_y, 0);
  CHECK_GE(params.gaussfilter_time, 0);
  for (const int size : params.medfilter_space) {
    // cv::medianBlur supports larger windows only for 8 bit images.
    CHECK(size == 0 || size == 3 || size == 5)
        << "Spatial median filter size must be 0, 3 or 5, got " << size;
  }
  for (const int size : params.medfilter_time) {
    CHECK(size == 0 || (size > 0 && size % 2 == 1))
        << "Temporal median filter size must be 0 or odd, got " << size;
  }
  CHECK_GE(params.tailfilter_width, 0);
  CHECK_GE(params.tailfilter_height, 0);
  CHECK(params.tailfilter_shape == "ellipse" ||
        params.tailfilter_shape == "rect" ||
        params.tailfilter_shape == "cross")
      << "Unsupported tail filter shape: " << params.tailfilter_shape;
}

cv::Mat MakeTailFilter(const CleaningParams &params) {
  if (params.tailfilter_width <= 0 || params.tailfilter_height <= 0) {
    return cv::Mat();
  }
  int shape = cv::MORPH_ELLIPSE;
  if (params.tailfilter_shape == "rect") {
    shape = cv::MORPH_RECT;
  } else if (params.tailfilter_shape == "cross") {
    shape = cv::MORPH_CROSS;
  }
  return cv::getStructuringElement(
      shape, cv::Size(params.tailfilter_width, params.tailfilter_height));
}

Session ClipHeights(const Session &session, const CleaningParams &params) {
  return TransformValidFrames(
      session, [&params](const cv::Mat &frame) -> cv::Mat {
        cv::Mat result = frame.clone();
        const cv::Mat out_of_range =
            (frame < params.min_height) | (frame > params.max_height);
        result.setTo(0, out_of_range);
        return result;
      });
}

cv::Mat CleanFrameSpatial(const cv::Mat &frame, const CleaningParams &params,
                          const cv::Mat &tail_filter) {
  cv::Mat result = frame.clone();
  if (!tail_filter.empty()) {
    cv::Mat opened;
    cv::morphologyEx(result, opened, cv::MORPH_OPEN, tail_filter);
    result = opened;
  }
  for (const int size : params.medfilter_space) {
    if (size > 0) {
      cv::Mat filtered;
      cv::medianBlur(result, filtered, size);
      result = filtered;
    }
  }
  if (params.gaussfilter_space_x > 0) {
    cv::Mat blurred;
    cv::GaussianBlur(result, blurred,
                     cv::Size(kGaussianKernelSize, kGaussianKernelSize),
                     params.gaussfilter_space_x, params.gaussfilter_space_y);
    result = blurred;
  }
  return result;
}

Session MedianFilterTime(const Session &session, int window_size) {
  CHECK_GT(window_size, 0);
  CHECK_EQ(window_size % 2, 1);
  const std::vector<size_t> valid_indices = ValidFrameIndices(session);
  Session result = session;
  if (valid_indices.empty()) {
    return result;
  }
  const int radius = window_size / 2;
  const cv::Size frame_size = session.frame_size();
  std::vector<float> window_values;
  for (size_t position = 0; position < valid_indices.size(); ++position) {
    const size_t first = position >= static_cast<size_t>(radius)
                             ? position - radius
                             : 0;
    const size_t last =
        std::min(position + radius, valid_indices.size() - 1);
    std::vector<cv::Mat> window;
    for (size_t neighbor = first; neighbor <= last; ++neighbor) {
      cv::Mat as_float;
      session.frames.at(valid_indices.at(neighbor))
          .convertTo(as_float, CV_32F);
      window.push_back(as_float);
    }

    cv::Mat filtered(frame_size, CV_32F);
    for (int row = 0; row < frame_size.height; ++row) {
      for (int col = 0; col < frame_size.width; ++col) {
        window_values.clear();
        for (const cv::Mat &neighbor_frame : window) {
          window_values.push_back(neighbor_frame.at<float>(row, col));
        }
        const auto median_it =
            window_values.begin() + window_values.size() / 2;
        std::nth_element(window_values.begin(), median_it,
                         window_values.end());
        filtered.at<float>(row, col) = *median_it;
      }
    }
    result.frames.at(valid_indices.at(position)) = filtered;
  }
  return result;
}

Session GaussianFilterTime(const Session &session, double sigma) {
  CHECK_GT(sigma, 0);
  const std::vector<size_t> valid_indices = ValidFrameIndices(session);
  Session result = session;
  if (valid_indices.empty()) {
    return result;
  }
  const int radius = static_cast<int>(4.0 * sigma + 0.5);
  std::vector<double> kernel(2 * radius + 1);
  for (int offset = -radius; offset <= radius; ++offset) {
    kernel.at(offset + radius) =
        std::exp(-0.5 * (offset * offset) / (sigma * sigma));
  }

  const cv::Size frame_size = session.frame_size();
  const long num_valid = static_cast<long>(valid_indices.size());
  for (long position = 0; position < num_valid; ++position) {
    cv::Mat weighted_sum = cv::Mat::zeros(frame_size, CV_64F);
    double total_weight = 0;
    for (int offset = -radius; offset <= radius; ++offset) {
      const long neighbor = position + offset;
      if (neighbor < 0 || neighbor >= num_valid) {
        continue;
      }
      const double weight = kernel.at(offset + radius);
      cv::Mat neighbor_frame;
      session.frames.at(valid_indices.at(neighbor))
          .convertTo(neighbor_frame, CV_64F);
      weighted_sum += neighbor_frame * weight;
      total_weight += weight;
    }
    cv::Mat filtered;
    weighted_sum.convertTo(filtered, CV_32F, 1.0 / total_weight);
    result.frames.at(valid_indices.at(position)) = filtered;
  }
  return result;
}

Session CleanFrames(const Session &session, const CleaningParams &params) {
  const cv::Mat tail_filter = MakeTailFilter(params);
  Session result = TransformValidFrames(
      session, [&params, &tail_filter](const cv::Mat &frame) -> cv::Mat {
        return CleanFrameSpatial(frame, params, tail_filter);
      });
  for (const int size : params.medfilter_time) {
    if (size > 0) {
      result = MedianFilterTime(result, size);
    }
  }
  if (params.gaussfilter_time > 0) {
    result = GaussianFilterTime(result, params.gaussfilter_time);
  }
  return result;
}

cv::Mat FftMagnitude(const cv::Mat &frame) {
  cv::Mat as_float;
  frame.convertTo(as_float, CV_32F);
  cv::Mat spectrum;
  cv::dft(as_float, spectrum, cv::DFT_COMPLEX_OUTPUT);
  cv::Mat planes[2];
  cv::split(spectrum, planes);
  cv::Mat magnitude;
  cv::magnitude(planes[0], planes[1], magnitude);

  // Same quadrant swap as numpy.fft.fftshift, also for odd sizes.
  cv::Mat shifted(magnitude.size(), CV_32F);
  const int rows = magnitude.rows;
  const int cols = magnitude.cols;
  for (int row = 0; row < rows; ++row) {
    for (int col = 0; col < cols; ++col) {
      shifted.at<float>((row + rows / 2) % rows, (col + cols / 2) % cols) =
          magnitude.at<float>(row, col);
    }
  }
  return shifted;
}

} // namespace mousepca
