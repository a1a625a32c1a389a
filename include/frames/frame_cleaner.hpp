#ifndef MOUSEPCA_FRAMES_FRAME_CLEANER_HPP_
#define MOUSEPCA_FRAMES_FRAME_CLEANER_HPP_

#include <string>
#include <vector>

#include <opencv2/core/core.hpp>

#include <frames/session.hpp>

namespace mousepca {

// Frame filtering applied before PCA. Defaults are tuned for Kinect 2 depth
// frames with heights in millimetres above the floor.
struct CleaningParams {
  // Pixels outside [min_height, max_height] are zeroed.
  double min_height = 10;
  double max_height = 120;
  // Sigmas of the 21x21 spatial Gaussian; disabled when x sigma is 0.
  double gaussfilter_space_x = 1.5;
  double gaussfilter_space_y = 1;
  // Sigma (in frames) of the temporal Gaussian; disabled when 0.
  double gaussfilter_time = 0;
  // Kernel sizes of successive median filters; 0 entries are skipped.
  std::vector<int> medfilter_space = {0};
  std::vector<int> medfilter_time = {0};
  // Morphological opening removing the tail; disabled when either size is 0.
  int tailfilter_width = 9;
  int tailfilter_height = 9;
  // One of "ellipse", "rect", "cross".
  std::string tailfilter_shape = "ellipse";
  // Replace frames by their centred 2D Fourier magnitude.
  bool use_fft = false;
};

// Dies on parameter combinations the filters cannot handle.
void CheckCleaningParams(const CleaningParams &params);

// Structuring element for the tail filter; empty if disabled.
cv::Mat MakeTailFilter(const CleaningParams &params);

// Zeroes out-of-range heights of every valid frame.
Session ClipHeights(const Session &session, const CleaningParams &params);

// Tail filter, spatial median filters and spatial Gaussian, in this order.
cv::Mat CleanFrameSpatial(const cv::Mat &frame, const CleaningParams &params,
                          const cv::Mat &tail_filter);

// Median filter of odd window size along time, per pixel, over the valid
// frames only. The window is truncated at the session boundaries.
Session MedianFilterTime(const Session &session, int window_size);

// Gaussian filter along time, per pixel, over the valid frames only (kernel
// truncated at 4 sigma). Weights are renormalized over the frames that fall
// inside the session.
Session GaussianFilterTime(const Session &session, double sigma);

// Spatial filters on every valid frame, then the temporal filters.
Session CleanFrames(const Session &session, const CleaningParams &params);

// Magnitude of the 2D DFT with the zero frequency moved to the centre.
cv::Mat FftMagnitude(const cv::Mat &frame);

} // namespace mousepca

#endif // MOUSEPCA_FRAMES_FRAME_CLEANER_HPP_
