#ifndef MOUSEPCA_PCA_MISSING_DATA_HPP_
#define MOUSEPCA_PCA_MISSING_DATA_HPP_

#include <vector>

#include <Eigen/Dense>

#include <opencv2/core/core.hpp>

#include <frames/session.hpp>
#include <pca/errors.hpp>
#include <pca/pca_basis.hpp>

namespace mousepca {

// Missing data PCA: pixels the extraction flagged as unreliable (e.g. hidden
// by the cable) are zeroed, and during training re-imputed from a low rank
// reconstruction over several passes.
struct MissingDataParams {
  bool enabled = false;
  // Number of training passes, each one ending in a basis.
  int iters = 10;
  // A pixel is missing if its mask score is below mask_threshold and its
  // raw height above mask_height_threshold.
  double mask_threshold = -16;
  double mask_height_threshold = 5;
  // Components used to reconstruct missing pixels between passes.
  int recon_pcs = 10;
};

// CV_8U mask, 1 where the pixel of frame is missing.
cv::Mat MissingPixelMask(const cv::Mat &frame, const cv::Mat &mask_scores,
                         const MissingDataParams &params);

// Fills session.missing from session.mask_scores and zeroes the missing
// pixels of every valid frame. A session without mask scores is returned
// unchanged, with no missing pixels.
Session MaskMissingPixels(const Session &session,
                          const MissingDataParams &params);

// Replaces the entries of *chunk (one flattened frame per row) where missing
// is non-zero by their reconstruction from the first num_components
// components of basis. Reconstructed values outside [min_value, max_value]
// become 0.
void ImputeMissing(const PcaBasis &basis, int num_components, double min_value,
                   double max_value, const Eigen::MatrixXd &missing,
                   Eigen::MatrixXd *chunk);

// Session with the missing pixels of every valid frame imputed from all
// components of basis. Sessions without missing pixels are returned as is.
Session ImputeSession(const Session &session, const PcaBasis &basis,
                      double min_value, double max_value);

// Appends the missing entries of chunk to *values, row by row.
void StoreMissing(const Eigen::MatrixXd &missing, const Eigen::MatrixXd &chunk,
                  std::vector<double> *values);

// Overwrites the missing entries of *chunk with values, starting at *cursor
// and advancing it. The inverse of StoreMissing.
void RestoreMissing(const Eigen::MatrixXd &missing,
                    const std::vector<double> &values, size_t *cursor,
                    Eigen::MatrixXd *chunk);

} // namespace mousepca

#endif // MOUSEPCA_PCA_MISSING_DATA_HPP_
