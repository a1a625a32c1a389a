#include <io/basis_storage.hpp>

#include <opencv2/core/core.hpp>

#include <glog/logging.h>

#include <io/file_storage_utils.hpp>

namespace mousepca {

std::string RunConfigPathFor(const std::string &basis_path) {
  return StripContainerExtension(basis_path) + ".json";
}

bool WriteBasis(const std::string &filename, const PcaBasis &basis,
                PipelineError *error) {
  const std::string temporary_path = TemporaryPathFor(filename);
  try {
    cv::FileStorage storage(temporary_path, cv::FileStorage::WRITE);
    if (!storage.isOpened()) {
      return SetError(error, ErrorKind::kIOFailure, filename,
                      "cannot open " + temporary_path + " for writing");
    }
    WriteMatrix(&storage, kMean, basis.mean);
    WriteMatrix(&storage, kComponents, basis.components);
    WriteMatrix(&storage, kExplainedVariance,
                basis.explained_variance.transpose());
    WriteMatrix(&storage, kExplainedVarianceRatio,
                basis.explained_variance_ratio.transpose());
    WriteMatrix(&storage, kSingularValues, basis.singular_values.transpose());
    storage << kTotalVariance << basis.total_variance;
    // FileStorage has no 64 bit integers.
    storage << kNObservations << static_cast<double>(basis.n_observations);
    storage << kFrameHeight << basis.frame_height;
    storage << kFrameWidth << basis.frame_width;
    storage.release();
  } catch (const cv::Exception &e) {
    return SetError(error, ErrorKind::kIOFailure, filename,
                    std::string("cannot write basis: ") + e.what());
  }
  if (!CommitTemporaryFile(temporary_path, filename, error)) {
    return false;
  }
  LOG(INFO) << "Wrote " << basis.num_components() << " components of dimension "
            << basis.dimension() << " to " << filename;
  return true;
}

bool ReadBasis(const std::string &filename, PcaBasis *basis,
               PipelineError *error) {
  CHECK_NOTNULL(basis);
  PcaBasis result;
  try {
    cv::FileStorage storage(filename, cv::FileStorage::READ);
    if (!storage.isOpened()) {
      return SetError(error, ErrorKind::kIOFailure, filename,
                      "cannot open basis file");
    }
    Eigen::RowVectorXd explained_variance;
    Eigen::RowVectorXd explained_variance_ratio;
    Eigen::RowVectorXd singular_values;
    if (!ReadRowVector(storage[kMean], &result.mean) ||
        !ReadMatrix(storage[kComponents], &result.components) ||
        !ReadRowVector(storage[kExplainedVariance], &explained_variance) ||
        !ReadRowVector(storage[kExplainedVarianceRatio],
                       &explained_variance_ratio) ||
        !ReadRowVector(storage[kSingularValues], &singular_values) ||
        storage[kTotalVariance].empty() || storage[kNObservations].empty()) {
      return SetError(error, ErrorKind::kIOFailure, filename,
                      "basis file is missing arrays");
    }
    result.explained_variance = explained_variance.transpose();
    result.explained_variance_ratio = explained_variance_ratio.transpose();
    result.singular_values = singular_values.transpose();
    result.total_variance = static_cast<double>(storage[kTotalVariance]);
    result.n_observations = static_cast<long>(
        static_cast<double>(storage[kNObservations]));
    if (!storage[kFrameHeight].empty() && !storage[kFrameWidth].empty()) {
      result.frame_height = static_cast<int>(storage[kFrameHeight]);
      result.frame_width = static_cast<int>(storage[kFrameWidth]);
    }
  } catch (const cv::Exception &e) {
    return SetError(error, ErrorKind::kIOFailure, filename,
                    std::string("cannot read basis: ") + e.what());
  }

  const long k = result.num_components();
  if (result.components.cols() != result.dimension() ||
      result.explained_variance.size() != k ||
      result.explained_variance_ratio.size() != k ||
      result.singular_values.size() != k) {
    return SetError(error, ErrorKind::kShapeMismatch, filename,
                    "basis arrays disagree: mean has dimension " +
                        std::to_string(result.dimension()) + ", components " +
                        std::to_string(result.components.rows()) + "x" +
                        std::to_string(result.components.cols()));
  }
  if (result.frame_height > 0 &&
      static_cast<long>(result.frame_height) * result.frame_width !=
          result.dimension()) {
    return SetError(error, ErrorKind::kShapeMismatch, filename,
                    "frame size " + std::to_string(result.frame_height) + "x" +
                        std::to_string(result.frame_width) +
                        " does not match basis dimension " +
                        std::to_string(result.dimension()));
  }
  *basis = result;
  return true;
}

} // namespace mousepca
