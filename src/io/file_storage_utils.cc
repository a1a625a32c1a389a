#include <io/file_storage_utils.hpp>

#include <boost/filesystem.hpp>
#include <boost/system/error_code.hpp>
#include <glog/logging.h>
#include <opencv2/core/eigen.hpp>

namespace mousepca {

std::string StripContainerExtension(const std::string &path) {
  const std::string extension(kContainerExtension);
  if (path.size() >= extension.size() &&
      path.compare(path.size() - extension.size(), extension.size(),
                   extension) == 0) {
    return path.substr(0, path.size() - extension.size());
  }
  return path;
}

void WriteMatrix(cv::FileStorage *storage, const std::string &name,
                 const Eigen::MatrixXd &matrix) {
  CHECK_NOTNULL(storage);
  cv::Mat cv_matrix;
  if (matrix.size() > 0) {
    cv::eigen2cv(matrix, cv_matrix);
  }
  *storage << name << cv_matrix;
}

bool ReadMatrix(const cv::FileNode &node, Eigen::MatrixXd *matrix) {
  CHECK_NOTNULL(matrix);
  if (node.empty()) {
    return false;
  }
  cv::Mat cv_matrix;
  node >> cv_matrix;
  if (cv_matrix.empty()) {
    matrix->resize(0, 0);
    return true;
  }
  if (cv_matrix.channels() != 1) {
    return false;
  }
  cv_matrix.convertTo(cv_matrix, CV_64F);
  cv::cv2eigen(cv_matrix, *matrix);
  return true;
}

bool ReadRowVector(const cv::FileNode &node, Eigen::RowVectorXd *vector) {
  CHECK_NOTNULL(vector);
  Eigen::MatrixXd matrix;
  if (!ReadMatrix(node, &matrix)) {
    return false;
  }
  if (matrix.size() == 0) {
    vector->resize(0);
    return true;
  }
  if (matrix.rows() != 1) {
    return false;
  }
  *vector = matrix.row(0);
  return true;
}

std::string TemporaryPathFor(const std::string &path) {
  const boost::filesystem::path final_path(path);
  return (final_path.parent_path() /
          ("tmp_" + final_path.filename().string()))
      .string();
}

bool CommitTemporaryFile(const std::string &temporary_path,
                         const std::string &path, PipelineError *error) {
  boost::system::error_code error_code;
  boost::filesystem::rename(temporary_path, path, error_code);
  if (error_code) {
    return SetError(error, ErrorKind::kIOFailure, path,
                    "cannot rename " + temporary_path + ": " +
                        error_code.message());
  }
  return true;
}

} // namespace mousepca
