#ifndef MOUSEPCA_IO_FILE_STORAGE_UTILS_HPP_
#define MOUSEPCA_IO_FILE_STORAGE_UTILS_HPP_

#include <string>

#include <Eigen/Dense>

#include <opencv2/core/core.hpp>

#include <pca/errors.hpp>

namespace mousepca {

// Extension selecting gzip compressed YAML in cv::FileStorage.
constexpr char kContainerExtension[] = ".yml.gz";

// "dir/name.yml.gz" -> "dir/name"; other paths are returned unchanged.
std::string StripContainerExtension(const std::string &path);

// Matrices are stored as CV_64F cv::Mat nodes.
void WriteMatrix(cv::FileStorage *storage, const std::string &name,
                 const Eigen::MatrixXd &matrix);
// An absent node fails; a stored empty matrix reads back as 0 x 0.
bool ReadMatrix(const cv::FileNode &node, Eigen::MatrixXd *matrix);
bool ReadRowVector(const cv::FileNode &node, Eigen::RowVectorXd *vector);

// Sibling path the container is written to before it is renamed to path.
// Keeps the extension so that cv::FileStorage picks the same format.
std::string TemporaryPathFor(const std::string &path);

// Renames the temporary file over path. Fails with kIOFailure.
bool CommitTemporaryFile(const std::string &temporary_path,
                         const std::string &path, PipelineError *error);

} // namespace mousepca

#endif // MOUSEPCA_IO_FILE_STORAGE_UTILS_HPP_
