#ifndef MOUSEPCA_IO_BASIS_STORAGE_HPP_
#define MOUSEPCA_IO_BASIS_STORAGE_HPP_

#include <string>

#include <pca/errors.hpp>
#include <pca/pca_basis.hpp>

namespace mousepca {

// Default basis container name in the output directory.
constexpr char kDefaultBasisName[] = "pca";

constexpr char kMean[] = "mean";
constexpr char kComponents[] = "components";
constexpr char kExplainedVariance[] = "explained_variance";
constexpr char kExplainedVarianceRatio[] = "explained_variance_ratio";
constexpr char kSingularValues[] = "singular_values";
constexpr char kTotalVariance[] = "total_variance";
constexpr char kNObservations[] = "n_observations";
constexpr char kFrameHeight[] = "frame_height";
constexpr char kFrameWidth[] = "frame_width";

// Path of the run config stored next to a basis: "dir/pca.yml.gz" maps to
// "dir/pca.json".
std::string RunConfigPathFor(const std::string &basis_path);

// Writes the basis to filename (a .yml.gz path). The file only appears under
// its final name once completely written.
bool WriteBasis(const std::string &filename, const PcaBasis &basis,
                PipelineError *error);

// Fails with kIOFailure on unreadable files or missing nodes, and with
// kShapeMismatch if the stored arrays disagree in size.
bool ReadBasis(const std::string &filename, PcaBasis *basis,
               PipelineError *error);

} // namespace mousepca

#endif // MOUSEPCA_IO_BASIS_STORAGE_HPP_
