#ifndef MOUSEPCA_FRAMES_FRAME_SOURCE_HPP_
#define MOUSEPCA_FRAMES_FRAME_SOURCE_HPP_

#include <memory>
#include <string>
#include <vector>

#include <opencv2/core/core.hpp>

#include <frames/session.hpp>
#include <pca/errors.hpp>

namespace mousepca {

// Supplies the frames of one session. Implementations must be usable from a
// worker thread, one source per thread.
class FrameSource {
public:
  virtual ~FrameSource() {}

  // Human readable origin of the frames, used in log messages.
  virtual std::string description() const = 0;

  // Size of the valid frames without loading the whole session. Used to pick
  // the corpus frame size before training.
  virtual bool ReadFrameSize(cv::Size *frame_size, PipelineError *error) = 0;

  // Loads all frames, the validity mask, the timestamps and the per-pixel
  // mask scores if the source has them. Valid frames are CV_32F single
  // channel images. Fails with kIOFailure.
  virtual bool Load(Session *session, PipelineError *error) = 0;
};

// Session stored as a directory with a session.json manifest listing frame
// image files. Every frame entry may carry time_usec and mask_file (an image
// of per-pixel log-likelihoods, e.g. a 32 bit float TIFF); either all entries
// have a timestamp or none does, and either all valid entries have a mask or
// none does.
class ManifestFrameSource : public FrameSource {
public:
  explicit ManifestFrameSource(const std::string &manifest_path);

  std::string description() const override { return manifest_path_; }
  bool ReadFrameSize(cv::Size *frame_size, PipelineError *error) override;
  bool Load(Session *session, PipelineError *error) override;

private:
  struct FrameEntry {
    long frame_id = 0;
    std::string file;
    bool has_time = false;
    long time_usec = 0;
    bool is_valid = true;
    std::string mask_file;
  };

  // Parses the manifest into uuid_ and entries_ on first use.
  bool ReadManifest(PipelineError *error);
  // Reads file (relative to the manifest) as a CV_32F single channel image.
  bool ReadImage(const FrameEntry &entry, const std::string &file,
                 cv::Mat *image, PipelineError *error) const;

  const std::string manifest_path_;
  bool manifest_read_ = false;
  std::string uuid_;
  std::vector<FrameEntry> entries_;
  bool has_times_ = false;
  bool has_masks_ = false;
};

// Serves a session that is already in memory.
class InMemoryFrameSource : public FrameSource {
public:
  explicit InMemoryFrameSource(const Session &session);

  std::string description() const override { return session_.key; }
  bool ReadFrameSize(cv::Size *frame_size, PipelineError *error) override;
  bool Load(Session *session, PipelineError *error) override;

private:
  const Session session_;
};

// Paths of all session manifests under input_dir (recursive), sorted.
std::vector<std::string> FindSessionManifests(const std::string &input_dir);

std::vector<std::unique_ptr<FrameSource>>
MakeManifestFrameSources(const std::vector<std::string> &manifest_paths);

} // namespace mousepca

#endif // MOUSEPCA_FRAMES_FRAME_SOURCE_HPP_
