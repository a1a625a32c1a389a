#include <frames/frame_source.hpp>

#include <algorithm>

#include <boost/filesystem.hpp>
#include <glog/logging.h>
#include <nlohmann/json.hpp>
#include <opencv2/imgcodecs/imgcodecs.hpp>

#include <io/json_constants.hpp>
#include <io/json_converters.hpp>

namespace mousepca {

ManifestFrameSource::ManifestFrameSource(const std::string &manifest_path)
    : manifest_path_(manifest_path) {}

bool ManifestFrameSource::ReadManifest(PipelineError *error) {
  if (manifest_read_) {
    return true;
  }
  std::unique_ptr<nlohmann::json> manifest;
  if (!ReadJsonFile(manifest_path_, &manifest, error)) {
    return false;
  }
  std::vector<FrameEntry> entries;
  try {
    uuid_ = manifest->at(kUuid).get<std::string>();
    for (const nlohmann::json &frame_json : manifest->at(kFrames)) {
      FrameEntry entry;
      entry.frame_id = frame_json.at(kFrameId).get<long>();
      entry.file = frame_json.at(kFile).get<std::string>();
      if (frame_json.count(kTimeUsec) > 0) {
        entry.has_time = true;
        entry.time_usec = frame_json.at(kTimeUsec).get<long>();
      }
      if (frame_json.count(kIsValid) > 0) {
        entry.is_valid = frame_json.at(kIsValid).get<bool>();
      }
      if (frame_json.count(kMaskFile) > 0) {
        entry.mask_file = frame_json.at(kMaskFile).get<std::string>();
      }
      entries.push_back(entry);
    }
  } catch (const nlohmann::json::exception &e) {
    return SetError(error, ErrorKind::kIOFailure, manifest_path_,
                    std::string("malformed session manifest: ") + e.what());
  }

  size_t num_timed = 0;
  size_t num_valid = 0;
  size_t num_masked = 0;
  for (const FrameEntry &entry : entries) {
    num_timed += entry.has_time;
    num_valid += entry.is_valid;
    num_masked += entry.is_valid && !entry.mask_file.empty();
  }
  // Timestamps and masks are all or nothing.
  if (num_timed != 0 && num_timed != entries.size()) {
    return SetError(error, ErrorKind::kIOFailure, uuid_,
                    std::to_string(entries.size() - num_timed) + " of " +
                        std::to_string(entries.size()) +
                        " frames lack time_usec in " + manifest_path_);
  }
  if (num_masked != 0 && num_masked != num_valid) {
    return SetError(error, ErrorKind::kIOFailure, uuid_,
                    std::to_string(num_valid - num_masked) + " of " +
                        std::to_string(num_valid) +
                        " valid frames lack mask_file in " + manifest_path_);
  }
  entries_ = entries;
  has_times_ = num_timed > 0;
  has_masks_ = num_masked > 0;
  manifest_read_ = true;
  return true;
}

bool ManifestFrameSource::ReadImage(const FrameEntry &entry,
                                    const std::string &file, cv::Mat *image,
                                    PipelineError *error) const {
  const boost::filesystem::path image_path =
      boost::filesystem::path(manifest_path_).parent_path() / file;
  cv::Mat raw;
  try {
    raw = cv::imread(image_path.string(), cv::IMREAD_ANYDEPTH);
  } catch (const cv::Exception &e) {
    return SetError(error, ErrorKind::kIOFailure, uuid_,
                    "could not decode " + image_path.string() + ": " +
                        e.what());
  }
  if (raw.empty()) {
    return SetError(error, ErrorKind::kIOFailure, uuid_,
                    "could not read frame " + std::to_string(entry.frame_id) +
                        " from " + image_path.string());
  }
  if (raw.channels() != 1) {
    return SetError(error, ErrorKind::kIOFailure, uuid_,
                    image_path.string() + " is not a single channel image");
  }
  raw.convertTo(*image, CV_32F);
  return true;
}

bool ManifestFrameSource::ReadFrameSize(cv::Size *frame_size,
                                        PipelineError *error) {
  CHECK_NOTNULL(frame_size);
  if (!ReadManifest(error)) {
    return false;
  }
  for (const FrameEntry &entry : entries_) {
    if (entry.is_valid) {
      cv::Mat frame;
      if (!ReadImage(entry, entry.file, &frame, error)) {
        return false;
      }
      *frame_size = frame.size();
      return true;
    }
  }
  *frame_size = cv::Size();
  return true;
}

bool ManifestFrameSource::Load(Session *session, PipelineError *error) {
  CHECK_NOTNULL(session);
  if (!ReadManifest(error)) {
    return false;
  }
  Session result;
  result.key = uuid_;
  for (const FrameEntry &entry : entries_) {
    cv::Mat frame;
    if (entry.is_valid && !ReadImage(entry, entry.file, &frame, error)) {
      return false;
    }
    result.frames.push_back(frame);
    result.valid.push_back(entry.is_valid);
    if (has_times_) {
      result.times_usec.push_back(entry.time_usec);
    }
    if (has_masks_) {
      cv::Mat mask_scores;
      if (entry.is_valid &&
          !ReadImage(entry, entry.mask_file, &mask_scores, error)) {
        return false;
      }
      result.mask_scores.push_back(mask_scores);
    }
  }
  LOG(INFO) << "Loaded session " << result.key << " from " << manifest_path_
            << ": " << result.size() << " frames, " << result.num_valid()
            << " valid.";
  *session = result;
  return true;
}

InMemoryFrameSource::InMemoryFrameSource(const Session &session)
    : session_(session) {}

bool InMemoryFrameSource::ReadFrameSize(cv::Size *frame_size,
                                        PipelineError *error) {
  CHECK_NOTNULL(frame_size);
  *frame_size = session_.frame_size();
  return true;
}

bool InMemoryFrameSource::Load(Session *session, PipelineError *error) {
  *CHECK_NOTNULL(session) = session_;
  return true;
}

std::vector<std::string> FindSessionManifests(const std::string &input_dir) {
  CHECK(boost::filesystem::is_directory(input_dir))
      << input_dir << " is not a directory.";
  std::vector<std::string> result;
  for (boost::filesystem::recursive_directory_iterator it(input_dir), end;
       it != end; ++it) {
    if (boost::filesystem::is_regular_file(it->path()) &&
        it->path().filename() == kSessionManifestName) {
      result.push_back(it->path().string());
    }
  }
  std::sort(result.begin(), result.end());
  LOG(INFO) << "Found " << result.size() << " sessions under " << input_dir;
  return result;
}

std::vector<std::unique_ptr<FrameSource>>
MakeManifestFrameSources(const std::vector<std::string> &manifest_paths) {
  std::vector<std::unique_ptr<FrameSource>> result;
  for (const std::string &path : manifest_paths) {
    result.emplace_back(new ManifestFrameSource(path));
  }
  return result;
}

} // namespace mousepca
