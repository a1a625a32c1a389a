#ifndef MOUSEPCA_IO_JSON_CONSTANTS_HPP_
#define MOUSEPCA_IO_JSON_CONSTANTS_HPP_

namespace mousepca {
// Session manifest.
constexpr char kSessionManifestName[] = "session.json";
constexpr char kUuid[] = "uuid";
constexpr char kFrames[] = "frames";
constexpr char kFrameId[] = "frame_id";
constexpr char kFile[] = "file";
constexpr char kTimeUsec[] = "time_usec";
constexpr char kIsValid[] = "is_valid";
constexpr char kMaskFile[] = "mask_file";

// Persisted pipeline config.
constexpr char kStartTime[] = "start_time";
constexpr char kInputs[] = "inputs";
constexpr char kMinHeight[] = "min_height";
constexpr char kMaxHeight[] = "max_height";
constexpr char kGaussfilterSpace[] = "gaussfilter_space";
constexpr char kGaussfilterTime[] = "gaussfilter_time";
constexpr char kMedfilterSpace[] = "medfilter_space";
constexpr char kMedfilterTime[] = "medfilter_time";
constexpr char kTailfilterSize[] = "tailfilter_size";
constexpr char kTailfilterShape[] = "tailfilter_shape";
constexpr char kUseFft[] = "use_fft";
constexpr char kFlipModelFile[] = "flip_model_file";
constexpr char kRank[] = "rank";
constexpr char kChunkSize[] = "chunk_size";
constexpr char kWorkers[] = "workers";
constexpr char kFillGaps[] = "fill_gaps";
constexpr char kFps[] = "fps";
constexpr char kMissingData[] = "missing_data";
constexpr char kMissingDataIters[] = "missing_data_iters";
constexpr char kMaskThreshold[] = "mask_threshold";
constexpr char kMaskHeightThreshold[] = "mask_height_threshold";
constexpr char kReconPcs[] = "recon_pcs";
} // namespace mousepca

#endif // MOUSEPCA_IO_JSON_CONSTANTS_HPP_
