// =============================================================================
// wfgen - Waveform Job
// =============================================================================
// End-to-end generation of a subject's waveform image.
//
// Stages (strictly sequential):
//   Fetching -> Extracting -> Rasterizing -> Encoding -> Uploading
//   -> Persisting -> Done
//
// Fetching, Uploading and Persisting failures end the job with an error.
// Extraction never fails (it falls back to a synthetic envelope). The
// downloaded audio lives in a temp file owned by a TempFileGuard, so it is
// removed on every exit path.
//
// Re-running a job for the same subject overwrites the same storage key
// (waveforms/<subjectId>.png) and persists the same URL.
//
// Usage:
//   WaveformJob job(config, objectStore, subjectStore,
//                   std::make_unique<audio::FfmpegPcmDecoder>());
//   auto result = job.run({.subjectId = 42, .sourceAssetKey = "audio/42.m4a"});
// =============================================================================

#ifndef WFG_JOB_WAVEFORM_JOB_H
#define WFG_JOB_WAVEFORM_JOB_H

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include "wfg/audio/amplitude_extractor.h"
#include "wfg/common/config.h"
#include "wfg/common/error.h"
#include "wfg/common/types.h"
#include "wfg/storage/object_store.h"
#include "wfg/storage/subject_store.h"

namespace wfg::job {

// =============================================================================
// Request / Result
// =============================================================================

/// @brief Input of a waveform job.
struct WaveformJobRequest {
    /// @brief Owning record; values <= 0 mean "missing".
    SubjectId subjectId = 0;

    /// @brief Object store key of the source audio.
    std::string sourceAssetKey;

    /// @brief Check that both fields are present.
    [[nodiscard]] VoidResult validate() const;
};

/// @brief Output of a successful waveform job.
struct WaveformResult {
    /// @brief Public URL of the uploaded image.
    std::string publicUrl;

    /// @brief Object store key the image was written to.
    std::string storageKey;
};

/// @brief Progress of a job. After run() returns, the last stage entered.
enum class JobStage : std::uint8_t {
    kPending = 0,
    kFetching = 1,
    kExtracting = 2,
    kRasterizing = 3,
    kEncoding = 4,
    kUploading = 5,
    kPersisting = 6,
    kDone = 7,
};

[[nodiscard]] std::string_view jobStageName(JobStage stage) noexcept;

/// @brief Deterministic storage key of a subject's waveform image.
[[nodiscard]] std::string waveformKey(SubjectId subjectId);

/// @brief Unique temp path for a subject's downloaded audio.
/// Format: <dir>/audio-<subjectId>-<epochMillis>-<counter>
[[nodiscard]] std::filesystem::path makeTempAudioPath(const std::filesystem::path& directory,
                                                      SubjectId subjectId);

// =============================================================================
// TempFileGuard
// =============================================================================

/// @brief Removes a file when it goes out of scope. Removal errors are ignored.
class TempFileGuard {
public:
    explicit TempFileGuard(std::filesystem::path path) : path_(std::move(path)) {}

    ~TempFileGuard();

    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;
    TempFileGuard(TempFileGuard&&) = delete;
    TempFileGuard& operator=(TempFileGuard&&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

// =============================================================================
// WaveformJob
// =============================================================================

/// @brief Orchestrates fetch, extract, rasterize, encode, upload and persist.
/// @note The stores must outlive the job.
class WaveformJob {
public:
    WaveformJob(WaveformConfig config, storage::IObjectStore& objects,
                storage::ISubjectStore& subjects, std::unique_ptr<audio::IPcmDecoder> decoder);

    WaveformJob(WaveformConfig config, storage::IObjectStore& objects,
                storage::ISubjectStore& subjects, audio::AmplitudeExtractor extractor);

    /// @brief Run the pipeline for one request.
    /// @return Public URL and key, or an error:
    ///         kInvalidArgument (bad request or config, nothing was done),
    ///         kIOError (fetch), kFormatError (encode),
    ///         kStorageError (upload), kPersistenceError (record update).
    [[nodiscard]] Result<WaveformResult> run(const WaveformJobRequest& request);

    [[nodiscard]] JobStage stage() const noexcept { return stage_; }

    /// @brief Temp file used by the last run (already removed), empty if none.
    [[nodiscard]] const std::filesystem::path& lastTempPath() const noexcept {
        return lastTempPath_;
    }

    /// @brief Whether the last run used fallback amplitudes.
    [[nodiscard]] bool usedFallback() const noexcept { return extractor_.usedFallback(); }

    [[nodiscard]] const WaveformConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] Result<WaveformResult> runStages(const WaveformJobRequest& request);

    void enter(JobStage stage, SubjectId subjectId);

    WaveformConfig config_;
    storage::IObjectStore& objects_;
    storage::ISubjectStore& subjects_;
    audio::AmplitudeExtractor extractor_;
    JobStage stage_ = JobStage::kPending;
    std::filesystem::path lastTempPath_;
};

}  // namespace wfg::job

#endif  // WFG_JOB_WAVEFORM_JOB_H
