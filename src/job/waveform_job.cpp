// =============================================================================
// wfgen - Waveform Job Implementation
// =============================================================================

#include "wfg/job/waveform_job.h"

#include <atomic>
#include <chrono>
#include <fstream>
#include <span>
#include <system_error>

#include <fmt/format.h>

#include "wfg/common/logger.h"
#include "wfg/format/png_encoder.h"
#include "wfg/render/waveform_rasterizer.h"

namespace wfg::job {

namespace {

std::atomic<std::uint64_t> gTempCounter{0};

/// @brief Re-tag a collaborator error with the code of the stage it ended.
Error stageError(ErrorCode code, JobStage stage, const Error& cause) {
    return Error{code, fmt::format("{}: {}", jobStageName(stage), cause.message())};
}

VoidResult writeFile(const std::filesystem::path& path, std::span<const std::uint8_t> bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return makeVoidError(ErrorCode::kIOError,
                             fmt::format("Failed to create temp file {}", path.string()));
    }
    out.write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
        return makeVoidError(ErrorCode::kIOError,
                             fmt::format("Failed to write temp file {}", path.string()));
    }
    return makeVoidSuccess();
}

}  // namespace

// =============================================================================
// Free Functions
// =============================================================================

VoidResult WaveformJobRequest::validate() const {
    if (subjectId <= 0) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("Missing subject id (got {})", subjectId));
    }
    if (sourceAssetKey.empty()) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("Missing source asset key for subject {}", subjectId));
    }
    return makeVoidSuccess();
}

std::string_view jobStageName(JobStage stage) noexcept {
    switch (stage) {
        case JobStage::kPending:
            return "Pending";
        case JobStage::kFetching:
            return "Fetching";
        case JobStage::kExtracting:
            return "Extracting";
        case JobStage::kRasterizing:
            return "Rasterizing";
        case JobStage::kEncoding:
            return "Encoding";
        case JobStage::kUploading:
            return "Uploading";
        case JobStage::kPersisting:
            return "Persisting";
        case JobStage::kDone:
            return "Done";
    }
    return "Unknown";
}

std::string waveformKey(SubjectId subjectId) {
    return fmt::format("waveforms/{}.png", subjectId);
}

std::filesystem::path makeTempAudioPath(const std::filesystem::path& directory,
                                        SubjectId subjectId) {
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
    const auto sequence = gTempCounter.fetch_add(1, std::memory_order_relaxed);
    return directory / fmt::format("audio-{}-{}-{}", subjectId, millis, sequence);
}

TempFileGuard::~TempFileGuard() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
}

// =============================================================================
// WaveformJob Implementation
// =============================================================================

WaveformJob::WaveformJob(WaveformConfig config, storage::IObjectStore& objects,
                         storage::ISubjectStore& subjects,
                         std::unique_ptr<audio::IPcmDecoder> decoder)
    : WaveformJob(std::move(config), objects, subjects,
                  audio::AmplitudeExtractor(std::move(decoder))) {}

WaveformJob::WaveformJob(WaveformConfig config, storage::IObjectStore& objects,
                         storage::ISubjectStore& subjects, audio::AmplitudeExtractor extractor)
    : config_(std::move(config)),
      objects_(objects),
      subjects_(subjects),
      extractor_(std::move(extractor)) {}

void WaveformJob::enter(JobStage stage, SubjectId subjectId) {
    stage_ = stage;
    WFG_LOG_DEBUG("Subject {}: {}", subjectId, jobStageName(stage));
}

Result<WaveformResult> WaveformJob::run(const WaveformJobRequest& request) {
    stage_ = JobStage::kPending;
    lastTempPath_.clear();

    if (auto valid = request.validate(); !valid) {
        WFG_LOG_ERROR("Rejected waveform job: {}", valid.error().message());
        return std::unexpected(valid.error());
    }
    if (auto valid = config_.validate(); !valid) {
        WFG_LOG_ERROR("Invalid waveform configuration: {}", valid.error().message());
        return std::unexpected(valid.error());
    }

    WFG_LOG_INFO("Generating waveform for subject {} from '{}'", request.subjectId,
                 request.sourceAssetKey);

    auto result = runStages(request);
    if (!result) {
        WFG_LOG_ERROR("Waveform job for subject {} failed at {}: {}", request.subjectId,
                      jobStageName(stage_), result.error().message());
        return result;
    }

    WFG_LOG_INFO("Waveform for subject {} published at {}", request.subjectId,
                 result->publicUrl);
    return result;
}

Result<WaveformResult> WaveformJob::runStages(const WaveformJobRequest& request) {
    const SubjectId subjectId = request.subjectId;

    // Fetching
    enter(JobStage::kFetching, subjectId);
    auto audioBytes = objects_.download(request.sourceAssetKey);
    if (!audioBytes) {
        return std::unexpected(stageError(ErrorCode::kIOError, stage_, audioBytes.error()));
    }

    TempFileGuard tempFile(makeTempAudioPath(config_.effectiveTempDirectory(), subjectId));
    lastTempPath_ = tempFile.path();
    if (auto written = writeFile(tempFile.path(), *audioBytes); !written) {
        return std::unexpected(stageError(ErrorCode::kIOError, stage_, written.error()));
    }
    audioBytes->clear();
    audioBytes->shrink_to_fit();

    // Extracting
    enter(JobStage::kExtracting, subjectId);
    const AmplitudeSeries samples = extractor_.extract(tempFile.path(), config_.sampleCount);

    // Rasterizing
    enter(JobStage::kRasterizing, subjectId);
    const PixelGrid grid =
        render::rasterizeWaveform(samples, config_.width, config_.height, config_.color);

    // Encoding
    enter(JobStage::kEncoding, subjectId);
    auto image = tryExecute([&grid] { return format::PngEncoder().encode(grid); },
                            ErrorCode::kFormatError);
    if (!image) {
        return std::unexpected(stageError(image.error().code(), stage_, image.error()));
    }

    // Uploading
    enter(JobStage::kUploading, subjectId);
    WaveformResult result;
    result.storageKey = waveformKey(subjectId);
    auto url = objects_.upload(result.storageKey, *image, kPngMimeType);
    if (!url) {
        return std::unexpected(stageError(ErrorCode::kStorageError, stage_, url.error()));
    }
    result.publicUrl = std::move(*url);

    // Persisting
    enter(JobStage::kPersisting, subjectId);
    if (auto persisted = subjects_.updateWaveformUrl(subjectId, result.publicUrl); !persisted) {
        return std::unexpected(
            stageError(ErrorCode::kPersistenceError, stage_, persisted.error()));
    }

    enter(JobStage::kDone, subjectId);
    return result;
}

}  // namespace wfg::job
