// =============================================================================
// wfgen - Amplitude Extraction
// =============================================================================
// Reduces an audio file to a fixed-length envelope of normalized peak
// amplitudes.
//
// This module provides:
// - IPcmDecoder: source of mono signed 16-bit PCM for an audio file
// - FfmpegPcmDecoder: decodes by running an external ffmpeg-style process
// - computeAmplitudes: bucketed peak detection and normalization
// - fallbackAmplitudes: pseudo-random envelope used when decoding fails
// - AmplitudeExtractor: decode + reduce, never failing for a valid N
//
// Bucketing:
//   size = floor(total / N); bucket i covers [i*size, (i+1)*size) and the
//   last bucket also takes the remainder. Peaks are |s| / 32768 and the
//   series is divided by max(maxPeak, 0.01).
//
// Usage:
//   AmplitudeExtractor extractor(std::make_unique<FfmpegPcmDecoder>());
//   AmplitudeSeries samples = extractor.extract("/tmp/audio-42", 150);
// =============================================================================

#ifndef WFG_AUDIO_AMPLITUDE_EXTRACTOR_H
#define WFG_AUDIO_AMPLITUDE_EXTRACTOR_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <random>
#include <span>
#include <string>
#include <vector>

#include "wfg/common/config.h"
#include "wfg/common/error.h"
#include "wfg/common/types.h"

namespace wfg::audio {

/// @brief Mono signed 16-bit PCM samples.
using PcmSamples = std::vector<std::int16_t>;

// =============================================================================
// PCM Decoding
// =============================================================================

/// @brief Source of mono s16 PCM for an audio file.
class IPcmDecoder {
public:
    virtual ~IPcmDecoder() = default;

    /// @brief Decode an audio file.
    /// @return Samples, or an error if the file could not be decoded.
    [[nodiscard]] virtual Result<PcmSamples> decode(const std::filesystem::path& path) = 0;
};

/// @brief Decoder backed by an external process writing raw s16le to stdout.
class FfmpegPcmDecoder : public IPcmDecoder {
public:
    explicit FfmpegPcmDecoder(std::string decoderPath = kDefaultDecoder,
                              std::uint32_t sampleRate = kDecodeSampleRate);

    [[nodiscard]] Result<PcmSamples> decode(const std::filesystem::path& path) override;

    /// @brief Full argument vector used for a given input file.
    [[nodiscard]] std::vector<std::string> commandLine(const std::filesystem::path& path) const;

    [[nodiscard]] const std::string& decoderPath() const noexcept { return decoderPath_; }

private:
    std::string decoderPath_;
    std::uint32_t sampleRate_;
};

/// @brief Interpret a byte stream as little-endian s16 samples.
/// @note A trailing odd byte is ignored.
[[nodiscard]] PcmSamples pcmFromLittleEndian(std::span<const std::uint8_t> bytes);

// =============================================================================
// Amplitude Reduction
// =============================================================================

/// @brief Reduce PCM to exactly `count` normalized peaks.
/// @throws UsageError if count is 0.
[[nodiscard]] AmplitudeSeries computeAmplitudes(std::span<const std::int16_t> samples,
                                                std::size_t count);

/// @brief Generate `count` values uniformly distributed in [0.3, 0.7].
[[nodiscard]] AmplitudeSeries fallbackAmplitudes(std::size_t count, std::mt19937& engine);

// =============================================================================
// AmplitudeExtractor
// =============================================================================

/// @brief Decode + reduce with graceful fallback.
class AmplitudeExtractor {
public:
    /// @brief Construct with a decoder and a nondeterministically seeded engine.
    explicit AmplitudeExtractor(std::unique_ptr<IPcmDecoder> decoder);

    /// @brief Construct with a decoder and a fixed seed.
    AmplitudeExtractor(std::unique_ptr<IPcmDecoder> decoder, std::uint32_t seed);

    /// @brief Extract `count` normalized amplitudes from an audio file.
    /// Decode failures and empty output are logged and replaced by the fallback
    /// envelope; they are never reported to the caller.
    /// @throws UsageError if count is 0.
    [[nodiscard]] AmplitudeSeries extract(const std::filesystem::path& path, std::size_t count);

    /// @brief Whether the most recent extract() returned fallback values.
    [[nodiscard]] bool usedFallback() const noexcept { return usedFallback_; }

private:
    std::unique_ptr<IPcmDecoder> decoder_;
    std::mt19937 engine_;
    bool usedFallback_ = false;
};

}  // namespace wfg::audio

#endif  // WFG_AUDIO_AMPLITUDE_EXTRACTOR_H
