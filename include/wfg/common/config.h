// =============================================================================
// wfgen - Configuration
// =============================================================================
// Configuration structures for waveform rendering and the storage backends.
//
// - WaveformConfig: image dimensions, sample count, color, decoder settings
// - StorageConfig: object store root, public URL base, subject record root
//
// StorageConfig can be loaded from the environment:
//   WFG_STORAGE_ROOT  directory backing the object store
//   WFG_PUBLIC_URL    base URL under which stored objects are reachable
//   WFG_SUBJECT_ROOT  directory holding subject record updates
//   WFG_DECODER       decoder executable (default: ffmpeg)
// =============================================================================

#ifndef WFG_COMMON_CONFIG_H
#define WFG_COMMON_CONFIG_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include "wfg/common/error.h"
#include "wfg/common/types.h"

namespace wfg {

// =============================================================================
// Environment Variable Names
// =============================================================================

inline constexpr const char* kEnvStorageRoot = "WFG_STORAGE_ROOT";
inline constexpr const char* kEnvPublicUrl = "WFG_PUBLIC_URL";
inline constexpr const char* kEnvSubjectRoot = "WFG_SUBJECT_ROOT";
inline constexpr const char* kEnvDecoder = "WFG_DECODER";

/// @brief Default external decoder executable.
inline constexpr const char* kDefaultDecoder = "ffmpeg";

// =============================================================================
// WaveformConfig
// =============================================================================

/// @brief Rendering and extraction settings for a waveform job.
struct WaveformConfig {
    /// @brief Image width in pixels.
    std::uint32_t width = kDefaultWaveformWidth;

    /// @brief Image height in pixels.
    std::uint32_t height = kDefaultWaveformHeight;

    /// @brief Number of amplitude buckets.
    std::size_t sampleCount = kDefaultWaveformSamples;

    /// @brief Bar color.
    Rgb color = kDefaultWaveformColor;

    /// @brief Decoder executable, resolved through PATH when not absolute.
    std::string decoderPath = kDefaultDecoder;

    /// @brief Decode sample rate (Hz).
    std::uint32_t sampleRate = kDecodeSampleRate;

    /// @brief Directory for per-job temporary files (empty = system temp dir).
    std::filesystem::path tempDirectory;

    /// @brief Validate configuration.
    [[nodiscard]] VoidResult validate() const;

    /// @brief Effective temporary directory.
    [[nodiscard]] std::filesystem::path effectiveTempDirectory() const;
};

// =============================================================================
// StorageConfig
// =============================================================================

/// @brief Settings for the directory-backed object and subject stores.
struct StorageConfig {
    /// @brief Root directory of the object store.
    std::filesystem::path storageRoot;

    /// @brief Public base URL of stored objects, without trailing slash.
    std::string publicBaseUrl;

    /// @brief Root directory of subject record updates.
    std::filesystem::path subjectRoot;

    /// @brief Check that every required field is set.
    [[nodiscard]] bool isConfigured() const noexcept;

    /// @brief Validate configuration.
    [[nodiscard]] VoidResult validate() const;

    /// @brief Load settings from WFG_* environment variables.
    /// @note Unset variables leave the field empty.
    [[nodiscard]] static StorageConfig fromEnvironment();
};

/// @brief Read the decoder executable from WFG_DECODER, falling back to ffmpeg.
[[nodiscard]] std::string decoderFromEnvironment();

}  // namespace wfg

#endif  // WFG_COMMON_CONFIG_H
