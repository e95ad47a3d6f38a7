// =============================================================================
// wfgen - Configuration Implementation
// =============================================================================

#include "wfg/common/config.h"

#include <cstdlib>
#include <system_error>

#include <fmt/format.h>

namespace wfg {

namespace {

std::string envOrEmpty(const char* name) {
    const char* value = std::getenv(name);
    return value != nullptr ? std::string(value) : std::string();
}

}  // namespace

// =============================================================================
// WaveformConfig Implementation
// =============================================================================

VoidResult WaveformConfig::validate() const {
    if (width == 0 || height == 0) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("Image dimensions must be positive, got {}x{}",
                                         width, height));
    }

    if (width > kMaxImageDimension || height > kMaxImageDimension) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("Image dimensions must be at most {}, got {}x{}",
                                         kMaxImageDimension, width, height));
    }

    if (sampleCount == 0) {
        return makeVoidError(ErrorCode::kInvalidArgument, "Sample count must be > 0");
    }

    if (sampleRate == 0) {
        return makeVoidError(ErrorCode::kInvalidArgument, "Sample rate must be > 0");
    }

    if (decoderPath.empty()) {
        return makeVoidError(ErrorCode::kInvalidArgument, "Decoder path must not be empty");
    }

    return makeVoidSuccess();
}

std::filesystem::path WaveformConfig::effectiveTempDirectory() const {
    if (!tempDirectory.empty()) {
        return tempDirectory;
    }
    std::error_code ec;
    auto dir = std::filesystem::temp_directory_path(ec);
    return ec ? std::filesystem::path("/tmp") : dir;
}

// =============================================================================
// StorageConfig Implementation
// =============================================================================

bool StorageConfig::isConfigured() const noexcept {
    return !storageRoot.empty() && !publicBaseUrl.empty() && !subjectRoot.empty();
}

VoidResult StorageConfig::validate() const {
    if (storageRoot.empty()) {
        return makeVoidError(ErrorCode::kNotConfigured,
                             fmt::format("Object storage root is not set (use --storage-root or {})",
                                         kEnvStorageRoot));
    }
    if (publicBaseUrl.empty()) {
        return makeVoidError(ErrorCode::kNotConfigured,
                             fmt::format("Public URL base is not set (use --public-url or {})",
                                         kEnvPublicUrl));
    }
    if (subjectRoot.empty()) {
        return makeVoidError(ErrorCode::kNotConfigured,
                             fmt::format("Subject store root is not set (use --subject-root or {})",
                                         kEnvSubjectRoot));
    }
    return makeVoidSuccess();
}

StorageConfig StorageConfig::fromEnvironment() {
    StorageConfig config;
    config.storageRoot = envOrEmpty(kEnvStorageRoot);
    config.publicBaseUrl = envOrEmpty(kEnvPublicUrl);
    config.subjectRoot = envOrEmpty(kEnvSubjectRoot);
    return config;
}

std::string decoderFromEnvironment() {
    std::string decoder = envOrEmpty(kEnvDecoder);
    return decoder.empty() ? std::string(kDefaultDecoder) : decoder;
}

}  // namespace wfg
