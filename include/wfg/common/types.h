// =============================================================================
// wfgen - Common Type Definitions
// =============================================================================
// Core type definitions for the wfgen library.
//
// This module defines:
// - AmplitudeSeries: normalized peak amplitudes, one per time bucket
// - Rgb: a bar fill color
// - PixelGrid: a W x H RGBA8 raster, row-major, origin top-left
// - EncodedImage: an opaque PNG byte stream
// - SubjectId: identifier of the record owning a waveform
// - Waveform defaults (300 x 60, 150 samples, 8 kHz decode)
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef WFG_COMMON_TYPES_H
#define WFG_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace wfg {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Identifier of the record that owns a waveform (e.g. a post ID).
using SubjectId = std::int64_t;

/// @brief Normalized peak amplitudes, each in [0.0, 1.0].
using AmplitudeSeries = std::vector<float>;

/// @brief A complete PNG byte stream.
using EncodedImage = std::vector<std::uint8_t>;

/// @brief Raw byte buffer.
using ByteBuffer = std::vector<std::uint8_t>;

// =============================================================================
// Constants
// =============================================================================

/// @brief Default waveform image width (pixels).
inline constexpr std::uint32_t kDefaultWaveformWidth = 300;

/// @brief Default waveform image height (pixels).
inline constexpr std::uint32_t kDefaultWaveformHeight = 60;

/// @brief Default number of amplitude samples per waveform.
inline constexpr std::size_t kDefaultWaveformSamples = 150;

/// @brief Sample rate requested from the external decoder (Hz).
inline constexpr std::uint32_t kDecodeSampleRate = 8000;

/// @brief Full-scale value of a signed 16-bit PCM sample.
inline constexpr float kPcmFullScale = 32768.0F;

/// @brief Normalization floor; keeps near-silent audio from dividing by zero.
inline constexpr float kNormalizationFloor = 0.01F;

/// @brief Fallback amplitude range used when decoding fails.
inline constexpr float kFallbackMinAmplitude = 0.3F;
inline constexpr float kFallbackMaxAmplitude = 0.7F;

/// @brief Largest width or height rendered or decoded.
/// @note Keeps width * height * 4 well inside 32-bit chunk lengths.
inline constexpr std::uint32_t kMaxImageDimension = 8192;

/// @brief Bytes per RGBA8 pixel.
inline constexpr std::size_t kBytesPerPixel = 4;

/// @brief Alpha of a drawn bar pixel.
inline constexpr std::uint8_t kOpaque = 255;

/// @brief Registered MIME type of the encoded image.
inline constexpr std::string_view kPngMimeType = "image/png";

// =============================================================================
// Rgb
// =============================================================================

/// @brief Opaque fill color for waveform bars.
struct Rgb {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;

    friend constexpr bool operator==(const Rgb&, const Rgb&) = default;
};

/// @brief Default bar color.
inline constexpr Rgb kDefaultWaveformColor{233, 69, 96};

// =============================================================================
// PixelGrid
// =============================================================================

/// @brief Width x height grid of RGBA8 pixels, row-major, origin top-left.
/// @note Zero-initialized: every pixel starts transparent black.
class PixelGrid {
public:
    PixelGrid() = default;

    /// @brief Create a zeroed grid.
    PixelGrid(std::uint32_t width, std::uint32_t height)
        : width_(width),
          height_(height),
          pixels_(static_cast<std::size_t>(width) * height * kBytesPerPixel, 0) {}

    [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
    [[nodiscard]] std::uint32_t height() const noexcept { return height_; }

    /// @brief Bytes per row (width * 4).
    [[nodiscard]] std::size_t stride() const noexcept {
        return static_cast<std::size_t>(width_) * kBytesPerPixel;
    }

    /// @brief All pixel bytes, RGBA interleaved.
    [[nodiscard]] std::span<const std::uint8_t> bytes() const noexcept { return pixels_; }
    [[nodiscard]] std::span<std::uint8_t> bytes() noexcept { return pixels_; }

    /// @brief Bytes of one row.
    [[nodiscard]] std::span<const std::uint8_t> row(std::uint32_t y) const noexcept {
        return std::span<const std::uint8_t>(pixels_).subspan(y * stride(), stride());
    }

    /// @brief Pointer to the 4 bytes of pixel (x, y).
    [[nodiscard]] const std::uint8_t* pixel(std::uint32_t x, std::uint32_t y) const noexcept {
        return pixels_.data() + y * stride() + static_cast<std::size_t>(x) * kBytesPerPixel;
    }

    /// @brief Set pixel (x, y) to an opaque color.
    void setOpaque(std::uint32_t x, std::uint32_t y, Rgb color) noexcept {
        std::uint8_t* p = pixels_.data() + y * stride() + static_cast<std::size_t>(x) * kBytesPerPixel;
        p[0] = color.r;
        p[1] = color.g;
        p[2] = color.b;
        p[3] = kOpaque;
    }

    /// @brief Alpha of pixel (x, y).
    [[nodiscard]] std::uint8_t alpha(std::uint32_t x, std::uint32_t y) const noexcept {
        return pixel(x, y)[3];
    }

    [[nodiscard]] bool empty() const noexcept { return pixels_.empty(); }

    friend bool operator==(const PixelGrid&, const PixelGrid&) = default;

private:
    std::uint32_t width_ = 0;
    std::uint32_t height_ = 0;
    std::vector<std::uint8_t> pixels_;
};

}  // namespace wfg

#endif  // WFG_COMMON_TYPES_H
