// =============================================================================
// wfgen - PNG Container Format Definitions
// =============================================================================
// Binary format definitions for the subset of PNG produced by wfgen.
//
// This module defines:
// - PNG signature constants (8 bytes)
// - Chunk type tags (IHDR, IDAT, IEND)
// - ImageHeader structure (IHDR payload, 13 bytes)
// - Big-endian helpers for chunk framing
//
// Stream Layout:
// +----------------+
// |   Signature    |  (8 bytes)
// +----------------+
// |  IHDR chunk    |  (12 + 13 bytes)
// +----------------+
// |  IDAT chunk    |  (12 + zlib stream)
// +----------------+
// |  IEND chunk    |  (12 bytes)
// +----------------+
//
// Chunk Layout:
//   length (u32 BE) | type (4 ASCII) | payload (length bytes) | CRC-32 (u32 BE)
//   The CRC covers type + payload.
// =============================================================================

#ifndef WFG_FORMAT_PNG_FORMAT_H
#define WFG_FORMAT_PNG_FORMAT_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace wfg::format {

// =============================================================================
// Signature Constants
// =============================================================================

/// @brief PNG signature bytes.
/// @note 0x89 'P' 'N' 'G' CR LF Ctrl-Z LF
inline constexpr std::array<std::uint8_t, 8> kPngSignature = {
    0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A
};

// =============================================================================
// Chunk Constants
// =============================================================================

/// @brief Chunk type tags.
inline constexpr std::string_view kChunkIhdr = "IHDR";
inline constexpr std::string_view kChunkIdat = "IDAT";
inline constexpr std::string_view kChunkIend = "IEND";

/// @brief Size of a chunk type tag.
inline constexpr std::size_t kChunkTypeSize = 4;

/// @brief Framing overhead per chunk (length + type + CRC).
inline constexpr std::size_t kChunkOverhead = 12;

/// @brief Size of the IHDR payload.
inline constexpr std::size_t kImageHeaderSize = 13;

/// @brief Largest chunk length allowed by the format (2^31 - 1).
inline constexpr std::uint32_t kMaxChunkLength = 0x7FFFFFFFU;

// =============================================================================
// Header Field Values
// =============================================================================

/// @brief Bit depth per channel.
inline constexpr std::uint8_t kBitDepth8 = 8;

/// @brief Color type: truecolor with alpha (RGBA).
inline constexpr std::uint8_t kColorTypeRgba = 6;

/// @brief Compression method 0 (deflate).
inline constexpr std::uint8_t kCompressionDeflate = 0;

/// @brief Filter method 0 (adaptive, five filter types).
inline constexpr std::uint8_t kFilterMethodAdaptive = 0;

/// @brief Interlace method 0 (none).
inline constexpr std::uint8_t kInterlaceNone = 0;

/// @brief Per-scanline filter types.
enum class FilterType : std::uint8_t {
    kNone = 0,
    kSub = 1,
    kUp = 2,
    kAverage = 3,
    kPaeth = 4
};

// =============================================================================
// ImageHeader (IHDR payload)
// =============================================================================

/// @brief Decoded IHDR payload.
struct ImageHeader {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::uint8_t bitDepth = kBitDepth8;
    std::uint8_t colorType = kColorTypeRgba;
    std::uint8_t compressionMethod = kCompressionDeflate;
    std::uint8_t filterMethod = kFilterMethodAdaptive;
    std::uint8_t interlaceMethod = kInterlaceNone;

    friend constexpr bool operator==(const ImageHeader&, const ImageHeader&) = default;

    /// @brief Serialize to the 13-byte IHDR payload.
    [[nodiscard]] std::array<std::uint8_t, kImageHeaderSize> serialize() const noexcept;

    /// @brief Parse a 13-byte IHDR payload.
    /// @throws FormatError if the payload has the wrong size.
    [[nodiscard]] static ImageHeader deserialize(std::span<const std::uint8_t> payload);

    /// @brief Check whether this is the 8-bit RGBA, non-interlaced layout wfgen handles.
    [[nodiscard]] bool isRgba8() const noexcept {
        return bitDepth == kBitDepth8 && colorType == kColorTypeRgba &&
               compressionMethod == kCompressionDeflate &&
               filterMethod == kFilterMethodAdaptive && interlaceMethod == kInterlaceNone;
    }
};

// =============================================================================
// Big-Endian Helpers
// =============================================================================

/// @brief Store a 32-bit value big-endian.
constexpr void storeBe32(std::uint8_t* out, std::uint32_t value) noexcept {
    out[0] = static_cast<std::uint8_t>(value >> 24);
    out[1] = static_cast<std::uint8_t>(value >> 16);
    out[2] = static_cast<std::uint8_t>(value >> 8);
    out[3] = static_cast<std::uint8_t>(value);
}

/// @brief Load a big-endian 32-bit value.
[[nodiscard]] constexpr std::uint32_t loadBe32(const std::uint8_t* in) noexcept {
    return (static_cast<std::uint32_t>(in[0]) << 24) | (static_cast<std::uint32_t>(in[1]) << 16) |
           (static_cast<std::uint32_t>(in[2]) << 8) | static_cast<std::uint32_t>(in[3]);
}

/// @brief Check whether data starts with the PNG signature.
[[nodiscard]] bool hasPngSignature(std::span<const std::uint8_t> data) noexcept;

}  // namespace wfg::format

#endif  // WFG_FORMAT_PNG_FORMAT_H
