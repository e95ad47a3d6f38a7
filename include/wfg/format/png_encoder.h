// =============================================================================
// wfgen - PNG Encoder
// =============================================================================
// Serializes a PixelGrid into a PNG stream: signature, IHDR, a single IDAT
// holding the zlib-compressed scanlines (each prefixed with filter type 0),
// and IEND. Output is byte-for-byte deterministic for a given grid.
//
// Usage:
//   PngEncoder encoder;
//   EncodedImage png = encoder.encode(grid);
// =============================================================================

#ifndef WFG_FORMAT_PNG_ENCODER_H
#define WFG_FORMAT_PNG_ENCODER_H

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "wfg/common/types.h"
#include "wfg/format/deflate.h"

namespace wfg::format {

/// @brief Encoder configuration.
struct PngEncoderOptions {
    /// @brief zlib level for the IDAT stream.
    int compressionLevel = kMaxDeflateLevel;
};

/// @brief Encodes RGBA8 pixel grids as PNG.
class PngEncoder {
public:
    explicit PngEncoder(PngEncoderOptions options = {}) : options_(options) {}

    /// @brief Encode a grid.
    /// @param grid Pixels to encode (width and height must be > 0).
    /// @return Complete PNG stream.
    /// @throws FormatError on an empty grid or compressor failure.
    [[nodiscard]] EncodedImage encode(const PixelGrid& grid) const;

    /// @brief Build the filtered scanline buffer (filter byte 0 + row bytes per row).
    [[nodiscard]] static std::vector<std::uint8_t> filterScanlines(const PixelGrid& grid);

    /// @brief Append one framed chunk to out.
    static void appendChunk(std::vector<std::uint8_t>& out, std::string_view type,
                            std::span<const std::uint8_t> payload);

private:
    PngEncoderOptions options_;
};

}  // namespace wfg::format

#endif  // WFG_FORMAT_PNG_ENCODER_H
