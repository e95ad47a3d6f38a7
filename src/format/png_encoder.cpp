// =============================================================================
// wfgen - PNG Encoder Implementation
// =============================================================================

#include "wfg/format/png_encoder.h"

#include <array>
#include <cstring>

#include <fmt/format.h>

#include "wfg/common/error.h"
#include "wfg/common/logger.h"
#include "wfg/format/crc32.h"
#include "wfg/format/png_format.h"

namespace wfg::format {

// =============================================================================
// PngEncoder Implementation
// =============================================================================

std::vector<std::uint8_t> PngEncoder::filterScanlines(const PixelGrid& grid) {
    const std::size_t stride = grid.stride();
    std::vector<std::uint8_t> raw(static_cast<std::size_t>(grid.height()) * (1 + stride));

    for (std::uint32_t y = 0; y < grid.height(); ++y) {
        std::uint8_t* line = raw.data() + static_cast<std::size_t>(y) * (1 + stride);
        line[0] = static_cast<std::uint8_t>(FilterType::kNone);
        auto src = grid.row(y);
        std::memcpy(line + 1, src.data(), stride);
    }

    return raw;
}

void PngEncoder::appendChunk(std::vector<std::uint8_t>& out, std::string_view type,
                             std::span<const std::uint8_t> payload) {
    if (type.size() != kChunkTypeSize) {
        throw FormatError(fmt::format("Chunk type must be 4 characters, got '{}'", type));
    }
    if (payload.size() > kMaxChunkLength) {
        throw FormatError(fmt::format("{} payload of {} bytes exceeds chunk limit", type,
                                      payload.size()));
    }

    std::array<std::uint8_t, 4> word{};

    storeBe32(word.data(), static_cast<std::uint32_t>(payload.size()));
    out.insert(out.end(), word.begin(), word.end());

    out.insert(out.end(), type.begin(), type.end());
    out.insert(out.end(), payload.begin(), payload.end());

    Crc32 crc;
    crc.update(type);
    crc.update(payload);
    storeBe32(word.data(), crc.value());
    out.insert(out.end(), word.begin(), word.end());
}

EncodedImage PngEncoder::encode(const PixelGrid& grid) const {
    if (grid.width() == 0 || grid.height() == 0) {
        throw FormatError(fmt::format("Cannot encode an empty {}x{} grid", grid.width(),
                                      grid.height()));
    }

    ImageHeader header;
    header.width = grid.width();
    header.height = grid.height();
    const auto headerBytes = header.serialize();

    const auto scanlines = filterScanlines(grid);
    const auto compressed = zlibCompress(scanlines, options_.compressionLevel);

    EncodedImage out;
    out.reserve(kPngSignature.size() + 3 * kChunkOverhead + kImageHeaderSize + compressed.size());

    out.insert(out.end(), kPngSignature.begin(), kPngSignature.end());
    appendChunk(out, kChunkIhdr, headerBytes);
    appendChunk(out, kChunkIdat, compressed);
    appendChunk(out, kChunkIend, {});

    WFG_LOG_DEBUG("Encoded {}x{} PNG: {} scanline bytes -> {} bytes", grid.width(),
                  grid.height(), scanlines.size(), out.size());

    return out;
}

}  // namespace wfg::format
