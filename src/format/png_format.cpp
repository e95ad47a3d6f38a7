// =============================================================================
// wfgen - PNG Container Format Helpers
// =============================================================================

#include "wfg/format/png_format.h"

#include <algorithm>

#include <fmt/format.h>

#include "wfg/common/error.h"

namespace wfg::format {

std::array<std::uint8_t, kImageHeaderSize> ImageHeader::serialize() const noexcept {
    std::array<std::uint8_t, kImageHeaderSize> out{};
    storeBe32(out.data(), width);
    storeBe32(out.data() + 4, height);
    out[8] = bitDepth;
    out[9] = colorType;
    out[10] = compressionMethod;
    out[11] = filterMethod;
    out[12] = interlaceMethod;
    return out;
}

ImageHeader ImageHeader::deserialize(std::span<const std::uint8_t> payload) {
    if (payload.size() != kImageHeaderSize) {
        throw FormatError(fmt::format("IHDR payload must be {} bytes, got {}", kImageHeaderSize,
                                      payload.size()));
    }
    ImageHeader header;
    header.width = loadBe32(payload.data());
    header.height = loadBe32(payload.data() + 4);
    header.bitDepth = payload[8];
    header.colorType = payload[9];
    header.compressionMethod = payload[10];
    header.filterMethod = payload[11];
    header.interlaceMethod = payload[12];
    return header;
}

bool hasPngSignature(std::span<const std::uint8_t> data) noexcept {
    return data.size() >= kPngSignature.size() &&
           std::equal(kPngSignature.begin(), kPngSignature.end(), data.begin());
}

}  // namespace wfg::format
