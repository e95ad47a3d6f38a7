// =============================================================================
// wfgen - PNG Reader
// =============================================================================
// Parses and validates PNG streams, and decodes 8-bit RGBA non-interlaced
// images back into a PixelGrid. Used by the info/verify commands and by
// the encoder round-trip tests.
//
// Key features:
// - Signature and chunk framing validation
// - Per-chunk CRC-32 verification (strict or report-only)
// - IDAT concatenation and zlib inflate
// - All five scanline filter types (None, Sub, Up, Average, Paeth)
//
// Usage:
//   PngReader reader(bytes);
//   reader.open();
//   PixelGrid grid = reader.decode();
// =============================================================================

#ifndef WFG_FORMAT_PNG_READER_H
#define WFG_FORMAT_PNG_READER_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

#include "wfg/common/types.h"
#include "wfg/format/png_format.h"

namespace wfg::format {

/// @brief Location and checksum state of one chunk.
struct ChunkInfo {
    /// @brief Four-character chunk type.
    std::string type;

    /// @brief Offset of the chunk's length field within the stream.
    std::size_t offset = 0;

    /// @brief Payload length.
    std::uint32_t length = 0;

    /// @brief CRC stored in the stream.
    std::uint32_t storedCrc = 0;

    /// @brief CRC computed over type + payload.
    std::uint32_t computedCrc = 0;

    [[nodiscard]] bool crcValid() const noexcept { return storedCrc == computedCrc; }

    /// @brief Offset of the first payload byte.
    [[nodiscard]] std::size_t payloadOffset() const noexcept { return offset + 8; }
};

/// @brief Reader for PNG streams.
class PngReader {
public:
    /// @brief Construct over an in-memory stream.
    explicit PngReader(std::vector<std::uint8_t> data);

    /// @brief Load a PNG file.
    /// @throws IOError if the file cannot be read.
    [[nodiscard]] static PngReader fromFile(const std::filesystem::path& path);

    /// @brief Parse the signature and chunk list.
    /// @param verifyChecksums Throw ChecksumError on the first CRC mismatch.
    /// @throws FormatError on malformed framing or a missing IHDR/IDAT/IEND.
    void open(bool verifyChecksums = true);

    /// @brief Check whether open() has succeeded.
    [[nodiscard]] bool isOpen() const noexcept { return opened_; }

    /// @brief Decoded IHDR.
    [[nodiscard]] const ImageHeader& header() const noexcept { return header_; }

    /// @brief All chunks in stream order.
    [[nodiscard]] const std::vector<ChunkInfo>& chunks() const noexcept { return chunks_; }

    /// @brief Number of chunks whose stored CRC does not match.
    [[nodiscard]] std::size_t corruptChunkCount() const noexcept;

    /// @brief Payload of a chunk.
    [[nodiscard]] std::span<const std::uint8_t> payload(const ChunkInfo& chunk) const noexcept;

    /// @brief Concatenated IDAT payloads (the zlib stream).
    [[nodiscard]] std::vector<std::uint8_t> imageData() const;

    /// @brief Inflate the image data into filtered scanlines.
    /// @throws FormatError if the stream is corrupt or has the wrong size.
    [[nodiscard]] std::vector<std::uint8_t> inflateScanlines() const;

    /// @brief Decode pixels.
    /// @throws FormatError for layouts other than 8-bit RGBA non-interlaced.
    [[nodiscard]] PixelGrid decode() const;

    /// @brief Total stream size in bytes.
    [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }

    /// @brief The raw stream.
    [[nodiscard]] std::span<const std::uint8_t> bytes() const noexcept { return data_; }

private:
    void requireOpen() const;

    std::vector<std::uint8_t> data_;
    std::vector<ChunkInfo> chunks_;
    ImageHeader header_;
    bool opened_ = false;
};

/// @brief Reverse the scanline filters of an RGBA8 image in place.
/// @param scanlines Filter byte + row bytes for each row.
/// @param width Image width in pixels.
/// @param height Image height in pixels.
/// @return Unfiltered pixel grid.
/// @throws FormatError on an unknown filter type.
[[nodiscard]] PixelGrid unfilterScanlines(std::span<std::uint8_t> scanlines, std::uint32_t width,
                                          std::uint32_t height);

}  // namespace wfg::format

#endif  // WFG_FORMAT_PNG_READER_H
