// =============================================================================
// wfgen - PNG Reader Implementation
// =============================================================================

#include "wfg/format/png_reader.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iterator>

#include <fmt/format.h>

#include "wfg/common/error.h"
#include "wfg/common/logger.h"
#include "wfg/format/crc32.h"
#include "wfg/format/deflate.h"

namespace wfg::format {

namespace {

/// @brief Bytes per complete pixel for RGBA8.
constexpr std::size_t kBpp = kBytesPerPixel;

[[nodiscard]] std::uint8_t paethPredictor(int a, int b, int c) noexcept {
    const int p = a + b - c;
    const int pa = std::abs(p - a);
    const int pb = std::abs(p - b);
    const int pc = std::abs(p - c);
    if (pa <= pb && pa <= pc) {
        return static_cast<std::uint8_t>(a);
    }
    if (pb <= pc) {
        return static_cast<std::uint8_t>(b);
    }
    return static_cast<std::uint8_t>(c);
}

[[nodiscard]] bool isValidChunkType(std::span<const std::uint8_t> type) noexcept {
    for (std::uint8_t ch : type) {
        const bool upper = ch >= 'A' && ch <= 'Z';
        const bool lower = ch >= 'a' && ch <= 'z';
        if (!upper && !lower) {
            return false;
        }
    }
    return true;
}

}  // namespace

// =============================================================================
// Scanline Unfiltering
// =============================================================================

PixelGrid unfilterScanlines(std::span<std::uint8_t> scanlines, std::uint32_t width,
                            std::uint32_t height) {
    const std::size_t stride = static_cast<std::size_t>(width) * kBpp;
    if (scanlines.size() != static_cast<std::size_t>(height) * (1 + stride)) {
        throw FormatError(fmt::format("Scanline buffer is {} bytes, expected {} for {}x{}",
                                      scanlines.size(),
                                      static_cast<std::size_t>(height) * (1 + stride), width,
                                      height));
    }

    PixelGrid grid(width, height);
    auto out = grid.bytes();
    const std::uint8_t* prev = nullptr;

    for (std::uint32_t y = 0; y < height; ++y) {
        std::uint8_t* line = scanlines.data() + static_cast<std::size_t>(y) * (1 + stride);
        const auto filter = static_cast<FilterType>(line[0]);
        std::uint8_t* cur = line + 1;

        for (std::size_t i = 0; i < stride; ++i) {
            const int left = i >= kBpp ? cur[i - kBpp] : 0;
            const int up = prev != nullptr ? prev[i] : 0;
            const int upLeft = (prev != nullptr && i >= kBpp) ? prev[i - kBpp] : 0;

            switch (filter) {
                case FilterType::kNone:
                    break;
                case FilterType::kSub:
                    cur[i] = static_cast<std::uint8_t>(cur[i] + left);
                    break;
                case FilterType::kUp:
                    cur[i] = static_cast<std::uint8_t>(cur[i] + up);
                    break;
                case FilterType::kAverage:
                    cur[i] = static_cast<std::uint8_t>(cur[i] + ((left + up) >> 1));
                    break;
                case FilterType::kPaeth:
                    cur[i] = static_cast<std::uint8_t>(cur[i] + paethPredictor(left, up, upLeft));
                    break;
                default:
                    throw FormatError(fmt::format("Unknown filter type {} on row {}",
                                                  static_cast<int>(line[0]), y));
            }
        }

        std::copy(cur, cur + stride, out.begin() + static_cast<std::ptrdiff_t>(y * stride));
        prev = cur;
    }

    return grid;
}

// =============================================================================
// PngReader Implementation
// =============================================================================

PngReader::PngReader(std::vector<std::uint8_t> data) : data_(std::move(data)) {}

PngReader PngReader::fromFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IOError("Failed to open file: " + path.string(), ErrorContext(path.string()));
    }

    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                                    std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw IOError("Failed to read file: " + path.string(), ErrorContext(path.string()));
    }

    return PngReader(std::move(bytes));
}

void PngReader::open(bool verifyChecksums) {
    chunks_.clear();
    opened_ = false;

    if (!hasPngSignature(data_)) {
        throw FormatError("Missing PNG signature");
    }

    std::size_t pos = kPngSignature.size();
    bool sawIend = false;

    while (pos < data_.size()) {
        if (data_.size() - pos < kChunkOverhead) {
            throw FormatError("Truncated chunk header", ErrorContext().withOffset(pos));
        }

        ChunkInfo chunk;
        chunk.offset = pos;
        chunk.length = loadBe32(data_.data() + pos);

        std::span<const std::uint8_t> type(data_.data() + pos + 4, kChunkTypeSize);
        if (!isValidChunkType(type)) {
            throw FormatError("Invalid chunk type", ErrorContext().withOffset(pos + 4));
        }
        chunk.type.assign(type.begin(), type.end());

        if (chunk.length > kMaxChunkLength ||
            data_.size() - pos - kChunkOverhead < chunk.length) {
            throw FormatError(fmt::format("{} chunk length {} runs past end of stream",
                                          chunk.type, chunk.length),
                              ErrorContext().withOffset(pos));
        }

        const std::size_t crcPos = chunk.payloadOffset() + chunk.length;
        chunk.storedCrc = loadBe32(data_.data() + crcPos);

        Crc32 crc;
        crc.update(std::span<const std::uint8_t>(data_.data() + pos + 4,
                                                 kChunkTypeSize + chunk.length));
        chunk.computedCrc = crc.value();

        if (verifyChecksums && !chunk.crcValid()) {
            throw ChecksumError(chunk.storedCrc, chunk.computedCrc,
                                ErrorContext().withOffset(pos));
        }

        if (chunks_.empty() && chunk.type != kChunkIhdr) {
            throw FormatError("First chunk must be IHDR, got " + chunk.type);
        }

        pos = crcPos + 4;
        const bool isIend = chunk.type == kChunkIend;
        chunks_.push_back(std::move(chunk));

        if (isIend) {
            sawIend = true;
            break;
        }
    }

    if (!sawIend) {
        throw FormatError("Missing IEND chunk");
    }
    if (pos != data_.size()) {
        throw FormatError(fmt::format("{} trailing bytes after IEND", data_.size() - pos),
                          ErrorContext().withOffset(pos));
    }

    header_ = ImageHeader::deserialize(payload(chunks_.front()));
    if (header_.width == 0 || header_.height == 0 || header_.width > kMaxChunkLength ||
        header_.height > kMaxChunkLength) {
        throw FormatError(fmt::format("Invalid image dimensions {}x{}", header_.width,
                                      header_.height));
    }

    bool hasIdat = false;
    for (const auto& c : chunks_) {
        hasIdat = hasIdat || c.type == kChunkIdat;
    }
    if (!hasIdat) {
        throw FormatError("Missing IDAT chunk");
    }

    opened_ = true;
    WFG_LOG_DEBUG("Opened PNG: {}x{}, {} chunks, {} bytes", header_.width, header_.height,
                  chunks_.size(), data_.size());
}

std::size_t PngReader::corruptChunkCount() const noexcept {
    std::size_t count = 0;
    for (const auto& chunk : chunks_) {
        if (!chunk.crcValid()) {
            ++count;
        }
    }
    return count;
}

std::span<const std::uint8_t> PngReader::payload(const ChunkInfo& chunk) const noexcept {
    return std::span<const std::uint8_t>(data_).subspan(chunk.payloadOffset(), chunk.length);
}

std::vector<std::uint8_t> PngReader::imageData() const {
    requireOpen();
    std::vector<std::uint8_t> stream;
    for (const auto& chunk : chunks_) {
        if (chunk.type == kChunkIdat) {
            auto bytes = payload(chunk);
            stream.insert(stream.end(), bytes.begin(), bytes.end());
        }
    }
    return stream;
}

std::vector<std::uint8_t> PngReader::inflateScanlines() const {
    requireOpen();
    if (!header_.isRgba8()) {
        throw FormatError(fmt::format(
            "Unsupported layout: bit depth {}, color type {}, interlace {}",
            static_cast<int>(header_.bitDepth), static_cast<int>(header_.colorType),
            static_cast<int>(header_.interlaceMethod)));
    }

    if (header_.width > kMaxImageDimension || header_.height > kMaxImageDimension) {
        throw FormatError(fmt::format("Image {}x{} exceeds the decodable limit of {} pixels "
                                      "per side",
                                      header_.width, header_.height, kMaxImageDimension));
    }

    const std::size_t expected =
        static_cast<std::size_t>(header_.height) * (1 + static_cast<std::size_t>(header_.width) * kBpp);
    auto scanlines = zlibDecompress(imageData(), expected, expected);
    if (scanlines.size() != expected) {
        throw FormatError(fmt::format("Image data inflates to {} bytes, expected {}",
                                      scanlines.size(), expected));
    }
    return scanlines;
}

PixelGrid PngReader::decode() const {
    auto scanlines = inflateScanlines();
    return unfilterScanlines(scanlines, header_.width, header_.height);
}

void PngReader::requireOpen() const {
    if (!opened_) {
        throw FormatError("PNG stream has not been opened");
    }
}

}  // namespace wfg::format
