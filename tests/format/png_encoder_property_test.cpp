// =============================================================================
// wfgen - PNG Encoder Property Tests
// =============================================================================
// Byte-level layout of the encoded stream, plus properties:
// - PngReader decodes every encoder output back to the identical grid
// - libpng (an independent decoder) reads the same pixels
// - corrupting any payload or CRC byte is reported as a checksum error
// - encoding is deterministic
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include <png.h>

#include "wfg/common/error.h"
#include "wfg/common/types.h"
#include "wfg/format/crc32.h"
#include "wfg/format/deflate.h"
#include "wfg/format/png_encoder.h"
#include "wfg/format/png_format.h"
#include "wfg/format/png_reader.h"

namespace wfg::format::test {

namespace {

std::uint32_t readBe32(const EncodedImage& png, std::size_t pos) {
    return loadBe32(png.data() + pos);
}

/// @brief Pixels decoded by libpng's simplified read API.
struct LibpngImage {
    bool ok = false;
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::vector<std::uint8_t> rgba;
};

LibpngImage decodeWithLibpng(const EncodedImage& png) {
    LibpngImage result;

    png_image image;
    std::memset(&image, 0, sizeof(image));
    image.version = PNG_IMAGE_VERSION;

    if (png_image_begin_read_from_memory(&image, png.data(), png.size()) == 0) {
        return result;
    }

    image.format = PNG_FORMAT_RGBA;
    result.rgba.resize(PNG_IMAGE_SIZE(image));
    if (png_image_finish_read(&image, nullptr, result.rgba.data(), 0, nullptr) == 0) {
        png_image_free(&image);
        return result;
    }

    result.ok = true;
    result.width = image.width;
    result.height = image.height;
    return result;
}

}  // namespace

// =============================================================================
// RapidCheck Generators
// =============================================================================

namespace gen {

/// @brief Grid whose pixels are either transparent black or an opaque color.
[[nodiscard]] rc::Gen<PixelGrid> waveformLikeGrid() {
    return rc::gen::mapcat(
        rc::gen::pair(rc::gen::inRange<std::uint32_t>(1, 40),
                      rc::gen::inRange<std::uint32_t>(1, 40)),
        [](std::pair<std::uint32_t, std::uint32_t> dims) {
            const std::size_t count = static_cast<std::size_t>(dims.first) * dims.second;
            return rc::gen::map(
                rc::gen::container<std::vector<std::uint32_t>>(
                    count, rc::gen::arbitrary<std::uint32_t>()),
                [dims](const std::vector<std::uint32_t>& values) {
                    PixelGrid grid(dims.first, dims.second);
                    for (std::uint32_t y = 0; y < dims.second; ++y) {
                        for (std::uint32_t x = 0; x < dims.first; ++x) {
                            const auto v = values[static_cast<std::size_t>(y) * dims.first + x];
                            if ((v & 1U) != 0) {
                                grid.setOpaque(x, y,
                                               Rgb{static_cast<std::uint8_t>(v >> 8),
                                                   static_cast<std::uint8_t>(v >> 16),
                                                   static_cast<std::uint8_t>(v >> 24)});
                            }
                        }
                    }
                    return grid;
                });
        });
}

/// @brief Grid filled with arbitrary RGBA bytes.
[[nodiscard]] rc::Gen<PixelGrid> arbitraryGrid() {
    return rc::gen::mapcat(
        rc::gen::pair(rc::gen::inRange<std::uint32_t>(1, 24),
                      rc::gen::inRange<std::uint32_t>(1, 24)),
        [](std::pair<std::uint32_t, std::uint32_t> dims) {
            const std::size_t size =
                static_cast<std::size_t>(dims.first) * dims.second * kBytesPerPixel;
            return rc::gen::map(
                rc::gen::container<std::vector<std::uint8_t>>(
                    size, rc::gen::arbitrary<std::uint8_t>()),
                [dims](const std::vector<std::uint8_t>& bytes) {
                    PixelGrid grid(dims.first, dims.second);
                    std::memcpy(grid.bytes().data(), bytes.data(), bytes.size());
                    return grid;
                });
        });
}

}  // namespace gen

// =============================================================================
// Layout Tests
// =============================================================================

TEST(PngEncoderTest, SignatureAndHeaderLayout) {
    PixelGrid grid(300, 60);
    grid.setOpaque(0, 30, kDefaultWaveformColor);

    const auto png = PngEncoder().encode(grid);

    ASSERT_GT(png.size(), 8U + 25U + 12U + 12U);
    const std::vector<std::uint8_t> signature = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};
    EXPECT_TRUE(std::equal(signature.begin(), signature.end(), png.begin()));

    // IHDR: length 13, type, W, H, depth 8, color type 6, 0, 0, 0
    EXPECT_EQ(readBe32(png, 8), 13U);
    EXPECT_EQ(std::string(png.begin() + 12, png.begin() + 16), "IHDR");
    EXPECT_EQ(readBe32(png, 16), 300U);
    EXPECT_EQ(readBe32(png, 20), 60U);
    EXPECT_EQ(png[24], 8);
    EXPECT_EQ(png[25], 6);
    EXPECT_EQ(png[26], 0);
    EXPECT_EQ(png[27], 0);
    EXPECT_EQ(png[28], 0);

    const auto ihdrCrc = crc32(std::span<const std::uint8_t>(png.data() + 12, 4 + 13));
    EXPECT_EQ(readBe32(png, 29), ihdrCrc);

    EXPECT_EQ(std::string(png.begin() + 37, png.begin() + 41), "IDAT");
}

TEST(PngEncoderTest, EndsWithEmptyIend) {
    const auto png = PngEncoder().encode(PixelGrid(3, 2));
    const std::vector<std::uint8_t> trailer = {0x00, 0x00, 0x00, 0x00, 'I',  'E',
                                               'N',  'D',  0xAE, 0x42, 0x60, 0x82};
    ASSERT_GE(png.size(), trailer.size());
    EXPECT_TRUE(std::equal(trailer.begin(), trailer.end(), png.end() - 12));
}

TEST(PngEncoderTest, ImageDataIsUnfilteredScanlines) {
    PixelGrid grid(5, 4);
    grid.setOpaque(2, 1, Rgb{1, 2, 3});

    const auto png = PngEncoder().encode(grid);
    const std::uint32_t idatLength = readBe32(png, 33);
    const std::span<const std::uint8_t> idat(png.data() + 41, idatLength);

    const auto scanlines = zlibDecompress(idat);
    ASSERT_EQ(scanlines.size(), 4U * (1 + 5 * 4));
    for (std::size_t row = 0; row < 4; ++row) {
        EXPECT_EQ(scanlines[row * 21], 0) << "row " << row;
    }
    // Row 1, pixel 2
    const std::size_t p = 1 * 21 + 1 + 2 * 4;
    EXPECT_EQ(scanlines[p], 1);
    EXPECT_EQ(scanlines[p + 1], 2);
    EXPECT_EQ(scanlines[p + 2], 3);
    EXPECT_EQ(scanlines[p + 3], 255);
}

TEST(PngEncoderTest, EmptyGridIsRejected) {
    EXPECT_THROW((void)PngEncoder().encode(PixelGrid()), FormatError);
    EXPECT_THROW((void)PngEncoder().encode(PixelGrid(0, 10)), FormatError);
}

TEST(PngEncoderTest, ChunkTypeMustBeFourCharacters) {
    std::vector<std::uint8_t> out;
    EXPECT_THROW(PngEncoder::appendChunk(out, "IDATX", {}), FormatError);
}

TEST(PngEncoderTest, MimeType) {
    EXPECT_EQ(kPngMimeType, "image/png");
}

// =============================================================================
// Property Tests
// =============================================================================

RC_GTEST_PROP(PngEncoderProperty, ReaderRoundTrip, ()) {
    const auto grid = *gen::arbitraryGrid();
    const auto png = PngEncoder().encode(grid);

    PngReader reader(png);
    reader.open();

    RC_ASSERT(reader.header().width == grid.width());
    RC_ASSERT(reader.header().height == grid.height());
    RC_ASSERT(reader.header().isRgba8());
    RC_ASSERT(reader.decode() == grid);
}

RC_GTEST_PROP(PngEncoderProperty, LibpngDecodesSamePixels, ()) {
    const auto grid = *gen::waveformLikeGrid();
    const auto png = PngEncoder().encode(grid);

    const auto decoded = decodeWithLibpng(png);
    RC_ASSERT(decoded.ok);
    RC_ASSERT(decoded.width == grid.width());
    RC_ASSERT(decoded.height == grid.height());
    RC_ASSERT(std::equal(decoded.rgba.begin(), decoded.rgba.end(), grid.bytes().begin(),
                         grid.bytes().end()));
}

RC_GTEST_PROP(PngEncoderProperty, Deterministic, ()) {
    const auto grid = *gen::arbitraryGrid();
    PngEncoder encoder;
    RC_ASSERT(encoder.encode(grid) == encoder.encode(grid));
}

RC_GTEST_PROP(PngEncoderProperty, CorruptionIsDetected, ()) {
    const auto grid = *gen::waveformLikeGrid();
    auto png = PngEncoder().encode(grid);

    PngReader clean(png);
    clean.open();
    const auto chunks = clean.chunks();

    const auto& chunk = *rc::gen::elementOf(chunks);
    // Payload and CRC bytes of the chosen chunk.
    const auto pos = *rc::gen::inRange<std::size_t>(chunk.payloadOffset(),
                                                    chunk.payloadOffset() + chunk.length + 4);
    const auto delta = *rc::gen::inRange<int>(1, 256);
    png[pos] = static_cast<std::uint8_t>(png[pos] ^ delta);

    PngReader corrupt(png);
    RC_ASSERT_THROWS_AS(corrupt.open(), ChecksumError);
}

}  // namespace wfg::format::test
