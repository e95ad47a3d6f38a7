// =============================================================================
// wfgen - PNG Reader Tests
// =============================================================================
// Stream validation and scanline unfiltering, on hand-built PNG streams.
// =============================================================================

#include "wfg/format/png_reader.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

#include "wfg/common/error.h"
#include "wfg/format/deflate.h"
#include "wfg/format/png_encoder.h"

namespace wfg::format {
namespace {

/// @brief Assemble a PNG from an explicit header and raw scanlines.
std::vector<std::uint8_t> buildPng(const ImageHeader& header,
                                   const std::vector<std::uint8_t>& scanlines) {
    std::vector<std::uint8_t> out(kPngSignature.begin(), kPngSignature.end());
    const auto ihdr = header.serialize();
    PngEncoder::appendChunk(out, kChunkIhdr, ihdr);
    PngEncoder::appendChunk(out, kChunkIdat, zlibCompress(scanlines));
    PngEncoder::appendChunk(out, kChunkIend, {});
    return out;
}

ImageHeader rgbaHeader(std::uint32_t width, std::uint32_t height) {
    ImageHeader header;
    header.width = width;
    header.height = height;
    return header;
}

// =============================================================================
// Unfiltering
// =============================================================================

TEST(UnfilterTest, SubAddsLeftPixel) {
    std::vector<std::uint8_t> lines = {1, 10, 20, 30, 40, 5, 5, 5, 5};
    const auto grid = unfilterScanlines(lines, 2, 1);
    const std::uint8_t* p = grid.pixel(1, 0);
    EXPECT_EQ(p[0], 15);
    EXPECT_EQ(p[1], 25);
    EXPECT_EQ(p[2], 35);
    EXPECT_EQ(p[3], 45);
}

TEST(UnfilterTest, UpAddsPreviousRow) {
    std::vector<std::uint8_t> lines = {0, 10, 20, 30, 40,  //
                                       2, 1, 2, 3, 4};
    const auto grid = unfilterScanlines(lines, 1, 2);
    const std::uint8_t* p = grid.pixel(0, 1);
    EXPECT_EQ(p[0], 11);
    EXPECT_EQ(p[1], 22);
    EXPECT_EQ(p[2], 33);
    EXPECT_EQ(p[3], 44);
}

TEST(UnfilterTest, AverageUsesFlooredMean) {
    std::vector<std::uint8_t> lines = {0, 10, 20, 30, 40,  //
                                       3, 1, 1, 1, 1};
    const auto grid = unfilterScanlines(lines, 1, 2);
    const std::uint8_t* p = grid.pixel(0, 1);
    EXPECT_EQ(p[0], 6);
    EXPECT_EQ(p[1], 11);
    EXPECT_EQ(p[2], 16);
    EXPECT_EQ(p[3], 21);
}

TEST(UnfilterTest, PaethPicksNearestNeighbour) {
    // Row 0: pixels 20, 30. Row 1 (Paeth): first pixel predicts "up" (20),
    // second pixel has left=100, up=30, upLeft=20 and predicts left.
    std::vector<std::uint8_t> lines = {0, 20, 20, 20, 20, 30, 30, 30, 30,  //
                                       4, 80, 80, 80, 80, 7, 7, 7, 7};
    const auto grid = unfilterScanlines(lines, 2, 2);
    EXPECT_EQ(grid.pixel(0, 1)[0], 100);
    EXPECT_EQ(grid.pixel(1, 1)[0], 107);
    EXPECT_EQ(grid.pixel(1, 1)[3], 107);
}

TEST(UnfilterTest, UnknownFilterIsRejected) {
    std::vector<std::uint8_t> lines = {9, 0, 0, 0, 0};
    EXPECT_THROW((void)unfilterScanlines(lines, 1, 1), FormatError);
}

TEST(UnfilterTest, WrongSizeIsRejected) {
    std::vector<std::uint8_t> lines = {0, 0, 0, 0};
    EXPECT_THROW((void)unfilterScanlines(lines, 1, 1), FormatError);
}

// =============================================================================
// Stream Validation
// =============================================================================

TEST(PngReaderTest, DecodesFilteredStream) {
    std::vector<std::uint8_t> lines = {1, 10, 20, 30, 255, 5, 5, 5, 0};
    PngReader reader(buildPng(rgbaHeader(2, 1), lines));
    reader.open();

    ASSERT_EQ(reader.chunks().size(), 3U);
    EXPECT_EQ(reader.chunks()[0].type, "IHDR");
    EXPECT_EQ(reader.chunks()[1].type, "IDAT");
    EXPECT_EQ(reader.chunks()[2].type, "IEND");
    EXPECT_EQ(reader.corruptChunkCount(), 0U);

    const auto grid = reader.decode();
    EXPECT_EQ(grid.pixel(1, 0)[0], 15);
    EXPECT_EQ(grid.pixel(1, 0)[3], 255);
}

TEST(PngReaderTest, MultipleIdatChunksAreConcatenated) {
    std::vector<std::uint8_t> lines = {0, 1, 2, 3, 4, 0, 5, 6, 7, 8};
    const auto compressed = zlibCompress(lines);
    const std::size_t half = compressed.size() / 2;

    std::vector<std::uint8_t> png(kPngSignature.begin(), kPngSignature.end());
    PngEncoder::appendChunk(png, kChunkIhdr, rgbaHeader(1, 2).serialize());
    PngEncoder::appendChunk(png, kChunkIdat,
                            std::span<const std::uint8_t>(compressed).first(half));
    PngEncoder::appendChunk(png, kChunkIdat,
                            std::span<const std::uint8_t>(compressed).subspan(half));
    PngEncoder::appendChunk(png, kChunkIend, {});

    PngReader reader(png);
    reader.open();
    const auto grid = reader.decode();
    EXPECT_EQ(grid.pixel(0, 1)[0], 5);
    EXPECT_EQ(grid.pixel(0, 1)[3], 8);
}

TEST(PngReaderTest, MissingSignature) {
    auto png = buildPng(rgbaHeader(1, 1), {0, 0, 0, 0, 0});
    png[1] = 'X';
    PngReader reader(png);
    EXPECT_THROW(reader.open(), FormatError);
    EXPECT_FALSE(reader.isOpen());
}

TEST(PngReaderTest, TrailingBytesAfterIend) {
    auto png = buildPng(rgbaHeader(1, 1), {0, 0, 0, 0, 0});
    png.push_back(0);
    PngReader reader(png);
    EXPECT_THROW(reader.open(), FormatError);
}

TEST(PngReaderTest, MissingIend) {
    auto png = buildPng(rgbaHeader(1, 1), {0, 0, 0, 0, 0});
    png.resize(png.size() - 12);
    PngReader reader(png);
    EXPECT_THROW(reader.open(), FormatError);
}

TEST(PngReaderTest, FirstChunkMustBeIhdr) {
    std::vector<std::uint8_t> png(kPngSignature.begin(), kPngSignature.end());
    PngEncoder::appendChunk(png, kChunkIdat, zlibCompress(std::vector<std::uint8_t>{0}));
    PngEncoder::appendChunk(png, kChunkIend, {});
    PngReader reader(png);
    EXPECT_THROW(reader.open(), FormatError);
}

TEST(PngReaderTest, ChecksumModes) {
    auto png = buildPng(rgbaHeader(1, 1), {0, 9, 9, 9, 255});
    // Last byte of the IHDR CRC.
    png[8 + 4 + 4 + 13 + 3] ^= 0x01;

    PngReader strict(png);
    EXPECT_THROW(strict.open(), ChecksumError);

    PngReader lenient(png);
    lenient.open(false);
    EXPECT_TRUE(lenient.isOpen());
    EXPECT_EQ(lenient.corruptChunkCount(), 1U);
    EXPECT_FALSE(lenient.chunks()[0].crcValid());
}

TEST(PngReaderTest, DecodeRequiresOpen) {
    PngReader reader(buildPng(rgbaHeader(1, 1), {0, 0, 0, 0, 0}));
    EXPECT_THROW((void)reader.decode(), FormatError);
}

TEST(PngReaderTest, OtherLayoutsAreNotDecoded) {
    ImageHeader rgb = rgbaHeader(1, 1);
    rgb.colorType = 2;
    PngReader reader(buildPng(rgb, {0, 1, 2, 3}));
    reader.open();
    EXPECT_FALSE(reader.header().isRgba8());
    EXPECT_THROW((void)reader.decode(), FormatError);
}

TEST(PngReaderTest, ShortImageDataIsRejected) {
    PngReader reader(buildPng(rgbaHeader(2, 2), {0, 0, 0, 0, 0}));
    reader.open();
    EXPECT_THROW((void)reader.inflateScanlines(), FormatError);
}

TEST(PngReaderTest, LongImageDataIsRejected) {
    PngReader reader(buildPng(rgbaHeader(1, 1), std::vector<std::uint8_t>(4096, 0)));
    reader.open();
    EXPECT_THROW((void)reader.inflateScanlines(), FormatError);
}

TEST(PngReaderTest, OversizedHeaderFailsDecodeWithoutAllocating) {
    // 68-byte file whose IHDR (with a valid CRC) claims 30000 x 30000 pixels.
    const auto png = buildPng(rgbaHeader(30000, 30000), {0, 0, 0, 0, 0});
    PngReader reader(png);
    reader.open();
    EXPECT_EQ(reader.header().width, 30000U);
    EXPECT_THROW((void)reader.inflateScanlines(), FormatError);
    EXPECT_THROW((void)reader.decode(), FormatError);
}

TEST(PngReaderTest, DimensionsAboveLimitOnOneSide) {
    PngReader reader(buildPng(rgbaHeader(kMaxImageDimension + 1, 1), {0, 0, 0, 0, 0}));
    reader.open();
    EXPECT_THROW((void)reader.decode(), FormatError);
}

TEST(PngReaderTest, HeaderDimensionsAboveFormatRangeAreRejected) {
    PngReader reader(buildPng(rgbaHeader(0x80000000U, 1), {0, 0, 0, 0, 0}));
    EXPECT_THROW(reader.open(), FormatError);
}

TEST(PngReaderTest, MissingFileIsIoError) {
    const auto path = std::filesystem::temp_directory_path() / "wfg-no-such-image.png";
    std::filesystem::remove(path);
    EXPECT_THROW((void)PngReader::fromFile(path), IOError);
}

}  // namespace
}  // namespace wfg::format
