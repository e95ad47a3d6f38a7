// =============================================================================
// wfgen - Waveform Rasterizer Property Tests
// =============================================================================
// Exact bar geometry on small grids, plus properties:
// - every pixel is either transparent black or the opaque bar color
// - every drawn bar is vertically symmetric about centerY
// - nothing is drawn in the 1 px gap columns
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <vector>

#include "wfg/common/error.h"
#include "wfg/common/types.h"
#include "wfg/render/waveform_rasterizer.h"

namespace wfg::render::test {

namespace {

[[nodiscard]] bool isBar(const PixelGrid& grid, std::uint32_t x, std::uint32_t y, Rgb color) {
    const std::uint8_t* p = grid.pixel(x, y);
    return p[0] == color.r && p[1] == color.g && p[2] == color.b && p[3] == kOpaque;
}

[[nodiscard]] bool isClear(const PixelGrid& grid, std::uint32_t x, std::uint32_t y) {
    const std::uint8_t* p = grid.pixel(x, y);
    return p[0] == 0 && p[1] == 0 && p[2] == 0 && p[3] == 0;
}

}  // namespace

// =============================================================================
// Geometry
// =============================================================================

TEST(WaveformRasterizerTest, BarWidthLeavesOnePixelGap) {
    EXPECT_EQ(barWidthFor(300, 150), 1U);
    EXPECT_EQ(barWidthFor(9, 3), 2U);
    EXPECT_EQ(barWidthFor(300, 10), 29U);
    EXPECT_EQ(barWidthFor(5, 10), 1U);
}

TEST(WaveformRasterizerTest, BarHeightHasFloorAndPadding) {
    EXPECT_EQ(barHeightFor(1.0F, 60), 56U);
    EXPECT_EQ(barHeightFor(0.5F, 60), 28U);
    EXPECT_EQ(barHeightFor(0.0F, 60), kMinBarHeight);
    EXPECT_EQ(barHeightFor(1.0F, 3), kMinBarHeight);
    EXPECT_EQ(barHeightFor(2.5F, 10), 6U);
    EXPECT_EQ(barHeightFor(-1.0F, 10), kMinBarHeight);
    EXPECT_EQ(barHeightFor(std::numeric_limits<float>::quiet_NaN(), 10), kMinBarHeight);
}

TEST(WaveformRasterizerTest, SmallGridExactPixels) {
    const std::vector<float> samples = {1.0F, 0.5F, 0.0F};
    const auto grid = rasterizeWaveform(samples, 9, 10);

    ASSERT_EQ(grid.width(), 9U);
    ASSERT_EQ(grid.height(), 10U);

    // {columns, first row, last row} for each bar
    struct Bar {
        std::uint32_t x0;
        std::uint32_t x1;
        std::uint32_t top;
        std::uint32_t bottom;
    };
    const Bar bars[] = {{0, 1, 2, 8}, {3, 4, 4, 6}, {6, 7, 4, 6}};

    for (std::uint32_t y = 0; y < 10; ++y) {
        for (std::uint32_t x = 0; x < 9; ++x) {
            bool expected = false;
            for (const auto& bar : bars) {
                expected = expected ||
                           (x >= bar.x0 && x <= bar.x1 && y >= bar.top && y <= bar.bottom);
            }
            if (expected) {
                EXPECT_TRUE(isBar(grid, x, y, kDefaultWaveformColor)) << x << "," << y;
            } else {
                EXPECT_TRUE(isClear(grid, x, y)) << x << "," << y;
            }
        }
    }
}

TEST(WaveformRasterizerTest, DefaultGeometry) {
    const std::vector<float> samples(kDefaultWaveformSamples, 1.0F);
    const auto grid = rasterizeWaveform(samples, kDefaultWaveformWidth, kDefaultWaveformHeight);

    // Bars at even columns, gaps at odd columns; rows 2..58 filled.
    EXPECT_TRUE(isBar(grid, 0, 30, kDefaultWaveformColor));
    EXPECT_TRUE(isClear(grid, 1, 30));
    EXPECT_TRUE(isBar(grid, 298, 2, kDefaultWaveformColor));
    EXPECT_TRUE(isBar(grid, 298, 58, kDefaultWaveformColor));
    EXPECT_TRUE(isClear(grid, 298, 1));
    EXPECT_TRUE(isClear(grid, 298, 59));
    EXPECT_TRUE(isClear(grid, 299, 30));
}

TEST(WaveformRasterizerTest, ShortImageUsesMinimumHeight) {
    const std::vector<float> samples = {1.0F};
    const auto grid = rasterizeWaveform(samples, 4, 3);

    // centerY 1, half 1: rows 0..2 at columns 0..2.
    for (std::uint32_t y = 0; y < 3; ++y) {
        EXPECT_TRUE(isBar(grid, 0, y, kDefaultWaveformColor));
        EXPECT_TRUE(isBar(grid, 2, y, kDefaultWaveformColor));
        EXPECT_TRUE(isClear(grid, 3, y));
    }
}

TEST(WaveformRasterizerTest, SinglePixelRowIsClipped) {
    const std::vector<float> samples = {0.8F};
    const auto grid = rasterizeWaveform(samples, 1, 1);
    EXPECT_TRUE(isBar(grid, 0, 0, kDefaultWaveformColor));
}

TEST(WaveformRasterizerTest, BarsBeyondWidthAreDropped) {
    const std::vector<float> samples(10, 1.0F);
    const auto grid = rasterizeWaveform(samples, 5, 10);

    for (std::uint32_t x = 0; x < 5; ++x) {
        const bool barColumn = (x % 2) == 0;
        EXPECT_EQ(grid.alpha(x, 5) == kOpaque, barColumn) << x;
    }
}

TEST(WaveformRasterizerTest, CustomColor) {
    const Rgb color{1, 2, 3};
    const std::vector<float> samples = {0.5F};
    const auto grid = rasterizeWaveform(samples, 4, 10, color);
    EXPECT_TRUE(isBar(grid, 0, 5, color));
}

TEST(WaveformRasterizerTest, InvalidInputIsRejected) {
    const std::vector<float> samples = {0.5F};
    EXPECT_THROW((void)rasterizeWaveform({}, 10, 10), UsageError);
    EXPECT_THROW((void)rasterizeWaveform(samples, 0, 10), UsageError);
    EXPECT_THROW((void)rasterizeWaveform(samples, 10, 0), UsageError);
}

// =============================================================================
// Property Tests
// =============================================================================

RC_GTEST_PROP(WaveformRasterizerProperty, PixelsAreClearOrBarColor, ()) {
    const auto samples = *rc::gen::nonEmpty(rc::gen::container<std::vector<float>>(
        rc::gen::map(rc::gen::inRange(0, 1001), [](int v) { return v / 1000.0F; })));
    const auto width = *rc::gen::inRange<std::uint32_t>(1, 200);
    const auto height = *rc::gen::inRange<std::uint32_t>(1, 80);

    const auto grid = rasterizeWaveform(samples, width, height);
    RC_ASSERT(grid.width() == width);
    RC_ASSERT(grid.height() == height);

    for (std::uint32_t y = 0; y < height; ++y) {
        for (std::uint32_t x = 0; x < width; ++x) {
            RC_ASSERT(isClear(grid, x, y) || isBar(grid, x, y, kDefaultWaveformColor));
        }
    }
}

RC_GTEST_PROP(WaveformRasterizerProperty, BarsAreCenteredAndGapsEmpty, ()) {
    const auto samples = *rc::gen::nonEmpty(rc::gen::container<std::vector<float>>(
        rc::gen::map(rc::gen::inRange(0, 1001), [](int v) { return v / 1000.0F; })));
    const auto width = *rc::gen::inRange<std::uint32_t>(1, 200);
    const auto height = *rc::gen::inRange<std::uint32_t>(5, 80);

    const auto grid = rasterizeWaveform(samples, width, height);
    const std::uint32_t barWidth = barWidthFor(width, samples.size());
    const std::uint32_t step = barWidth + kBarGap;
    const std::uint32_t centerY = height / 2;

    for (std::size_t i = 0; i < samples.size(); ++i) {
        const std::uint64_t x0 = i * step;
        if (x0 >= width) {
            break;
        }
        const auto x = static_cast<std::uint32_t>(x0);
        const std::uint32_t half = barHeightFor(samples[i], height) / 2;

        RC_ASSERT(grid.alpha(x, centerY) == kOpaque);
        for (std::uint32_t d = 0; d <= half; ++d) {
            if (centerY + d < height) {
                RC_ASSERT(grid.alpha(x, centerY + d) == kOpaque);
            }
            if (d <= centerY) {
                RC_ASSERT(grid.alpha(x, centerY - d) == kOpaque);
            }
        }
        if (x0 + barWidth < width) {
            for (std::uint32_t y = 0; y < height; ++y) {
                RC_ASSERT(grid.alpha(x + barWidth, y) == 0);
            }
        }
    }
}

}  // namespace wfg::render::test
