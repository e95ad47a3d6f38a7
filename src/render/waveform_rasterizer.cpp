// =============================================================================
// wfgen - Waveform Rasterizer Implementation
// =============================================================================

#include "wfg/render/waveform_rasterizer.h"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

#include "wfg/common/error.h"
#include "wfg/common/logger.h"

namespace wfg::render {

std::uint32_t barWidthFor(std::uint32_t width, std::size_t count) noexcept {
    if (count == 0) {
        return 1;
    }
    const auto perBar = static_cast<std::uint32_t>(width / count);
    return perBar > 1 ? perBar - 1 : 1;
}

std::uint32_t barHeightFor(float amplitude, std::uint32_t height) noexcept {
    const float a = std::isnan(amplitude) ? 0.0F : std::clamp(amplitude, 0.0F, 1.0F);
    const std::uint32_t usable = height > kVerticalPadding ? height - kVerticalPadding : 0;
    const auto scaled = static_cast<std::uint32_t>(std::floor(a * static_cast<float>(usable)));
    return std::max(kMinBarHeight, scaled);
}

PixelGrid rasterizeWaveform(std::span<const float> samples, std::uint32_t width,
                            std::uint32_t height, Rgb color) {
    if (samples.empty()) {
        throw UsageError("Cannot rasterize an empty amplitude series");
    }
    if (width == 0 || height == 0) {
        throw UsageError(fmt::format("Invalid waveform dimensions {}x{}", width, height));
    }

    PixelGrid grid(width, height);

    const std::uint32_t barWidth = barWidthFor(width, samples.size());
    const std::uint64_t step = static_cast<std::uint64_t>(barWidth) + kBarGap;
    const std::int64_t centerY = height / 2;

    for (std::size_t i = 0; i < samples.size(); ++i) {
        const std::uint64_t x0 = i * step;
        if (x0 >= width) {
            break;
        }
        const auto x1 = static_cast<std::uint32_t>(std::min<std::uint64_t>(x0 + barWidth, width));

        const std::int64_t half = barHeightFor(samples[i], height) / 2;
        const std::int64_t top = std::max<std::int64_t>(0, centerY - half);
        const std::int64_t bottom = std::min<std::int64_t>(height - 1, centerY + half);

        for (auto y = static_cast<std::uint32_t>(top); y <= bottom; ++y) {
            for (auto x = static_cast<std::uint32_t>(x0); x < x1; ++x) {
                grid.setOpaque(x, y, color);
            }
        }
    }

    WFG_LOG_TRACE("Rasterized {} bars of width {} into {}x{}", samples.size(), barWidth, width,
                  height);
    return grid;
}

}  // namespace wfg::render
