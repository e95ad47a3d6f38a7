// =============================================================================
// wfgen - Waveform Rasterizer
// =============================================================================
// Draws an amplitude series as vertically centered bars on a transparent
// RGBA8 grid.
//
// Geometry:
//   barWidth  = max(1, floor(W / N) - 1), followed by a 1 px gap
//   centerY   = floor(H / 2)
//   barHeight = max(2, floor(a * (H - 4))), half = floor(barHeight / 2)
//   rows centerY - half .. centerY + half are filled (inclusive, clipped)
//
// Bars are left-packed from x = 0; columns at x >= W are dropped.
// =============================================================================

#ifndef WFG_RENDER_WAVEFORM_RASTERIZER_H
#define WFG_RENDER_WAVEFORM_RASTERIZER_H

#include <cstdint>
#include <span>

#include "wfg/common/types.h"

namespace wfg::render {

/// @brief Minimum drawn bar height in pixels.
inline constexpr std::uint32_t kMinBarHeight = 2;

/// @brief Vertical padding subtracted from the image height.
inline constexpr std::uint32_t kVerticalPadding = 4;

/// @brief Gap between adjacent bars in pixels.
inline constexpr std::uint32_t kBarGap = 1;

/// @brief Width of each bar for a given image width and bar count.
[[nodiscard]] std::uint32_t barWidthFor(std::uint32_t width, std::size_t count) noexcept;

/// @brief Height of a bar for an amplitude, before clipping.
[[nodiscard]] std::uint32_t barHeightFor(float amplitude, std::uint32_t height) noexcept;

/// @brief Render samples into a width x height grid.
/// @param samples Amplitudes in [0, 1]; values outside are clamped.
/// @param width Grid width (> 0).
/// @param height Grid height (> 0).
/// @param color Bar fill color.
/// @throws UsageError if samples is empty or a dimension is 0.
[[nodiscard]] PixelGrid rasterizeWaveform(std::span<const float> samples, std::uint32_t width,
                                          std::uint32_t height,
                                          Rgb color = kDefaultWaveformColor);

}  // namespace wfg::render

#endif  // WFG_RENDER_WAVEFORM_RASTERIZER_H
