// =============================================================================
// wfgen - zlib Deflate Wrapper
// =============================================================================
// Thin wrapper over zlib producing and consuming zlib-format (RFC 1950)
// deflate streams, as carried by PNG IDAT chunks.
//
// - zlibCompress: one-shot compression at a chosen level (default 9)
// - zlibDecompress: streaming inflate of a complete zlib stream
// =============================================================================

#ifndef WFG_FORMAT_DEFLATE_H
#define WFG_FORMAT_DEFLATE_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace wfg::format {

/// @brief Maximum zlib compression level.
inline constexpr int kMaxDeflateLevel = 9;

/// @brief Compress bytes into a zlib stream.
/// @param data Raw input.
/// @param level zlib level (0-9).
/// @return Compressed stream.
/// @throws FormatError if zlib reports an error.
[[nodiscard]] std::vector<std::uint8_t> zlibCompress(std::span<const std::uint8_t> data,
                                                     int level = kMaxDeflateLevel);

/// @brief Largest up-front output reservation; past it the buffer grows as
/// inflate produces data.
inline constexpr std::size_t kMaxInflateReserve = 4 * 1024 * 1024;

/// @brief Inflate a complete zlib stream.
/// @param data Compressed stream.
/// @param sizeHint Expected output size, used to pre-size the buffer (capped
///        at kMaxInflateReserve).
/// @param maxOutput Output limit in bytes, 0 for none.
/// @return Decompressed bytes.
/// @throws FormatError if the stream is corrupt, truncated, or inflates past
///         maxOutput.
[[nodiscard]] std::vector<std::uint8_t> zlibDecompress(std::span<const std::uint8_t> data,
                                                       std::size_t sizeHint = 0,
                                                       std::size_t maxOutput = 0);

}  // namespace wfg::format

#endif  // WFG_FORMAT_DEFLATE_H
