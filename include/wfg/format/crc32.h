// =============================================================================
// wfgen - CRC-32
// =============================================================================
// Table-driven CRC-32 as used by PNG chunk framing (ISO 3309 / ITU-T V.42):
// reflected polynomial 0xEDB88320, initial value 0xFFFFFFFF, final XOR
// 0xFFFFFFFF.
//
// The 256-entry lookup table is built once on first use and shared
// read-only by every caller; concurrent use needs no locking.
//
// Usage:
//   std::uint32_t crc = wfg::format::crc32(bytes);
//
//   wfg::format::Crc32 acc;
//   acc.update(type);
//   acc.update(payload);
//   std::uint32_t chunkCrc = acc.value();
// =============================================================================

#ifndef WFG_FORMAT_CRC32_H
#define WFG_FORMAT_CRC32_H

#include <array>
#include <cstdint>
#include <span>
#include <string_view>

namespace wfg::format {

/// @brief Reflected CRC-32 polynomial.
inline constexpr std::uint32_t kCrc32Polynomial = 0xEDB88320U;

/// @brief Initial register value and final XOR mask.
inline constexpr std::uint32_t kCrc32Init = 0xFFFFFFFFU;

/// @brief CRC-32 lookup table type, one entry per input byte value.
using Crc32Table = std::array<std::uint32_t, 256>;

/// @brief Get the process-wide CRC-32 lookup table.
/// @note Built on first call; immutable afterwards.
[[nodiscard]] const Crc32Table& crc32Table() noexcept;

/// @brief Incremental CRC-32 accumulator.
class Crc32 {
public:
    Crc32() noexcept : table_(crc32Table()) {}

    /// @brief Feed bytes into the checksum.
    void update(std::span<const std::uint8_t> data) noexcept;

    /// @brief Feed ASCII characters into the checksum.
    void update(std::string_view text) noexcept;

    /// @brief Final checksum of everything fed so far.
    [[nodiscard]] std::uint32_t value() const noexcept { return state_ ^ kCrc32Init; }

    /// @brief Restart from the initial state.
    void reset() noexcept { state_ = kCrc32Init; }

private:
    const Crc32Table& table_;
    std::uint32_t state_ = kCrc32Init;
};

/// @brief One-shot CRC-32 of a byte sequence.
/// @note crc32({}) == 0.
[[nodiscard]] std::uint32_t crc32(std::span<const std::uint8_t> data) noexcept;

/// @brief One-shot CRC-32 of ASCII text.
[[nodiscard]] std::uint32_t crc32(std::string_view text) noexcept;

}  // namespace wfg::format

#endif  // WFG_FORMAT_CRC32_H
