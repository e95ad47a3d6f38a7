// =============================================================================
// wfgen - CRC-32 Implementation
// =============================================================================

#include "wfg/format/crc32.h"

namespace wfg::format {

namespace {

constexpr Crc32Table buildCrc32Table() noexcept {
    Crc32Table table{};
    for (std::uint32_t n = 0; n < 256; ++n) {
        std::uint32_t c = n;
        for (int k = 0; k < 8; ++k) {
            c = (c & 1U) != 0 ? kCrc32Polynomial ^ (c >> 1) : c >> 1;
        }
        table[n] = c;
    }
    return table;
}

}  // namespace

const Crc32Table& crc32Table() noexcept {
    static const Crc32Table table = buildCrc32Table();
    return table;
}

void Crc32::update(std::span<const std::uint8_t> data) noexcept {
    std::uint32_t c = state_;
    for (std::uint8_t byte : data) {
        c = table_[(c ^ byte) & 0xFFU] ^ (c >> 8);
    }
    state_ = c;
}

void Crc32::update(std::string_view text) noexcept {
    std::uint32_t c = state_;
    for (char ch : text) {
        c = table_[(c ^ static_cast<std::uint8_t>(ch)) & 0xFFU] ^ (c >> 8);
    }
    state_ = c;
}

std::uint32_t crc32(std::span<const std::uint8_t> data) noexcept {
    Crc32 acc;
    acc.update(data);
    return acc.value();
}

std::uint32_t crc32(std::string_view text) noexcept {
    Crc32 acc;
    acc.update(text);
    return acc.value();
}

}  // namespace wfg::format
