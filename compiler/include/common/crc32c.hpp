//! # CRC32C Hash Utility
//!
//! CRC32C (Castagnoli polynomial, reflected form 0x82F63B78). Used to
//! fingerprint canonical signature strings for symbol mangling.
//!
//! ```cpp
//! uint32_t h = autojit::crc32c(text.data(), text.size());
//! ```

#ifndef AUTOJIT_COMMON_CRC32C_HPP
#define AUTOJIT_COMMON_CRC32C_HPP

#include <array>
#include <cstddef>
#include <cstdint>

namespace autojit {

namespace detail {

inline constexpr uint32_t CRC32C_POLY = 0x82F63B78u;

constexpr auto make_crc32c_table() -> std::array<uint32_t, 256> {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int bit = 0; bit < 8; ++bit) {
            crc = (crc & 1u) ? (crc >> 1) ^ CRC32C_POLY : crc >> 1;
        }
        table[i] = crc;
    }
    return table;
}

inline constexpr std::array<uint32_t, 256> CRC32C_TABLE = make_crc32c_table();

} // namespace detail

/// Continues a CRC32C computation over `len` more bytes.
[[nodiscard]] inline uint32_t crc32c_update(uint32_t crc, const void* data, size_t len) noexcept {
    const auto* bytes = static_cast<const uint8_t*>(data);
    crc = ~crc;
    for (size_t i = 0; i < len; ++i) {
        crc = detail::CRC32C_TABLE[(crc ^ bytes[i]) & 0xFFu] ^ (crc >> 8);
    }
    return ~crc;
}

/// Computes the CRC32C of a byte range.
[[nodiscard]] inline uint32_t crc32c(const void* data, size_t len) noexcept {
    return crc32c_update(0, data, len);
}

} // namespace autojit

#endif // AUTOJIT_COMMON_CRC32C_HPP
