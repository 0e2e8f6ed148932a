#include "common/fingerprint.hpp"

#include "common/crc32c.hpp"

namespace autojit {

std::string Fingerprint::to_hex() const {
    static constexpr char HEX[] = "0123456789abcdef";
    std::string out(32, '0');
    const uint64_t halves[2] = {high, low};
    for (int h = 0; h < 2; ++h) {
        uint64_t val = halves[h];
        for (int i = 15; i >= 0; --i) {
            out[static_cast<size_t>(h * 16 + i)] = HEX[val & 0xF];
            val >>= 4;
        }
    }
    return out;
}

Fingerprint fingerprint_bytes(const void* data, size_t len) {
    if (!data || len == 0) {
        return {};
    }

    const auto* bytes = static_cast<const uint8_t*>(data);
    size_t half = len / 2;

    // High word: CRC of the first half, tagged with the length.
    uint32_t crc_high = crc32c(bytes, half > 0 ? half : len);
    uint64_t hi = (static_cast<uint64_t>(crc_high) << 32) | static_cast<uint64_t>(len & 0xFFFFFFFFu);

    // Low word: CRC of the second half chained onto the first, salted.
    static constexpr uint32_t SALT = 0x9E3779B9;
    uint32_t crc_low = crc32c_update(crc_high, bytes + half, len - half);
    uint64_t lo = (static_cast<uint64_t>(crc_low) << 32) |
                  static_cast<uint64_t>(SALT ^ static_cast<uint32_t>(len >> 1));

    return {hi, lo};
}

Fingerprint fingerprint_string(std::string_view str) {
    return fingerprint_bytes(str.data(), str.size());
}

} // namespace autojit
