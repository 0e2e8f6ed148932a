//! # Fingerprints
//!
//! 128-bit fingerprints over canonical strings. The specialization cache uses
//! them to derive stable, collision-resistant symbol names for compiled
//! artifacts (`add` + `i4(i4, i4)` -> `__autojit_add_3f1c...`).
//!
//! Uses CRC32C from `common/crc32c.hpp`.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace autojit {

/// 128-bit fingerprint.
struct Fingerprint {
    uint64_t high = 0;
    uint64_t low = 0;

    bool operator==(const Fingerprint& other) const = default;

    [[nodiscard]] bool is_zero() const {
        return high == 0 && low == 0;
    }

    /// Returns a 32-character lowercase hex string.
    [[nodiscard]] std::string to_hex() const;
};

/// Compute a fingerprint from raw bytes. Empty input yields the zero fingerprint.
[[nodiscard]] Fingerprint fingerprint_bytes(const void* data, size_t len);

[[nodiscard]] Fingerprint fingerprint_string(std::string_view str);

} // namespace autojit
