#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace adsb::utils {

// MSB-first value of n (<= 32) one-per-byte bits.
inline uint32_t bits_to_uint(const uint8_t* bits, size_t n) {
    uint32_t v = 0;
    for (size_t i = 0; i < n; ++i)
        v = (v << 1) | (bits[i] & 1u);
    return v;
}

inline void uint_to_bits(uint32_t v, size_t n, uint8_t* out) {
    for (size_t i = 0; i < n; ++i)
        out[i] = static_cast<uint8_t>((v >> (n - 1 - i)) & 1u);
}

// Uppercase hex, four bits per character. nbits must be a multiple of 4.
std::string bits_to_hex(const uint8_t* bits, size_t nbits);

// Parse a hex string into bits; nullopt on any non-hex character.
std::optional<std::vector<uint8_t>> hex_to_bits(std::string_view hex);

} // namespace adsb::utils
