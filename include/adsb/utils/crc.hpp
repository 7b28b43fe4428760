#pragma once
#include <cstddef>
#include <cstdint>
#include <utility>

#include "adsb/constants.hpp"

namespace adsb::utils {

// Mode-S CRC-24. Bits are stored one per byte, MSB first, as produced by
// the demodulator. Each call starts from a zero register.
struct ModeSCrc {
    uint32_t poly = MODES_CRC_POLY;

    // Parity over `nbits` data bits.
    uint32_t compute(const uint8_t* bits, size_t nbits) const;

    // Remainder over a whole message (data followed by 24 parity bits).
    // Zero for an intact message with an unmodified parity field.
    uint32_t remainder(const uint8_t* bits, size_t nbits) const;

    // {ok, computed parity} for a message whose last 24 bits are the parity.
    std::pair<bool, uint32_t> verify_with_parity(const uint8_t* bits, size_t nbits) const;

    // Overwrite the last 24 bits of an nbits message with its parity.
    void write_parity(uint8_t* bits, size_t nbits) const;
};

} // namespace adsb::utils
