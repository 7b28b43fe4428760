#pragma once
#include <array>
#include <cstddef>
#include <cstdint>

namespace adsb {

// Mode-S PPM: 1 Mbit/s, two chips per bit.
inline constexpr double MODES_BIT_RATE  = 1.0e6;
inline constexpr double MODES_CHIP_RATE = 2.0e6;

inline constexpr double MODES_PREAMBLE_US = 8.0;
inline constexpr double MODES_LONG_DATA_US = 112.0;

inline constexpr std::size_t MODES_LONG_BITS  = 112;
inline constexpr std::size_t MODES_SHORT_BITS = 56;
inline constexpr std::size_t MODES_PARITY_BITS = 24;

// Preamble chips: pulses at 0, 1.0, 3.5 and 4.5 us.
inline constexpr std::size_t MODES_SYNC_CHIPS = 16;
inline constexpr std::array<uint8_t, MODES_SYNC_CHIPS> MODES_SYNC_SEQUENCE = {
    1, 0, 1, 0, 0, 0, 0, 1, 0, 1, 0, 0, 0, 0, 0, 0};

// Generator 0x1FFF409 (25 bits); the leading term is implicit.
inline constexpr uint32_t MODES_CRC_POLY = 0xFFF409u;

// Downlink formats this receiver knows about.
inline constexpr uint8_t DF_SHORT_AIR_SURVEILLANCE = 0;
inline constexpr uint8_t DF_SURVEILLANCE_ALT       = 4;
inline constexpr uint8_t DF_SURVEILLANCE_ID        = 5;
inline constexpr uint8_t DF_ALL_CALL_REPLY         = 11;
inline constexpr uint8_t DF_EXTENDED_SQUITTER      = 17;
inline constexpr uint8_t DF_EXTENDED_SQUITTER_NT   = 18;

} // namespace adsb
