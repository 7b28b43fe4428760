#pragma once
#include <cstdint>
#include <optional>

namespace adsb::msg {

// Decode a 12-bit airborne altitude code (AC12) in feet. Q=1 gives 25 ft
// steps from -1000 ft; Q=0 is Gillham coded in 100 ft steps. nullopt for
// the all-zero "no altitude" code and for invalid Gillham patterns.
std::optional<double> decode_ac12(uint32_t ac12);

// Gillham (Mode C) altitude in units of 100 ft from the 13-bit identity
// layout C1 A1 C2 A2 C4 A4 M B1 D1 B2 D2 B4 D4.
std::optional<int> gillham_to_hundreds(uint32_t id13);

// Q=1 encoding of an altitude in feet; nullopt outside -1000..50175 ft.
std::optional<uint32_t> encode_ac12(double feet);

} // namespace adsb::msg
