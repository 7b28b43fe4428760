#pragma once
#include <cstdint>
#include <optional>
#include <utility>

#include "adsb/msg/message.hpp"

namespace adsb::msg {

inline constexpr double kCprScale = 131072.0;  // 2^17

struct CprFrame {
    uint32_t lat{0};
    uint32_t lon{0};
    double time{0.0};
};

struct Position {
    double latitude{0.0};
    double longitude{0.0};
};

// Number of longitude zones at a latitude (1..59).
int cpr_nl(double lat);

// Airborne global decode of an even/odd pair. `newest` selects which frame
// fixes the final zone. nullopt when the two latitudes fall in different
// NL zones or the latitude is out of range.
std::optional<Position> cpr_decode_global(const CprFrame& even, const CprFrame& odd, CprFormat newest);

// Airborne 17-bit encoding of a position: {lat_cpr, lon_cpr}.
std::pair<uint32_t, uint32_t> cpr_encode(double lat, double lon, CprFormat fmt);

} // namespace adsb::msg
