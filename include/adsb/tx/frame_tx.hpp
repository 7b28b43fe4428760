#pragma once
#include <complex>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "adsb/msg/message.hpp"

namespace adsb::tx {

// 56-bit ME field of an airborne position squitter (TC 9..18).
struct AirbornePosition {
    uint8_t tc{11};
    uint8_t surveillance_status{0};
    bool single_antenna{false};
    uint32_t altitude_code{0};   // AC12
    bool utc_synchronized{false};
    msg::CprFormat format{msg::CprFormat::Even};
    uint32_t lat_cpr{0};
    uint32_t lon_cpr{0};
};

std::vector<uint8_t> encode_me(const AirbornePosition& pos);

// Identification ME (TC 1..4). Callsign is padded with spaces to 8
// characters; characters outside A-Z, 0-9 and space are rejected.
std::optional<std::vector<uint8_t>> encode_identification_me(uint8_t tc, uint8_t category,
                                                             std::string_view callsign);

// DF/CA/AA + ME + parity. `me` must hold 56 bits for DF 17/18; the result
// is 112 bits with a valid parity field.
std::vector<uint8_t> make_extended_squitter(uint8_t df, uint8_t ca, uint32_t icao,
                                            const std::vector<uint8_t>& me);

// DF11 all-call reply with interrogator code 0: 56 bits.
std::vector<uint8_t> make_all_call_reply(uint8_t ca, uint32_t icao);

// PPM baseband: 8 us preamble followed by the bits, `samples_per_chip`
// samples per 0.5 us chip, real-valued pulses of the given amplitude.
std::vector<std::complex<float>> modulate(const std::vector<uint8_t>& bits, unsigned samples_per_chip,
                                          float amplitude = 1.0f);

} // namespace adsb::tx
