#include "adsb/tx/frame_tx.hpp"
#include "adsb/constants.hpp"
#include "adsb/utils/bits.hpp"
#include "adsb/utils/crc.hpp"

#include <algorithm>

namespace adsb::tx {

using utils::uint_to_bits;

namespace {

int callsign_code(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A' + 1;
    if (c >= 'a' && c <= 'z') return c - 'a' + 1;
    if (c >= '0' && c <= '9') return c - '0' + 48;
    if (c == ' ') return 32;
    return -1;
}

} // namespace

std::vector<uint8_t> encode_me(const AirbornePosition& pos) {
    std::vector<uint8_t> me(56, 0);
    uint_to_bits(pos.tc, 5, &me[0]);
    uint_to_bits(pos.surveillance_status, 2, &me[5]);
    me[7] = pos.single_antenna ? 1 : 0;
    uint_to_bits(pos.altitude_code & 0xFFFu, 12, &me[8]);
    me[20] = pos.utc_synchronized ? 1 : 0;
    me[21] = pos.format == msg::CprFormat::Odd ? 1 : 0;
    uint_to_bits(pos.lat_cpr & 0x1FFFFu, 17, &me[22]);
    uint_to_bits(pos.lon_cpr & 0x1FFFFu, 17, &me[39]);
    return me;
}

std::optional<std::vector<uint8_t>> encode_identification_me(uint8_t tc, uint8_t category,
                                                             std::string_view callsign) {
    if (callsign.size() > 8)
        return std::nullopt;
    std::vector<uint8_t> me(56, 0);
    uint_to_bits(tc, 5, &me[0]);
    uint_to_bits(category, 3, &me[5]);
    for (std::size_t i = 0; i < 8; ++i) {
        int code = i < callsign.size() ? callsign_code(callsign[i]) : 32;
        if (code < 0)
            return std::nullopt;
        uint_to_bits(static_cast<uint32_t>(code), 6, &me[8 + 6 * i]);
    }
    return me;
}

std::vector<uint8_t> make_extended_squitter(uint8_t df, uint8_t ca, uint32_t icao,
                                            const std::vector<uint8_t>& me) {
    std::vector<uint8_t> bits(MODES_LONG_BITS, 0);
    uint_to_bits(df, 5, &bits[0]);
    uint_to_bits(ca, 3, &bits[5]);
    uint_to_bits(icao & 0xFFFFFFu, 24, &bits[8]);
    std::copy_n(me.begin(), std::min<std::size_t>(me.size(), 56), bits.begin() + 32);
    utils::ModeSCrc crc;
    crc.write_parity(bits.data(), bits.size());
    return bits;
}

std::vector<uint8_t> make_all_call_reply(uint8_t ca, uint32_t icao) {
    std::vector<uint8_t> bits(MODES_SHORT_BITS, 0);
    uint_to_bits(DF_ALL_CALL_REPLY, 5, &bits[0]);
    uint_to_bits(ca, 3, &bits[5]);
    uint_to_bits(icao & 0xFFFFFFu, 24, &bits[8]);
    utils::ModeSCrc crc;
    crc.write_parity(bits.data(), bits.size());
    return bits;
}

std::vector<std::complex<float>> modulate(const std::vector<uint8_t>& bits, unsigned samples_per_chip,
                                          float amplitude) {
    std::vector<uint8_t> chips(MODES_SYNC_SEQUENCE.begin(), MODES_SYNC_SEQUENCE.end());
    chips.reserve(MODES_SYNC_CHIPS + 2 * bits.size());
    for (uint8_t b : bits) {
        chips.push_back(b ? 1 : 0);
        chips.push_back(b ? 0 : 1);
    }
    std::vector<std::complex<float>> out(chips.size() * samples_per_chip);
    for (std::size_t c = 0; c < chips.size(); ++c) {
        if (!chips[c]) continue;
        std::fill_n(out.begin() + static_cast<std::ptrdiff_t>(c * samples_per_chip), samples_per_chip,
                    std::complex<float>(amplitude, 0.0f));
    }
    return out;
}

} // namespace adsb::tx
