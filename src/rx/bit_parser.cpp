#include "adsb/rx/bit_parser.hpp"
#include "adsb/debug.hpp"
#include "adsb/rx/demod.hpp"
#include "adsb/utils/bits.hpp"
#include "adsb/utils/crc.hpp"

#include <algorithm>

namespace adsb::rx {

PacketHeader parse_header(const uint8_t* bits) {
    PacketHeader h;
    h.df = static_cast<uint8_t>(utils::bits_to_uint(bits, 5));
    h.ca = static_cast<uint8_t>(utils::bits_to_uint(bits + 5, 3));
    return h;
}

std::size_t crc_length_for_df(uint8_t df) {
    switch (df) {
        case DF_ALL_CALL_REPLY:     return MODES_SHORT_BITS;
        case DF_EXTENDED_SQUITTER:  return MODES_LONG_BITS;
        default:                    return 0;
    }
}

bool check_crc_error(const uint8_t* bits, uint8_t df) {
    const std::size_t n = crc_length_for_df(df);
    if (n == 0) {
        debug::set_fail(debug::FAIL_DF_UNSUPPORTED);
        return true;
    }
    utils::ModeSCrc crc;
    auto [ok, parity] = crc.verify_with_parity(bits, n);
    if (!ok) {
        debug::set_fail(debug::FAIL_CRC);
        ADSB_DEBUGF("bit parser: DF%u CRC mismatch (calc %06X)", static_cast<unsigned>(df),
                    static_cast<unsigned>(parity));
    }
    return !ok;
}

PhyResult parse_bits(const ReceiverConfig& cfg, const SyncResult& sync, double radio_time) {
    PhyResult out;
    out.packets.resize(cfg.max_packets_per_frame);
    out.dropped = sync.dropped;

    const std::size_t n = std::min(sync.packets.size(), cfg.max_packets_per_frame);
    for (std::size_t p = 0; p < n; ++p) {
        const CandidatePacket& cand = sync.packets[p];
        PhyPacket& pkt = out.packets[p];
        if (cand.samples.size() < cfg.long_packet_bits * cfg.samples_per_symbol)
            continue;

        demod_bits(cand.samples.data(), cfg.long_packet_bits, cfg.samples_per_chip,
                   pkt.raw_bits.data());
        PacketHeader h = parse_header(pkt.raw_bits.data());
        pkt.df = h.df;
        pkt.ca = h.ca;
        pkt.crc_error = check_crc_error(pkt.raw_bits.data(), h.df);
        pkt.time = radio_time + static_cast<double>(cand.offset) / cfg.sample_rate;
        if (!pkt.crc_error)
            out.last_packet = cand.raw;
    }
    out.packet_count = n;
    return out;
}

} // namespace adsb::rx
