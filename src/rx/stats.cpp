#include "adsb/rx/stats.hpp"

namespace adsb::rx {

void PacketStats::accumulate(const PhyResult& phy) {
    ++frames;
    dropped += phy.dropped;
    for (const auto& pkt : phy.detected()) {
        ++packets;
        ++per_df[pkt.df & 0x1Fu];
        if (pkt.crc_error)
            ++crc_failed;
        else
            ++crc_ok;
    }
}

void PacketStats::accumulate(const std::vector<msg::DecodedMessage>& msgs) {
    for (const auto& m : msgs) {
        ++messages;
        if (m.tc >= 0 && m.tc < 32)
            ++per_tc[static_cast<std::size_t>(m.tc)];
    }
}

double PacketStats::packet_error_rate() const {
    if (packets == 0)
        return 0.0;
    return static_cast<double>(crc_failed) / static_cast<double>(packets);
}

} // namespace adsb::rx
