#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "adsb/msg/message.hpp"
#include "adsb/rx/bit_parser.hpp"

namespace adsb::rx {

// Running packet counters for packet-error-rate reporting.
struct PacketStats {
    uint64_t frames{0};
    uint64_t packets{0};        // synchronization events handed to the bit parser
    uint64_t crc_ok{0};
    uint64_t crc_failed{0};
    uint64_t dropped{0};        // validated preambles beyond frame capacity
    uint64_t messages{0};
    std::array<uint64_t, 32> per_df{};
    std::array<uint64_t, 32> per_tc{};

    void accumulate(const PhyResult& phy);
    void accumulate(const std::vector<msg::DecodedMessage>& msgs);

    // crc_failed / packets; 0 before the first packet.
    double packet_error_rate() const;
    void reset() { *this = PacketStats{}; }
};

} // namespace adsb::rx
