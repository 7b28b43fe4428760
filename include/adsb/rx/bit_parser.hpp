#pragma once
#include <array>
#include <complex>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "adsb/config.hpp"
#include "adsb/rx/sync.hpp"

namespace adsb::rx {

struct PhyPacket {
    std::array<uint8_t, MODES_LONG_BITS> raw_bits{};
    bool crc_error{true};
    double time{0.0};   // seconds
    uint8_t df{0};
    uint8_t ca{0};
};

struct PhyResult {
    // Sized to max_packets_per_frame; only the first packet_count are filled.
    std::vector<PhyPacket> packets;
    std::size_t packet_count{0};
    std::size_t dropped{0};
    // Raw window of the last packet in the frame that passed CRC.
    std::optional<std::vector<std::complex<float>>> last_packet;

    std::span<const PhyPacket> detected() const {
        return {packets.data(), packet_count};
    }
};

struct PacketHeader {
    uint8_t df{0};
    uint8_t ca{0};
};

// DF from bits 1-5 and CA from bits 6-8, MSB first.
PacketHeader parse_header(const uint8_t* bits);

// Number of bits covered by the CRC for a downlink format; 0 when the
// format is not accepted by this receiver.
std::size_t crc_length_for_df(uint8_t df);

// True when the CRC check fails or the format is not accepted.
bool check_crc_error(const uint8_t* bits, uint8_t df);

// Demodulate, extract header and validate every candidate of one frame.
PhyResult parse_bits(const ReceiverConfig& cfg, const SyncResult& sync, double radio_time);

} // namespace adsb::rx
