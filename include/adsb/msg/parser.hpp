#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

#include "adsb/msg/cpr.hpp"
#include "adsb/msg/message.hpp"
#include "adsb/rx/bit_parser.hpp"

namespace adsb::msg {

// Latest even and odd airborne CPR frames of one aircraft.
struct CprPair {
    std::optional<CprFrame> even;
    std::optional<CprFrame> odd;
};

// Cross-packet state of the message parser: CPR frames per ICAO address.
class ParserState {
public:
    explicit ParserState(double pair_window = 10.0) : pair_window_(pair_window) {}

    // Store a frame and try a global decode against the other format.
    std::optional<Position> update_position(uint32_t icao, CprFormat fmt, const CprFrame& frame);

    // Forget aircraft whose newest frame is older than the pairing window.
    void prune(double now);
    void reset() { aircraft_.clear(); }

    std::size_t tracked() const { return aircraft_.size(); }
    double pair_window() const { return pair_window_; }

private:
    double pair_window_;
    std::unordered_map<uint32_t, CprPair> aircraft_;
};

// Decode one packet. The caller is expected to pass CRC-valid packets;
// fields are still filled from whatever bits are present otherwise.
DecodedMessage parse_message(ParserState& state, const rx::PhyPacket& pkt);

// Decode every CRC-valid packet among the first packet_count of a frame,
// in detection order.
std::vector<DecodedMessage> parse_messages(ParserState& state, const rx::PhyResult& phy);

// Type code field of an extended squitter (bits 33-37).
uint8_t type_code(const uint8_t* bits);

// ICAO address of a packet: bits 9-32 for DF 11/17/18 and the other
// address-announced formats. DF 0/4/5/16/20/21 overlay the address on the
// parity field, so it is recovered there instead.
uint32_t icao_address(const uint8_t* bits, uint8_t df);

} // namespace adsb::msg
