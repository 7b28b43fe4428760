#pragma once

#include <complex>
#include <cstddef>
#include <span>
#include <vector>

#include "adsb/config.hpp"
#include "adsb/msg/message.hpp"
#include "adsb/msg/parser.hpp"
#include "adsb/rx/bit_parser.hpp"
#include "adsb/rx/stats.hpp"
#include "adsb/workspace.hpp"

namespace adsb {

struct FrameResult {
    rx::PhyResult phy;
    std::vector<msg::DecodedMessage> messages;
    std::size_t message_count{0};
};

// One receive chain: physical layer state, CPR pairing state and counters.
class Receiver {
public:
    explicit Receiver(const ReceiverConfig& config);

    // Process one front-end frame whose first sample arrived at radio_time.
    FrameResult process(std::span<const std::complex<float>> frame, double radio_time);

    // Process the next frame, stamping it with the internal radio clock,
    // which then advances by frame_duration.
    FrameResult process_next(std::span<const std::complex<float>> frame);

    void reset();

    const ReceiverConfig& config() const { return ws_.cfg; }
    const rx::PacketStats& stats() const { return stats_; }
    const msg::ParserState& parser_state() const { return parser_; }
    double radio_time() const { return radio_time_; }

private:
    Workspace ws_;
    msg::ParserState parser_;
    rx::PacketStats stats_;
    double radio_time_{0.0};
};

} // namespace adsb
