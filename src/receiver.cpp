#include "adsb/receiver.hpp"
#include "adsb/rx/phy.hpp"

namespace adsb {

Receiver::Receiver(const ReceiverConfig& config)
    : ws_(config), parser_(config.cpr_pair_window) {}

FrameResult Receiver::process(std::span<const std::complex<float>> frame, double radio_time) {
    FrameResult out;
    out.phy = rx::receive_phy(ws_, frame, radio_time);
    out.messages = msg::parse_messages(parser_, out.phy);
    out.message_count = out.messages.size();
    stats_.accumulate(out.phy);
    stats_.accumulate(out.messages);
    return out;
}

FrameResult Receiver::process_next(std::span<const std::complex<float>> frame) {
    FrameResult out = process(frame, radio_time_);
    radio_time_ += ws_.cfg.frame_duration;
    return out;
}

void Receiver::reset() {
    ws_.reset();
    parser_.reset();
    stats_.reset();
    radio_time_ = 0.0;
}

} // namespace adsb
