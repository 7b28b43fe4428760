#pragma once
#include <complex>
#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include "adsb/workspace.hpp"

namespace adsb::rx {

struct CandidatePacket {
    // long_packet_length energy samples starting at the first data chip.
    std::vector<float> samples;
    // Preamble start relative to the first sample of the current
    // (interpolated) frame, corrected for interpolator delay. Negative when
    // the packet began in the previous frame.
    std::ptrdiff_t offset{0};
    // Complex samples of the whole packet, preamble included.
    std::vector<std::complex<float>> raw;
};

struct SyncResult {
    std::vector<CandidatePacket> packets;
    // Validated preambles beyond max_packets_per_frame.
    std::size_t dropped{0};
    // Raw window of the last validated packet.
    std::optional<std::vector<std::complex<float>>> last_packet;

    std::size_t count() const { return packets.size(); }
};

// Normalized preamble match at the start of `energy` (16 chips of
// samples_per_chip samples). Range [-1, 1]; -1 when the window is empty.
float preamble_metric(const float* energy, unsigned samples_per_chip);

// Structural check: every pulse chip above half the mean pulse energy and
// every quiet chip below it.
bool validate_preamble(const float* energy, unsigned samples_per_chip);

// Push one interpolated frame through the overlap buffer and return the
// packets whose preamble starts in the searchable region. Throws
// std::invalid_argument when z is longer than cfg.frame_length.
SyncResult synchronize(Workspace& ws, std::span<const std::complex<float>> z);

} // namespace adsb::rx
