#pragma once

#include <complex>
#include <cstddef>
#include <cstdint>
#include <vector>

#include <liquid/liquid.h>

#include "adsb/config.hpp"

namespace adsb {

// Per-chain receive state. One Workspace per signal source; frames for that
// source must be fed in arrival order.
class Workspace {
public:
    Workspace();
    explicit Workspace(const ReceiverConfig& config);
    ~Workspace();

    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    void init(const ReceiverConfig& config);
    // Clear buffers and filter history without re-deriving anything.
    void reset();
    void reset_debug_variables();

    // Polyphase interpolation of one block; y must hold x.size()*factor samples.
    void interpolate(const std::complex<float>* x, std::size_t n, std::complex<float>* y);

    ReceiverConfig cfg;

    // Synchronizer buffers: [overlap | current frame], capacity
    // frame_length + max_packet_length.
    std::vector<std::complex<float>> sync_iq;
    std::vector<float> sync_energy;
    std::size_t sync_active{0};
    // Leading positions of the next call already covered by an accepted packet.
    std::size_t sync_skip{0};

    // Scratch reused across calls.
    std::vector<std::complex<float>> interp_out;
    std::vector<float> corr;

    uint64_t frames_processed{0};
    std::size_t dbg_last_peak{0};
    float dbg_last_metric{0.0f};
    std::size_t dbg_rejected{0};

private:
    firinterp_crcf interp{nullptr};
};

} // namespace adsb
