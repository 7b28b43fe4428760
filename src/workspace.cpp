#include "adsb/workspace.hpp"

#include <algorithm>
#include <stdexcept>

namespace adsb {

Workspace::Workspace() : interp(nullptr) {}

Workspace::Workspace(const ReceiverConfig& config) : interp(nullptr) {
    init(config);
}

Workspace::~Workspace() {
    if (interp)
        firinterp_crcf_destroy(interp);
}

void Workspace::init(const ReceiverConfig& config) {
    cfg = config;

    if (interp) {
        firinterp_crcf_destroy(interp);
        interp = nullptr;
    }
    if (cfg.interpolation_factor > 1) {
        interp = firinterp_crcf_create(cfg.interpolation_factor,
                                       cfg.interpolation_filter.data(),
                                       static_cast<unsigned int>(cfg.interpolation_filter.size()));
        if (!interp)
            throw std::runtime_error("firinterp_crcf_create failed");
    }

    const std::size_t cap = cfg.frame_length + cfg.max_packet_length;
    sync_iq.assign(cap, std::complex<float>(0.0f, 0.0f));
    sync_energy.assign(cap, 0.0f);
    // First frame sees an all-zero overlap region.
    sync_active = cfg.max_packet_length;
    sync_skip = 0;

    interp_out.clear();
    interp_out.reserve(cfg.frame_length);
    corr.clear();
    corr.reserve(cap / std::max(1u, cfg.sync_downsample_factor) + 1);

    frames_processed = 0;
    reset_debug_variables();
}

void Workspace::reset() {
    if (interp)
        firinterp_crcf_reset(interp);
    std::fill(sync_iq.begin(), sync_iq.end(), std::complex<float>(0.0f, 0.0f));
    std::fill(sync_energy.begin(), sync_energy.end(), 0.0f);
    sync_active = cfg.max_packet_length;
    sync_skip = 0;
    frames_processed = 0;
    reset_debug_variables();
}

void Workspace::reset_debug_variables() {
    dbg_last_peak = 0;
    dbg_last_metric = 0.0f;
    dbg_rejected = 0;
}

void Workspace::interpolate(const std::complex<float>* x, std::size_t n, std::complex<float>* y) {
    if (!interp) {
        std::copy(x, x + n, y);
        return;
    }
    firinterp_crcf_execute_block(interp,
                                 reinterpret_cast<liquid_float_complex*>(const_cast<std::complex<float>*>(x)),
                                 static_cast<unsigned int>(n),
                                 reinterpret_cast<liquid_float_complex*>(y));
}

} // namespace adsb
