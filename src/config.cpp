#include "adsb/config.hpp"

#include <liquid/liquid.h>

#include <cmath>
#include <numeric>
#include <stdexcept>
#include <string>

namespace adsb {

namespace {

constexpr unsigned kMaxRationalDenominator = 64;
constexpr unsigned kRrcDelaySymbols = 3;
constexpr float kRrcRolloff = 0.5f;

struct Ratio {
    unsigned long num;
    unsigned den;
};

// Smallest denominator d such that rate/chip_rate == n/d.
bool rational_ratio(double rate, double chip_rate, Ratio& out) {
    for (unsigned d = 1; d <= kMaxRationalDenominator; ++d) {
        double n = rate * d / chip_rate;
        double r = std::round(n);
        if (r >= 1.0 && std::fabs(n - r) < 1e-6) {
            out.num = static_cast<unsigned long>(r);
            out.den = d;
            return true;
        }
    }
    return false;
}

std::vector<float> design_interpolation_filter(unsigned k) {
    if (k <= 1)
        return {1.0f};
    const unsigned len = 2u * k * kRrcDelaySymbols + 1u;
    std::vector<float> h(len);
    liquid_firdes_rrcos(k, kRrcDelaySymbols, kRrcRolloff, 0.0f, h.data());
    // Unit DC gain per polyphase branch.
    float sum = std::accumulate(h.begin(), h.end(), 0.0f);
    if (sum == 0.0f)
        throw std::invalid_argument("RRC prototype has zero DC gain");
    const float scale = static_cast<float>(k) / sum;
    for (auto& v : h)
        v *= scale;
    return h;
}

} // namespace

ReceiverConfig make_receiver_config(const ReceiverParams& p) {
    if (!(p.front_end_sample_rate > 0.0) || !std::isfinite(p.front_end_sample_rate))
        throw std::invalid_argument("Front-end sample rate must be positive");
    if (!(p.sync_threshold > 0.0f) || p.sync_threshold > 1.0f)
        throw std::invalid_argument("Sync threshold must be in (0, 1]");
    if (!(p.cpr_pair_window > 0.0))
        throw std::invalid_argument("CPR pairing window must be positive");

    ReceiverConfig c;
    c.front_end_sample_rate = p.front_end_sample_rate;
    c.chip_rate = MODES_CHIP_RATE;

    Ratio r{};
    if (!rational_ratio(p.front_end_sample_rate, c.chip_rate, r))
        throw std::invalid_argument("Sample rate " + std::to_string(p.front_end_sample_rate) +
                                    " Hz has no rational relation to the chip rate");
    if (r.den > 2)
        c.interpolation_factor = r.den;
    else if (r.num <= 1)
        c.interpolation_factor = 2u * r.den;
    else
        c.interpolation_factor = r.den;
    c.sample_rate = c.front_end_sample_rate * c.interpolation_factor;

    const double spc = c.sample_rate / c.chip_rate;
    if (std::fabs(spc - std::round(spc)) > 1e-6 || std::round(spc) < 2.0)
        throw std::invalid_argument("Sample rate must be an integer multiple of the chip rate with at least 2 samples per chip");
    c.samples_per_chip = static_cast<unsigned>(std::lround(spc));
    c.samples_per_symbol = 2u * c.samples_per_chip;

    c.preamble_length = static_cast<std::size_t>(MODES_PREAMBLE_US) * c.samples_per_symbol;
    c.long_packet_length = MODES_LONG_BITS * c.samples_per_symbol;
    c.max_packet_length = c.preamble_length + c.long_packet_length;

    const double max_packet_duration = (MODES_PREAMBLE_US + MODES_LONG_DATA_US) * 1e-6;
    const double max_packet_frontend = max_packet_duration * c.front_end_sample_rate;
    if (p.samples_per_frame > 0)
        c.samples_per_frame = p.samples_per_frame;
    else
        c.samples_per_frame = static_cast<std::size_t>(std::llround(180.0 * max_packet_frontend));
    c.frame_length = c.samples_per_frame * c.interpolation_factor;
    c.frame_duration = static_cast<double>(c.samples_per_frame) / c.front_end_sample_rate;

    if (p.max_packets_per_frame > 0) {
        c.max_packets_per_frame = p.max_packets_per_frame;
    } else {
        auto n = static_cast<std::size_t>(std::floor(c.samples_per_frame / max_packet_frontend / 4.0 + 1e-9));
        c.max_packets_per_frame = n > 0 ? n : 1;
    }

    c.interpolation_filter = design_interpolation_filter(c.interpolation_factor);
    c.interpolation_delay = c.interpolation_factor > 1 ? c.interpolation_factor * kRrcDelaySymbols : 0u;

    c.sync_sequence = MODES_SYNC_SEQUENCE;
    c.sync_downsample_factor = 2;
    const std::size_t sync_len = MODES_SYNC_CHIPS * c.samples_per_chip;
    c.sync_filter.clear();
    for (std::size_t n = 0; n < sync_len; n += c.sync_downsample_factor) {
        uint8_t chip = c.sync_sequence[n / c.samples_per_chip];
        c.sync_filter.push_back(chip ? 1.0f : -1.0f);
    }
    c.sync_threshold = p.sync_threshold;
    c.cpr_pair_window = p.cpr_pair_window;
    return c;
}

ReceiverParams rtlsdr_params() {
    ReceiverParams p;
    p.front_end_sample_rate = 2.4e6;
    return p;
}

ReceiverParams pluto_params() {
    ReceiverParams p;
    p.front_end_sample_rate = 12e6;
    return p;
}

} // namespace adsb
