#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "adsb/constants.hpp"

namespace adsb {

struct ReceiverParams {
    // Complex sample rate of the front end in Hz.
    double front_end_sample_rate = 2.4e6;
    // Front-end samples per frame. 0 derives the default 180-packet frame.
    std::size_t samples_per_frame = 0;
    // Maximum packets extracted per frame. 0 derives it from the frame size.
    std::size_t max_packets_per_frame = 0;
    // Normalized preamble correlation threshold in (0, 1].
    float sync_threshold = 0.5f;
    // Even/odd CPR frames older than this (seconds) are not paired.
    double cpr_pair_window = 10.0;
};

// Derived receiver parameters. Built once per session by make_receiver_config().
struct ReceiverConfig {
    double front_end_sample_rate{0.0};
    double chip_rate{MODES_CHIP_RATE};
    unsigned interpolation_factor{1};
    double sample_rate{0.0};

    unsigned samples_per_chip{0};
    unsigned samples_per_symbol{0};

    std::size_t preamble_length{0};     // samples, interpolated rate
    std::size_t long_packet_length{0};  // data part of a 112-bit packet
    std::size_t max_packet_length{0};   // preamble + long packet

    std::size_t samples_per_frame{0};   // front-end rate
    std::size_t frame_length{0};        // interpolated rate
    double frame_duration{0.0};
    std::size_t max_packets_per_frame{1};

    std::size_t long_packet_bits{MODES_LONG_BITS};
    std::size_t short_packet_bits{MODES_SHORT_BITS};

    // RRC prototype for the polyphase interpolator and its group delay in
    // output samples. A single unit tap when interpolation_factor == 1.
    std::vector<float> interpolation_filter;
    unsigned interpolation_delay{0};

    std::array<uint8_t, MODES_SYNC_CHIPS> sync_sequence{MODES_SYNC_SEQUENCE};
    unsigned sync_downsample_factor{2};
    // +1/-1 per subsampled preamble sample, in correlation order.
    std::vector<float> sync_filter;
    float sync_threshold{0.5f};

    double cpr_pair_window{10.0};
};

// Validate params and derive every length and timing field.
// Throws std::invalid_argument when the rate cannot be brought to an
// integer number of samples per chip.
ReceiverConfig make_receiver_config(const ReceiverParams& params);

// Front-end presets matching the supported radios.
ReceiverParams rtlsdr_params();
ReceiverParams pluto_params();

} // namespace adsb
