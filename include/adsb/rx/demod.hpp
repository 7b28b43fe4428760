#pragma once
#include <cstddef>
#include <cstdint>

namespace adsb::rx {

// PPM decision for one bit: correlate with +1 over the first chip and -1
// over the second. A zero statistic decodes as 0.
inline uint8_t demod_bit(const float* symbol, unsigned samples_per_chip) {
    float stat = 0.0f;
    for (unsigned n = 0; n < samples_per_chip; ++n)
        stat += symbol[n];
    for (unsigned n = 0; n < samples_per_chip; ++n)
        stat -= symbol[samples_per_chip + n];
    return stat > 0.0f ? 1u : 0u;
}

// Demodulate nbits consecutive symbols of 2*samples_per_chip energy samples.
inline void demod_bits(const float* samples, std::size_t nbits, unsigned samples_per_chip,
                       uint8_t* bits) {
    const std::size_t sps = 2u * samples_per_chip;
    for (std::size_t b = 0; b < nbits; ++b)
        bits[b] = demod_bit(samples + b * sps, samples_per_chip);
}

} // namespace adsb::rx
