#pragma once

#include <complex>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace adsb {

enum class IqFormat { Auto, F32, CS16, BB };

struct IqCapture {
    std::vector<std::complex<float>> samples;
    // Taken from the file header when present, 0 otherwise.
    double sample_rate{0.0};
    double center_frequency{0.0};
};

// Load a baseband capture. Formats:
//  - F32:  interleaved little-endian float32 I/Q, no header.
//  - CS16: interleaved int16 I/Q scaled by 1/32768, no header.
//  - BB:   optional 32-byte header ('b','b',0,0, uint32 centre frequency
//          Hz, uint32 sample rate Hz, padding) followed by F32 data.
//  - Auto: BB when the magic matches, else F32 when the size is a
//          multiple of 8 bytes, else CS16.
// Throws std::runtime_error on open/read/alignment failures.
IqCapture load_iq(const std::filesystem::path& path, IqFormat fmt = IqFormat::Auto);

// Remove the DC component and scale so the largest magnitude is `peak`.
// A silent capture is left untouched.
void condition_capture(std::vector<std::complex<float>>& samples, float peak = 0.9f);

// Write interleaved float32 I/Q.
void save_cf32(const std::filesystem::path& path, const std::vector<std::complex<float>>& samples);

} // namespace adsb
