#include "adsb/iq_loader.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace adsb {

namespace {

constexpr std::size_t kBbHeaderBytes = 32;
constexpr double kAdsbCenterFrequency = 1090e6;

uint32_t read_le32(const unsigned char* p) {
    return uint32_t(p[0]) | (uint32_t(p[1]) << 8) | (uint32_t(p[2]) << 16) | (uint32_t(p[3]) << 24);
}

bool has_bb_magic(const std::vector<unsigned char>& raw) {
    return raw.size() >= kBbHeaderBytes && raw[0] == 'b' && raw[1] == 'b' && raw[2] == 0 && raw[3] == 0;
}

std::vector<std::complex<float>> decode_cs16(const unsigned char* p, std::size_t bytes) {
    const std::size_t n = bytes / (sizeof(int16_t) * 2);
    std::vector<std::complex<float>> out(n);
    const float s = 1.0f / 32768.0f;
    for (std::size_t i = 0; i < n; ++i) {
        int16_t iq[2];
        std::memcpy(iq, p + i * sizeof(iq), sizeof(iq));
        out[i] = {iq[0] * s, iq[1] * s};
    }
    return out;
}

std::vector<std::complex<float>> decode_f32(const unsigned char* p, std::size_t bytes) {
    const std::size_t n = bytes / (sizeof(float) * 2);
    std::vector<std::complex<float>> out(n);
    // Endianness is assumed little-endian host.
    std::memcpy(out.data(), p, n * sizeof(std::complex<float>));
    return out;
}

} // namespace

IqCapture load_iq(const std::filesystem::path& path, IqFormat fmt) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
        throw std::runtime_error("Failed to open IQ file: " + path.string());
    std::vector<unsigned char> raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad())
        throw std::runtime_error("Failed to read IQ data from file: " + path.string());

    if (fmt == IqFormat::Auto) {
        if (has_bb_magic(raw)) fmt = IqFormat::BB;
        else if (raw.size() % 8 == 0) fmt = IqFormat::F32;
        else fmt = IqFormat::CS16;
    }

    IqCapture cap;
    switch (fmt) {
        case IqFormat::BB: {
            std::size_t skip = 0;
            cap.center_frequency = kAdsbCenterFrequency;
            if (has_bb_magic(raw)) {
                cap.center_frequency = read_le32(raw.data() + 4);
                cap.sample_rate = read_le32(raw.data() + 8);
                skip = kBbHeaderBytes;
            }
            const std::size_t body = raw.size() - skip;
            if (body % 8 != 0)
                throw std::runtime_error("bb payload is not aligned to complex64 samples: " + path.string());
            cap.samples = decode_f32(raw.data() + skip, body);
            break;
        }
        case IqFormat::CS16:
            if (raw.size() % 4 != 0)
                throw std::runtime_error("IQ file size is not aligned to cs16 samples: " + path.string());
            cap.samples = decode_cs16(raw.data(), raw.size());
            break;
        case IqFormat::F32:
        default:
            if (raw.size() % 8 != 0)
                throw std::runtime_error("IQ file size is not aligned to complex64 samples: " + path.string());
            cap.samples = decode_f32(raw.data(), raw.size());
            break;
    }
    return cap;
}

void condition_capture(std::vector<std::complex<float>>& samples, float peak) {
    if (samples.empty())
        return;
    std::complex<double> mean(0.0, 0.0);
    for (const auto& v : samples)
        mean += std::complex<double>(v.real(), v.imag());
    mean /= static_cast<double>(samples.size());
    const std::complex<float> dc(static_cast<float>(mean.real()), static_cast<float>(mean.imag()));
    float max_mag = 0.0f;
    for (auto& v : samples) {
        v -= dc;
        max_mag = std::max(max_mag, std::abs(v));
    }
    if (!(max_mag > 0.0f))
        return;
    const float scale = peak / max_mag;
    for (auto& v : samples)
        v *= scale;
}

void save_cf32(const std::filesystem::path& path, const std::vector<std::complex<float>>& samples) {
    std::ofstream of(path, std::ios::binary);
    if (!of)
        throw std::runtime_error("Failed to open output: " + path.string());
    for (auto c : samples) {
        float re = c.real();
        float im = c.imag();
        of.write(reinterpret_cast<const char*>(&re), sizeof(float));
        of.write(reinterpret_cast<const char*>(&im), sizeof(float));
    }
    if (!of)
        throw std::runtime_error("Failed to write output: " + path.string());
}

} // namespace adsb
