#include "adsb/msg/altitude.hpp"

#include <cmath>

namespace adsb::msg {

namespace {

// Reorder the 13-bit reply layout into the A4 A2 A1 | B4 B2 B1 | C4 C2 C1 |
// D4 D2 D1 nibble layout used by the Mode A/C conversion.
uint32_t id13_to_gillham(uint32_t id13) {
    uint32_t g = 0;
    if (id13 & 0x1000) g |= 0x0010;  // C1
    if (id13 & 0x0800) g |= 0x1000;  // A1
    if (id13 & 0x0400) g |= 0x0020;  // C2
    if (id13 & 0x0200) g |= 0x2000;  // A2
    if (id13 & 0x0100) g |= 0x0040;  // C4
    if (id13 & 0x0080) g |= 0x4000;  // A4
    if (id13 & 0x0020) g |= 0x0100;  // B1
    if (id13 & 0x0010) g |= 0x0001;  // D1
    if (id13 & 0x0008) g |= 0x0200;  // B2
    if (id13 & 0x0004) g |= 0x0002;  // D2
    if (id13 & 0x0002) g |= 0x0400;  // B4
    if (id13 & 0x0001) g |= 0x0004;  // D4
    return g;
}

} // namespace

std::optional<int> gillham_to_hundreds(uint32_t id13) {
    const uint32_t g = id13_to_gillham(id13);
    // D1 and the unused bits must be clear, and some C bit must be set.
    if ((g & 0xFFFF8889u) != 0 || (g & 0x00F0u) == 0)
        return std::nullopt;

    uint32_t hundreds = 0;
    if (g & 0x0010) hundreds ^= 0x007;  // C1
    if (g & 0x0020) hundreds ^= 0x003;  // C2
    if (g & 0x0040) hundreds ^= 0x001;  // C4
    if ((hundreds & 5) == 5) hundreds ^= 2;
    if (hundreds > 5)
        return std::nullopt;

    uint32_t five_hundreds = 0;
    if (g & 0x0002) five_hundreds ^= 0x0FF;  // D2
    if (g & 0x0004) five_hundreds ^= 0x07F;  // D4
    if (g & 0x1000) five_hundreds ^= 0x03F;  // A1
    if (g & 0x2000) five_hundreds ^= 0x01F;  // A2
    if (g & 0x4000) five_hundreds ^= 0x00F;  // A4
    if (g & 0x0100) five_hundreds ^= 0x007;  // B1
    if (g & 0x0200) five_hundreds ^= 0x003;  // B2
    if (g & 0x0400) five_hundreds ^= 0x001;  // B4

    if (five_hundreds & 1)
        hundreds = 6 - hundreds;
    return static_cast<int>(five_hundreds * 5 + hundreds) - 13;
}

std::optional<double> decode_ac12(uint32_t ac12) {
    ac12 &= 0xFFFu;
    if (ac12 == 0)
        return std::nullopt;
    if (ac12 & 0x010u) {
        uint32_t n = ((ac12 & 0xFE0u) >> 1) | (ac12 & 0x00Fu);
        return static_cast<double>(n) * 25.0 - 1000.0;
    }
    // Insert M=0 to get the 13-bit identity layout.
    uint32_t id13 = ((ac12 & 0xFC0u) << 1) | (ac12 & 0x03Fu);
    auto h = gillham_to_hundreds(id13);
    if (!h || *h < -12)
        return std::nullopt;
    return static_cast<double>(*h) * 100.0;
}

std::optional<uint32_t> encode_ac12(double feet) {
    if (!std::isfinite(feet))
        return std::nullopt;
    long n = std::lround((feet + 1000.0) / 25.0);
    if (n < 0 || n > 0x7FF)
        return std::nullopt;
    uint32_t u = static_cast<uint32_t>(n);
    return ((u & 0x7F0u) << 1) | 0x010u | (u & 0x00Fu);
}

} // namespace adsb::msg
