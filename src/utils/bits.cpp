#include "adsb/utils/bits.hpp"

namespace adsb::utils {

std::string bits_to_hex(const uint8_t* bits, size_t nbits) {
    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    out.reserve(nbits / 4);
    for (size_t i = 0; i + 4 <= nbits; i += 4)
        out.push_back(kHex[bits_to_uint(bits + i, 4)]);
    return out;
}

std::optional<std::vector<uint8_t>> hex_to_bits(std::string_view hex) {
    std::vector<uint8_t> bits;
    bits.reserve(hex.size() * 4);
    for (char ch : hex) {
        uint32_t v;
        if (ch >= '0' && ch <= '9') v = static_cast<uint32_t>(ch - '0');
        else if (ch >= 'A' && ch <= 'F') v = static_cast<uint32_t>(ch - 'A' + 10);
        else if (ch >= 'a' && ch <= 'f') v = static_cast<uint32_t>(ch - 'a' + 10);
        else return std::nullopt;
        bits.resize(bits.size() + 4);
        uint_to_bits(v, 4, bits.data() + bits.size() - 4);
    }
    return bits;
}

} // namespace adsb::utils
