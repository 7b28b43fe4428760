#include "adsb/utils/crc.hpp"
#include "adsb/utils/bits.hpp"

namespace adsb::utils {

uint32_t ModeSCrc::compute(const uint8_t* bits, size_t nbits) const {
    uint32_t crc = 0;
    for (size_t i = 0; i < nbits; ++i) {
        uint32_t fb = ((crc >> 23) & 1u) ^ (bits[i] & 1u);
        crc = (crc << 1) & 0xFFFFFFu;
        if (fb) crc ^= poly;
    }
    return crc;
}

uint32_t ModeSCrc::remainder(const uint8_t* bits, size_t nbits) const {
    if (nbits < MODES_PARITY_BITS) return 0xFFFFFFu;
    const size_t data = nbits - MODES_PARITY_BITS;
    return compute(bits, data) ^ bits_to_uint(bits + data, MODES_PARITY_BITS);
}

std::pair<bool, uint32_t> ModeSCrc::verify_with_parity(const uint8_t* bits, size_t nbits) const {
    if (nbits <= MODES_PARITY_BITS) return {false, 0};
    const size_t data = nbits - MODES_PARITY_BITS;
    uint32_t calc = compute(bits, data);
    uint32_t got = bits_to_uint(bits + data, MODES_PARITY_BITS);
    return {calc == got, calc};
}

void ModeSCrc::write_parity(uint8_t* bits, size_t nbits) const {
    if (nbits <= MODES_PARITY_BITS) return;
    const size_t data = nbits - MODES_PARITY_BITS;
    uint_to_bits(compute(bits, data), MODES_PARITY_BITS, bits + data);
}

} // namespace adsb::utils
