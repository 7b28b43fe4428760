#pragma once
#include <complex>
#include <span>

#include "adsb/rx/bit_parser.hpp"
#include "adsb/workspace.hpp"

namespace adsb::rx {

// One receive cycle of the physical layer: interpolate the front-end
// frame, synchronize on the energy, then demodulate and CRC-check every
// candidate. radio_time is the time of the first sample of `frame`.
PhyResult receive_phy(Workspace& ws, std::span<const std::complex<float>> frame, double radio_time);

} // namespace adsb::rx
