#pragma once
#include <complex>
#include <span>

#include "adsb/workspace.hpp"

namespace adsb::rx {

// Upsample one front-end frame by ws.cfg.interpolation_factor through the
// RRC polyphase filter held in the workspace. Filter history carries over
// between calls. Factor 1 returns the input span untouched; otherwise the
// result aliases ws.interp_out and stays valid until the next call.
std::span<const std::complex<float>> interpolate(Workspace& ws,
                                                 std::span<const std::complex<float>> x);

} // namespace adsb::rx
