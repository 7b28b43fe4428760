#include "adsb/rx/interpolator.hpp"

namespace adsb::rx {

std::span<const std::complex<float>> interpolate(Workspace& ws,
                                                 std::span<const std::complex<float>> x) {
    const unsigned factor = ws.cfg.interpolation_factor;
    if (factor <= 1)
        return x;
    ws.interp_out.resize(x.size() * factor);
    if (x.empty())
        return {};
    ws.interpolate(x.data(), x.size(), ws.interp_out.data());
    return {ws.interp_out.data(), ws.interp_out.size()};
}

} // namespace adsb::rx
