#include "adsb/rx/phy.hpp"
#include "adsb/rx/interpolator.hpp"
#include "adsb/rx/sync.hpp"

namespace adsb::rx {

PhyResult receive_phy(Workspace& ws, std::span<const std::complex<float>> frame, double radio_time) {
    auto z = interpolate(ws, frame);
    SyncResult sync = synchronize(ws, z);
    return parse_bits(ws.cfg, sync, radio_time);
}

} // namespace adsb::rx
