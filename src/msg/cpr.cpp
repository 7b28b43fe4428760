#include "adsb/msg/cpr.hpp"
#include "adsb/debug.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace adsb::msg {

namespace {

constexpr int kNz = 15;

double cpr_mod(double a, double b) {
    double r = a - b * std::floor(a / b);
    return r;
}

double dlat_for(CprFormat fmt) {
    return 360.0 / (fmt == CprFormat::Odd ? 4.0 * kNz - 1.0 : 4.0 * kNz);
}

} // namespace

int cpr_nl(double lat) {
    lat = std::fabs(lat);
    if (lat == 0.0) return 59;
    if (lat == 87.0) return 2;
    if (lat > 87.0) return 1;
    const double pi = std::numbers::pi;
    const double a = 1.0 - std::cos(pi / (2.0 * kNz));
    const double c = std::cos(pi / 180.0 * lat);
    const double nl = std::floor(2.0 * pi / std::acos(1.0 - a / (c * c)));
    return static_cast<int>(nl);
}

std::optional<Position> cpr_decode_global(const CprFrame& even, const CprFrame& odd, CprFormat newest) {
    const double lat0 = even.lat;
    const double lat1 = odd.lat;
    const double lon0 = even.lon;
    const double lon1 = odd.lon;
    const double dlat0 = dlat_for(CprFormat::Even);
    const double dlat1 = dlat_for(CprFormat::Odd);

    const double j = std::floor((59.0 * lat0 - 60.0 * lat1) / kCprScale + 0.5);
    double rlat0 = dlat0 * (cpr_mod(j, 60.0) + lat0 / kCprScale);
    double rlat1 = dlat1 * (cpr_mod(j, 59.0) + lat1 / kCprScale);
    if (rlat0 >= 270.0) rlat0 -= 360.0;
    if (rlat1 >= 270.0) rlat1 -= 360.0;

    if (rlat0 < -90.0 || rlat0 > 90.0 || rlat1 < -90.0 || rlat1 > 90.0) {
        debug::set_fail(debug::FAIL_CPR_LATITUDE);
        return std::nullopt;
    }
    if (cpr_nl(rlat0) != cpr_nl(rlat1)) {
        debug::set_fail(debug::FAIL_CPR_ZONE);
        ADSB_DEBUGF("cpr: zone mismatch (%.4f / %.4f)", rlat0, rlat1);
        return std::nullopt;
    }

    const bool odd_newest = newest == CprFormat::Odd;
    Position pos;
    pos.latitude = odd_newest ? rlat1 : rlat0;

    const int nl = cpr_nl(pos.latitude);
    const int ni = std::max(nl - (odd_newest ? 1 : 0), 1);
    const double m = std::floor((lon0 * (nl - 1) - lon1 * nl) / kCprScale + 0.5);
    const double lon_cpr = odd_newest ? lon1 : lon0;
    double lon = (360.0 / ni) * (cpr_mod(m, ni) + lon_cpr / kCprScale);
    if (lon >= 180.0) lon -= 360.0;
    pos.longitude = lon;
    return pos;
}

std::pair<uint32_t, uint32_t> cpr_encode(double lat, double lon, CprFormat fmt) {
    const int i = fmt == CprFormat::Odd ? 1 : 0;
    const double dlat = dlat_for(fmt);
    const double yz = std::floor(kCprScale * cpr_mod(lat, dlat) / dlat + 0.5);
    const double rlat = dlat * (yz / kCprScale + std::floor(lat / dlat));
    const double dlon = 360.0 / std::max(cpr_nl(rlat) - i, 1);
    const double xz = std::floor(kCprScale * cpr_mod(lon, dlon) / dlon + 0.5);
    const auto mask = [](double v) { return static_cast<uint32_t>(static_cast<int64_t>(v)) & 0x1FFFFu; };
    return {mask(yz), mask(xz)};
}

} // namespace adsb::msg
