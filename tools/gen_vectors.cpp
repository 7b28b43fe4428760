#include "adsb/constants.hpp"
#include "adsb/iq_loader.hpp"
#include "adsb/msg/altitude.hpp"
#include "adsb/msg/cpr.hpp"
#include "adsb/tx/frame_tx.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <initializer_list>
#include <string>
#include <vector>

using namespace adsb;

static void usage(const char* argv0) {
    std::fprintf(stderr,
        "Usage: %s --icao <hex> --out <iq_file> [--rate <Hz, multiple of 2e6>] [--alt <ft>] [--lat <deg> --lon <deg>] [--callsign <str>] [--gap-us <us>] [--amplitude <a>]\n",
        argv0);
}

static void append_burst(std::vector<std::complex<float>>& iq, const std::vector<uint8_t>& bits,
                         unsigned spc, float amplitude, std::size_t gap) {
    auto burst = tx::modulate(bits, spc, amplitude);
    iq.insert(iq.end(), burst.begin(), burst.end());
    iq.insert(iq.end(), gap, std::complex<float>(0.0f, 0.0f));
}

int main(int argc, char** argv) {
    std::string icao_hex;
    std::string out_path;
    std::string callsign;
    double rate = 2e6;
    double alt = 38000.0;
    double lat = NAN;
    double lon = NAN;
    double gap_us = 200.0;
    float amplitude = 0.5f;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--icao" && i + 1 < argc) icao_hex = argv[++i];
        else if (a == "--out" && i + 1 < argc) out_path = argv[++i];
        else if (a == "--rate" && i + 1 < argc) rate = std::strtod(argv[++i], nullptr);
        else if (a == "--alt" && i + 1 < argc) alt = std::strtod(argv[++i], nullptr);
        else if (a == "--lat" && i + 1 < argc) lat = std::strtod(argv[++i], nullptr);
        else if (a == "--lon" && i + 1 < argc) lon = std::strtod(argv[++i], nullptr);
        else if (a == "--callsign" && i + 1 < argc) callsign = argv[++i];
        else if (a == "--gap-us" && i + 1 < argc) gap_us = std::strtod(argv[++i], nullptr);
        else if (a == "--amplitude" && i + 1 < argc) amplitude = std::strtof(argv[++i], nullptr);
        else { usage(argv[0]); return 1; }
    }
    if (icao_hex.empty() || out_path.empty()) { usage(argv[0]); return 1; }

    const double spc_f = rate / MODES_CHIP_RATE;
    if (!(spc_f >= 1.0) || std::fabs(spc_f - std::round(spc_f)) > 1e-9) {
        std::fprintf(stderr, "Rate must be a positive multiple of %.0f Hz\n", MODES_CHIP_RATE);
        return 1;
    }
    const unsigned spc = static_cast<unsigned>(std::lround(spc_f));
    const uint32_t icao = static_cast<uint32_t>(std::strtoul(icao_hex.c_str(), nullptr, 16)) & 0xFFFFFFu;
    const auto gap = static_cast<std::size_t>(gap_us * 1e-6 * rate);

    std::vector<std::complex<float>> iq(gap, std::complex<float>(0.0f, 0.0f));

    if (!callsign.empty()) {
        auto me = tx::encode_identification_me(4, 0, callsign);
        if (!me) { std::fprintf(stderr, "Unsupported callsign: %s\n", callsign.c_str()); return 1; }
        append_burst(iq, tx::make_extended_squitter(DF_EXTENDED_SQUITTER, 5, icao, *me), spc, amplitude, gap);
    }

    auto ac12 = msg::encode_ac12(alt);
    if (!ac12) { std::fprintf(stderr, "Altitude out of range: %.0f\n", alt); return 1; }

    tx::AirbornePosition pos;
    pos.altitude_code = *ac12;
    const bool has_position = !std::isnan(lat) && !std::isnan(lon);
    for (auto fmt : {msg::CprFormat::Even, msg::CprFormat::Odd}) {
        pos.format = fmt;
        if (has_position) {
            auto [ylat, xlon] = msg::cpr_encode(lat, lon, fmt);
            pos.lat_cpr = ylat;
            pos.lon_cpr = xlon;
        }
        append_burst(iq, tx::make_extended_squitter(DF_EXTENDED_SQUITTER, 5, icao, tx::encode_me(pos)),
                     spc, amplitude, gap);
    }
    append_burst(iq, tx::make_all_call_reply(5, icao), spc, amplitude, gap);

    try {
        save_cf32(out_path, iq);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "%s\n", e.what());
        return 1;
    }
    std::fprintf(stderr, "Wrote %zu samples at %.0f Hz to %s\n", iq.size(), rate, out_path.c_str());
    return 0;
}
