#include "adsb/msg/parser.hpp"
#include "adsb/debug.hpp"
#include "adsb/msg/altitude.hpp"
#include "adsb/utils/bits.hpp"
#include "adsb/utils/crc.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <numbers>

namespace adsb::msg {

using utils::bits_to_uint;

namespace {

constexpr double kMetresToFeet = 3.28084;

const char kCallsignChars[] =
    "#ABCDEFGHIJKLMNOPQRSTUVWXYZ##### ###############0123456789######";

std::size_t message_bits(uint8_t df) {
    return df >= 16 ? MODES_LONG_BITS : MODES_SHORT_BITS;
}

std::string format_icao(uint32_t icao) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%06X", static_cast<unsigned>(icao & 0xFFFFFFu));
    return buf;
}

VehicleCategory vehicle_category(uint8_t tc, uint32_t cat) {
    if (cat == 0)
        return VehicleCategory::NoData;
    switch (tc) {
        case 4:
            // Set A maps straight onto Light..Rotorcraft.
            return static_cast<VehicleCategory>(cat);
        case 3: {
            static const VehicleCategory set_b[8] = {
                VehicleCategory::NoData, VehicleCategory::Glider, VehicleCategory::LighterThanAir,
                VehicleCategory::Parachute, VehicleCategory::HangGlider, VehicleCategory::Reserved,
                VehicleCategory::UAV, VehicleCategory::Spacecraft};
            return set_b[cat & 7u];
        }
        case 2: {
            static const VehicleCategory set_c[8] = {
                VehicleCategory::NoData, VehicleCategory::EmergencyVehicle,
                VehicleCategory::ServiceVehicle, VehicleCategory::FixedTetheredObstruction,
                VehicleCategory::ClusterObstacle, VehicleCategory::LineObstacle,
                VehicleCategory::Reserved, VehicleCategory::Reserved};
            return set_c[cat & 7u];
        }
        default:
            return VehicleCategory::Reserved;
    }
}

void parse_identification(const uint8_t* b, DecodedMessage& m) {
    m.category = vehicle_category(static_cast<uint8_t>(m.tc), bits_to_uint(b + 37, 3));
    std::string id;
    id.reserve(8);
    for (std::size_t c = 0; c < 8; ++c)
        id.push_back(kCallsignChars[bits_to_uint(b + 40 + 6 * c, 6)]);
    while (!id.empty() && id.back() == ' ')
        id.pop_back();
    m.flight_id = id;
}

void parse_airborne_position(ParserState& state, uint32_t icao, const uint8_t* b, DecodedMessage& m) {
    m.status = static_cast<Status>(bits_to_uint(b + 37, 2));
    m.single_antenna = to_flag(b[39]);

    const uint32_t alt = bits_to_uint(b + 40, 12);
    if (m.tc >= 20) {
        if (alt != 0)
            m.altitude = static_cast<double>(alt) * kMetresToFeet;
    } else if (auto ft = decode_ac12(alt)) {
        m.altitude = *ft;
    }

    m.utc_synchronized = to_flag(b[52]);
    m.cpr_format = b[53] ? CprFormat::Odd : CprFormat::Even;
    CprFrame frame;
    frame.lat = bits_to_uint(b + 54, 17);
    frame.lon = bits_to_uint(b + 71, 17);
    frame.time = m.time;
    m.cpr_latitude = frame.lat;
    m.cpr_longitude = frame.lon;

    if (auto pos = state.update_position(icao, m.cpr_format, frame)) {
        m.latitude = pos->latitude;
        m.longitude = pos->longitude;
    }
}

void parse_airborne_velocity(const uint8_t* b, DecodedMessage& m) {
    const uint32_t st = bits_to_uint(b + 37, 3);
    m.velocity_subtype = (st >= 1 && st <= 4) ? static_cast<VelocitySubtype>(st)
                                              : VelocitySubtype::Reserved;
    m.intent_change = to_flag(b[40]);
    m.ifr_capability = to_flag(b[41]);
    m.velocity_uncertainty = bits_to_uint(b + 42, 3);

    const double factor = (st == 2 || st == 4) ? 4.0 : 1.0;
    if (st == 1 || st == 2) {
        const uint32_t vew = bits_to_uint(b + 46, 10);
        const uint32_t vns = bits_to_uint(b + 57, 10);
        if (vew != 0 && vns != 0) {
            const double vx = (vew - 1.0) * factor * (b[45] ? -1.0 : 1.0);
            const double vy = (vns - 1.0) * factor * (b[56] ? -1.0 : 1.0);
            m.speed = std::hypot(vx, vy);
            double hdg = std::atan2(vx, vy) * 180.0 / std::numbers::pi;
            if (hdg < 0.0) hdg += 360.0;
            m.heading = hdg;
        }
        m.speed_reference = SpeedReference::Ground;
    } else if (st == 3 || st == 4) {
        if (b[45])
            m.heading = bits_to_uint(b + 46, 10) * 360.0 / 1024.0;
        const uint32_t as = bits_to_uint(b + 57, 10);
        if (as != 0)
            m.speed = (as - 1.0) * factor;
        m.speed_reference = b[56] ? SpeedReference::TAS : SpeedReference::IAS;
    } else {
        return;
    }

    m.vertical_rate_source = b[67] ? VerticalRateSource::Barometric : VerticalRateSource::GNSS;
    const uint32_t vr = bits_to_uint(b + 69, 9);
    if (vr != 0)
        m.vertical_rate = (vr - 1.0) * 64.0 * (b[68] ? -1.0 : 1.0);
    const uint32_t dalt = bits_to_uint(b + 81, 7);
    if (dalt != 0)
        m.height_difference = (dalt - 1.0) * 25.0 * (b[80] ? -1.0 : 1.0);
}

} // namespace

std::optional<Position> ParserState::update_position(uint32_t icao, CprFormat fmt, const CprFrame& frame) {
    CprPair& pair = aircraft_[icao];
    if (fmt == CprFormat::Odd)
        pair.odd = frame;
    else
        pair.even = frame;

    std::optional<CprFrame>& other = (fmt == CprFormat::Odd) ? pair.even : pair.odd;
    if (!other)
        return std::nullopt;
    if (std::fabs(frame.time - other->time) > pair_window_) {
        debug::set_fail(debug::FAIL_CPR_STALE);
        ADSB_DEBUGF("cpr: %06X partner frame %.3f s old, discarded",
                    static_cast<unsigned>(icao), frame.time - other->time);
        other.reset();
        return std::nullopt;
    }
    // The frame just received is the newest; it fixes the zone.
    return cpr_decode_global(*pair.even, *pair.odd, fmt);
}

void ParserState::prune(double now) {
    for (auto it = aircraft_.begin(); it != aircraft_.end();) {
        double newest = -std::numeric_limits<double>::infinity();
        if (it->second.even) newest = std::max(newest, it->second.even->time);
        if (it->second.odd) newest = std::max(newest, it->second.odd->time);
        if (now - newest > pair_window_)
            it = aircraft_.erase(it);
        else
            ++it;
    }
}

uint8_t type_code(const uint8_t* bits) {
    return static_cast<uint8_t>(bits_to_uint(bits + 32, 5));
}

uint32_t icao_address(const uint8_t* bits, uint8_t df) {
    switch (df) {
        case 0: case 4: case 5: case 16: case 20: case 21: {
            utils::ModeSCrc crc;
            return crc.remainder(bits, message_bits(df));
        }
        default:
            return bits_to_uint(bits + 8, 24);
    }
}

DecodedMessage parse_message(ParserState& state, const rx::PhyPacket& pkt) {
    const uint8_t* b = pkt.raw_bits.data();
    DecodedMessage m;
    m.time = pkt.time;
    m.crc_error = pkt.crc_error;
    m.df = pkt.df;
    m.ca = pkt.ca;
    m.message = utils::bits_to_hex(b, message_bits(pkt.df));

    const uint32_t icao = icao_address(b, pkt.df);
    m.icao24 = format_icao(icao);

    if (pkt.df != DF_EXTENDED_SQUITTER && pkt.df != DF_EXTENDED_SQUITTER_NT)
        return m;

    m.tc = type_code(b);
    if (m.tc >= 1 && m.tc <= 4)
        parse_identification(b, m);
    else if ((m.tc >= 9 && m.tc <= 18) || (m.tc >= 20 && m.tc <= 22))
        parse_airborne_position(state, icao, b, m);
    else if (m.tc == 19)
        parse_airborne_velocity(b, m);
    return m;
}

std::vector<DecodedMessage> parse_messages(ParserState& state, const rx::PhyResult& phy) {
    std::vector<DecodedMessage> out;
    double latest = -std::numeric_limits<double>::infinity();
    for (const auto& pkt : phy.detected()) {
        if (pkt.crc_error)
            continue;
        out.push_back(parse_message(state, pkt));
        latest = std::max(latest, pkt.time);
    }
    if (!out.empty())
        state.prune(latest);
    return out;
}

} // namespace adsb::msg
