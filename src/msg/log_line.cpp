#include "adsb/msg/log_line.hpp"

#include <cmath>
#include <cstdio>

namespace adsb::msg {

namespace {

void append_number(std::string& out, double v, int precision) {
    out.push_back(',');
    if (std::isnan(v))
        return;
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%.*f", precision, v);
    out += buf;
}

void append_text(std::string& out, const char* s) {
    out.push_back(',');
    out += s;
}

} // namespace

const std::string& log_header() {
    static const std::string header =
        "Time,Message,CRC,DF,CA,ICAO24,TC,Category,FlightID,Status,Altitude,"
        "CPRFormat,Latitude,Longitude,Speed,Heading,VerticalRate";
    return header;
}

std::string format_log_line(const DecodedMessage& m) {
    std::string out;
    out.reserve(160);
    char buf[48];
    if (!std::isnan(m.time)) {
        std::snprintf(buf, sizeof(buf), "%.6f", m.time);
        out += buf;
    }
    append_text(out, m.message.c_str());
    append_text(out, m.crc_error ? "1" : "0");
    std::snprintf(buf, sizeof(buf), ",%u,%u", static_cast<unsigned>(m.df), static_cast<unsigned>(m.ca));
    out += buf;
    append_text(out, m.icao24.c_str());
    out.push_back(',');
    if (m.tc >= 0)
        out += std::to_string(m.tc);
    append_text(out, to_string(m.category));
    append_text(out, m.flight_id.c_str());
    append_text(out, to_string(m.status));
    append_number(out, m.altitude, 0);
    append_text(out, to_string(m.cpr_format));
    append_number(out, m.latitude, 6);
    append_number(out, m.longitude, 6);
    append_number(out, m.speed, 1);
    append_number(out, m.heading, 2);
    append_number(out, m.vertical_rate, 0);
    return out;
}

} // namespace adsb::msg
