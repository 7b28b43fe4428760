#pragma once
#include <cstdint>
#include <limits>
#include <string>

namespace adsb::msg {

inline constexpr double kUnset = std::numeric_limits<double>::quiet_NaN();

enum class CprFormat : uint8_t {
    Even  = 0,
    Odd   = 1,
    Unset = 3,
};

// Surveillance status of airborne position squitters.
enum class Status : uint8_t {
    NoEmergency    = 0,
    PermanentAlert = 1,
    TemporaryAlert = 2,
    SPI            = 3,
    Unset          = 4,
};

enum class VehicleCategory : uint8_t {
    NoData                   = 0,
    Light                    = 1,
    Medium                   = 2,
    Heavy                    = 3,
    HighVortex               = 4,
    VeryHeavy                = 5,
    HighPerformanceHighSpeed = 6,
    Rotorcraft               = 7,
    Glider                   = 8,
    LighterThanAir           = 9,
    Parachute                = 10,
    HangGlider               = 11,
    UAV                      = 12,
    Spacecraft               = 13,
    EmergencyVehicle         = 14,
    ServiceVehicle           = 15,
    FixedTetheredObstruction = 16,
    ClusterObstacle          = 17,
    LineObstacle             = 18,
    Reserved                 = 19,
    Unset                    = 20,
};

enum class VelocitySubtype : uint8_t {
    Reserved            = 0,
    CartesianNormal     = 1,
    CartesianSupersonic = 2,
    PolarNormal         = 3,
    PolarSupersonic     = 4,
    Unset               = 8,
};

enum class SpeedReference : uint8_t {
    Ground = 0,
    IAS    = 1,
    TAS    = 2,
    Unset  = 3,
};

enum class VerticalRateSource : uint8_t {
    GNSS       = 0,
    Barometric = 1,
    Unset      = 2,
};

enum class Flag : uint8_t {
    False = 0,
    True  = 1,
    Unset = 2,
};

inline Flag to_flag(uint32_t bit) { return bit ? Flag::True : Flag::False; }

// Fixed-shape decoded message. Fields that a DF/TC does not carry keep
// their sentinel: NaN, empty string, or the enum's Unset code.
struct DecodedMessage {
    double time{kUnset};
    std::string message;        // raw bits as hex
    bool crc_error{true};
    uint8_t df{0};
    uint8_t ca{0};
    std::string icao24;         // 6 uppercase hex characters
    int tc{-1};                 // -1 for formats without a type code

    // Identification
    VehicleCategory category{VehicleCategory::Unset};
    std::string flight_id;

    // Airborne position
    Status status{Status::Unset};
    Flag single_antenna{Flag::Unset};
    double altitude{kUnset};    // ft
    Flag utc_synchronized{Flag::Unset};
    CprFormat cpr_format{CprFormat::Unset};
    double cpr_latitude{kUnset};   // raw 17-bit value
    double cpr_longitude{kUnset};
    double latitude{kUnset};       // deg, after global decode
    double longitude{kUnset};

    // Airborne velocity
    VelocitySubtype velocity_subtype{VelocitySubtype::Unset};
    Flag intent_change{Flag::Unset};
    Flag ifr_capability{Flag::Unset};
    double velocity_uncertainty{kUnset};   // NUCv
    double speed{kUnset};                  // kt
    SpeedReference speed_reference{SpeedReference::Unset};
    double heading{kUnset};                // deg
    VerticalRateSource vertical_rate_source{VerticalRateSource::Unset};
    double vertical_rate{kUnset};          // ft/min
    double height_difference{kUnset};      // GNSS minus baro, ft
};

const char* to_string(VehicleCategory c);
const char* to_string(Status s);
const char* to_string(CprFormat f);

} // namespace adsb::msg
