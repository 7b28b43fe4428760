#include "adsb/msg/message.hpp"

namespace adsb::msg {

const char* to_string(VehicleCategory c) {
    switch (c) {
        case VehicleCategory::NoData:                   return "NoData";
        case VehicleCategory::Light:                    return "Light";
        case VehicleCategory::Medium:                   return "Medium";
        case VehicleCategory::Heavy:                    return "Heavy";
        case VehicleCategory::HighVortex:               return "HighVortex";
        case VehicleCategory::VeryHeavy:                return "VeryHeavy";
        case VehicleCategory::HighPerformanceHighSpeed: return "HighPerformanceHighSpeed";
        case VehicleCategory::Rotorcraft:               return "Rotorcraft";
        case VehicleCategory::Glider:                   return "Glider";
        case VehicleCategory::LighterThanAir:           return "LighterThanAir";
        case VehicleCategory::Parachute:                return "Parachute";
        case VehicleCategory::HangGlider:               return "HangGlider";
        case VehicleCategory::UAV:                      return "UAV";
        case VehicleCategory::Spacecraft:               return "Spacecraft";
        case VehicleCategory::EmergencyVehicle:         return "EmergencyVehicle";
        case VehicleCategory::ServiceVehicle:           return "ServiceVehicle";
        case VehicleCategory::FixedTetheredObstruction: return "FixedTetheredObstruction";
        case VehicleCategory::ClusterObstacle:          return "ClusterObstacle";
        case VehicleCategory::LineObstacle:             return "LineObstacle";
        case VehicleCategory::Reserved:                 return "Reserved";
        case VehicleCategory::Unset:                    break;
    }
    return "";
}

const char* to_string(Status s) {
    switch (s) {
        case Status::NoEmergency:    return "NoEmergency";
        case Status::PermanentAlert: return "PermanentAlert";
        case Status::TemporaryAlert: return "TemporaryAlert";
        case Status::SPI:            return "SPI";
        case Status::Unset:          break;
    }
    return "";
}

const char* to_string(CprFormat f) {
    switch (f) {
        case CprFormat::Even:  return "Even";
        case CprFormat::Odd:   return "Odd";
        case CprFormat::Unset: break;
    }
    return "";
}

} // namespace adsb::msg
