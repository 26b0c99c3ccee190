// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "CapabilityClassifier.hxx"

namespace mqttMatter
{
    struct DeviceClassMapping {
        std::string_view device_class;
        CapabilityType type;
    };

    static constexpr std::array<DeviceClassMapping, 29> DEVICE_CLASS_MAP = {{
        {"temperature",                      CapabilityType::TEMPERATURE_SENSOR},
        {"humidity",                         CapabilityType::HUMIDITY_SENSOR},
        {"pressure",                         CapabilityType::PRESSURE_SENSOR},
        {"illuminance",                      CapabilityType::LIGHT_SENSOR},
        {"power",                            CapabilityType::ELECTRICAL_SENSOR},
        {"energy",                           CapabilityType::ELECTRICAL_SENSOR},
        {"voltage",                          CapabilityType::ELECTRICAL_SENSOR},
        {"current",                          CapabilityType::ELECTRICAL_SENSOR},
        {"carbon_dioxide",                   CapabilityType::AIR_QUALITY_SENSOR},
        {"carbon_monoxide",                  CapabilityType::AIR_QUALITY_SENSOR},
        {"volatile_organic_compounds",       CapabilityType::AIR_QUALITY_SENSOR},
        {"volatile_organic_compounds_parts", CapabilityType::AIR_QUALITY_SENSOR},
        {"motion",                           CapabilityType::OCCUPANCY_SENSOR},
        {"presence",                         CapabilityType::OCCUPANCY_SENSOR},
        {"door",                             CapabilityType::CONTACT_SENSOR},
        {"window",                           CapabilityType::CONTACT_SENSOR},
        {"moisture",                         CapabilityType::WATER_LEAK_DETECTOR},
        {"smoke",                            CapabilityType::SMOKE_CO_ALARM},
        {"gas",                              CapabilityType::SMOKE_CO_ALARM},
        {"light",                            CapabilityType::DIMMABLE_LIGHT},
        {"switch",                           CapabilityType::ON_OFF_SWITCH},
        {"outlet",                           CapabilityType::ON_OFF_OUTLET},
        {"valve",                            CapabilityType::WATER_VALVE},
        {"cover",                            CapabilityType::COVER},
        {"fan",                              CapabilityType::FAN},
        {"humidifier",                       CapabilityType::AIR_PURIFIER},
        {"dehumidifier",                     CapabilityType::AIR_PURIFIER},
        {"thermostat",                       CapabilityType::THERMOSTAT},
        {"lock",                             CapabilityType::DOOR_LOCK},
    }};

    std::optional<CapabilityType> CapabilityClassifier::fromDeviceClass(const std::string_view device_class) {
        if (device_class.empty()) {
            return std::nullopt;
        }
        for (const auto& [name, type] : DEVICE_CLASS_MAP) {
            if (name == device_class) {
                return type;
            }
        }
        return std::nullopt;
    }

    std::optional<CapabilityType> CapabilityClassifier::fromUnit(const std::string_view unit) {
        if (unit == "W" || unit == "Wh" || unit == "kWh") {
            return CapabilityType::ELECTRICAL_SENSOR;
        }
        if (unit == "°C" || unit == "°F") {
            return CapabilityType::TEMPERATURE_SENSOR;
        }
        return std::nullopt;
    }

    CapabilityType CapabilityClassifier::classify(const EntityRecord& entity) {
        if (entity.device_class) {
            if (const auto type = fromDeviceClass(*entity.device_class)) {
                return *type;
            }
        }

        if (entity.unit_of_measurement) {
            if (const auto type = fromUnit(*entity.unit_of_measurement)) {
                return *type;
            }
        }

        if (entity.discovery_type == "number") {
            // 0..100 reads as a percentage, i.e. a level control
            if (entity.numeric_range && entity.numeric_range->min >= 0.0 && entity.numeric_range->max <= 100.0) {
                return CapabilityType::DIMMABLE_LIGHT;
            }
            return CapabilityType::MODE_SELECT;
        }

        if (entity.discovery_type == "select") {
            return CapabilityType::MODE_SELECT;
        }

        return CapabilityType::GENERIC_SWITCH;
    }

    const char* capabilityTypeName(const CapabilityType type) {
        switch (type) {
            case CapabilityType::TEMPERATURE_SENSOR:  return "temperature_sensor";
            case CapabilityType::HUMIDITY_SENSOR:     return "humidity_sensor";
            case CapabilityType::PRESSURE_SENSOR:     return "pressure_sensor";
            case CapabilityType::LIGHT_SENSOR:        return "light_sensor";
            case CapabilityType::ELECTRICAL_SENSOR:   return "electrical_sensor";
            case CapabilityType::AIR_QUALITY_SENSOR:  return "air_quality_sensor";
            case CapabilityType::OCCUPANCY_SENSOR:    return "occupancy_sensor";
            case CapabilityType::CONTACT_SENSOR:      return "contact_sensor";
            case CapabilityType::WATER_LEAK_DETECTOR: return "water_leak_detector";
            case CapabilityType::SMOKE_CO_ALARM:      return "smoke_co_alarm";
            case CapabilityType::DIMMABLE_LIGHT:      return "dimmable_light";
            case CapabilityType::ON_OFF_SWITCH:       return "on_off_switch";
            case CapabilityType::ON_OFF_OUTLET:       return "on_off_outlet";
            case CapabilityType::WATER_VALVE:         return "water_valve";
            case CapabilityType::COVER:               return "cover";
            case CapabilityType::FAN:                 return "fan";
            case CapabilityType::AIR_PURIFIER:        return "air_purifier";
            case CapabilityType::THERMOSTAT:          return "thermostat";
            case CapabilityType::DOOR_LOCK:           return "door_lock";
            case CapabilityType::MODE_SELECT:         return "mode_select";
            case CapabilityType::GENERIC_SWITCH:      return "generic_switch";
        }
        return "generic_switch";
    }

    uint16_t matterDeviceTypeId(const CapabilityType type) {
        switch (type) {
            case CapabilityType::TEMPERATURE_SENSOR:  return 0x0302;
            case CapabilityType::HUMIDITY_SENSOR:     return 0x0307;
            case CapabilityType::PRESSURE_SENSOR:     return 0x0305;
            case CapabilityType::LIGHT_SENSOR:        return 0x0106;
            case CapabilityType::ELECTRICAL_SENSOR:   return 0x0510;
            case CapabilityType::AIR_QUALITY_SENSOR:  return 0x002C;
            case CapabilityType::OCCUPANCY_SENSOR:    return 0x0107;
            case CapabilityType::CONTACT_SENSOR:      return 0x0015;
            case CapabilityType::WATER_LEAK_DETECTOR: return 0x0043;
            case CapabilityType::SMOKE_CO_ALARM:      return 0x0076;
            case CapabilityType::DIMMABLE_LIGHT:      return 0x0101;
            case CapabilityType::ON_OFF_SWITCH:       return 0x0103;
            case CapabilityType::ON_OFF_OUTLET:       return 0x010A;
            case CapabilityType::WATER_VALVE:         return 0x0042;
            case CapabilityType::COVER:               return 0x0202;
            case CapabilityType::FAN:                 return 0x002B;
            case CapabilityType::AIR_PURIFIER:        return 0x002D;
            case CapabilityType::THERMOSTAT:          return 0x0301;
            case CapabilityType::DOOR_LOCK:           return 0x000A;
            case CapabilityType::MODE_SELECT:         return 0x0027;
            case CapabilityType::GENERIC_SWITCH:      return 0x000F;
        }
        return 0x000F;
    }
} // mqttMatter
