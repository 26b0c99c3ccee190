// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef MQTTMATTER_CAPABILITYCLASSIFIER_HXX
#define MQTTMATTER_CAPABILITYCLASSIFIER_HXX

#include "discovery/DiscoveryTypes.hxx"

namespace mqttMatter
{
    // Matter device types an entity can be bridged as
    enum class CapabilityType : uint8_t {
        TEMPERATURE_SENSOR,
        HUMIDITY_SENSOR,
        PRESSURE_SENSOR,
        LIGHT_SENSOR,
        ELECTRICAL_SENSOR,
        AIR_QUALITY_SENSOR,
        OCCUPANCY_SENSOR,
        CONTACT_SENSOR,
        WATER_LEAK_DETECTOR,
        SMOKE_CO_ALARM,
        DIMMABLE_LIGHT,
        ON_OFF_SWITCH,
        ON_OFF_OUTLET,
        WATER_VALVE,
        COVER,
        FAN,
        AIR_PURIFIER,
        THERMOSTAT,
        DOOR_LOCK,
        MODE_SELECT,
        GENERIC_SWITCH
    };

    class CapabilityClassifier {
        public:
            CapabilityClassifier() = delete;

            /**
             * @brief Maps an entity to its capability type.
             * Precedence: device_class, then unit of measurement, then discovery type
             * ("number", "select"), then GENERIC_SWITCH. Never fails.
             */
            [[nodiscard]] static CapabilityType classify(const EntityRecord& entity);

            [[nodiscard]] static std::optional<CapabilityType> fromDeviceClass(std::string_view device_class);
            [[nodiscard]] static std::optional<CapabilityType> fromUnit(std::string_view unit);
    };

    [[nodiscard]] const char* capabilityTypeName(CapabilityType type);

    // Matter device type id from the Device Library
    [[nodiscard]] uint16_t matterDeviceTypeId(CapabilityType type);
} // mqttMatter

#endif //MQTTMATTER_CAPABILITYCLASSIFIER_HXX
