// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef MQTTMATTER_DEVICEREGISTRAR_HXX
#define MQTTMATTER_DEVICEREGISTRAR_HXX

#include "CapabilityClassifier.hxx"

namespace mqttMatter
{
    struct ChildCapability {
        std::string name;             // Entity display name
        std::string entity_id;
        CapabilityType type{CapabilityType::GENERIC_SWITCH};
    };

    // Composite endpoint for one physical device
    struct DeviceRegistration {
        std::string device_identifier;
        std::string display_name;
        std::string vendor;
        std::string model;
        std::string serial;
        std::string firmware_version;
        uint32_t hardware_version{0};
        std::vector<ChildCapability> children;
    };

    /**
     * @brief Boundary towards the Matter side of the bridge.
     * Registering the same identifier twice must be harmless.
     */
    class DeviceRegistrar {
        public:
            virtual ~DeviceRegistrar() = default;
            virtual esp_err_t registerDevice(const DeviceRegistration& registration) = 0;
    };
} // mqttMatter

#endif //MQTTMATTER_DEVICEREGISTRAR_HXX
