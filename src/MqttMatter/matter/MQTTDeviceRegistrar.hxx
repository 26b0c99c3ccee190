// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef MQTTMATTER_MQTTDEVICEREGISTRAR_HXX
#define MQTTMATTER_MQTTDEVICEREGISTRAR_HXX

#include "DeviceRegistrar.hxx"

namespace mqttMatter
{
    class MQTTClient;

    /**
     * @brief Publishes each resolved device as a retained JSON document to
     * <bridge_topic>/devices/<id>/config for the Matter side to pick up.
     */
    class MQTTDeviceRegistrar final : public DeviceRegistrar {
        public:
            MQTTDeviceRegistrar(const MQTTClient& mqtt, std::string bridge_topic);

            esp_err_t registerDevice(const DeviceRegistration& registration) override;

            [[nodiscard]] std::string registrationTopic(const std::string& device_identifier) const;
            [[nodiscard]] static std::string toJson(const DeviceRegistration& registration);

        private:
            const MQTTClient& m_mqtt;
            std::string m_bridge_topic;
    };
} // mqttMatter

#endif //MQTTMATTER_MQTTDEVICEREGISTRAR_HXX
