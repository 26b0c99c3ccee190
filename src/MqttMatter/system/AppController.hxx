// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef MQTTMATTER_APPCONTROLLER_HXX
#define MQTTMATTER_APPCONTROLLER_HXX

#include "config/ConfigManager.hxx"
#include "matter/MQTTDeviceRegistrar.hxx"
#include "mqtt/MQTTDiscoveryRouter.hxx"
#include "system/DiscoveryBridge.hxx"

namespace mqttMatter
{
    class AppController {
        public:
            AppController(const AppController&) = delete;
            AppController& operator=(const AppController&) = delete;

            static AppController& Instance() {
                static AppController instance;
                return instance;
            }

            esp_err_t start();

        private:
            AppController() = default;

            esp_err_t initBridgeSubsystem();
            esp_err_t initNetworkSubsystem();

            // Callbacks
            void onNetworkConnected();
            void onNetworkDisconnected();
            void onMqttConnected();

            void postEvent(MqttEvent event) const;

            AppConfig m_config;
            std::unique_ptr<MQTTDeviceRegistrar> m_registrar;
            std::unique_ptr<DiscoveryBridge> m_bridge;
            std::unique_ptr<MQTTDiscoveryRouter> m_router;

            bool m_mqtt_initialized{false};
    };
} // mqttMatter

#endif //MQTTMATTER_APPCONTROLLER_HXX
