// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef MQTTMATTER_MQTTCLIENT_HXX
#define MQTTMATTER_MQTTCLIENT_HXX

#include "mqtt_client.h"

namespace mqttMatter
{
    enum class MqttStatus {
        DISCONNECTED,
        CONNECTING,
        CONNECTED
    };

    struct MqttSettings {
        std::string uri;                // Full broker URI, see ConfigManager::buildBrokerUri()
        std::string client_id;
        std::string username;
        std::string password;
        std::string availability_topic; // Last will target, empty disables it
    };

    class MQTTClient {
        public:
            MQTTClient(const MQTTClient&) = delete;
            MQTTClient& operator=(const MQTTClient&) = delete;

            static MQTTClient& Instance() {
                static MQTTClient instance;
                return instance;
            }

            esp_err_t init(const MqttSettings& settings);

            esp_err_t connect();
            void disconnect();

            [[nodiscard]] MqttStatus getStatus() const;

            /**
             * @return ESP_ERR_INVALID_STATE before init(), ESP_FAIL when the client refuses the message.
             */
            esp_err_t publish(const std::string& topic, const std::string& payload, int qos = 0, bool retain = false) const;
            esp_err_t subscribe(const std::string& topic, int qos = 0) const;

            // Callbacks, invoked from the esp-mqtt task
            std::function<void()> onConnected;
            std::function<void()> onDisconnected;
            std::function<void(const std::string& topic, const std::string& data)> onData;
            std::function<void(const std::string& reason)> onError;

            static void mqttEventHandler(void* handler_args, esp_event_base_t base, int32_t event_id, void* event_data);

        private:
            MQTTClient() = default;

            void handleData(const esp_mqtt_event_t& event);

            esp_mqtt_client_handle_t client_handle{nullptr};
            std::atomic<MqttStatus> status{MqttStatus::DISCONNECTED};
            MqttSettings m_settings;

            // Reassembly of payloads larger than the esp-mqtt input buffer
            std::string m_fragment_topic;
            std::string m_fragment_data;
    };
} // mqttMatter

#endif //MQTTMATTER_MQTTCLIENT_HXX
