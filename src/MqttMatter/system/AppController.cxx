// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "system/AppController.hxx"
#include "mqtt/MQTTClient.hxx"
#include "mqtt/MQTTEventProcess.hxx"
#include "system/SyslogConfig.hxx"
#include "wifi/Wifi.hxx"
#include "utils/StringUtils.hxx"

namespace mqttMatter
{
    static constexpr  char TAG[] = "AppController";

    esp_err_t AppController::start() {
        ESP_LOGI(TAG, "Starting bridge...");
        m_config = ConfigManager::Instance().getConfig();

        if (const esp_err_t err = initBridgeSubsystem(); err != ESP_OK) {
            return err;
        }
        return initNetworkSubsystem();
    }

    esp_err_t AppController::initBridgeSubsystem() {
        ESP_LOGI(TAG, "Initializing bridge subsystem...");
        auto& mqtt = MQTTClient::Instance();

        BridgeIdentity identity;
        identity.vendor = m_config.vendor_name;
        identity.model = m_config.product_name;

        DiscoveryRouterSettings router_settings;
        router_settings.discovery_root = m_config.discovery_topic;
        router_settings.window_ms = m_config.discovery_window_ms;
        router_settings.runtime_topics = utils::splitList(m_config.runtime_topics);

        m_registrar = std::make_unique<MQTTDeviceRegistrar>(mqtt, m_config.bridge_topic);
        m_bridge = std::make_unique<DiscoveryBridge>(m_config.discovery_topic, *m_registrar, std::move(identity));
        m_router = std::make_unique<MQTTDiscoveryRouter>(mqtt, *m_bridge, std::move(router_settings));

        auto& process = MQTTEventProcess::Instance();
        if (const esp_err_t err = process.init([this](const MqttEvent& event) { m_router->dispatch(event); }); err != ESP_OK) {
            return err;
        }
        if (const esp_err_t err = m_router->init(process); err != ESP_OK) {
            return err;
        }

        mqtt.onConnected = [this]() { this->onMqttConnected(); };
        mqtt.onDisconnected = [this]() { postEvent({MqttEventType::DISCONNECTED, {}, {}, 0}); };
        mqtt.onData = [this](const std::string& topic, const std::string& data) {
            postEvent({MqttEventType::DATA, topic, data, 0});
        };
        mqtt.onError = [this](const std::string& reason) { postEvent({MqttEventType::TRANSPORT_ERROR, {}, reason, 0}); };
        return ESP_OK;
    }

    esp_err_t AppController::initNetworkSubsystem() {
        auto& wifi = Wifi::Instance();
        if (const esp_err_t err = wifi.init(); err != ESP_OK) {
            return err;
        }

        wifi.onConnected = [this]() { this->onNetworkConnected(); };
        wifi.onDisconnected = [this]() { this->onNetworkDisconnected(); };

        return wifi.connectToAP(m_config.wifi_ssid, m_config.wifi_password);
    }

    void AppController::onNetworkConnected() {
        ESP_LOGI(TAG, "Network Connected. IP: %s", Wifi::Instance().getIpAddress().c_str());

        if (m_config.syslog_enabled && !m_config.syslog_server.empty()) {
            if (const esp_err_t err = SyslogConfig::Instance().init(m_config.syslog_server); err != ESP_OK) {
                ESP_LOGW(TAG, "Remote logging unavailable: %s", esp_err_to_name(err));
            }
        }

        auto& mqtt = MQTTClient::Instance();
        if (!m_mqtt_initialized) {
            MqttSettings settings;
            settings.uri = ConfigManager::buildBrokerUri(m_config.mqtt_host, m_config.mqtt_port);
            settings.client_id = m_config.client_id;
            settings.username = m_config.mqtt_user;
            settings.password = m_config.mqtt_pass;
            settings.availability_topic = utils::stringFormat("%s/status", m_config.bridge_topic.c_str());

            if (const esp_err_t err = mqtt.init(settings); err != ESP_OK) {
                ESP_LOGE(TAG, "MQTT init failed: %s", esp_err_to_name(err));
                return;
            }
            m_mqtt_initialized = true;
        }

        if (const esp_err_t err = mqtt.connect(); err != ESP_OK) {
            ESP_LOGE(TAG, "MQTT connect failed: %s", esp_err_to_name(err));
        }
    }

    void AppController::onNetworkDisconnected() {
        ESP_LOGW(TAG, "Network Disconnected, stopping MQTT.");
        MQTTClient::Instance().disconnect();
    }

    void AppController::onMqttConnected() {
        ESP_LOGI(TAG, "MQTT connected successfully.");
        auto const& mqtt = MQTTClient::Instance();

        const std::string status_topic = utils::stringFormat("%s/status", m_config.bridge_topic.c_str());
        if (mqtt.publish(status_topic, CONFIG_MQTTMATTER_PAYLOAD_ONLINE, 1, true) != ESP_OK) {
            ESP_LOGW(TAG, "Failed to publish availability to %s", status_topic.c_str());
        }

        const std::string version_topic = utils::stringFormat("%s/version", m_config.bridge_topic.c_str());
        if (mqtt.publish(version_topic, MQTTMATTER_VERSION, 1, true) != ESP_OK) {
            ESP_LOGW(TAG, "Failed to publish version to %s", version_topic.c_str());
        }

        postEvent({MqttEventType::CONNECTED, {}, {}, 0});
    }

    void AppController::postEvent(MqttEvent event) const {
        const auto& process = MQTTEventProcess::Instance();
        if (event.type != MqttEventType::DATA) {
            // Connection state changes drive the discovery window and are never dropped
            if (!process.enqueueBlocking(std::move(event))) {
                ESP_LOGE(TAG, "Event processor not running, transport event lost");
            }
            return;
        }
        // Holding the esp-mqtt task here pushes back on the broker connection
        if (!process.enqueue(std::move(event), pdMS_TO_TICKS(CONFIG_MQTTMATTER_EVENT_ENQUEUE_TIMEOUT_MS))) {
            ESP_LOGE(TAG, "Transport message lost after %d ms", CONFIG_MQTTMATTER_EVENT_ENQUEUE_TIMEOUT_MS);
        }
    }
} // mqttMatter
