// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "MQTTClient.hxx"
#include "utils/StringUtils.hxx"

namespace mqttMatter
{
    static constexpr char  TAG[] = "MQTTClient";

    esp_err_t MQTTClient::init(const MqttSettings& settings) {
        if (client_handle) {
            ESP_LOGI(TAG, "Re-initializing MQTT client");
            esp_mqtt_client_stop(client_handle);
            esp_mqtt_client_destroy(client_handle);
            client_handle = nullptr;
        }
        m_settings = settings;

        esp_mqtt_client_config_t mqtt_cfg = {};
        mqtt_cfg.broker.address.uri = m_settings.uri.c_str();
        mqtt_cfg.credentials.client_id = m_settings.client_id.c_str();
        if (!m_settings.username.empty()) {
            mqtt_cfg.credentials.username = m_settings.username.c_str();
        }
        if (!m_settings.password.empty()) {
            mqtt_cfg.credentials.authentication.password = m_settings.password.c_str();
        }
        if (!m_settings.availability_topic.empty()) {
            mqtt_cfg.session.last_will.topic = m_settings.availability_topic.c_str();
            mqtt_cfg.session.last_will.msg = CONFIG_MQTTMATTER_PAYLOAD_OFFLINE;
            mqtt_cfg.session.last_will.qos = 1;
            mqtt_cfg.session.last_will.retain = true;
        }

        client_handle = esp_mqtt_client_init(&mqtt_cfg);
        if (!client_handle) {
            ESP_LOGE(TAG, "esp_mqtt_client_init failed for %s", m_settings.uri.c_str());
            return ESP_FAIL;
        }
        const esp_err_t err = esp_mqtt_client_register_event(client_handle, MQTT_EVENT_ANY, mqttEventHandler, this);
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "Failed to register MQTT event handler: %s", esp_err_to_name(err));
            esp_mqtt_client_destroy(client_handle);
            client_handle = nullptr;
            return err;
        }
        status = MqttStatus::DISCONNECTED;
        ESP_LOGI(TAG, "MQTT client configured for %s as '%s'", m_settings.uri.c_str(), m_settings.client_id.c_str());
        return ESP_OK;
    }

    esp_err_t MQTTClient::connect() {
        if (!client_handle) {
            ESP_LOGE(TAG, "connect() called before init()");
            return ESP_ERR_INVALID_STATE;
        }
        status = MqttStatus::CONNECTING;
        const esp_err_t err = esp_mqtt_client_start(client_handle);
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "Failed to start MQTT client: %s", esp_err_to_name(err));
            status = MqttStatus::DISCONNECTED;
        }
        return err;
    }

    void MQTTClient::disconnect() {
        if (!client_handle || status == MqttStatus::DISCONNECTED) {
            return;
        }
        status = MqttStatus::DISCONNECTED;
        if (const esp_err_t err = esp_mqtt_client_stop(client_handle); err != ESP_OK) {
            ESP_LOGW(TAG, "esp_mqtt_client_stop: %s", esp_err_to_name(err));
        }
    }

    MqttStatus MQTTClient::getStatus() const {
        return status;
    }

    esp_err_t MQTTClient::publish(const std::string& topic, const std::string& payload, const int qos, const bool retain) const {
        if (!client_handle) return ESP_ERR_INVALID_STATE;
        const int msg_id = esp_mqtt_client_publish(client_handle, topic.c_str(), payload.c_str(), static_cast<int>(payload.length()), qos, retain);
        if (msg_id < 0) {
            ESP_LOGE(TAG, "Publish to '%s' failed", topic.c_str());
            return ESP_FAIL;
        }
        return ESP_OK;
    }

    esp_err_t MQTTClient::subscribe(const std::string& topic, const int qos) const {
        if (!client_handle) return ESP_ERR_INVALID_STATE;
        if (esp_mqtt_client_subscribe(client_handle, topic.c_str(), qos) < 0) {
            ESP_LOGE(TAG, "Subscribe to '%s' failed", topic.c_str());
            return ESP_FAIL;
        }
        return ESP_OK;
    }

    void MQTTClient::handleData(const esp_mqtt_event_t& event) {
        const bool fragmented = event.total_data_len > event.data_len;
        if (!fragmented) {
            if (onData) {
                onData(std::string(event.topic, event.topic_len), std::string(event.data, event.data_len));
            }
            return;
        }

        // Topic is only present on the first chunk
        if (event.current_data_offset == 0) {
            m_fragment_topic.assign(event.topic, event.topic_len);
            m_fragment_data.clear();
            m_fragment_data.reserve(event.total_data_len);
        }
        m_fragment_data.append(event.data, event.data_len);

        if (event.current_data_offset + event.data_len >= event.total_data_len) {
            if (onData) {
                onData(m_fragment_topic, m_fragment_data);
            }
            m_fragment_topic.clear();
            m_fragment_data.clear();
        }
    }

    void MQTTClient::mqttEventHandler(void* handler_args, [[maybe_unused]] esp_event_base_t base, int32_t event_id, void* event_data) {
        auto* client = static_cast<MQTTClient*>(handler_args);
        auto const* event = static_cast<esp_mqtt_event_handle_t>(event_data);
        if (!client || !event) return;

        switch (static_cast<esp_mqtt_event_id_t>(event_id)) {
            case MQTT_EVENT_CONNECTED:
                ESP_LOGI(TAG, "MQTT_EVENT_CONNECTED");
                client->status = MqttStatus::CONNECTED;
                if (client->onConnected) client->onConnected();
                break;
            case MQTT_EVENT_DISCONNECTED:
                ESP_LOGW(TAG, "MQTT_EVENT_DISCONNECTED");
                if (client->status != MqttStatus::DISCONNECTED) {
                    client->status = MqttStatus::CONNECTING;
                }
                if (client->onDisconnected) client->onDisconnected();
                break;
            case MQTT_EVENT_SUBSCRIBED:
                ESP_LOGD(TAG, "MQTT_EVENT_SUBSCRIBED, msg_id=%d", event->msg_id);
                break;
            case MQTT_EVENT_DATA:
                client->handleData(*event);
                break;
            case MQTT_EVENT_ERROR: {
                std::string reason = "unknown";
                if (event->error_handle) {
                    reason = utils::stringFormat("type=%d, connect_return_code=%d, errno=%d",
                                                 static_cast<int>(event->error_handle->error_type),
                                                 static_cast<int>(event->error_handle->connect_return_code),
                                                 event->error_handle->esp_transport_sock_errno);
                }
                ESP_LOGE(TAG, "MQTT_EVENT_ERROR (%s)", reason.c_str());
                if (client->onError) client->onError(reason);
                break;
            }
            default:
                ESP_LOGD(TAG, "Other event id:%d", event->event_id);
                break;
        }
    }
} // mqttMatter
