// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "MQTTDiscoveryRouter.hxx"
#include "MQTTClient.hxx"
#include "MQTTEventProcess.hxx"
#include "utils/StringUtils.hxx"

namespace mqttMatter
{
    static constexpr char TAG[] = "DiscoveryRouter";
    static constexpr std::string_view CONFIG_SUFFIX = "/config";

    MQTTDiscoveryRouter::MQTTDiscoveryRouter(const MQTTClient& mqtt, TransportListener& listener, DiscoveryRouterSettings settings)
        : m_mqtt(mqtt), m_listener(listener), m_settings(std::move(settings)) {
        while (!m_settings.discovery_root.empty() && m_settings.discovery_root.back() == '/') {
            m_settings.discovery_root.pop_back();
        }
    }

    MQTTDiscoveryRouter::~MQTTDiscoveryRouter() {
        if (m_window_timer) {
            xTimerDelete(m_window_timer, portMAX_DELAY);
        }
    }

    esp_err_t MQTTDiscoveryRouter::init(const MQTTEventProcess& process) {
        // Timer service task must not block, a full queue is handled by re-arming
        return init([&process](MqttEvent event) { return process.enqueue(std::move(event), 0); });
    }

    esp_err_t MQTTDiscoveryRouter::init(EventSink post_event) {
        if (m_window_timer) return ESP_OK;
        if (!post_event) return ESP_ERR_INVALID_ARG;
        m_post_event = std::move(post_event);

        const TickType_t period = std::max<TickType_t>(1, pdMS_TO_TICKS(m_settings.window_ms));
        m_window_timer = xTimerCreate("disc_window_tmr", period, pdFALSE, this, windowTimerCallback);
        if (!m_window_timer) {
            ESP_LOGE(TAG, "Failed to create discovery window timer");
            return ESP_ERR_NO_MEM;
        }
        ESP_LOGI(TAG, "Discovery window: %u ms on '%s'", static_cast<unsigned>(m_settings.window_ms), m_settings.discovery_root.c_str());
        return ESP_OK;
    }

    std::vector<std::string> MQTTDiscoveryRouter::discoverySubscriptions() const {
        const char* root = m_settings.discovery_root.c_str();
        return {
            utils::stringFormat("%s/+/+/config", root),
            utils::stringFormat("%s/+/+/+/config", root)
        };
    }

    bool MQTTDiscoveryRouter::isDiscoveryTopic(const std::string& topic) const {
        return topic.starts_with(m_settings.discovery_root) && topic.ends_with(CONFIG_SUFFIX);
    }

    void MQTTDiscoveryRouter::dispatch(const MqttEvent& event) {
        switch (event.type) {
            case MqttEventType::CONNECTED:
                handleConnected();
                break;
            case MqttEventType::DISCONNECTED:
                m_listener.onDisconnected();
                break;
            case MqttEventType::DATA:
                handleData(event.topic, event.payload);
                break;
            case MqttEventType::TRANSPORT_ERROR:
                m_listener.onTransportError(event.payload);
                break;
            case MqttEventType::WINDOW_EXPIRED:
                handleWindowExpired(event.generation);
                break;
        }
    }

    void MQTTDiscoveryRouter::handleConnected() {
        ++m_generation;
        m_window_open = true;
        m_listener.onConnected(m_generation);

        for (const auto& topic : discoverySubscriptions()) {
            if (const esp_err_t err = m_mqtt.subscribe(topic); err != ESP_OK) {
                ESP_LOGE(TAG, "Subscription '%s' failed: %s", topic.c_str(), esp_err_to_name(err));
            } else {
                ESP_LOGI(TAG, "Subscribed to discovery: %s", topic.c_str());
            }
        }
        for (const auto& topic : m_settings.runtime_topics) {
            if (const esp_err_t err = m_mqtt.subscribe(topic); err != ESP_OK) {
                ESP_LOGE(TAG, "Subscription '%s' failed: %s", topic.c_str(), esp_err_to_name(err));
            }
        }

        armWindowTimer();
    }

    void MQTTDiscoveryRouter::handleData(const std::string& topic, const std::string& payload) {
        if (!m_window_open) {
            m_listener.onRuntimeMessage(topic, payload);
            return;
        }
        if (isDiscoveryTopic(topic)) {
            m_listener.onDiscoveryMessage(topic, payload);
            return;
        }
        ESP_LOGD(TAG, "Dropping '%s' during discovery window", topic.c_str());
    }

    void MQTTDiscoveryRouter::handleWindowExpired(const uint32_t generation) {
        if (generation != m_generation || !m_window_open) {
            ESP_LOGD(TAG, "Ignoring stale window expiry (%u, current %u)", static_cast<unsigned>(generation), static_cast<unsigned>(m_generation));
            return;
        }
        m_window_open = false;
        ESP_LOGI(TAG, "Discovery window %u closed", static_cast<unsigned>(generation));
        m_listener.onDiscoveryWindowClosed(generation);
    }

    void MQTTDiscoveryRouter::armWindowTimer() {
        if (!m_window_timer) {
            ESP_LOGD(TAG, "No window timer, window %u stays open until expiry is dispatched", static_cast<unsigned>(m_generation));
            return;
        }
        m_armed_generation = m_generation;
        // Starts a dormant timer, restarts one left over from a previous connection
        // and undoes a retry period
        const TickType_t period = std::max<TickType_t>(1, pdMS_TO_TICKS(m_settings.window_ms));
        if (xTimerChangePeriod(m_window_timer, period, 0) != pdPASS) {
            ESP_LOGE(TAG, "Failed to arm discovery window timer");
        }
    }

    void MQTTDiscoveryRouter::windowTimerCallback(TimerHandle_t timer) {
        if (auto* self = static_cast<MQTTDiscoveryRouter*>(pvTimerGetTimerID(timer))) {
            self->onWindowTimerExpired();
        }
    }

    void MQTTDiscoveryRouter::onWindowTimerExpired() {
        if (!m_post_event) return;

        MqttEvent event;
        event.type = MqttEventType::WINDOW_EXPIRED;
        event.generation = m_armed_generation;
        if (m_post_event(std::move(event))) {
            return;
        }

        ++m_expiry_retries;
        ESP_LOGW(TAG, "Window %u expiry could not be queued, retrying in %u ms",
                 static_cast<unsigned>(m_armed_generation.load()), static_cast<unsigned>(m_settings.expiry_retry_ms));
        const TickType_t retry = std::max<TickType_t>(1, pdMS_TO_TICKS(m_settings.expiry_retry_ms));
        if (m_window_timer && xTimerChangePeriod(m_window_timer, retry, 0) != pdPASS) {
            ESP_LOGE(TAG, "Failed to re-arm discovery window timer");
        }
    }
} // mqttMatter
