// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "DiscoveryBridge.hxx"

namespace mqttMatter
{
    static constexpr char TAG[] = "DiscoveryBridge";

    DiscoveryBridge::DiscoveryBridge(std::string discovery_root, DeviceRegistrar& registrar, BridgeIdentity identity)
        : m_collector(std::move(discovery_root)), m_orchestrator(registrar, std::move(identity)) {}

    void DiscoveryBridge::onConnected(const uint32_t generation) {
        m_collector.beginSession(generation);
    }

    void DiscoveryBridge::onDiscoveryMessage(const std::string& topic, const std::string& payload) {
        if (const esp_err_t err = m_collector.onDiscoveryMessage(topic, payload); err != ESP_OK) {
            ESP_LOGD(TAG, "Discovery message on '%s' dropped: %s", topic.c_str(), esp_err_to_name(err));
        }
    }

    void DiscoveryBridge::onDiscoveryWindowClosed(const uint32_t generation) {
        if (const DiscoverySession* current = m_collector.session(); current && current->generation() != generation) {
            ESP_LOGW(TAG, "Window %u closed but session %u is current, not bridging",
                     static_cast<unsigned>(generation), static_cast<unsigned>(current->generation()));
            return;
        }
        const DiscoverySession* session = m_collector.freezeSession();
        if (!session) {
            return;
        }
        m_last_report = m_orchestrator.onDiscoveryWindowClosed(*session);
    }

    void DiscoveryBridge::onRuntimeMessage(const std::string& topic, [[maybe_unused]] const std::string& payload) {
        // No live-state consumer yet
        ++m_runtime_messages;
        ESP_LOGD(TAG, "Runtime message on '%s' (%u bytes)", topic.c_str(), static_cast<unsigned>(payload.size()));
    }

    void DiscoveryBridge::onDisconnected() {
        ESP_LOGW(TAG, "Transport disconnected");
    }

    void DiscoveryBridge::onTransportError(const std::string& reason) {
        ESP_LOGE(TAG, "Transport error: %s", reason.c_str());
    }
} // mqttMatter
