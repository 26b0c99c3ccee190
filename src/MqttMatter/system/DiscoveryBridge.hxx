// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef MQTTMATTER_DISCOVERYBRIDGE_HXX
#define MQTTMATTER_DISCOVERYBRIDGE_HXX

#include "mqtt/TransportListener.hxx"
#include "discovery/DiscoveryCollector.hxx"
#include "matter/BridgeOrchestrator.hxx"

namespace mqttMatter
{
    /**
     * @brief Glues routed transport events to the collector and the orchestrator.
     * Each connection opens a session, the window close freezes it and bridges its devices once.
     */
    class DiscoveryBridge final : public TransportListener {
        public:
            DiscoveryBridge(std::string discovery_root, DeviceRegistrar& registrar, BridgeIdentity identity);

            void onConnected(uint32_t generation) override;
            void onDiscoveryMessage(const std::string& topic, const std::string& payload) override;
            void onDiscoveryWindowClosed(uint32_t generation) override;
            void onRuntimeMessage(const std::string& topic, const std::string& payload) override;
            void onDisconnected() override;
            void onTransportError(const std::string& reason) override;

            [[nodiscard]] const DiscoveryCollector& collector() const { return m_collector; }
            [[nodiscard]] const std::optional<BridgeReport>& lastReport() const { return m_last_report; }
            [[nodiscard]] size_t runtimeMessageCount() const { return m_runtime_messages; }

        private:
            DiscoveryCollector m_collector;
            BridgeOrchestrator m_orchestrator;
            std::optional<BridgeReport> m_last_report;
            size_t m_runtime_messages{0};
    };
} // mqttMatter

#endif //MQTTMATTER_DISCOVERYBRIDGE_HXX
