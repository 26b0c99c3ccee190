// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef MQTTMATTER_DISCOVERYCOLLECTOR_HXX
#define MQTTMATTER_DISCOVERYCOLLECTOR_HXX

#include "DiscoverySession.hxx"

namespace mqttMatter
{
    class DiscoveryCollector {
        public:
            explicit DiscoveryCollector(std::string discovery_root);

            DiscoveryCollector(const DiscoveryCollector&) = delete;
            DiscoveryCollector& operator=(const DiscoveryCollector&) = delete;

            // Replaces the current session with an empty, open one
            void beginSession(uint32_t generation);

            /**
             * @brief Parses one discovery payload and records its entity.
             * @return ESP_OK when stored or discarded as duplicate,
             *         ESP_ERR_INVALID_ARG for unparsable payloads or foreign topics,
             *         ESP_ERR_NOT_FOUND when a required field is missing,
             *         ESP_ERR_INVALID_STATE without an open session.
             */
            esp_err_t onDiscoveryMessage(const std::string& topic, const std::string& raw_payload);

            /**
             * @brief Closes the current session for writing and hands it out read-only.
             * @return nullptr when no session was started.
             */
            const DiscoverySession* freezeSession();

            [[nodiscard]] const DiscoverySession* session() const { return m_session.get(); }
            [[nodiscard]] const std::string& discoveryRoot() const { return m_discovery_root; }

            // "<root>/sensor/abc/config" -> "sensor"
            [[nodiscard]] std::optional<std::string> discoveryTypeFromTopic(const std::string& topic) const;

        private:
            esp_err_t reject(esp_err_t reason);

            std::string m_discovery_root;
            std::unique_ptr<DiscoverySession> m_session;
    };
} // mqttMatter

#endif //MQTTMATTER_DISCOVERYCOLLECTOR_HXX
