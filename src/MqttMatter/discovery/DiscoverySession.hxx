// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef MQTTMATTER_DISCOVERYSESSION_HXX
#define MQTTMATTER_DISCOVERYSESSION_HXX

#include "DiscoveryTypes.hxx"

namespace mqttMatter
{
    enum class SessionState {
        OPEN,
        FROZEN
    };

    enum class InsertResult {
        INSERTED,
        DUPLICATE
    };

    /**
     * @brief Device/entity graph collected during one discovery window.
     * Writable while OPEN; freeze() makes it read-only for the rest of its life.
     */
    class DiscoverySession {
        public:
            explicit DiscoverySession(uint32_t generation) : m_generation(generation) {}

            DiscoverySession(const DiscoverySession&) = delete;
            DiscoverySession& operator=(const DiscoverySession&) = delete;

            /**
             * @brief Adds an entity to its device, creating the device on first sighting.
             * The first record for an entity id wins; later ones are reported as DUPLICATE.
             * @param device_name Used only when the device is created.
             * @return ESP_ERR_INVALID_STATE once the session is frozen.
             */
            esp_err_t addEntity(EntityRecord entity, const std::string& device_name, InsertResult& result);

            void freeze();
            void recordRejected() { ++m_rejected_count; }

            [[nodiscard]] SessionState state() const { return m_state; }
            [[nodiscard]] bool isFrozen() const { return m_state == SessionState::FROZEN; }
            [[nodiscard]] uint32_t generation() const { return m_generation; }

            [[nodiscard]] const std::map<std::string, DeviceRecord>& devices() const { return m_devices; }
            [[nodiscard]] const EntityRecord* findEntity(const std::string& entity_id) const;
            [[nodiscard]] const DeviceRecord* findDevice(const std::string& device_identifier) const;

            [[nodiscard]] size_t entityCount() const { return m_entity_index.size(); }
            [[nodiscard]] size_t duplicateCount() const { return m_duplicate_count; }
            [[nodiscard]] size_t rejectedCount() const { return m_rejected_count; }

        private:
            uint32_t m_generation;
            SessionState m_state{SessionState::OPEN};

            std::map<std::string, DeviceRecord> m_devices;
            std::map<std::string, std::string> m_entity_index; // entity_id -> device_identifier

            size_t m_duplicate_count{0};
            size_t m_rejected_count{0};
    };
} // mqttMatter

#endif //MQTTMATTER_DISCOVERYSESSION_HXX
