// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "DiscoverySession.hxx"

namespace mqttMatter
{
    static constexpr char TAG[] = "DiscoverySession";

    esp_err_t DiscoverySession::addEntity(EntityRecord entity, const std::string& device_name, InsertResult& result) {
        if (m_state == SessionState::FROZEN) {
            ESP_LOGW(TAG, "Session %u is frozen, entity '%s' ignored", static_cast<unsigned>(m_generation), entity.entity_id.c_str());
            return ESP_ERR_INVALID_STATE;
        }

        if (m_entity_index.contains(entity.entity_id)) {
            ++m_duplicate_count;
            result = InsertResult::DUPLICATE;
            return ESP_OK;
        }

        auto [device_it, created] = m_devices.try_emplace(entity.device_identifier);
        DeviceRecord& device = device_it->second;
        if (created) {
            device.device_identifier = entity.device_identifier;
            device.display_name = device_name;
            ESP_LOGI(TAG, "New device '%s' (%s)", device.display_name.c_str(), device.device_identifier.c_str());
        }

        m_entity_index.emplace(entity.entity_id, entity.device_identifier);
        const std::string entity_id = entity.entity_id;
        device.entities.emplace(entity_id, std::move(entity));

        result = InsertResult::INSERTED;
        return ESP_OK;
    }

    void DiscoverySession::freeze() {
        if (m_state == SessionState::FROZEN) {
            return;
        }
        m_state = SessionState::FROZEN;
        ESP_LOGI(TAG, "Session %u frozen: %u devices, %u entities, %u duplicates, %u rejected",
                 static_cast<unsigned>(m_generation),
                 static_cast<unsigned>(m_devices.size()),
                 static_cast<unsigned>(m_entity_index.size()),
                 static_cast<unsigned>(m_duplicate_count),
                 static_cast<unsigned>(m_rejected_count));
    }

    const EntityRecord* DiscoverySession::findEntity(const std::string& entity_id) const {
        const auto index_it = m_entity_index.find(entity_id);
        if (index_it == m_entity_index.end()) {
            return nullptr;
        }
        const DeviceRecord* device = findDevice(index_it->second);
        if (!device) {
            return nullptr;
        }
        const auto entity_it = device->entities.find(entity_id);
        return entity_it != device->entities.end() ? &entity_it->second : nullptr;
    }

    const DeviceRecord* DiscoverySession::findDevice(const std::string& device_identifier) const {
        const auto it = m_devices.find(device_identifier);
        return it != m_devices.end() ? &it->second : nullptr;
    }
} // mqttMatter
