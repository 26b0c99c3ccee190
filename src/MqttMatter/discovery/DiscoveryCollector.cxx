// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "DiscoveryCollector.hxx"

namespace mqttMatter
{
    static constexpr char TAG[] = "DiscoveryCollector";

    // Fields mapped onto EntityRecord members, everything else goes to raw_attributes
    static constexpr std::array<std::string_view, 7> MAPPED_FIELDS = {
        "unique_id", "name", "device", "device_class", "unit_of_measurement", "min", "max"
    };

    static std::optional<std::string> getString(const cJSON* object, const char* key) {
        const cJSON* item = cJSON_GetObjectItemCaseSensitive(object, key);
        if (cJSON_IsString(item) && item->valuestring != nullptr) {
            return std::string(item->valuestring);
        }
        return std::nullopt;
    }

    static std::optional<std::string> getFirstIdentifier(const cJSON* device) {
        const cJSON* identifiers = cJSON_GetObjectItemCaseSensitive(device, "identifiers");
        if (cJSON_IsArray(identifiers)) {
            const cJSON* first = cJSON_GetArrayItem(identifiers, 0);
            if (cJSON_IsString(first) && first->valuestring != nullptr) {
                return std::string(first->valuestring);
            }
            return std::nullopt;
        }
        if (cJSON_IsString(identifiers) && identifiers->valuestring != nullptr) {
            return std::string(identifiers->valuestring);
        }
        return std::nullopt;
    }

    DiscoveryCollector::DiscoveryCollector(std::string discovery_root)
        : m_discovery_root(std::move(discovery_root)) {
        while (!m_discovery_root.empty() && m_discovery_root.back() == '/') {
            m_discovery_root.pop_back();
        }
    }

    void DiscoveryCollector::beginSession(const uint32_t generation) {
        m_session = std::make_unique<DiscoverySession>(generation);
        ESP_LOGI(TAG, "Discovery session %u opened on '%s'", static_cast<unsigned>(generation), m_discovery_root.c_str());
    }

    const DiscoverySession* DiscoveryCollector::freezeSession() {
        if (!m_session) {
            ESP_LOGW(TAG, "No discovery session to freeze");
            return nullptr;
        }
        m_session->freeze();
        return m_session.get();
    }

    std::optional<std::string> DiscoveryCollector::discoveryTypeFromTopic(const std::string& topic) const {
        const std::string prefix = m_discovery_root + "/";
        if (!topic.starts_with(prefix)) {
            return std::nullopt;
        }
        const std::string_view rest = std::string_view(topic).substr(prefix.size());
        const auto separator = rest.find('/');
        if (separator == std::string_view::npos || separator == 0) {
            return std::nullopt;
        }
        return std::string(rest.substr(0, separator));
    }

    esp_err_t DiscoveryCollector::reject(const esp_err_t reason) {
        if (m_session && !m_session->isFrozen()) {
            m_session->recordRejected();
        }
        return reason;
    }

    esp_err_t DiscoveryCollector::onDiscoveryMessage(const std::string& topic, const std::string& raw_payload) {
        if (!m_session || m_session->isFrozen()) {
            ESP_LOGW(TAG, "Discovery message on '%s' outside of an open session, ignored", topic.c_str());
            return ESP_ERR_INVALID_STATE;
        }

        auto discovery_type = discoveryTypeFromTopic(topic);
        if (!discovery_type) {
            ESP_LOGW(TAG, "Topic '%s' is not below discovery root '%s'", topic.c_str(), m_discovery_root.c_str());
            return reject(ESP_ERR_INVALID_ARG);
        }

        cJSON* root = cJSON_ParseWithLength(raw_payload.data(), raw_payload.size());
        if (!cJSON_IsObject(root)) {
            ESP_LOGE(TAG, "Failed to parse discovery payload on '%s'", topic.c_str());
            cJSON_Delete(root);
            return reject(ESP_ERR_INVALID_ARG);
        }

        const cJSON* device = cJSON_GetObjectItemCaseSensitive(root, "device");
        auto entity_id = getString(root, "unique_id");
        auto device_name = cJSON_IsObject(device) ? getString(device, "name") : std::nullopt;
        auto device_identifier = cJSON_IsObject(device) ? getFirstIdentifier(device) : std::nullopt;

        if (!entity_id || !device_name || !device_identifier) {
            ESP_LOGE(TAG, "Discovery payload on '%s' lacks %s", topic.c_str(),
                     !entity_id ? "unique_id" : (!device_name ? "device.name" : "device.identifiers"));
            cJSON_Delete(root);
            return reject(ESP_ERR_NOT_FOUND);
        }

        EntityRecord entity;
        entity.entity_id = std::move(*entity_id);
        entity.device_identifier = std::move(*device_identifier);
        entity.display_name = getString(root, "name").value_or(entity.entity_id);
        entity.discovery_type = std::move(*discovery_type);
        entity.discovery_topic = topic;
        entity.device_class = getString(root, "device_class");
        entity.unit_of_measurement = getString(root, "unit_of_measurement");

        const cJSON* min = cJSON_GetObjectItemCaseSensitive(root, "min");
        const cJSON* max = cJSON_GetObjectItemCaseSensitive(root, "max");
        if (cJSON_IsNumber(min) && cJSON_IsNumber(max)) {
            entity.numeric_range = NumericRange{min->valuedouble, max->valuedouble};
        }

        const cJSON* field = nullptr;
        cJSON_ArrayForEach(field, root) {
            if (field->string == nullptr) continue;
            const std::string_view key(field->string);
            if (std::ranges::find(MAPPED_FIELDS, key) != MAPPED_FIELDS.end()) continue;
            if (char* text = cJSON_PrintUnformatted(field)) {
                entity.raw_attributes.emplace(std::string(key), text);
                cJSON_free(text);
            }
        }
        cJSON_Delete(root);

        const std::string stored_id = entity.entity_id;
        InsertResult result{};
        const esp_err_t err = m_session->addEntity(std::move(entity), *device_name, result);
        if (err != ESP_OK) {
            return err;
        }

        if (result == InsertResult::DUPLICATE) {
            ESP_LOGD(TAG, "Entity '%s' already known, message discarded", stored_id.c_str());
        } else {
            ESP_LOGI(TAG, "Entity '%s' (%s) collected", stored_id.c_str(), topic.c_str());
        }
        return ESP_OK;
    }
} // mqttMatter
