// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "MQTTDeviceRegistrar.hxx"
#include "mqtt/MQTTClient.hxx"
#include "utils/StringUtils.hxx"

namespace mqttMatter
{
    static constexpr char TAG[] = "MQTTDeviceRegistrar";

    MQTTDeviceRegistrar::MQTTDeviceRegistrar(const MQTTClient& mqtt, std::string bridge_topic)
        : m_mqtt(mqtt), m_bridge_topic(std::move(bridge_topic)) {}

    std::string MQTTDeviceRegistrar::registrationTopic(const std::string& device_identifier) const {
        // Wildcard characters are not allowed in a publish topic
        std::string sanitized = device_identifier;
        std::ranges::replace_if(sanitized, [](const char c) { return c == '/' || c == '+' || c == '#'; }, '_');
        return utils::stringFormat("%s/devices/%s/config", m_bridge_topic.c_str(), sanitized.c_str());
    }

    std::string MQTTDeviceRegistrar::toJson(const DeviceRegistration& registration) {
        cJSON* root = cJSON_CreateObject();
        if (!root) return {};

        cJSON_AddStringToObject(root, "id", registration.device_identifier.c_str());
        cJSON_AddStringToObject(root, "name", registration.display_name.c_str());
        cJSON_AddStringToObject(root, "vendor", registration.vendor.c_str());
        cJSON_AddStringToObject(root, "model", registration.model.c_str());
        cJSON_AddStringToObject(root, "serial", registration.serial.c_str());
        cJSON_AddStringToObject(root, "firmware", registration.firmware_version.c_str());
        cJSON_AddNumberToObject(root, "hardware", registration.hardware_version);

        cJSON* children = cJSON_AddArrayToObject(root, "children");
        for (const auto& child : registration.children) {
            cJSON* item = cJSON_CreateObject();
            if (!item) continue;
            cJSON_AddStringToObject(item, "name", child.name.c_str());
            cJSON_AddStringToObject(item, "entity", child.entity_id.c_str());
            cJSON_AddStringToObject(item, "type", capabilityTypeName(child.type));
            cJSON_AddNumberToObject(item, "device_type", matterDeviceTypeId(child.type));
            cJSON_AddItemToArray(children, item);
        }

        std::string payload;
        if (char* json_payload = cJSON_PrintUnformatted(root)) {
            payload = json_payload;
            cJSON_free(json_payload);
        }
        cJSON_Delete(root);
        return payload;
    }

    esp_err_t MQTTDeviceRegistrar::registerDevice(const DeviceRegistration& registration) {
        const std::string payload = toJson(registration);
        if (payload.empty()) {
            ESP_LOGE(TAG, "Failed to serialize device '%s'", registration.device_identifier.c_str());
            return ESP_ERR_NO_MEM;
        }
        return m_mqtt.publish(registrationTopic(registration.device_identifier), payload, 1, true);
    }
} // mqttMatter
