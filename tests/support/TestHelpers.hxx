// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef MQTTMATTER_TESTHELPERS_HXX
#define MQTTMATTER_TESTHELPERS_HXX

#include "matter/DeviceRegistrar.hxx"
#include "utils/StringUtils.hxx"

namespace mqttMatter::test {
    // Discovery payload with the required fields; extra is appended verbatim (",\"key\":value,...")
    inline std::string entityPayload(const char* unique_id, const char* device_id, const char* device_name, const char* extra = "") {
        return utils::stringFormat(
            R"({"unique_id":"%s","name":"%s name","device":{"name":"%s","identifiers":["%s","secondary"]}%s})",
            unique_id, unique_id, device_name, device_id, extra);
    }

    class RecordingRegistrar final : public DeviceRegistrar {
        public:
            esp_err_t registerDevice(const DeviceRegistration& registration) override {
                registrations.push_back(registration);
                if (std::ranges::find(rejected_ids, registration.device_identifier) != rejected_ids.end()) {
                    return ESP_FAIL;
                }
                return ESP_OK;
            }

            [[nodiscard]] const DeviceRegistration* find(const std::string& device_id) const {
                for (const auto& registration : registrations) {
                    if (registration.device_identifier == device_id) return &registration;
                }
                return nullptr;
            }

            std::vector<DeviceRegistration> registrations;
            std::vector<std::string> rejected_ids;
    };
}

#endif //MQTTMATTER_TESTHELPERS_HXX
