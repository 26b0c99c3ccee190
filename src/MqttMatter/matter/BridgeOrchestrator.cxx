// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "BridgeOrchestrator.hxx"
#include "utils/StringUtils.hxx"

namespace mqttMatter
{
    static constexpr char TAG[] = "BridgeOrchestrator";

    BridgeOrchestrator::BridgeOrchestrator(DeviceRegistrar& registrar, BridgeIdentity identity)
        : m_registrar(registrar), m_identity(std::move(identity)) {}

    DeviceRegistration BridgeOrchestrator::buildRegistration(const DeviceRecord& device) const {
        DeviceRegistration registration;
        registration.device_identifier = device.device_identifier;
        registration.display_name = device.display_name;
        registration.vendor = m_identity.vendor;
        registration.model = m_identity.model;
        registration.serial = m_identity.serial;
        registration.firmware_version = m_identity.firmware_version;
        registration.hardware_version = m_identity.hardware_version;

        registration.children.reserve(device.entities.size());
        for (const auto& entity : device.entities | std::views::values) {
            const CapabilityType type = CapabilityClassifier::classify(entity);
            ESP_LOGD(TAG, "  %s -> %s", entity.entity_id.c_str(), capabilityTypeName(type));

            // Endpoint names must be unique within a device
            std::string name = entity.display_name;
            const bool name_taken = std::ranges::any_of(registration.children, [&name](const ChildCapability& child) {
                return child.name == name;
            });
            if (name_taken) {
                ESP_LOGW(TAG, "Device '%s' has several entities named '%s', using '%s (%s)'",
                         device.device_identifier.c_str(), name.c_str(), name.c_str(), entity.entity_id.c_str());
                name = utils::stringFormat("%s (%s)", name.c_str(), entity.entity_id.c_str());
            }
            registration.children.push_back({std::move(name), entity.entity_id, type});
        }
        return registration;
    }

    BridgeReport BridgeOrchestrator::onDiscoveryWindowClosed(const DiscoverySession& session) {
        BridgeReport report;
        if (!session.isFrozen()) {
            ESP_LOGW(TAG, "Session %u is still open, registering its current content", static_cast<unsigned>(session.generation()));
        }

        for (const auto& device : session.devices() | std::views::values) {
            if (device.entities.empty()) {
                ++report.skipped;
                continue;
            }

            const DeviceRegistration registration = buildRegistration(device);
            ESP_LOGI(TAG, "Registering '%s' (%s) with %u endpoints", registration.display_name.c_str(),
                     registration.device_identifier.c_str(), static_cast<unsigned>(registration.children.size()));

            if (const esp_err_t err = m_registrar.registerDevice(registration); err != ESP_OK) {
                ESP_LOGE(TAG, "Registration of '%s' failed: %s", registration.device_identifier.c_str(), esp_err_to_name(err));
                ++report.failed;
                report.failed_devices.push_back(registration.device_identifier);
                continue;
            }
            ++report.registered;
        }

        ESP_LOGI(TAG, "Bridging done: %u registered, %u failed", static_cast<unsigned>(report.registered), static_cast<unsigned>(report.failed));
        return report;
    }
} // mqttMatter
