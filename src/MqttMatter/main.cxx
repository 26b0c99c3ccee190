// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include <esp_err.h>
#include <esp_log.h>

#include "config/ConfigManager.hxx"
#include "system/AppController.hxx"

static constexpr char  TAG[] = "mqtt2matter";

extern "C" void app_main(void) {
    ESP_LOGI(TAG, "MQTT-to-Matter Bridge v.%s starting...", MQTTMATTER_VERSION);

    auto& config = mqttMatter::ConfigManager::Instance();
    ESP_ERROR_CHECK(config.init());
    ESP_ERROR_CHECK(config.load());

    if (!config.isConfigured()) {
        const auto current = config.getConfig();
        if (current.wifi_ssid.empty() || current.mqtt_host.empty()) {
            ESP_LOGE(TAG, "Device is not configured: WiFi SSID and MQTT host are required.");
            return;
        }
        ESP_LOGI(TAG, "Storing build-time defaults as initial configuration.");
        ESP_ERROR_CHECK(config.save());
    }

    if (const esp_err_t err = mqttMatter::AppController::Instance().start(); err != ESP_OK) {
        ESP_LOGE(TAG, "Bridge start failed: %s", esp_err_to_name(err));
        return;
    }

    ESP_LOGI(TAG, "Application setup complete. Logic running in background tasks.");
}
