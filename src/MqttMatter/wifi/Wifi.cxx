// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include <esp_check.h>
#include <esp_netif.h>
#include <lwip/ip4_addr.h>
#include "Wifi.hxx"

namespace mqttMatter
{
    static constexpr char  TAG[] = "Wifi";

    static void connectOrLog() {
        if (const esp_err_t err = esp_wifi_connect(); err != ESP_OK) {
            ESP_LOGE(TAG, "esp_wifi_connect: %s", esp_err_to_name(err));
        }
    }

    esp_err_t Wifi::init() {
        if (initialized) {
            return ESP_OK;
        }

        ESP_RETURN_ON_ERROR(esp_netif_init(), TAG, "esp_netif_init failed");
        if (const esp_err_t err = esp_event_loop_create_default(); err != ESP_OK && err != ESP_ERR_INVALID_STATE) {
            ESP_LOGE(TAG, "Default event loop: %s", esp_err_to_name(err));
            return err;
        }

        m_netif = esp_netif_create_default_wifi_sta();
        if (!m_netif) {
            ESP_LOGE(TAG, "Failed to create default STA netif");
            return ESP_FAIL;
        }

        wifi_init_config_t cfg = WIFI_INIT_CONFIG_DEFAULT();
        ESP_RETURN_ON_ERROR(esp_wifi_init(&cfg), TAG, "esp_wifi_init failed");

        ESP_RETURN_ON_ERROR(esp_event_handler_instance_register(WIFI_EVENT, ESP_EVENT_ANY_ID, &wifiEventHandler, this, nullptr),
                            TAG, "WIFI_EVENT handler registration failed");
        ESP_RETURN_ON_ERROR(esp_event_handler_instance_register(IP_EVENT, IP_EVENT_STA_GOT_IP, &wifiEventHandler, this, nullptr),
                            TAG, "IP_EVENT handler registration failed");

        m_reconnect_timer = xTimerCreate("wifi_retry_tmr", pdMS_TO_TICKS(CONFIG_MQTTMATTER_WIFI_RETRY_DELAY_MS), pdFALSE, this, reconnectTimerCallback);
        if (!m_reconnect_timer) {
            ESP_LOGE(TAG, "Failed to create reconnect timer");
            return ESP_ERR_NO_MEM;
        }

        initialized = true;
        ESP_LOGI(TAG, "WiFi station initialized.");
        return ESP_OK;
    }

    esp_err_t Wifi::connectToAP(const std::string& ssid, const std::string& password) {
        if (!initialized) {
            return ESP_ERR_INVALID_STATE;
        }
        status = Status::CONNECTING;
        m_retry_count = 0;

        wifi_config_t wifi_config = {};
        strncpy(reinterpret_cast<char*>(wifi_config.sta.ssid), ssid.c_str(), sizeof(wifi_config.sta.ssid) - 1);
        strncpy(reinterpret_cast<char*>(wifi_config.sta.password), password.c_str(), sizeof(wifi_config.sta.password) - 1);

        ESP_RETURN_ON_ERROR(esp_wifi_set_mode(WIFI_MODE_STA), TAG, "esp_wifi_set_mode failed");
        ESP_RETURN_ON_ERROR(esp_wifi_set_config(WIFI_IF_STA, &wifi_config), TAG, "esp_wifi_set_config failed");
        const esp_err_t err = esp_wifi_start();
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "esp_wifi_start: %s", esp_err_to_name(err));
            status = Status::DISCONNECTED;
            return err;
        }

        ESP_LOGI(TAG, "Connecting to AP SSID: %s", ssid.c_str());
        return ESP_OK;
    }

    std::string Wifi::getIpAddress() const {
        if (status != Status::CONNECTED || !m_netif) {
            return "0.0.0.0";
        }
        esp_netif_ip_info_t ip_info;
        if (esp_netif_get_ip_info(m_netif, &ip_info) != ESP_OK) {
            return "0.0.0.0";
        }
        return ip4addr_ntoa(reinterpret_cast<const ip4_addr_t*>(&ip_info.ip));
    }

    void Wifi::reconnectTimerCallback(TimerHandle_t timer) {
        if (pvTimerGetTimerID(timer)) {
            connectOrLog();
        }
    }

    void Wifi::wifiEventHandler(void* arg, esp_event_base_t event_base, int32_t event_id, void* event_data) {
        auto* manager = static_cast<Wifi*>(arg);

        if (event_base == WIFI_EVENT && event_id == WIFI_EVENT_STA_START) {
            ESP_LOGI(TAG, "STA_START: connecting...");
            connectOrLog();
        } else if (event_base == WIFI_EVENT && event_id == WIFI_EVENT_STA_DISCONNECTED) {
            const bool was_connected = manager->status == Status::CONNECTED;
            manager->status = Status::CONNECTING;
            if (was_connected && manager->onDisconnected) manager->onDisconnected();

            ++manager->m_retry_count;
            if (manager->m_retry_count < CONFIG_MQTTMATTER_WIFI_MAX_RETRY) {
                ESP_LOGW(TAG, "STA_DISCONNECTED: attempt %u of %d, retrying...", static_cast<unsigned>(manager->m_retry_count), CONFIG_MQTTMATTER_WIFI_MAX_RETRY);
                connectOrLog();
            } else {
                ESP_LOGE(TAG, "WiFi connection failed %u times in a row, retrying in %d ms", static_cast<unsigned>(manager->m_retry_count), CONFIG_MQTTMATTER_WIFI_RETRY_DELAY_MS);
                if (xTimerReset(manager->m_reconnect_timer, 0) != pdPASS) {
                    ESP_LOGE(TAG, "Failed to schedule reconnect");
                }
            }
        } else if (event_base == IP_EVENT && event_id == IP_EVENT_STA_GOT_IP) {
            ip_event_got_ip_t const* event = static_cast<ip_event_got_ip_t*>(event_data);
            ESP_LOGI(TAG, "GOT_IP: " IPSTR, IP2STR(&event->ip_info.ip));
            manager->m_retry_count = 0;
            manager->status = Status::CONNECTED;
            if (manager->onConnected) manager->onConnected();
        }
    }
} // mqttMatter
