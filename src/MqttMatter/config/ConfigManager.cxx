// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "ConfigManager.hxx"
#include "utils/NvsHandle.hxx"
#include "utils/StringUtils.hxx"
#include <esp_mac.h>

namespace mqttMatter
{
    static constexpr char  TAG[] = "Config";
    static constexpr char  NVS_NAMESPACE[] = CONFIG_MQTTMATTER_NVS_NAMESPACE;
    static constexpr std::array<std::string_view, 4> KNOWN_SCHEMES = {"mqtt://", "mqtts://", "ws://", "wss://"};

    esp_err_t ConfigManager::init() {
        if (initialized) {
            return ESP_OK;
        }
        esp_err_t ret = nvs_flash_init();
        if (ret == ESP_ERR_NVS_NO_FREE_PAGES || ret == ESP_ERR_NVS_NEW_VERSION_FOUND) {
            ESP_LOGW(TAG, "NVS partition was truncated, erasing and re-initializing...");
            if (const esp_err_t err = nvs_flash_erase(); err != ESP_OK) {
                ESP_LOGE(TAG, "NVS erase failed: %s", esp_err_to_name(err));
                return err;
            }
            ret = nvs_flash_init();
        }
        if (ret != ESP_OK) {
            ESP_LOGE(TAG, "NVS init failed: %s", esp_err_to_name(ret));
            return ret;
        }

        initialized = true;
        ESP_LOGI(TAG, "NVS initialized successfully.");
        return ESP_OK;
    }

    AppConfig ConfigManager::defaults() {
        AppConfig config;
        config.wifi_ssid = CONFIG_MQTTMATTER_WIFI_SSID;
        config.wifi_password = CONFIG_MQTTMATTER_WIFI_PASSWORD;
        config.mqtt_host = CONFIG_MQTTMATTER_MQTT_HOST;
        config.mqtt_port = CONFIG_MQTTMATTER_MQTT_DEFAULT_PORT;
        config.discovery_topic = CONFIG_MQTTMATTER_DISCOVERY_TOPIC;
        config.discovery_window_ms = CONFIG_MQTTMATTER_DISCOVERY_WINDOW_MS;
        config.bridge_topic = CONFIG_MQTTMATTER_BRIDGE_TOPIC;
        config.vendor_name = CONFIG_MQTTMATTER_VENDOR_NAME;
        config.product_name = CONFIG_MQTTMATTER_PRODUCT_NAME;
        return config;
    }

    esp_err_t ConfigManager::load() {
        std::lock_guard lock(config_mutex);

        const utils::NvsHandle nvs_handle(NVS_NAMESPACE, NVS_READWRITE);
        if (!nvs_handle) {
            return nvs_handle.openError();
        }

        size_t failed_keys = 0;
        const auto track = [&failed_keys](const esp_err_t err) {
            if (err != ESP_OK) ++failed_keys;
        };

        track(getString(nvs_handle.get(), "wifi_ssid", config_cache.wifi_ssid, CONFIG_MQTTMATTER_WIFI_SSID));
        track(getString(nvs_handle.get(), "wifi_pass", config_cache.wifi_password, CONFIG_MQTTMATTER_WIFI_PASSWORD));
        track(getString(nvs_handle.get(), "mqtt_host", config_cache.mqtt_host, CONFIG_MQTTMATTER_MQTT_HOST));
        track(getU32(nvs_handle.get(), "mqtt_port", config_cache.mqtt_port, CONFIG_MQTTMATTER_MQTT_DEFAULT_PORT));
        track(getString(nvs_handle.get(), "mqtt_user", config_cache.mqtt_user, ""));
        track(getString(nvs_handle.get(), "mqtt_pass", config_cache.mqtt_pass, ""));
        track(getString(nvs_handle.get(), "cid", config_cache.client_id, ""));
        track(getString(nvs_handle.get(), "disc_topic", config_cache.discovery_topic, CONFIG_MQTTMATTER_DISCOVERY_TOPIC));
        track(getU32(nvs_handle.get(), "disc_window", config_cache.discovery_window_ms, CONFIG_MQTTMATTER_DISCOVERY_WINDOW_MS));
        track(getString(nvs_handle.get(), "rt_topics", config_cache.runtime_topics, ""));
        track(getString(nvs_handle.get(), "bridge_topic", config_cache.bridge_topic, CONFIG_MQTTMATTER_BRIDGE_TOPIC));
        track(getString(nvs_handle.get(), "vendor", config_cache.vendor_name, CONFIG_MQTTMATTER_VENDOR_NAME));
        track(getString(nvs_handle.get(), "product", config_cache.product_name, CONFIG_MQTTMATTER_PRODUCT_NAME));
        track(getString(nvs_handle.get(), "syslog_srv", config_cache.syslog_server, ""));

        // Flags default to 0 when the key is missing
        uint8_t syslog_enabled_flag = 0;
        if (const esp_err_t err = nvs_get_u8(nvs_handle.get(), "syslog_en", &syslog_enabled_flag); err != ESP_ERR_NVS_NOT_FOUND) {
            track(err);
        }
        config_cache.syslog_enabled = (syslog_enabled_flag == 1);

        uint8_t configured_flag = 0;
        if (const esp_err_t err = nvs_get_u8(nvs_handle.get(), "configured", &configured_flag); err != ESP_ERR_NVS_NOT_FOUND) {
            track(err);
        }
        config_cache.configured = (configured_flag == 1);

        if (config_cache.client_id.empty()) {
            uint8_t mac[6] = {};
            if (const esp_err_t err = esp_read_mac(mac, ESP_MAC_WIFI_STA); err != ESP_OK) {
                ESP_LOGW(TAG, "Cannot read MAC for client id: %s", esp_err_to_name(err));
            }
            config_cache.client_id = utils::stringFormat("mqtt2matter_%02x%02x%02x", mac[3], mac[4], mac[5]);
        }

        if (failed_keys > 0) {
            ESP_LOGW(TAG, "%u keys could not be read, defaults kept for them.", static_cast<unsigned>(failed_keys));
        }
        ESP_LOGI(TAG, "Configuration loaded (configured=%d).", configured_flag);
        return ESP_OK;
    }

    esp_err_t ConfigManager::save() {
        std::lock_guard lock(config_mutex);

        const utils::NvsHandle nvs_handle(NVS_NAMESPACE, NVS_READWRITE);
        if (!nvs_handle) {
            return nvs_handle.openError();
        }

        esp_err_t err;

        #define SetNVS(func, key, value) \
            err = func(nvs_handle.get(), key, value); \
            if (err != ESP_OK) return err;

        SetNVS(setString, "wifi_ssid", config_cache.wifi_ssid);
        SetNVS(setString, "wifi_pass", config_cache.wifi_password);
        SetNVS(setString, "mqtt_host", config_cache.mqtt_host);
        SetNVS(nvs_set_u32, "mqtt_port", config_cache.mqtt_port);
        SetNVS(setString, "mqtt_user", config_cache.mqtt_user);
        SetNVS(setString, "mqtt_pass", config_cache.mqtt_pass);
        SetNVS(setString, "cid", config_cache.client_id);
        SetNVS(setString, "disc_topic", config_cache.discovery_topic);
        SetNVS(nvs_set_u32, "disc_window", config_cache.discovery_window_ms);
        SetNVS(setString, "rt_topics", config_cache.runtime_topics);
        SetNVS(setString, "bridge_topic", config_cache.bridge_topic);
        SetNVS(setString, "vendor", config_cache.vendor_name);
        SetNVS(setString, "product", config_cache.product_name);
        SetNVS(setString, "syslog_srv", config_cache.syslog_server);
        SetNVS(nvs_set_u8, "syslog_en", static_cast<uint8_t>(config_cache.syslog_enabled ? 1 : 0));

        #undef SetNVS

        return ensureConfiguredAndCommit(nvs_handle.get());
    }

    esp_err_t ConfigManager::ensureConfiguredAndCommit(nvs_handle_t handle) {
        if (!config_cache.configured) {
            if (const esp_err_t err = nvs_set_u8(handle, "configured", 1); err != ESP_OK) {
                return err;
            }
            config_cache.configured = true;
        }

        const esp_err_t err = nvs_commit(handle);
        if (err == ESP_OK) {
            ESP_LOGI(TAG, "Configuration saved successfully.");
        } else {
            ESP_LOGE(TAG, "Failed to commit NVS changes: %s", esp_err_to_name(err));
        }
        return err;
    }

    AppConfig ConfigManager::getConfig() const {
        std::lock_guard lock(config_mutex);
        return config_cache;
    }

    void ConfigManager::setConfig(const AppConfig& new_config) {
        std::lock_guard lock(config_mutex);
        const bool was_configured = config_cache.configured;
        config_cache = new_config;
        config_cache.configured = was_configured;
    }

    bool ConfigManager::isConfigured() const {
        std::lock_guard lock(config_mutex);
        return config_cache.configured;
    }

    std::string ConfigManager::buildBrokerUri(const std::string& host, const uint32_t port) {
        const std::string_view trimmed = utils::trim(host);
        std::string uri;
        size_t authority_start = 0;

        const bool has_scheme = std::ranges::any_of(KNOWN_SCHEMES, [&](const std::string_view scheme) {
            return trimmed.starts_with(scheme);
        });
        if (has_scheme) {
            uri = std::string(trimmed);
            authority_start = uri.find("://") + 3;
        } else {
            uri = utils::stringFormat("mqtt://%.*s", static_cast<int>(trimmed.size()), trimmed.data());
            authority_start = 7;
        }

        const auto path_start = uri.find('/', authority_start);
        const std::string_view authority = std::string_view(uri).substr(authority_start, path_start - authority_start);
        if (port == 0 || authority.find(':') != std::string_view::npos) {
            return uri;
        }

        const std::string port_part = utils::stringFormat(":%u", static_cast<unsigned>(port));
        if (path_start == std::string::npos) {
            uri += port_part;
        } else {
            uri.insert(path_start, port_part);
        }
        return uri;
    }

    esp_err_t ConfigManager::getString(nvs_handle_t handle, const char* key, std::string& out_value, const char* default_value) {
        size_t required_size = 0;
        esp_err_t err = nvs_get_str(handle, key, nullptr, &required_size);

        if (err == ESP_ERR_NVS_NOT_FOUND) {
            out_value = default_value ? default_value : "";
            ESP_LOGD(TAG, "Key '%s' not found in NVS, using default value: '%s'", key, out_value.c_str());
            return ESP_OK;
        }
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "Error reading key '%s': %s", key, esp_err_to_name(err));
            return err;
        }
        if (required_size == 0) {
            out_value.clear();
            return ESP_OK;
        }

        std::vector<char> buf(required_size);
        err = nvs_get_str(handle, key, buf.data(), &required_size);
        if (err == ESP_OK) {
            out_value.assign(buf.data(), required_size > 0 ? required_size - 1 : 0);
        }
        return err;
    }

    esp_err_t ConfigManager::setString(const nvs_handle_t handle, const char* key, const std::string& value) {
        return nvs_set_str(handle, key, value.c_str());
    }

    esp_err_t ConfigManager::getU32(const nvs_handle_t handle, const char* key, uint32_t& out_value, const uint32_t default_value) {
        const esp_err_t err = nvs_get_u32(handle, key, &out_value);
        if (err == ESP_ERR_NVS_NOT_FOUND) {
            out_value = default_value;
            ESP_LOGD(TAG, "Key '%s' not found in NVS, using default value: %u", key, static_cast<unsigned>(default_value));
            return ESP_OK;
        }
        return err;
    }
}
