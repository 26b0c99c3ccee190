// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef MQTTMATTER_CONFIGMANAGER_HXX
#define MQTTMATTER_CONFIGMANAGER_HXX

namespace mqttMatter
{
    struct AppConfig {
        // WiFi
        std::string wifi_ssid;
        std::string wifi_password;

        // MQTT
        std::string mqtt_host;
        uint32_t mqtt_port{CONFIG_MQTTMATTER_MQTT_DEFAULT_PORT};
        std::string mqtt_user;
        std::string mqtt_pass;
        std::string client_id;

        // Discovery
        std::string discovery_topic;
        uint32_t discovery_window_ms{CONFIG_MQTTMATTER_DISCOVERY_WINDOW_MS};
        std::string runtime_topics;

        // Bridge
        std::string bridge_topic;
        std::string vendor_name;
        std::string product_name;

        // Syslog
        std::string syslog_server;
        bool syslog_enabled{false};

        bool configured{false};
    };

    class ConfigManager {
        public:
            ConfigManager(const ConfigManager&) = delete;
            ConfigManager& operator=(const ConfigManager&) = delete;

            [[nodiscard]] static ConfigManager& Instance() {
                static ConfigManager instance;
                return instance;
            }

            esp_err_t init();
            esp_err_t load();
            esp_err_t save();

            [[nodiscard]] AppConfig getConfig() const;
            void setConfig(const AppConfig& new_config);
            [[nodiscard]] bool isConfigured() const;

            /**
             * @brief Broker URI for esp-mqtt.
             * A host without scheme gets "mqtt://"; the port is appended unless the host already names one.
             */
            [[nodiscard]] static std::string buildBrokerUri(const std::string& host, uint32_t port);

            // Config with every field at its compile-time default
            [[nodiscard]] static AppConfig defaults();

        private:
            ConfigManager() = default;
            esp_err_t ensureConfiguredAndCommit(nvs_handle_t handle);

            static esp_err_t getString(nvs_handle_t handle, const char* key, std::string& out_value, const char* default_value);
            static esp_err_t getU32(nvs_handle_t handle, const char* key, uint32_t& out_value, uint32_t default_value);
            static esp_err_t setString(nvs_handle_t handle, const char* key, const std::string& value);

            AppConfig config_cache{defaults()};
            mutable std::mutex config_mutex;
            bool initialized{false};
    };
}

#endif //MQTTMATTER_CONFIGMANAGER_HXX
