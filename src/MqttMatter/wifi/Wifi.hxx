// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef MQTTMATTER_WIFI_HXX
#define MQTTMATTER_WIFI_HXX

#include <esp_netif.h>
#include <esp_wifi.h>

namespace mqttMatter
{
    // Station-only WiFi bring-up with automatic reconnect
    class Wifi {
    public:
        enum class Status {
            DISCONNECTED,
            CONNECTING,
            CONNECTED
        };

        Wifi(const Wifi&) = delete;
        Wifi& operator=(const Wifi&) = delete;

        static Wifi& Instance() {
            static Wifi instance;
            return instance;
        }

        esp_err_t init();
        esp_err_t connectToAP(const std::string& ssid, const std::string& password);

        [[nodiscard]] std::string getIpAddress() const;

        // Callbacks, invoked from the default event loop task
        std::function<void()> onConnected;
        std::function<void()> onDisconnected;

    private:
        Wifi() = default;

        static void wifiEventHandler(void* arg, esp_event_base_t event_base, int32_t event_id, void* event_data);
        static void reconnectTimerCallback(TimerHandle_t timer);

        std::atomic<Status> status{Status::DISCONNECTED};
        esp_netif_t* m_netif{nullptr};
        TimerHandle_t m_reconnect_timer{nullptr};
        uint32_t m_retry_count{0};
        bool initialized{false};
    };
} // mqttMatter

#endif //MQTTMATTER_WIFI_HXX
