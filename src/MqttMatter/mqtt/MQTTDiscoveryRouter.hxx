// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef MQTTMATTER_MQTTDISCOVERYROUTER_HXX
#define MQTTMATTER_MQTTDISCOVERYROUTER_HXX

#include "MQTTEvent.hxx"
#include "TransportListener.hxx"

namespace mqttMatter
{
    class MQTTClient;
    class MQTTEventProcess;

    struct DiscoveryRouterSettings {
        std::string discovery_root{CONFIG_MQTTMATTER_DISCOVERY_TOPIC};
        uint32_t window_ms{CONFIG_MQTTMATTER_DISCOVERY_WINDOW_MS};
        uint32_t expiry_retry_ms{CONFIG_MQTTMATTER_WINDOW_EXPIRY_RETRY_MS};   // Re-post delay when the queue is full
        std::vector<std::string> runtime_topics;   // Extra subscriptions for live state
    };

    /**
     * @brief Discovery side of the transport.
     * On every connect it subscribes to the discovery wildcards and opens a
     * discovery window; until the window timer fires, matching config messages
     * are discovery messages and everything else is dropped. Afterwards all
     * traffic is forwarded as runtime messages.
     */
    class MQTTDiscoveryRouter {
        public:
            MQTTDiscoveryRouter(const MQTTClient& mqtt, TransportListener& listener, DiscoveryRouterSettings settings);
            ~MQTTDiscoveryRouter();

            MQTTDiscoveryRouter(const MQTTDiscoveryRouter&) = delete;
            MQTTDiscoveryRouter& operator=(const MQTTDiscoveryRouter&) = delete;

            // Returns false when the event could not be queued
            using EventSink = std::function<bool(MqttEvent)>;

            // Creates the window timer; its expiry is posted to process
            esp_err_t init(const MQTTEventProcess& process);
            esp_err_t init(EventSink post_event);

            /**
             * @brief Posts the expiry of the armed window.
             * Runs on the timer service task. When the event cannot be queued the
             * timer is re-armed with expiry_retry_ms, so the window always closes.
             */
            void onWindowTimerExpired();

            // Single entry point for all events, called from the event task
            void dispatch(const MqttEvent& event);

            [[nodiscard]] bool isWindowOpen() const { return m_window_open; }
            [[nodiscard]] uint32_t expiryRetries() const { return m_expiry_retries; }
            [[nodiscard]] uint32_t generation() const { return m_generation; }

            // "<root>/+/+/config" and "<root>/+/+/+/config"
            [[nodiscard]] std::vector<std::string> discoverySubscriptions() const;
            [[nodiscard]] bool isDiscoveryTopic(const std::string& topic) const;

        private:
            void handleConnected();
            void handleData(const std::string& topic, const std::string& payload);
            void handleWindowExpired(uint32_t generation);
            void armWindowTimer();

            static void windowTimerCallback(TimerHandle_t timer);

            const MQTTClient& m_mqtt;
            TransportListener& m_listener;
            DiscoveryRouterSettings m_settings;

            EventSink m_post_event;
            TimerHandle_t m_window_timer{nullptr};
            std::atomic<uint32_t> m_armed_generation{0};
            std::atomic<uint32_t> m_expiry_retries{0};

            uint32_t m_generation{0};
            bool m_window_open{false};
    };
} // mqttMatter

#endif //MQTTMATTER_MQTTDISCOVERYROUTER_HXX
