// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef MQTTMATTER_MQTTEVENT_HXX
#define MQTTMATTER_MQTTEVENT_HXX

namespace mqttMatter
{
    enum class MqttEventType : uint8_t {
        CONNECTED,
        DISCONNECTED,
        DATA,
        TRANSPORT_ERROR,
        WINDOW_EXPIRED
    };

    struct MqttEvent {
        MqttEventType type{MqttEventType::DATA};
        std::string topic;
        std::string payload;      // Message body, or error text for TRANSPORT_ERROR
        uint32_t generation{0};   // WINDOW_EXPIRED: session that armed the timer
    };
} // mqttMatter

#endif //MQTTMATTER_MQTTEVENT_HXX
