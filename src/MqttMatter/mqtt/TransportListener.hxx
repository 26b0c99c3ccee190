// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef MQTTMATTER_TRANSPORTLISTENER_HXX
#define MQTTMATTER_TRANSPORTLISTENER_HXX

namespace mqttMatter
{
    // Receives the routed transport events, always from the event task and one at a time
    class TransportListener {
        public:
            virtual ~TransportListener() = default;

            virtual void onConnected(uint32_t generation) = 0;
            virtual void onDiscoveryMessage(const std::string& topic, const std::string& payload) = 0;
            virtual void onDiscoveryWindowClosed(uint32_t generation) = 0;
            virtual void onRuntimeMessage(const std::string& topic, const std::string& payload) = 0;
            virtual void onDisconnected() = 0;
            virtual void onTransportError(const std::string& reason) = 0;
    };
} // mqttMatter

#endif //MQTTMATTER_TRANSPORTLISTENER_HXX
