// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef MQTTMATTER_MQTTEVENTPROCESS_HXX
#define MQTTMATTER_MQTTEVENTPROCESS_HXX

#include "MQTTEvent.hxx"

namespace mqttMatter {
    /**
     * @brief Serializes transport and timer events onto one worker task.
     * Producers (esp-mqtt task, timer service task) only enqueue; the handler
     * sees the events one at a time in arrival order.
     */
    class MQTTEventProcess {
        public:
            using Handler = std::function<void(const MqttEvent&)>;

            MQTTEventProcess(const MQTTEventProcess&) = delete;
            MQTTEventProcess& operator=(const MQTTEventProcess&) = delete;
            static MQTTEventProcess& Instance() {
                static MQTTEventProcess instance;
                return instance;
            }

            esp_err_t init(Handler handler);
            // Gives up after `wait` ticks; the event is dropped and false returned
            bool enqueue(MqttEvent event, TickType_t wait = 0) const;

            /**
             * @brief Posts a control event that must not be lost.
             * Blocks until the worker frees a slot. Never call it from the worker task.
             * @return false only before init().
             */
            bool enqueueBlocking(MqttEvent event) const;


        private:
            MQTTEventProcess() = default;

            [[noreturn]] static void EventProcessTask(void* arg);

            QueueHandle_t m_queue{nullptr};
            Handler m_handler;
    };
} // mqttMatter

#endif //MQTTMATTER_MQTTEVENTPROCESS_HXX
