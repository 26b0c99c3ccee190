// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "mqtt/MQTTEventProcess.hxx"

namespace mqttMatter {
    static constexpr char TAG[] = "MQTTEventProcess";

    esp_err_t MQTTEventProcess::init(Handler handler) {
        if (m_queue) return ESP_OK;
        m_handler = std::move(handler);

        m_queue = xQueueCreate(CONFIG_MQTTMATTER_EVENT_QUEUE_DEPTH, sizeof(MqttEvent*));
        if (!m_queue) {
            ESP_LOGE(TAG, "Failed to create event queue");
            return ESP_ERR_NO_MEM;
        }
        if (xTaskCreate(EventProcessTask, "mqtt_evt_task", 6144, this, 5, nullptr) != pdPASS) {
            ESP_LOGE(TAG, "Failed to create event task");
            vQueueDelete(m_queue);
            m_queue = nullptr;
            return ESP_ERR_NO_MEM;
        }
        ESP_LOGI(TAG, "Event processor started");
        return ESP_OK;
    }

    bool MQTTEventProcess::enqueue(MqttEvent event, const TickType_t wait) const {
        if (!m_queue) return false;

        auto* msg = new MqttEvent(std::move(event));
        if (xQueueSend(m_queue, &msg, wait) != pdPASS) {
            ESP_LOGE(TAG, "Queue full, dropping event (type %d, topic '%s')", static_cast<int>(msg->type), msg->topic.c_str());
            delete msg;
            return false;
        }
        return true;
    }

    bool MQTTEventProcess::enqueueBlocking(MqttEvent event) const {
        if (!m_queue) return false;

        auto* msg = new MqttEvent(std::move(event));
        while (xQueueSend(m_queue, &msg, pdMS_TO_TICKS(CONFIG_MQTTMATTER_EVENT_ENQUEUE_TIMEOUT_MS)) != pdPASS) {
            ESP_LOGW(TAG, "Queue full for %d ms, still waiting to post event type %d",
                     CONFIG_MQTTMATTER_EVENT_ENQUEUE_TIMEOUT_MS, static_cast<int>(msg->type));
        }
        return true;
    }

    [[noreturn]] void MQTTEventProcess::EventProcessTask(void* arg) {
        const auto* self = static_cast<MQTTEventProcess*>(arg);
        MqttEvent* msg = nullptr;

        while (true) {
            if (xQueueReceive(self->m_queue, &msg, portMAX_DELAY) == pdPASS && msg) {
                if (self->m_handler) {
                    self->m_handler(*msg);
                }
                delete msg;
            }
        }
    }
} // mqttMatter
