// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "SyslogConfig.hxx"
#include <lwip/sockets.h>
#include <lwip/netdb.h>

namespace mqttMatter {

    static constexpr char TAG[] = "Syslog";
    static constexpr char SYSLOG_PORT[] = "514";
    static constexpr std::string_view SYSLOG_HEADER = "<14>mqtt2matter: ";
    static constexpr size_t MESSAGE_BUFFER_SIZE = 4096;
    static constexpr size_t MAX_LINE_SIZE = 256;

    esp_err_t SyslogConfig::init(const std::string& server_addr) {
        if (m_initialized) {
            return setServer(server_addr);
        }

        m_log_buffer = xMessageBufferCreate(MESSAGE_BUFFER_SIZE);
        if (!m_log_buffer) {
            ESP_LOGE(TAG, "Failed to create message buffer, remote logging disabled.");
            return ESP_ERR_NO_MEM;
        }

        if (xTaskCreate(senderTask, "syslog_task", 4096, this, 3, &m_task_handle) != pdPASS) {
            ESP_LOGE(TAG, "Failed to create sender task, remote logging disabled.");
            vMessageBufferDelete(m_log_buffer);
            m_log_buffer = nullptr;
            return ESP_ERR_NO_MEM;
        }

        const esp_err_t err = setServer(server_addr);
        m_original_logger = esp_log_set_vprintf(logHook);
        m_initialized = true;
        ESP_LOGI(TAG, "Remote logging to %s enabled.", server_addr.c_str());
        return err;
    }

    esp_err_t SyslogConfig::setServer(const std::string& server_addr) {
        std::lock_guard lock(m_sock_mutex);

        if (m_sock >= 0) {
            close(m_sock);
            m_sock = -1;
        }
        m_server_addr = server_addr;
        if (m_server_addr.empty()) {
            return ESP_OK;
        }

        addrinfo hints = {};
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_DGRAM;
        addrinfo* res = nullptr;

        if (const int err = getaddrinfo(m_server_addr.c_str(), SYSLOG_PORT, &hints, &res); err != 0 || res == nullptr) {
            ESP_LOGE(TAG, "DNS lookup failed for '%s': err=%d", m_server_addr.c_str(), err);
            return ESP_ERR_NOT_FOUND;
        }

        esp_err_t result = ESP_OK;
        m_sock = socket(res->ai_family, res->ai_socktype, 0);
        if (m_sock < 0) {
            ESP_LOGE(TAG, "Failed to create socket.");
            result = ESP_FAIL;
        } else if (::connect(m_sock, res->ai_addr, res->ai_addrlen) != 0) {
            ESP_LOGE(TAG, "Failed to connect socket.");
            close(m_sock);
            m_sock = -1;
            result = ESP_FAIL;
        }
        freeaddrinfo(res);
        return result;
    }

    std::string SyslogConfig::formatPacket(std::string_view line) {
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
            line.remove_suffix(1);
        }
        std::string packet(SYSLOG_HEADER);
        packet.append(line.substr(0, MAX_LINE_SIZE));
        return packet;
    }

    int SyslogConfig::logHook(const char* format, va_list args) {
        auto& self = Instance();
        int ret = 0;
        if (self.m_original_logger) {
            va_list args_copy;
            va_copy(args_copy, args);
            ret = self.m_original_logger(format, args_copy);
            va_end(args_copy);
        }

        // Never log from the ISR or from the sender itself
        if (!self.m_log_buffer || xPortInIsrContext() || xTaskGetCurrentTaskHandle() == self.m_task_handle) {
            return ret;
        }

        std::array<char, 192> line{};
        const int len = vsnprintf(line.data(), line.size(), format, args);
        if (len > 0) {
            const size_t actual_len = std::min(static_cast<size_t>(len), line.size() - 1);
            // Lines that do not fit into a full buffer are lost, logging from here would recurse
            static_cast<void>(xMessageBufferSend(self.m_log_buffer, line.data(), actual_len, 0));
        }
        return ret;
    }

    void SyslogConfig::senderTask(void* arg) {
        auto* self = static_cast<SyslogConfig*>(arg);
        std::array<char, MAX_LINE_SIZE + 1> recv_buffer{};

        while (true) {
            const size_t received = xMessageBufferReceive(self->m_log_buffer, recv_buffer.data(), recv_buffer.size() - 1, portMAX_DELAY);
            if (received > 0) {
                self->send(std::string_view(recv_buffer.data(), received));
            }
        }
    }

    void SyslogConfig::send(const std::string_view line) {
        std::lock_guard lock(m_sock_mutex);
        if (m_sock < 0) {
            return;
        }
        const std::string packet = formatPacket(line);
        if (packet.size() == SYSLOG_HEADER.size()) {
            return;
        }
        if (::send(m_sock, packet.data(), packet.size(), 0) < 0) {
            // Sender task output is not mirrored, so this stays local
            ESP_LOGD(TAG, "Syslog packet dropped (errno %d)", errno);
        }
    }

} // mqttMatter
