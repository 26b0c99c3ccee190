// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef MQTTMATTER_SYSLOGCONFIG_HXX
#define MQTTMATTER_SYSLOGCONFIG_HXX

#include <freertos/message_buffer.h>

namespace mqttMatter {
    /**
     * @brief Mirrors ESP log output to a remote syslog server over UDP.
     * The log hook only copies lines into a message buffer, a background task does the sending.
     */
    class SyslogConfig {
        public:
            SyslogConfig(const SyslogConfig&) = delete;
            SyslogConfig& operator=(const SyslogConfig&) = delete;

            static SyslogConfig& Instance() {
                static SyslogConfig instance;
                return instance;
            }

            esp_err_t init(const std::string& server_addr);
            esp_err_t setServer(const std::string& server_addr);

            // "<14>mqtt2matter: " + line without trailing newlines, truncated to fit a packet
            [[nodiscard]] static std::string formatPacket(std::string_view line);

        private:
            SyslogConfig() = default;
            static int logHook(const char* format, va_list args);
            [[noreturn]] static void senderTask(void* arg);
            void send(std::string_view line);

            std::string m_server_addr;
            int m_sock{-1};
            vprintf_like_t m_original_logger{nullptr};
            std::recursive_mutex m_sock_mutex;
            bool m_initialized{false};
            MessageBufferHandle_t m_log_buffer{nullptr};
            TaskHandle_t m_task_handle{nullptr};
    };
} // mqttMatter

#endif //MQTTMATTER_SYSLOGCONFIG_HXX
