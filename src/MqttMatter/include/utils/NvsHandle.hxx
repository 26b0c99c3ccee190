// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef MQTTMATTER_NVSHANDLE_HXX
#define MQTTMATTER_NVSHANDLE_HXX
#include <esp_log.h>
#include <nvs.h>

namespace mqttMatter::utils {
    // Owns an open NVS namespace; the open error is kept for the caller to return
    class NvsHandle {
        public:
            NvsHandle(const char* ns, const nvs_open_mode_t mode) {
                m_open_error = nvs_open(ns, mode, &m_handle);
                if (m_open_error != ESP_OK) {
                    ESP_LOGE("NvsHandle", "Cannot open NVS namespace '%s': %s", ns, esp_err_to_name(m_open_error));
                    m_handle = 0;
                }
            }

            ~NvsHandle() {
                if (m_handle) {
                    nvs_close(m_handle);
                }
            }

            NvsHandle(const NvsHandle&) = delete;
            NvsHandle& operator=(const NvsHandle&) = delete;

            [[nodiscard]] nvs_handle_t get() const { return m_handle; }
            [[nodiscard]] esp_err_t openError() const { return m_open_error; }
            explicit operator bool() const { return m_handle != 0; }

        private:
            nvs_handle_t m_handle{0};
            esp_err_t m_open_error{ESP_OK};
    };
}

#endif //MQTTMATTER_NVSHANDLE_HXX
