// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef MQTTMATTER_BRIDGEORCHESTRATOR_HXX
#define MQTTMATTER_BRIDGEORCHESTRATOR_HXX

#include "DeviceRegistrar.hxx"
#include "discovery/DiscoverySession.hxx"

namespace mqttMatter
{
    // Descriptive metadata stamped on every bridged device
    struct BridgeIdentity {
        std::string vendor{CONFIG_MQTTMATTER_VENDOR_NAME};
        std::string model{CONFIG_MQTTMATTER_PRODUCT_NAME};
        std::string serial{"unknown"};
        std::string firmware_version{"1.0.0"};
        uint32_t hardware_version{10000};
    };

    struct BridgeReport {
        size_t registered{0};
        size_t failed{0};
        size_t skipped{0};   // Devices without entities
        std::vector<std::string> failed_devices;
    };

    class BridgeOrchestrator {
        public:
            BridgeOrchestrator(DeviceRegistrar& registrar, BridgeIdentity identity);

            /**
             * @brief Registers every device of a frozen session, one request per device.
             * A rejected device is logged and counted; the remaining devices are still submitted.
             */
            BridgeReport onDiscoveryWindowClosed(const DiscoverySession& session);

            [[nodiscard]] DeviceRegistration buildRegistration(const DeviceRecord& device) const;

        private:
            DeviceRegistrar& m_registrar;
            BridgeIdentity m_identity;
    };
} // mqttMatter

#endif //MQTTMATTER_BRIDGEORCHESTRATOR_HXX
