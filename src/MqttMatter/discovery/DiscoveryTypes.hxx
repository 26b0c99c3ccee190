// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef MQTTMATTER_DISCOVERYTYPES_HXX
#define MQTTMATTER_DISCOVERYTYPES_HXX

namespace mqttMatter
{
    struct NumericRange {
        double min{0.0};
        double max{0.0};
    };

    // One discovered entity (sensor, switch, number, ...)
    struct EntityRecord {
        std::string entity_id;                          // unique_id, primary key
        std::string device_identifier;                  // device.identifiers[0]
        std::string display_name;                       // name
        std::string discovery_type;                     // <root>/<type>/.../config
        std::string discovery_topic;                    // Topic the payload came from

        std::optional<std::string> device_class{};      // device_class
        std::optional<std::string> unit_of_measurement{}; // unit_of_measurement
        std::optional<NumericRange> numeric_range{};    // min + max

        std::map<std::string, std::string> raw_attributes; // Remaining fields, unformatted JSON
    };

    // One physical device grouping its entities
    struct DeviceRecord {
        std::string device_identifier;
        std::string display_name;                       // Fixed by the first entity seen
        std::map<std::string, EntityRecord> entities;   // entity_id -> record
    };
} // mqttMatter

#endif //MQTTMATTER_DISCOVERYTYPES_HXX
