// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "unity.h"
#include "discovery/DiscoveryCollector.hxx"
#include "matter/BridgeOrchestrator.hxx"
#include "matter/MQTTDeviceRegistrar.hxx"
#include "mqtt/MQTTClient.hxx"
#include "support/TestHelpers.hxx"

using namespace mqttMatter;
using test::entityPayload;
using test::RecordingRegistrar;

static const ChildCapability* findChild(const DeviceRegistration& registration, const char* entity_id) {
    for (const auto& child : registration.children) {
        if (child.entity_id == entity_id) return &child;
    }
    return nullptr;
}

static void test_device_with_two_entities() {
    DiscoveryCollector collector("homeassistant");
    collector.beginSession(1);
    TEST_ASSERT_EQUAL(ESP_OK, collector.onDiscoveryMessage("homeassistant/sensor/e1/config",
        entityPayload("e1", "dev-1", "Hallway", R"(,"device_class":"temperature")")));
    TEST_ASSERT_EQUAL(ESP_OK, collector.onDiscoveryMessage("homeassistant/binary_sensor/e2/config",
        entityPayload("e2", "dev-1", "Hallway", R"(,"device_class":"door")")));
    const DiscoverySession* session = collector.freezeSession();
    TEST_ASSERT_NOT_NULL(session);

    RecordingRegistrar registrar;
    BridgeOrchestrator orchestrator(registrar, BridgeIdentity{});
    const BridgeReport report = orchestrator.onDiscoveryWindowClosed(*session);

    TEST_ASSERT_EQUAL(1, report.registered);
    TEST_ASSERT_EQUAL(0, report.failed);
    TEST_ASSERT_EQUAL(1, registrar.registrations.size());

    const DeviceRegistration& registration = registrar.registrations.front();
    TEST_ASSERT_EQUAL_STRING("dev-1", registration.device_identifier.c_str());
    TEST_ASSERT_EQUAL_STRING("Hallway", registration.display_name.c_str());
    TEST_ASSERT_EQUAL_STRING(CONFIG_MQTTMATTER_VENDOR_NAME, registration.vendor.c_str());
    TEST_ASSERT_EQUAL_STRING(CONFIG_MQTTMATTER_PRODUCT_NAME, registration.model.c_str());
    TEST_ASSERT_EQUAL_STRING("unknown", registration.serial.c_str());
    TEST_ASSERT_EQUAL_STRING("1.0.0", registration.firmware_version.c_str());
    TEST_ASSERT_EQUAL_UINT32(10000, registration.hardware_version);
    TEST_ASSERT_EQUAL(2, registration.children.size());

    const ChildCapability* temperature = findChild(registration, "e1");
    const ChildCapability* door = findChild(registration, "e2");
    TEST_ASSERT_NOT_NULL(temperature);
    TEST_ASSERT_NOT_NULL(door);
    TEST_ASSERT_TRUE(temperature->type == CapabilityType::TEMPERATURE_SENSOR);
    TEST_ASSERT_TRUE(door->type == CapabilityType::CONTACT_SENSOR);
    TEST_ASSERT_EQUAL_STRING("e1 name", temperature->name.c_str());
}

static void test_failed_device_does_not_stop_others() {
    DiscoveryCollector collector("homeassistant");
    collector.beginSession(1);
    TEST_ASSERT_EQUAL(ESP_OK, collector.onDiscoveryMessage("homeassistant/sensor/a/config", entityPayload("a", "dev-a", "A")));
    TEST_ASSERT_EQUAL(ESP_OK, collector.onDiscoveryMessage("homeassistant/sensor/b/config", entityPayload("b", "dev-b", "B")));
    TEST_ASSERT_EQUAL(ESP_OK, collector.onDiscoveryMessage("homeassistant/sensor/c/config", entityPayload("c", "dev-c", "C")));
    const DiscoverySession* session = collector.freezeSession();

    RecordingRegistrar registrar;
    registrar.rejected_ids = {"dev-b"};
    BridgeOrchestrator orchestrator(registrar, BridgeIdentity{});
    const BridgeReport report = orchestrator.onDiscoveryWindowClosed(*session);

    TEST_ASSERT_EQUAL(3, registrar.registrations.size());
    TEST_ASSERT_EQUAL(2, report.registered);
    TEST_ASSERT_EQUAL(1, report.failed);
    TEST_ASSERT_EQUAL(1, report.failed_devices.size());
    TEST_ASSERT_EQUAL_STRING("dev-b", report.failed_devices.front().c_str());
}

static void test_empty_session_registers_nothing() {
    DiscoveryCollector collector("homeassistant");
    collector.beginSession(1);
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, collector.onDiscoveryMessage("homeassistant/sensor/x/config", "garbage"));
    const DiscoverySession* session = collector.freezeSession();

    RecordingRegistrar registrar;
    BridgeOrchestrator orchestrator(registrar, BridgeIdentity{});
    const BridgeReport report = orchestrator.onDiscoveryWindowClosed(*session);

    TEST_ASSERT_EQUAL(0, registrar.registrations.size());
    TEST_ASSERT_EQUAL(0, report.registered);
}

static void test_custom_identity() {
    BridgeIdentity identity;
    identity.vendor = "Acme";
    identity.model = "Bridge X";
    identity.hardware_version = 2;

    DeviceRecord device;
    device.device_identifier = "dev-1";
    device.display_name = "Device";
    EntityRecord entity;
    entity.entity_id = "e1";
    entity.device_identifier = "dev-1";
    entity.display_name = "Mode";
    entity.discovery_type = "select";
    device.entities.emplace("e1", entity);

    RecordingRegistrar registrar;
    const BridgeOrchestrator orchestrator(registrar, identity);
    const DeviceRegistration registration = orchestrator.buildRegistration(device);

    TEST_ASSERT_EQUAL_STRING("Acme", registration.vendor.c_str());
    TEST_ASSERT_EQUAL_STRING("Bridge X", registration.model.c_str());
    TEST_ASSERT_EQUAL_UINT32(2, registration.hardware_version);
    TEST_ASSERT_EQUAL(1, registration.children.size());
    TEST_ASSERT_TRUE(registration.children.front().type == CapabilityType::MODE_SELECT);
}

static void test_duplicate_entity_names_are_disambiguated() {
    DiscoveryCollector collector("homeassistant");
    collector.beginSession(1);
    TEST_ASSERT_EQUAL(ESP_OK, collector.onDiscoveryMessage("homeassistant/switch/relay_a/config",
        R"({"unique_id":"relay_a","name":"Relay","device":{"name":"Board","identifiers":["board-1"]}})"));
    TEST_ASSERT_EQUAL(ESP_OK, collector.onDiscoveryMessage("homeassistant/switch/relay_b/config",
        R"({"unique_id":"relay_b","name":"Relay","device":{"name":"Board","identifiers":["board-1"]}})"));
    const DiscoverySession* session = collector.freezeSession();

    RecordingRegistrar registrar;
    const BridgeOrchestrator orchestrator(registrar, BridgeIdentity{});
    const DeviceRegistration registration = orchestrator.buildRegistration(*session->findDevice("board-1"));

    TEST_ASSERT_EQUAL(2, registration.children.size());
    TEST_ASSERT_EQUAL_STRING("Relay", findChild(registration, "relay_a")->name.c_str());
    TEST_ASSERT_EQUAL_STRING("Relay (relay_b)", findChild(registration, "relay_b")->name.c_str());
}

static void test_registration_json() {
    DeviceRegistration registration;
    registration.device_identifier = "dev-1";
    registration.display_name = "Hallway";
    registration.vendor = "Matterbridge";
    registration.model = "MQTT Base Device";
    registration.serial = "unknown";
    registration.firmware_version = "1.0.0";
    registration.hardware_version = 10000;
    registration.children.push_back({"Door", "e2", CapabilityType::CONTACT_SENSOR});

    const std::string json = MQTTDeviceRegistrar::toJson(registration);
    cJSON* root = cJSON_Parse(json.c_str());
    TEST_ASSERT_NOT_NULL(root);

    TEST_ASSERT_EQUAL_STRING("dev-1", cJSON_GetObjectItem(root, "id")->valuestring);
    TEST_ASSERT_EQUAL_STRING("Hallway", cJSON_GetObjectItem(root, "name")->valuestring);
    TEST_ASSERT_EQUAL_STRING("Matterbridge", cJSON_GetObjectItem(root, "vendor")->valuestring);
    TEST_ASSERT_EQUAL_STRING("1.0.0", cJSON_GetObjectItem(root, "firmware")->valuestring);
    TEST_ASSERT_EQUAL_INT(10000, cJSON_GetObjectItem(root, "hardware")->valueint);

    const cJSON* children = cJSON_GetObjectItem(root, "children");
    TEST_ASSERT_TRUE(cJSON_IsArray(children));
    TEST_ASSERT_EQUAL_INT(1, cJSON_GetArraySize(children));
    const cJSON* child = cJSON_GetArrayItem(children, 0);
    TEST_ASSERT_EQUAL_STRING("e2", cJSON_GetObjectItem(child, "entity")->valuestring);
    TEST_ASSERT_EQUAL_STRING("contact_sensor", cJSON_GetObjectItem(child, "type")->valuestring);
    TEST_ASSERT_EQUAL_INT(0x0015, cJSON_GetObjectItem(child, "device_type")->valueint);

    cJSON_Delete(root);
}

static void test_registration_topic() {
    const MQTTDeviceRegistrar registrar(MQTTClient::Instance(), "mqtt2matter");
    TEST_ASSERT_EQUAL_STRING("mqtt2matter/devices/dev-1/config", registrar.registrationTopic("dev-1").c_str());
    TEST_ASSERT_EQUAL_STRING("mqtt2matter/devices/zigbee_0x12___/config", registrar.registrationTopic("zigbee/0x12/+/#").c_str());
}

static void test_registration_without_connection_fails() {
    MQTTDeviceRegistrar registrar(MQTTClient::Instance(), "mqtt2matter");
    DeviceRegistration registration;
    registration.device_identifier = "dev-1";
    registration.display_name = "Device";
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_STATE, registrar.registerDevice(registration));
}

void run_bridge_orchestrator_tests() {
    RUN_TEST(test_device_with_two_entities);
    RUN_TEST(test_failed_device_does_not_stop_others);
    RUN_TEST(test_empty_session_registers_nothing);
    RUN_TEST(test_custom_identity);
    RUN_TEST(test_duplicate_entity_names_are_disambiguated);
    RUN_TEST(test_registration_json);
    RUN_TEST(test_registration_topic);
    RUN_TEST(test_registration_without_connection_fails);
}
