// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "unity.h"
#include "mqtt/MQTTClient.hxx"
#include "mqtt/MQTTDiscoveryRouter.hxx"
#include "mqtt/MQTTEventProcess.hxx"
#include "system/DiscoveryBridge.hxx"
#include "support/TestHelpers.hxx"

using namespace mqttMatter;
using test::entityPayload;
using test::RecordingRegistrar;

namespace {
    class RecordingListener final : public TransportListener {
        public:
            void onConnected(uint32_t generation) override { connected.push_back(generation); }
            void onDiscoveryMessage(const std::string& topic, const std::string&) override { discovery.push_back(topic); }
            void onDiscoveryWindowClosed(uint32_t generation) override { closed.push_back(generation); }
            void onRuntimeMessage(const std::string& topic, const std::string&) override { runtime.push_back(topic); }
            void onDisconnected() override { ++disconnects; }
            void onTransportError(const std::string& reason) override { errors.push_back(reason); }

            std::vector<uint32_t> connected;
            std::vector<std::string> discovery;
            std::vector<uint32_t> closed;
            std::vector<std::string> runtime;
            std::vector<std::string> errors;
            int disconnects{0};
    };

    MqttEvent connectedEvent() {
        MqttEvent event;
        event.type = MqttEventType::CONNECTED;
        return event;
    }

    MqttEvent dataEvent(const std::string& topic, const std::string& payload = "{}") {
        MqttEvent event;
        event.type = MqttEventType::DATA;
        event.topic = topic;
        event.payload = payload;
        return event;
    }

    MqttEvent windowExpiredEvent(uint32_t generation) {
        MqttEvent event;
        event.type = MqttEventType::WINDOW_EXPIRED;
        event.generation = generation;
        return event;
    }
}

static void test_discovery_subscriptions() {
    RecordingListener listener;
    DiscoveryRouterSettings settings;
    settings.discovery_root = "homeassistant/";
    const MQTTDiscoveryRouter router(MQTTClient::Instance(), listener, settings);

    const auto topics = router.discoverySubscriptions();
    TEST_ASSERT_EQUAL(2, topics.size());
    TEST_ASSERT_EQUAL_STRING("homeassistant/+/+/config", topics[0].c_str());
    TEST_ASSERT_EQUAL_STRING("homeassistant/+/+/+/config", topics[1].c_str());
    TEST_ASSERT_TRUE(router.isDiscoveryTopic("homeassistant/sensor/node/e1/config"));
    TEST_ASSERT_FALSE(router.isDiscoveryTopic("homeassistant/sensor/e1/state"));
    TEST_ASSERT_FALSE(router.isDiscoveryTopic("zigbee2mqtt/lamp/config"));
}

static void test_window_routes_and_drops() {
    RecordingListener listener;
    MQTTDiscoveryRouter router(MQTTClient::Instance(), listener, DiscoveryRouterSettings{});

    TEST_ASSERT_FALSE(router.isWindowOpen());
    router.dispatch(connectedEvent());
    TEST_ASSERT_TRUE(router.isWindowOpen());
    TEST_ASSERT_EQUAL(1, listener.connected.size());
    TEST_ASSERT_EQUAL_UINT32(1, listener.connected.front());

    router.dispatch(dataEvent("homeassistant/sensor/e1/config"));
    router.dispatch(dataEvent("homeassistant/sensor/e1/state"));
    router.dispatch(dataEvent("kitchen/temp"));
    TEST_ASSERT_EQUAL(1, listener.discovery.size());
    TEST_ASSERT_EQUAL(0, listener.runtime.size());

    router.dispatch(windowExpiredEvent(1));
    TEST_ASSERT_FALSE(router.isWindowOpen());
    TEST_ASSERT_EQUAL(1, listener.closed.size());

    router.dispatch(dataEvent("kitchen/temp"));
    router.dispatch(dataEvent("homeassistant/sensor/e9/config"));
    TEST_ASSERT_EQUAL(1, listener.discovery.size());
    TEST_ASSERT_EQUAL(2, listener.runtime.size());
    TEST_ASSERT_EQUAL_STRING("homeassistant/sensor/e9/config", listener.runtime.back().c_str());
}

static void test_stale_expiry_is_ignored() {
    RecordingListener listener;
    MQTTDiscoveryRouter router(MQTTClient::Instance(), listener, DiscoveryRouterSettings{});

    router.dispatch(connectedEvent());
    router.dispatch(connectedEvent());
    TEST_ASSERT_EQUAL_UINT32(2, router.generation());

    // Expiry armed by the first connection
    router.dispatch(windowExpiredEvent(1));
    TEST_ASSERT_TRUE(router.isWindowOpen());
    TEST_ASSERT_EQUAL(0, listener.closed.size());

    router.dispatch(windowExpiredEvent(2));
    router.dispatch(windowExpiredEvent(2));
    TEST_ASSERT_FALSE(router.isWindowOpen());
    TEST_ASSERT_EQUAL(1, listener.closed.size());
    TEST_ASSERT_EQUAL_UINT32(2, listener.closed.front());
}

static void test_disconnect_and_error_are_forwarded() {
    RecordingListener listener;
    MQTTDiscoveryRouter router(MQTTClient::Instance(), listener, DiscoveryRouterSettings{});

    MqttEvent error;
    error.type = MqttEventType::TRANSPORT_ERROR;
    error.payload = "connection refused";
    router.dispatch(error);

    MqttEvent disconnected;
    disconnected.type = MqttEventType::DISCONNECTED;
    router.dispatch(disconnected);

    TEST_ASSERT_EQUAL(1, listener.disconnects);
    TEST_ASSERT_EQUAL(1, listener.errors.size());
    TEST_ASSERT_EQUAL_STRING("connection refused", listener.errors.front().c_str());
}

static void test_late_discovery_message_is_not_bridged() {
    RecordingRegistrar registrar;
    DiscoveryBridge bridge("homeassistant", registrar, BridgeIdentity{});
    MQTTDiscoveryRouter router(MQTTClient::Instance(), bridge, DiscoveryRouterSettings{});

    router.dispatch(connectedEvent());
    router.dispatch(dataEvent("homeassistant/sensor/e1/config",
        entityPayload("e1", "dev-1", "Hallway", R"(,"device_class":"temperature")")));
    router.dispatch(dataEvent("homeassistant/binary_sensor/e2/config",
        entityPayload("e2", "dev-1", "Hallway", R"(,"device_class":"door")")));
    router.dispatch(windowExpiredEvent(router.generation()));

    TEST_ASSERT_EQUAL(1, registrar.registrations.size());
    TEST_ASSERT_EQUAL(2, registrar.registrations.front().children.size());
    TEST_ASSERT_TRUE(bridge.lastReport().has_value());
    TEST_ASSERT_EQUAL(1, bridge.lastReport()->registered);

    router.dispatch(dataEvent("homeassistant/sensor/e3/config", entityPayload("e3", "dev-1", "Hallway")));
    TEST_ASSERT_EQUAL(1, registrar.registrations.size());
    TEST_ASSERT_EQUAL(2, registrar.registrations.front().children.size());
    TEST_ASSERT_EQUAL(1, bridge.runtimeMessageCount());
    TEST_ASSERT_NULL(bridge.collector().session()->findEntity("e3"));
}

static void test_reconnect_starts_new_session() {
    RecordingRegistrar registrar;
    DiscoveryBridge bridge("homeassistant", registrar, BridgeIdentity{});
    MQTTDiscoveryRouter router(MQTTClient::Instance(), bridge, DiscoveryRouterSettings{});

    router.dispatch(connectedEvent());
    router.dispatch(dataEvent("homeassistant/sensor/e1/config", entityPayload("e1", "dev-1", "Hallway")));
    router.dispatch(connectedEvent());
    router.dispatch(dataEvent("homeassistant/sensor/e2/config", entityPayload("e2", "dev-2", "Porch")));

    // Expiry from the abandoned session must not bridge anything
    router.dispatch(windowExpiredEvent(1));
    TEST_ASSERT_EQUAL(0, registrar.registrations.size());

    router.dispatch(windowExpiredEvent(2));
    TEST_ASSERT_EQUAL(1, registrar.registrations.size());
    TEST_ASSERT_EQUAL_STRING("dev-2", registrar.registrations.front().device_identifier.c_str());
}

static void test_window_expiry_is_retried_when_queue_is_full() {
    RecordingListener listener;
    bool queue_full = true;
    std::vector<MqttEvent> posted;

    DiscoveryRouterSettings settings;
    // Long periods keep the real timer quiet, expiries are triggered by hand
    settings.window_ms = 60000;
    settings.expiry_retry_ms = 60000;
    MQTTDiscoveryRouter router(MQTTClient::Instance(), listener, settings);
    TEST_ASSERT_EQUAL(ESP_OK, router.init([&queue_full, &posted](MqttEvent event) {
        if (queue_full) return false;
        posted.push_back(std::move(event));
        return true;
    }));

    router.dispatch(connectedEvent());
    router.onWindowTimerExpired();
    TEST_ASSERT_EQUAL_UINT32(1, router.expiryRetries());
    TEST_ASSERT_TRUE(posted.empty());
    TEST_ASSERT_TRUE(router.isWindowOpen());

    // Retry fires once the worker has drained the queue
    queue_full = false;
    router.onWindowTimerExpired();
    TEST_ASSERT_EQUAL(1, posted.size());
    TEST_ASSERT_TRUE(posted.front().type == MqttEventType::WINDOW_EXPIRED);
    TEST_ASSERT_EQUAL_UINT32(1, posted.front().generation);

    router.dispatch(posted.front());
    TEST_ASSERT_FALSE(router.isWindowOpen());
    TEST_ASSERT_EQUAL(1, listener.closed.size());

    router.dispatch(dataEvent("kitchen/temp"));
    TEST_ASSERT_EQUAL(1, listener.runtime.size());
}

static void test_init_rejects_missing_sink() {
    RecordingListener listener;
    MQTTDiscoveryRouter router(MQTTClient::Instance(), listener, DiscoveryRouterSettings{});
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, router.init(MQTTDiscoveryRouter::EventSink{}));
}

static void test_event_process_rejects_before_init() {
    const auto& process = MQTTEventProcess::Instance();
    TEST_ASSERT_FALSE(process.enqueue(connectedEvent(), 0));
    TEST_ASSERT_FALSE(process.enqueueBlocking(connectedEvent()));
}

void run_discovery_router_tests() {
    RUN_TEST(test_discovery_subscriptions);
    RUN_TEST(test_window_routes_and_drops);
    RUN_TEST(test_stale_expiry_is_ignored);
    RUN_TEST(test_disconnect_and_error_are_forwarded);
    RUN_TEST(test_late_discovery_message_is_not_bridged);
    RUN_TEST(test_reconnect_starts_new_session);
    RUN_TEST(test_window_expiry_is_retried_when_queue_is_full);
    RUN_TEST(test_init_rejects_missing_sink);
    RUN_TEST(test_event_process_rejects_before_init);
}
