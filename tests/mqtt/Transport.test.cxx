// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "unity.h"
#include "mocks/FakeTransport.hxx"
#include "mqtt/MQTTDispatcher.hxx"

using namespace sihoa;
using sihoa::test::FakeTransport;
using namespace std::chrono_literals;

static void test_callbacks_reach_dispatcher() {
    FakeTransport transport;
    InboundQueue inbound;
    MQTTDispatcher dispatcher(transport, inbound);
    TEST_ASSERT_EQUAL(SIHOA_OK, dispatcher.registerTopic("z2m/lamp", [](const cJSON*) {}));

    int disconnects = 0;
    transport.setCallbacks(
        [&dispatcher](const int rc) { dispatcher.onConnect(rc); },
        [&disconnects]() { ++disconnects; },
        [&dispatcher](const std::string& t, const std::string& d) { dispatcher.onMessage(t, d); });

    transport.connectResult(0);
    transport.connectionLost();
    transport.deliver("z2m/lamp", R"({"state":"ON"})");

    TEST_ASSERT_EQUAL_size_t(2, transport.subscribed.size());
    TEST_ASSERT_EQUAL_INT(1, disconnects);
    MqttMessage message;
    TEST_ASSERT_TRUE(inbound.receive(message, 0ms));
    TEST_ASSERT_EQUAL_STRING("z2m/lamp", message.topic.c_str());
}

static void test_detach_waits_for_delivery_in_progress() {
    FakeTransport transport;
    std::atomic<int> delivered{0};
    std::atomic<bool> in_callback{false};
    transport.setCallbacks(nullptr, nullptr, [&](const std::string&, const std::string&) {
        in_callback = true;
        std::this_thread::sleep_for(5ms);
        ++delivered;
        in_callback = false;
    });

    std::atomic<bool> running{true};
    std::thread client_thread([&] {
        while (running) {
            transport.deliver("z2m/bridge/devices", "[]");
            std::this_thread::sleep_for(1ms);
        }
    });
    while (delivered == 0) {
        std::this_thread::sleep_for(1ms);
    }

    transport.detach();
    TEST_ASSERT_FALSE(in_callback);
    const int after_detach = delivered;

    std::this_thread::sleep_for(30ms);
    running = false;
    client_thread.join();
    TEST_ASSERT_EQUAL_INT(after_detach, delivered.load());
}

static void test_notify_without_callbacks_is_harmless() {
    FakeTransport transport;
    transport.connectResult(5);
    transport.connectionLost();
    transport.deliver("anything", "{}");
    TEST_ASSERT_TRUE(transport.subscribed.empty());
}

void run_transport_tests() {
    RUN_TEST(test_callbacks_reach_dispatcher);
    RUN_TEST(test_detach_waits_for_delivery_in_progress);
    RUN_TEST(test_notify_without_callbacks_is_harmless);
}
