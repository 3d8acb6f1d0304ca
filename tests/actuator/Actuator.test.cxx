// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "unity.h"
#include "actuator/Actuator.hxx"

using namespace sihoa;

namespace {
    std::vector<std::pair<std::string, std::string>> drain(OutboundQueue& queue) {
        std::vector<std::pair<std::string, std::string>> out;
        MqttMessage message;
        while (queue.receive(message, std::chrono::milliseconds{0})) {
            out.emplace_back(message.topic, utils::printJson(message.payload.get()));
        }
        return out;
    }

    void feed(Actuator& actuator, const char* json, const bool availability = false) {
        const JsonHandle payload = utils::parseJson(json);
        if (availability) {
            actuator.onAvailability(payload.get());
        } else {
            actuator.onReport(payload.get());
        }
    }
}

static void test_new_actuator_state_is_unknown() {
    OutboundQueue outbound;
    const Actuator lamp(ActuatorClass::Light, "lamp", "0x01", "zigbee_network", outbound);

    TEST_ASSERT_FALSE(lamp.online().has_value());
    TEST_ASSERT_FALSE(lamp.on().has_value());
    TEST_ASSERT_FALSE(lamp.pendingCommand());
    TEST_ASSERT_EQUAL_STRING("zigbee_network/lamp", lamp.stateTopic().c_str());
    TEST_ASSERT_EQUAL_STRING("zigbee_network/lamp/availability", lamp.availabilityTopic().c_str());
    TEST_ASSERT_EQUAL_STRING("zigbee_network/lamp/set", lamp.setTopic().c_str());
    TEST_ASSERT_EQUAL_STRING("zigbee_network/lamp/get", lamp.getTopic().c_str());
}

static void test_light_request_on_sends_set_then_get() {
    OutboundQueue outbound;
    Actuator lamp(ActuatorClass::Light, "lamp", "0x01", "base", outbound);

    TEST_ASSERT_EQUAL(CommandStatus::Issued, lamp.requestOn());
    TEST_ASSERT_TRUE(lamp.pendingCommand());

    const auto sent = drain(outbound);
    TEST_ASSERT_EQUAL_size_t(2, sent.size());
    TEST_ASSERT_EQUAL_STRING("base/lamp/set", sent[0].first.c_str());
    TEST_ASSERT_EQUAL_STRING(R"({"state":"ON","transition":0})", sent[0].second.c_str());
    TEST_ASSERT_EQUAL_STRING("base/lamp/get", sent[1].first.c_str());
    TEST_ASSERT_EQUAL_STRING(R"({"state":""})", sent[1].second.c_str());
}

static void test_plug_request_off_has_no_transition() {
    OutboundQueue outbound;
    Actuator plug(ActuatorClass::Plug, "heater", "0x02", "base", outbound);

    TEST_ASSERT_EQUAL(CommandStatus::Issued, plug.requestOff());
    const auto sent = drain(outbound);
    TEST_ASSERT_EQUAL_size_t(2, sent.size());
    TEST_ASSERT_EQUAL_STRING(R"({"state":"OFF"})", sent[0].second.c_str());
}

static void test_pending_command_suppresses_requests() {
    OutboundQueue outbound;
    Actuator lamp(ActuatorClass::Light, "lamp", "0x01", "base", outbound);

    TEST_ASSERT_EQUAL(CommandStatus::Issued, lamp.requestOn());
    drain(outbound);

    TEST_ASSERT_EQUAL(CommandStatus::Suppressed, lamp.requestOn());
    TEST_ASSERT_EQUAL(CommandStatus::Suppressed, lamp.requestOff());
    TEST_ASSERT_TRUE(outbound.empty());
    TEST_ASSERT_TRUE(lamp.pendingCommand());
}

static void test_on_report_confirms_state() {
    OutboundQueue outbound;
    Actuator lamp(ActuatorClass::Light, "lamp", "0x01", "base", outbound);
    lamp.requestOn();

    feed(lamp, R"({"state":"ON","brightness":254,"linkquality":120})");
    TEST_ASSERT_FALSE(lamp.pendingCommand());
    TEST_ASSERT_TRUE(lamp.on().has_value());
    TEST_ASSERT_TRUE(*lamp.on());

    const auto& attrs = std::get<LightAttributes>(lamp.attributes());
    TEST_ASSERT_EQUAL_INT(254, *attrs.brightness);
    TEST_ASSERT_EQUAL_INT(120, *attrs.link_quality);
}

static void test_brightness_only_report_keeps_state() {
    OutboundQueue outbound;
    Actuator lamp(ActuatorClass::Light, "lamp", "0x01", "base", outbound);
    feed(lamp, R"({"state":"OFF"})");
    lamp.requestOn();

    feed(lamp, R"({"brightness":10})");
    TEST_ASSERT_FALSE(lamp.pendingCommand());
    TEST_ASSERT_FALSE(*lamp.on());
    TEST_ASSERT_EQUAL_INT(10, *std::get<LightAttributes>(lamp.attributes()).brightness);
}

static void test_empty_or_malformed_report_is_ignored() {
    OutboundQueue outbound;
    Actuator lamp(ActuatorClass::Light, "lamp", "0x01", "base", outbound);
    lamp.requestOn();

    feed(lamp, "{}");
    feed(lamp, "[1,2]");
    lamp.onReport(nullptr);
    TEST_ASSERT_TRUE(lamp.pendingCommand());
    TEST_ASSERT_FALSE(lamp.on().has_value());
}

static void test_report_never_touches_online() {
    OutboundQueue outbound;
    Actuator lamp(ActuatorClass::Light, "lamp", "0x01", "base", outbound);
    feed(lamp, R"({"state":"ON"})");
    TEST_ASSERT_FALSE(lamp.online().has_value());
}

static void test_going_online_queues_read_request() {
    OutboundQueue outbound;
    Actuator lamp(ActuatorClass::Light, "lamp", "0x01", "base", outbound);

    feed(lamp, R"({"state":"online"})", true);
    TEST_ASSERT_TRUE(*lamp.online());
    auto sent = drain(outbound);
    TEST_ASSERT_EQUAL_size_t(1, sent.size());
    TEST_ASSERT_EQUAL_STRING("base/lamp/get", sent[0].first.c_str());
    TEST_ASSERT_EQUAL_STRING(R"({"power_on_behavior":"","color_temp_startup":""})", sent[0].second.c_str());

    // Repeated online is not a transition
    feed(lamp, R"({"state":"online"})", true);
    TEST_ASSERT_TRUE(outbound.empty());

    feed(lamp, R"({"state":"offline"})", true);
    TEST_ASSERT_FALSE(*lamp.online());
    TEST_ASSERT_TRUE(outbound.empty());
}

static void test_plug_read_request_asks_for_state() {
    OutboundQueue outbound;
    Actuator plug(ActuatorClass::Plug, "heater", "0x02", "base", outbound);

    feed(plug, R"({"state":"online"})", true);
    const auto sent = drain(outbound);
    TEST_ASSERT_EQUAL_size_t(1, sent.size());
    TEST_ASSERT_EQUAL_STRING(R"({"state":""})", sent[0].second.c_str());
}

static void test_availability_without_state_is_ignored() {
    OutboundQueue outbound;
    Actuator lamp(ActuatorClass::Light, "lamp", "0x01", "base", outbound);
    feed(lamp, R"({"foo":"online"})", true);
    lamp.onAvailability(nullptr);
    TEST_ASSERT_FALSE(lamp.online().has_value());
    TEST_ASSERT_TRUE(outbound.empty());
}

static void test_unknown_availability_keeps_previous_value() {
    OutboundQueue outbound;
    Actuator lamp(ActuatorClass::Light, "lamp", "0x01", "base", outbound);

    feed(lamp, R"({"state":"garbage"})", true);
    TEST_ASSERT_FALSE(lamp.online().has_value());

    feed(lamp, R"({"state":"online"})", true);
    drain(outbound);
    feed(lamp, R"({"state":"Offline"})", true);
    feed(lamp, R"({"state":""})", true);
    TEST_ASSERT_TRUE(*lamp.online());
    TEST_ASSERT_TRUE(outbound.empty());
}

static void test_pending_timeout_disabled_by_default() {
    OutboundQueue outbound;
    Actuator lamp(ActuatorClass::Light, "lamp", "0x01", "base", outbound);
    lamp.requestOn();
    TEST_ASSERT_FALSE(lamp.expirePending(Actuator::Clock::now() + std::chrono::hours(24)));
    TEST_ASSERT_TRUE(lamp.pendingCommand());
}

static void test_pending_timeout_clears_flag() {
    OutboundQueue outbound;
    Actuator lamp(ActuatorClass::Light, "lamp", "0x01", "base", outbound, std::chrono::milliseconds(500));
    lamp.requestOn();
    drain(outbound);

    TEST_ASSERT_FALSE(lamp.expirePending(Actuator::Clock::now()));
    TEST_ASSERT_TRUE(lamp.expirePending(Actuator::Clock::now() + std::chrono::seconds(1)));
    TEST_ASSERT_FALSE(lamp.pendingCommand());
    TEST_ASSERT_EQUAL(CommandStatus::Issued, lamp.requestOn());
}

void run_actuator_tests() {
    RUN_TEST(test_new_actuator_state_is_unknown);
    RUN_TEST(test_light_request_on_sends_set_then_get);
    RUN_TEST(test_plug_request_off_has_no_transition);
    RUN_TEST(test_pending_command_suppresses_requests);
    RUN_TEST(test_on_report_confirms_state);
    RUN_TEST(test_brightness_only_report_keeps_state);
    RUN_TEST(test_empty_or_malformed_report_is_ignored);
    RUN_TEST(test_report_never_touches_online);
    RUN_TEST(test_going_online_queues_read_request);
    RUN_TEST(test_plug_read_request_asks_for_state);
    RUN_TEST(test_availability_without_state_is_ignored);
    RUN_TEST(test_unknown_availability_keeps_previous_value);
    RUN_TEST(test_pending_timeout_disabled_by_default);
    RUN_TEST(test_pending_timeout_clears_flag);
}
