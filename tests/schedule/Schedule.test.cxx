// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "unity.h"
#include "schedule/GroupController.hxx"

using namespace sihoa;

static void test_parse_time_of_day() {
    const auto t = parseTimeOfDay("07:05");
    TEST_ASSERT_TRUE(t.has_value());
    TEST_ASSERT_EQUAL_UINT16(7 * 60 + 5, t->minutes);
    TEST_ASSERT_EQUAL_UINT16(9 * 60 + 30, parseTimeOfDay(" 9:30 ")->minutes);
    TEST_ASSERT_EQUAL_STRING("07:05", formatTimeOfDay(*t).c_str());

    TEST_ASSERT_FALSE(parseTimeOfDay("24:00").has_value());
    TEST_ASSERT_FALSE(parseTimeOfDay("12:60").has_value());
    TEST_ASSERT_FALSE(parseTimeOfDay("12:5").has_value());
    TEST_ASSERT_FALSE(parseTimeOfDay("noon").has_value());
    TEST_ASSERT_FALSE(parseTimeOfDay("").has_value());
}

static void test_window_same_day() {
    const ScheduleWindow window{TimeOfDay::fromHM(8, 0), TimeOfDay::fromHM(18, 0)};
    TEST_ASSERT_FALSE(window.isActive(TimeOfDay::fromHM(7, 59)));
    TEST_ASSERT_TRUE(window.isActive(TimeOfDay::fromHM(8, 0)));
    TEST_ASSERT_TRUE(window.isActive(TimeOfDay::fromHM(17, 59)));
    TEST_ASSERT_FALSE(window.isActive(TimeOfDay::fromHM(18, 0)));
}

static void test_window_spanning_midnight() {
    const ScheduleWindow window{TimeOfDay::fromHM(22, 0), TimeOfDay::fromHM(6, 0)};
    TEST_ASSERT_TRUE(window.isActive(TimeOfDay::fromHM(23, 30)));
    TEST_ASSERT_TRUE(window.isActive(TimeOfDay::fromHM(0, 0)));
    TEST_ASSERT_TRUE(window.isActive(TimeOfDay::fromHM(5, 59)));
    TEST_ASSERT_FALSE(window.isActive(TimeOfDay::fromHM(6, 0)));
    TEST_ASSERT_FALSE(window.isActive(TimeOfDay::fromHM(12, 0)));
}

static void test_empty_window_never_active() {
    const ScheduleWindow window{TimeOfDay::fromHM(10, 0), TimeOfDay::fromHM(10, 0)};
    TEST_ASSERT_FALSE(window.isActive(TimeOfDay::fromHM(10, 0)));
    TEST_ASSERT_FALSE(window.isActive(TimeOfDay::fromHM(3, 0)));
}

static void test_group_switches_online_members_only() {
    OutboundQueue outbound;
    Actuator online_lamp(ActuatorClass::Light, "porch", "0x01", "base", outbound);
    Actuator offline_lamp(ActuatorClass::Light, "garden", "0x02", "base", outbound);

    const JsonHandle online = utils::parseJson(R"({"state":"online"})");
    online_lamp.onAvailability(online.get());
    const JsonHandle off = utils::parseJson(R"({"state":"OFF"})");
    online_lamp.onReport(off.get());
    MqttMessage discard;
    while (outbound.receive(discard, std::chrono::milliseconds{0})) {}

    GroupController controller;
    controller.addActuator(online_lamp);
    controller.addActuator(offline_lamp);
    controller.setGroups({ActuatorGroup{"outside", {TimeOfDay::fromHM(18, 0), TimeOfDay::fromHM(23, 0)},
                                        {"porch", "garden", "missing"}}});

    TEST_ASSERT_EQUAL_size_t(1, controller.evaluate(TimeOfDay::fromHM(19, 0)));
    TEST_ASSERT_TRUE(online_lamp.pendingCommand());
    TEST_ASSERT_FALSE(offline_lamp.pendingCommand());

    MqttMessage set;
    TEST_ASSERT_TRUE(outbound.receive(set, std::chrono::milliseconds{0}));
    TEST_ASSERT_EQUAL_STRING("base/porch/set", set.topic.c_str());
    TEST_ASSERT_EQUAL_STRING("ON", utils::getString(set.payload.get(), "state")->c_str());

    // Re-evaluating while the command is pending issues nothing
    TEST_ASSERT_EQUAL_size_t(0, controller.evaluate(TimeOfDay::fromHM(19, 1)));
}

static void test_group_leaves_confirmed_state_alone() {
    OutboundQueue outbound;
    Actuator plug(ActuatorClass::Plug, "fountain", "0x03", "base", outbound);
    const JsonHandle online = utils::parseJson(R"({"state":"online"})");
    plug.onAvailability(online.get());
    const JsonHandle on = utils::parseJson(R"({"state":"ON"})");
    plug.onReport(on.get());

    GroupController controller;
    controller.addActuator(plug);
    controller.setGroups({ActuatorGroup{"water", {TimeOfDay::fromHM(9, 0), TimeOfDay::fromHM(17, 0)}, {"fountain"}}});

    TEST_ASSERT_EQUAL_size_t(0, controller.evaluate(TimeOfDay::fromHM(12, 0)));
    TEST_ASSERT_EQUAL_size_t(1, controller.evaluate(TimeOfDay::fromHM(17, 0)));
    TEST_ASSERT_TRUE(plug.pendingCommand());
}

void run_schedule_tests() {
    RUN_TEST(test_parse_time_of_day);
    RUN_TEST(test_window_same_day);
    RUN_TEST(test_window_spanning_midnight);
    RUN_TEST(test_empty_window_never_active);
    RUN_TEST(test_group_switches_online_members_only);
    RUN_TEST(test_group_leaves_confirmed_state_alone);
}
