// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "unity.h"
#include "utils/MessageQueue.hxx"

using namespace sihoa;

static void test_queue_is_fifo() {
    MessageQueue<int> queue;
    TEST_ASSERT_TRUE(queue.send(1));
    TEST_ASSERT_TRUE(queue.send(2));
    TEST_ASSERT_EQUAL_size_t(2, queue.size());

    int value = 0;
    TEST_ASSERT_TRUE(queue.receive(value, std::chrono::milliseconds{0}));
    TEST_ASSERT_EQUAL_INT(1, value);
    TEST_ASSERT_TRUE(queue.receive(value, std::chrono::milliseconds{0}));
    TEST_ASSERT_EQUAL_INT(2, value);
    TEST_ASSERT_TRUE(queue.empty());
}

static void test_receive_times_out_when_empty() {
    MessageQueue<int> queue;
    int value = 42;
    const auto start = std::chrono::steady_clock::now();
    TEST_ASSERT_FALSE(queue.receive(value, std::chrono::milliseconds{30}));
    TEST_ASSERT_TRUE(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds{30});
    TEST_ASSERT_EQUAL_INT(42, value);
}

static void test_bounded_queue_rejects_when_full() {
    MessageQueue<std::string> queue(1);
    TEST_ASSERT_TRUE(queue.send("a"));
    TEST_ASSERT_FALSE(queue.send("b"));
    TEST_ASSERT_EQUAL_size_t(1, queue.size());
}

static void test_receive_wakes_on_send_from_other_thread() {
    MessageQueue<int> queue;
    std::thread producer([&queue] {
        std::this_thread::sleep_for(std::chrono::milliseconds{20});
        queue.send(7);
    });
    int value = 0;
    TEST_ASSERT_TRUE(queue.receive(value, std::chrono::seconds{2}));
    TEST_ASSERT_EQUAL_INT(7, value);
    producer.join();
}

void run_message_queue_tests() {
    RUN_TEST(test_queue_is_fifo);
    RUN_TEST(test_receive_times_out_when_empty);
    RUN_TEST(test_bounded_queue_rejects_when_full);
    RUN_TEST(test_receive_wakes_on_send_from_other_thread);
}
