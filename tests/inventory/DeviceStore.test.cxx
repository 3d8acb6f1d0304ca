// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "unity.h"
#include "inventory/DeviceStore.hxx"

using namespace sihoa;

namespace {
    DeviceRecord makeRecord(const char* ieee, const char* name) {
        DeviceRecord record;
        record.ieee_address = ieee;
        record.friendly_name = name;
        return record;
    }
}

static void test_open_in_memory_creates_schema() {
    DeviceStore store;
    TEST_ASSERT_FALSE(store.isOpen());
    TEST_ASSERT_EQUAL(SIHOA_OK, store.open(":memory:"));
    TEST_ASSERT_TRUE(store.isOpen());

    std::vector<DeviceRecord> all;
    TEST_ASSERT_EQUAL(SIHOA_OK, store.listAll(all));
    TEST_ASSERT_TRUE(all.empty());
}

static void test_insert_and_get_round_trip_fields() {
    DeviceStore store;
    TEST_ASSERT_EQUAL(SIHOA_OK, store.open(":memory:"));

    DeviceRecord record = makeRecord("0x00124b0012345678", "kitchen");
    record.network_address = 4660;
    record.firmware_build_date = CalendarDate{2023, 5, 17};
    record.zigbee_model = "TRADFRI bulb";
    TEST_ASSERT_EQUAL(SIHOA_OK, store.insert(record));

    std::optional<DeviceRecord> loaded;
    TEST_ASSERT_EQUAL(SIHOA_OK, store.get("0x00124b0012345678", loaded));
    TEST_ASSERT_TRUE(loaded.has_value());
    TEST_ASSERT_EQUAL_STRING("kitchen", loaded->friendly_name.c_str());
    TEST_ASSERT_EQUAL_INT(4660, *loaded->network_address);
    TEST_ASSERT_TRUE(*loaded->firmware_build_date == (CalendarDate{2023, 5, 17}));
    TEST_ASSERT_EQUAL_STRING("TRADFRI bulb", loaded->zigbee_model->c_str());
    TEST_ASSERT_FALSE(loaded->firmware_version.has_value());
    TEST_ASSERT_FALSE(loaded->created_at.empty());
    TEST_ASSERT_TRUE(loaded->isActive());
}

static void test_get_missing_record() {
    DeviceStore store;
    TEST_ASSERT_EQUAL(SIHOA_OK, store.open(":memory:"));
    std::optional<DeviceRecord> loaded = makeRecord("x", "y");
    TEST_ASSERT_EQUAL(SIHOA_OK, store.get("0xdead", loaded));
    TEST_ASSERT_FALSE(loaded.has_value());
}

static void test_duplicate_friendly_name_is_constraint_error() {
    DeviceStore store;
    TEST_ASSERT_EQUAL(SIHOA_OK, store.open(":memory:"));
    TEST_ASSERT_EQUAL(SIHOA_OK, store.insert(makeRecord("0x01", "lamp")));
    TEST_ASSERT_EQUAL(SIHOA_ERR_STORE_CONSTRAINT, store.insert(makeRecord("0x02", "lamp")));
    TEST_ASSERT_EQUAL(SIHOA_ERR_STORE_CONSTRAINT, store.insert(makeRecord("0x01", "other")));
}

static void test_network_address_range_is_checked() {
    DeviceStore store;
    TEST_ASSERT_EQUAL(SIHOA_OK, store.open(":memory:"));

    DeviceRecord zero = makeRecord("0x01", "coordinator");
    zero.network_address = 0;
    TEST_ASSERT_EQUAL(SIHOA_OK, store.insert(zero));

    DeviceRecord too_big = makeRecord("0x02", "broken");
    too_big.network_address = 65536;
    TEST_ASSERT_EQUAL(SIHOA_ERR_STORE_CONSTRAINT, store.insert(too_big));
}

static void test_update_missing_record_is_not_found() {
    DeviceStore store;
    TEST_ASSERT_EQUAL(SIHOA_OK, store.open(":memory:"));
    TEST_ASSERT_EQUAL(SIHOA_ERR_NOT_FOUND, store.update(makeRecord("0x01", "ghost")));
}

static void test_list_active_skips_retired() {
    DeviceStore store;
    TEST_ASSERT_EQUAL(SIHOA_OK, store.open(":memory:"));
    TEST_ASSERT_EQUAL(SIHOA_OK, store.insert(makeRecord("0x02", "b")));
    DeviceRecord retired = makeRecord("0x01", "a");
    retired.retired_at = "2024-01-01 00:00:00";
    TEST_ASSERT_EQUAL(SIHOA_OK, store.insert(retired));

    std::vector<DeviceRecord> active;
    TEST_ASSERT_EQUAL(SIHOA_OK, store.listActive(active));
    TEST_ASSERT_EQUAL_size_t(1, active.size());
    TEST_ASSERT_EQUAL_STRING("0x02", active[0].ieee_address.c_str());

    std::vector<DeviceRecord> all;
    TEST_ASSERT_EQUAL(SIHOA_OK, store.listAll(all));
    TEST_ASSERT_EQUAL_size_t(2, all.size());
}

static void test_unit_of_work_rolls_back_without_commit() {
    DeviceStore store;
    TEST_ASSERT_EQUAL(SIHOA_OK, store.open(":memory:"));
    {
        DeviceStore::UnitOfWork uow(store);
        TEST_ASSERT_EQUAL(SIHOA_OK, uow.status());
        TEST_ASSERT_EQUAL(SIHOA_OK, store.insert(makeRecord("0x01", "temp")));
    }
    std::optional<DeviceRecord> loaded;
    TEST_ASSERT_EQUAL(SIHOA_OK, store.get("0x01", loaded));
    TEST_ASSERT_FALSE(loaded.has_value());

    {
        DeviceStore::UnitOfWork uow(store);
        TEST_ASSERT_EQUAL(SIHOA_OK, store.insert(makeRecord("0x01", "kept")));
        TEST_ASSERT_EQUAL(SIHOA_OK, uow.commit());
    }
    TEST_ASSERT_EQUAL(SIHOA_OK, store.get("0x01", loaded));
    TEST_ASSERT_TRUE(loaded.has_value());
}

void run_device_store_tests() {
    RUN_TEST(test_open_in_memory_creates_schema);
    RUN_TEST(test_insert_and_get_round_trip_fields);
    RUN_TEST(test_get_missing_record);
    RUN_TEST(test_duplicate_friendly_name_is_constraint_error);
    RUN_TEST(test_network_address_range_is_checked);
    RUN_TEST(test_update_missing_record_is_not_found);
    RUN_TEST(test_list_active_skips_retired);
    RUN_TEST(test_unit_of_work_rolls_back_without_commit);
}
