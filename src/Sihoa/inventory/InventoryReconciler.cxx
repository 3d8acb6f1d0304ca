// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "inventory/InventoryReconciler.hxx"
#include "utils/JsonHandle.hxx"

namespace sihoa
{
    static constexpr char TAG[] = "InventoryReconciler";

    namespace {
        // First alias holding a non-empty string
        std::optional<std::string> firstString(const cJSON* descriptor, std::initializer_list<const char*> keys) {
            for (const char* key : keys) {
                if (auto value = utils::getString(descriptor, key); value && !value->empty()) {
                    return value;
                }
            }
            return std::nullopt;
        }

        // First alias holding a number or a non-empty string, converted to int.
        // A present but unconvertible value yields nullopt.
        std::optional<int> firstInt(const cJSON* descriptor, std::initializer_list<const char*> keys) {
            for (const char* key : keys) {
                const cJSON* item = utils::getObjectItem(descriptor, key);
                if (cJSON_IsNumber(item)) {
                    return utils::getInt(descriptor, key);
                }
                if (cJSON_IsString(item) && item->valuestring && item->valuestring[0] != '\0') {
                    return utils::getInt(descriptor, key);
                }
            }
            return std::nullopt;
        }

        std::optional<CalendarDate> firstDate(const cJSON* descriptor, std::initializer_list<const char*> keys) {
            for (const char* key : keys) {
                if (const auto value = utils::getString(descriptor, key); value && !value->empty()) {
                    if (auto date = utils::parseBuildDate(*value)) return date;
                }
            }
            return std::nullopt;
        }

        template <typename T>
        void assignIfPresent(std::optional<T>& field, std::optional<T> value) {
            if (value) field = std::move(value);
        }
    }

    InventoryReconciler::InventoryReconciler(DeviceStore& store, WallClock clock)
        : m_store(store), m_clock(std::move(clock)) {}

    sihoa_err_t InventoryReconciler::reconcile(const std::string_view snapshot_json, ReconcileResult& result) {
        const JsonHandle snapshot = utils::parseJson(snapshot_json);
        if (!snapshot) {
            SIHOA_LOGE(TAG, "Snapshot is not valid JSON");
            result = {};
            return SIHOA_ERR_INVALID_ARG;
        }
        return reconcile(snapshot.get(), result);
    }

    sihoa_err_t InventoryReconciler::reconcile(const cJSON* snapshot, ReconcileResult& result) {
        result = {};
        if (!cJSON_IsArray(snapshot)) {
            SIHOA_LOGE(TAG, "Snapshot must be a JSON array of device descriptors");
            return SIHOA_ERR_INVALID_ARG;
        }

        DeviceStore::UnitOfWork uow(m_store);
        if (uow.status() != SIHOA_OK) {
            return uow.status();
        }

        ReconcileResult counts;
        std::set<std::string> processed;
        const cJSON* descriptor = nullptr;
        cJSON_ArrayForEach(descriptor, snapshot) {
            if (!cJSON_IsObject(descriptor)) continue;

            std::optional<std::string> ieee_address;
            if (const sihoa_err_t err = upsert(descriptor, ieee_address); err != SIHOA_OK) {
                SIHOA_LOGE(TAG, "Reconciliation aborted: %s", sihoa_err_to_name(err));
                return err;
            }
            if (ieee_address) {
                processed.insert(*ieee_address);
                ++counts.upserted;
            }
        }

        std::vector<DeviceRecord> active;
        if (const sihoa_err_t err = m_store.listActive(active); err != SIHOA_OK) {
            return err;
        }
        const std::string now = utils::formatUtcTimestamp(m_clock());
        for (auto& record : active) {
            if (processed.contains(record.ieee_address)) continue;
            record.retired_at = now;
            if (const sihoa_err_t err = m_store.update(record); err != SIHOA_OK) {
                SIHOA_LOGE(TAG, "Failed to retire %s: %s", record.ieee_address.c_str(), sihoa_err_to_name(err));
                return err;
            }
            SIHOA_LOGI(TAG, "Retired %s (%s)", record.ieee_address.c_str(), record.friendly_name.c_str());
            ++counts.retired;
        }

        if (const sihoa_err_t err = uow.commit(); err != SIHOA_OK) {
            return err;
        }
        result = counts;
        SIHOA_LOGI(TAG, "Stored/updated %zu devices, retired %zu", counts.upserted, counts.retired);
        return SIHOA_OK;
    }

    sihoa_err_t InventoryReconciler::upsert(const cJSON* descriptor, std::optional<std::string>& ieee_address) {
        ieee_address.reset();
        const auto address = firstString(descriptor, {"ieee_address", "ieeeAddress", "ieee"});
        const auto name = firstString(descriptor, {"friendly_name", "friendlyName", "name"});
        if (!address || !name) {
            SIHOA_LOGD(TAG, "Skipping descriptor without address or name");
            return SIHOA_OK;
        }

        std::optional<DeviceRecord> existing;
        if (const sihoa_err_t err = m_store.get(*address, existing); err != SIHOA_OK) {
            return err;
        }
        const bool is_new = !existing.has_value();
        DeviceRecord record = is_new ? DeviceRecord{} : std::move(*existing);
        record.ieee_address = *address;
        record.friendly_name = *name;

        assignIfPresent(record.network_address, firstInt(descriptor, {"network_address", "networkAddress"}));
        assignIfPresent(record.device_type, firstString(descriptor, {"type", "device_type"}));
        assignIfPresent(record.zigbee_model, firstString(descriptor, {"model", "zigbee_model", "model_id"}));
        assignIfPresent(record.zigbee_manufacturer, firstString(descriptor, {"manufacturer", "zigbee_manufacturer"}));
        assignIfPresent(record.firmware_version, firstString(descriptor, {"software_version", "firmware_version"}));
        assignIfPresent(record.firmware_build_date,
                        firstDate(descriptor, {"software_build_id", "firmware_build_date", "date_code"}));
        record.retired_at.reset();

        const sihoa_err_t err = is_new ? m_store.insert(record) : m_store.update(record);
        if (err != SIHOA_OK) {
            SIHOA_LOGE(TAG, "%s %s (%s) failed", is_new ? "Insert" : "Update",
                       address->c_str(), name->c_str());
            return err;
        }
        ieee_address = *address;
        return SIHOA_OK;
    }
} // sihoa
