// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef SIHOA_INVENTORYRECONCILER_HXX
#define SIHOA_INVENTORYRECONCILER_HXX

#include "inventory/DeviceStore.hxx"

namespace sihoa
{
    struct ReconcileResult {
        size_t upserted{0};
        size_t retired{0};
    };

    /**
     * @brief Reconciles a Zigbee2MQTT `bridge/devices` snapshot against the device store.
     *
     * Every descriptor carrying an address and a name is inserted or updated and
     * reactivated. Active records absent from the snapshot are retired. The whole pass
     * runs in one unit of work.
     */
    class InventoryReconciler {
    public:
        using WallClock = std::function<std::chrono::system_clock::time_point()>;

        explicit InventoryReconciler(DeviceStore& store, WallClock clock = std::chrono::system_clock::now);

        sihoa_err_t reconcile(const cJSON* snapshot, ReconcileResult& result);
        sihoa_err_t reconcile(std::string_view snapshot_json, ReconcileResult& result);

    private:
        /**
         * @brief Insert or update one descriptor.
         * @param ieee_address set to the record key when the descriptor was stored.
         */
        sihoa_err_t upsert(const cJSON* descriptor, std::optional<std::string>& ieee_address);

        DeviceStore& m_store;
        WallClock m_clock;
    };
} // sihoa

#endif //SIHOA_INVENTORYRECONCILER_HXX
