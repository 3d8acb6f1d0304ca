// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef SIHOA_DEVICESTORE_HXX
#define SIHOA_DEVICESTORE_HXX

#include "inventory/DeviceRecord.hxx"
#include "utils/SqliteHandle.hxx"

namespace sihoa
{
    /**
     * @brief SQLite backed device inventory (table `device`).
     *
     * Records are never deleted, only retired. Not thread safe, owned by one thread.
     */
    class DeviceStore {
    public:
        DeviceStore() = default;

        DeviceStore(const DeviceStore&) = delete;
        DeviceStore& operator=(const DeviceStore&) = delete;

        /**
         * @brief Open (or create) the database and make sure the schema exists.
         * @param path file path or ":memory:"
         */
        sihoa_err_t open(const std::string& path);
        void close();
        [[nodiscard]] bool isOpen() const { return static_cast<bool>(m_db); }

        sihoa_err_t get(const std::string& ieee_address, std::optional<DeviceRecord>& out) const;
        sihoa_err_t insert(const DeviceRecord& record);
        /**
         * @brief Overwrite every mutable column. created_at is left alone.
         */
        sihoa_err_t update(const DeviceRecord& record);
        sihoa_err_t listActive(std::vector<DeviceRecord>& out) const;
        sihoa_err_t listAll(std::vector<DeviceRecord>& out) const;

        /**
         * @brief Serializable unit of work. Rolls back unless commit() succeeded.
         */
        class UnitOfWork {
        public:
            explicit UnitOfWork(DeviceStore& store);
            ~UnitOfWork();

            UnitOfWork(const UnitOfWork&) = delete;
            UnitOfWork& operator=(const UnitOfWork&) = delete;

            [[nodiscard]] sihoa_err_t status() const { return m_status; }
            sihoa_err_t commit();

        private:
            DeviceStore& m_store;
            sihoa_err_t m_status{SIHOA_FAIL};
            bool m_open{false};
        };

    private:
        sihoa_err_t exec(const char* sql) const;
        sihoa_err_t translate(int rc, const char* what) const;
        sihoa_err_t query(const char* sql, std::vector<DeviceRecord>& out) const;

        SqliteHandle m_db;
    };
} // sihoa

#endif //SIHOA_DEVICESTORE_HXX
