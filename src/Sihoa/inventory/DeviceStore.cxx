// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "inventory/DeviceStore.hxx"

namespace sihoa
{
    static constexpr char TAG[] = "DeviceStore";

    static constexpr char SCHEMA_SQL[] =
        "CREATE TABLE IF NOT EXISTS device ("
        " ieee_address VARCHAR(24) NOT NULL,"
        " friendly_name VARCHAR(120) NOT NULL,"
        " network_address INTEGER,"
        " firmware_build_date DATE,"
        " firmware_version VARCHAR(60),"
        " device_type VARCHAR(60),"
        " zigbee_model VARCHAR(120),"
        " zigbee_manufacturer VARCHAR(120),"
        " created_at DATETIME DEFAULT CURRENT_TIMESTAMP NOT NULL,"
        " retired_at DATETIME,"
        " PRIMARY KEY (ieee_address),"
        " CONSTRAINT ck_device_network_address_range CHECK ((network_address IS NULL)"
        " OR (network_address >= 0 AND network_address <= 65535)),"
        " UNIQUE (friendly_name))";

    static constexpr char SELECT_COLUMNS[] =
        "SELECT ieee_address, friendly_name, network_address, firmware_version, firmware_build_date,"
        " device_type, zigbee_model, zigbee_manufacturer, created_at, retired_at FROM device";

    static constexpr int BUSY_TIMEOUT_MS = 5000;

    namespace {
        DeviceRecord readRow(const SqliteStatement& stmt) {
            DeviceRecord record;
            record.ieee_address = stmt.columnText(0).value_or("");
            record.friendly_name = stmt.columnText(1).value_or("");
            record.network_address = stmt.columnInt(2);
            record.firmware_version = stmt.columnText(3);
            if (const auto date = stmt.columnText(4)) {
                record.firmware_build_date = utils::parseYmd(*date, '-');
            }
            record.device_type = stmt.columnText(5);
            record.zigbee_model = stmt.columnText(6);
            record.zigbee_manufacturer = stmt.columnText(7);
            record.created_at = stmt.columnText(8).value_or("");
            record.retired_at = stmt.columnText(9);
            return record;
        }

        std::optional<std::string> dateColumn(const std::optional<CalendarDate>& date) {
            if (!date) return std::nullopt;
            return utils::formatDate(*date);
        }

        // Binds the columns shared by INSERT and UPDATE starting at index 1, ieee_address last.
        int bindRecord(const SqliteStatement& stmt, const DeviceRecord& record) {
            int rc = SQLITE_OK;
            if (rc == SQLITE_OK) rc = stmt.bind(1, record.friendly_name);
            if (rc == SQLITE_OK) rc = stmt.bind(2, record.network_address);
            if (rc == SQLITE_OK) rc = stmt.bind(3, record.firmware_version);
            if (rc == SQLITE_OK) rc = stmt.bind(4, dateColumn(record.firmware_build_date));
            if (rc == SQLITE_OK) rc = stmt.bind(5, record.device_type);
            if (rc == SQLITE_OK) rc = stmt.bind(6, record.zigbee_model);
            if (rc == SQLITE_OK) rc = stmt.bind(7, record.zigbee_manufacturer);
            if (rc == SQLITE_OK) rc = stmt.bind(8, record.retired_at);
            if (rc == SQLITE_OK) rc = stmt.bind(9, record.ieee_address);
            return rc;
        }
    }

    sihoa_err_t DeviceStore::open(const std::string& path) {
        m_db = SqliteHandle(path.c_str(), SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
        if (!m_db) {
            return SIHOA_ERR_STORE;
        }
        sqlite3_busy_timeout(m_db.get(), BUSY_TIMEOUT_MS);

        if (const sihoa_err_t err = exec(SCHEMA_SQL); err != SIHOA_OK) {
            close();
            return err;
        }
        SIHOA_LOGI(TAG, "Opened device store %s", path.c_str());
        return SIHOA_OK;
    }

    void DeviceStore::close() {
        m_db = SqliteHandle();
    }

    sihoa_err_t DeviceStore::get(const std::string& ieee_address, std::optional<DeviceRecord>& out) const {
        out.reset();
        if (!m_db) return SIHOA_ERR_STORE;

        const std::string sql = std::string(SELECT_COLUMNS) + " WHERE ieee_address = ?1";
        const SqliteStatement stmt(m_db.get(), sql.c_str());
        if (!stmt) return SIHOA_ERR_STORE;
        if (const int rc = stmt.bind(1, ieee_address); rc != SQLITE_OK) return translate(rc, "bind");

        const int rc = stmt.step();
        if (rc == SQLITE_ROW) {
            out = readRow(stmt);
            return SIHOA_OK;
        }
        if (rc == SQLITE_DONE) return SIHOA_OK;
        return translate(rc, "get");
    }

    sihoa_err_t DeviceStore::insert(const DeviceRecord& record) {
        if (!m_db) return SIHOA_ERR_STORE;
        const SqliteStatement stmt(m_db.get(),
            "INSERT INTO device (friendly_name, network_address, firmware_version, firmware_build_date,"
            " device_type, zigbee_model, zigbee_manufacturer, retired_at, ieee_address)"
            " VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9)");
        if (!stmt) return SIHOA_ERR_STORE;
        if (const int rc = bindRecord(stmt, record); rc != SQLITE_OK) return translate(rc, "bind");

        if (const int rc = stmt.step(); rc != SQLITE_DONE) {
            return translate(rc, "insert");
        }
        SIHOA_LOGD(TAG, "Inserted %s (%s)", record.ieee_address.c_str(), record.friendly_name.c_str());
        return SIHOA_OK;
    }

    sihoa_err_t DeviceStore::update(const DeviceRecord& record) {
        if (!m_db) return SIHOA_ERR_STORE;
        const SqliteStatement stmt(m_db.get(),
            "UPDATE device SET friendly_name = ?1, network_address = ?2, firmware_version = ?3,"
            " firmware_build_date = ?4, device_type = ?5, zigbee_model = ?6, zigbee_manufacturer = ?7,"
            " retired_at = ?8 WHERE ieee_address = ?9");
        if (!stmt) return SIHOA_ERR_STORE;
        if (const int rc = bindRecord(stmt, record); rc != SQLITE_OK) return translate(rc, "bind");

        if (const int rc = stmt.step(); rc != SQLITE_DONE) {
            return translate(rc, "update");
        }
        if (sqlite3_changes(m_db.get()) == 0) {
            return SIHOA_ERR_NOT_FOUND;
        }
        return SIHOA_OK;
    }

    sihoa_err_t DeviceStore::listActive(std::vector<DeviceRecord>& out) const {
        const std::string sql = std::string(SELECT_COLUMNS) + " WHERE retired_at IS NULL ORDER BY ieee_address";
        return query(sql.c_str(), out);
    }

    sihoa_err_t DeviceStore::listAll(std::vector<DeviceRecord>& out) const {
        const std::string sql = std::string(SELECT_COLUMNS) + " ORDER BY ieee_address";
        return query(sql.c_str(), out);
    }

    sihoa_err_t DeviceStore::query(const char* sql, std::vector<DeviceRecord>& out) const {
        out.clear();
        if (!m_db) return SIHOA_ERR_STORE;
        const SqliteStatement stmt(m_db.get(), sql);
        if (!stmt) return SIHOA_ERR_STORE;

        int rc;
        while ((rc = stmt.step()) == SQLITE_ROW) {
            out.push_back(readRow(stmt));
        }
        if (rc != SQLITE_DONE) {
            out.clear();
            return translate(rc, "scan");
        }
        return SIHOA_OK;
    }

    sihoa_err_t DeviceStore::exec(const char* sql) const {
        if (!m_db) return SIHOA_ERR_STORE;
        char* message = nullptr;
        const int rc = sqlite3_exec(m_db.get(), sql, nullptr, nullptr, &message);
        if (rc != SQLITE_OK) {
            SIHOA_LOGE(TAG, "%s failed: %s", sql, message ? message : sqlite3_errstr(rc));
            sqlite3_free(message);
            return (rc & 0xff) == SQLITE_CONSTRAINT ? SIHOA_ERR_STORE_CONSTRAINT : SIHOA_ERR_STORE;
        }
        return SIHOA_OK;
    }

    sihoa_err_t DeviceStore::translate(const int rc, const char* what) const {
        if ((rc & 0xff) == SQLITE_CONSTRAINT) {
            SIHOA_LOGW(TAG, "%s violates a constraint: %s", what, sqlite3_errmsg(m_db.get()));
            return SIHOA_ERR_STORE_CONSTRAINT;
        }
        SIHOA_LOGE(TAG, "%s failed (%d): %s", what, rc, sqlite3_errmsg(m_db.get()));
        return SIHOA_ERR_STORE;
    }

    DeviceStore::UnitOfWork::UnitOfWork(DeviceStore& store) : m_store(store) {
        m_status = m_store.exec("BEGIN IMMEDIATE");
        m_open = (m_status == SIHOA_OK);
    }

    DeviceStore::UnitOfWork::~UnitOfWork() {
        if (m_open) {
            SIHOA_LOGW(TAG, "Rolling back unit of work");
            if (m_store.exec("ROLLBACK") != SIHOA_OK) {
                SIHOA_LOGE(TAG, "Rollback failed");
            }
        }
    }

    sihoa_err_t DeviceStore::UnitOfWork::commit() {
        if (!m_open) return m_status == SIHOA_OK ? SIHOA_FAIL : m_status;
        m_status = m_store.exec("COMMIT");
        if (m_status == SIHOA_OK) {
            m_open = false;
        }
        return m_status;
    }
} // sihoa
