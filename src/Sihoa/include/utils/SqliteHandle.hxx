// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef SIHOA_SQLITEHANDLE_HXX
#define SIHOA_SQLITEHANDLE_HXX
#include <sqlite3.h>
#include <optional>
#include <string>
#include <utility>
#include "system/Log.hxx"

static constexpr char TAG_SQLITE[] = "SQLite_Handler";

// RAII wrapper for a SQLite connection
class SqliteHandle {
public:
    SqliteHandle() = default;
    SqliteHandle(const char* path, const int flags) {
        const int rc = sqlite3_open_v2(path, &m_db, flags, nullptr);
        if (rc != SQLITE_OK) {
            SIHOA_LOGE(TAG_SQLITE, "Error (%s) opening database %s", m_db ? sqlite3_errmsg(m_db) : sqlite3_errstr(rc), path);
            sqlite3_close(m_db);
            m_db = nullptr;
        }
    }

    ~SqliteHandle() {
        if (m_db) {
            sqlite3_close(m_db);
        }
    }

    SqliteHandle(SqliteHandle&& other) noexcept : m_db(std::exchange(other.m_db, nullptr)) {}
    SqliteHandle& operator=(SqliteHandle&& other) noexcept {
        if (this != &other) {
            if (m_db) sqlite3_close(m_db);
            m_db = std::exchange(other.m_db, nullptr);
        }
        return *this;
    }

    [[nodiscard]] sqlite3* get() const { return m_db; }
    explicit operator bool() const { return m_db != nullptr; }

    SqliteHandle(const SqliteHandle&) = delete;
    SqliteHandle& operator=(const SqliteHandle&) = delete;

private:
    sqlite3* m_db{nullptr};
};

// RAII wrapper for a prepared statement
class SqliteStatement {
public:
    SqliteStatement(sqlite3* db, const char* sql) {
        const int rc = sqlite3_prepare_v2(db, sql, -1, &m_stmt, nullptr);
        if (rc != SQLITE_OK) {
            SIHOA_LOGE(TAG_SQLITE, "Error (%s) preparing: %s", sqlite3_errmsg(db), sql);
            m_stmt = nullptr;
        }
    }

    ~SqliteStatement() {
        if (m_stmt) {
            sqlite3_finalize(m_stmt);
        }
    }

    int bind(const int index, const std::string& value) const {
        return sqlite3_bind_text(m_stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    }

    int bind(const int index, const int value) const {
        return sqlite3_bind_int(m_stmt, index, value);
    }

    template <typename T>
    int bind(const int index, const std::optional<T>& value) const {
        if (!value) return sqlite3_bind_null(m_stmt, index);
        return bind(index, *value);
    }

    [[nodiscard]] std::optional<std::string> columnText(const int index) const {
        if (sqlite3_column_type(m_stmt, index) == SQLITE_NULL) return std::nullopt;
        const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(m_stmt, index));
        return std::string(text ? text : "", static_cast<size_t>(sqlite3_column_bytes(m_stmt, index)));
    }

    [[nodiscard]] std::optional<int> columnInt(const int index) const {
        if (sqlite3_column_type(m_stmt, index) == SQLITE_NULL) return std::nullopt;
        return sqlite3_column_int(m_stmt, index);
    }

    int step() const { return sqlite3_step(m_stmt); }

    [[nodiscard]] sqlite3_stmt* get() const { return m_stmt; }
    explicit operator bool() const { return m_stmt != nullptr; }

    SqliteStatement(const SqliteStatement&) = delete;
    SqliteStatement& operator=(const SqliteStatement&) = delete;

private:
    sqlite3_stmt* m_stmt{nullptr};
};

#endif //SIHOA_SQLITEHANDLE_HXX
