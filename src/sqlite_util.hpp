#pragma once

#include "mediasync/log.hpp"
#include "mediasync/types.hpp"

#include <chrono>
#include <sqlite3.h>
#include <stdexcept>
#include <string>
#include <thread>

namespace mediasync::detail {

inline int64_t to_millis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

inline TimePoint from_millis(int64_t ms) {
    return TimePoint(std::chrono::milliseconds(ms));
}

// Execute a SQL statement with retry on SQLITE_BUSY
inline bool sql_exec(sqlite3* db, const char* sql) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        char* err = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
        if (rc == SQLITE_OK) return true;
        if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
            if (err) sqlite3_free(err);
            std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
            continue;
        }
        if (err) {
            log_error("SQL error: %s (rc=%d)", err, rc);
            sqlite3_free(err);
        }
        return false;
    }
    log_error("SQL timed out after retries");
    return false;
}

// Step a prepared statement with SQLITE_BUSY retry
inline int sql_step_retry(sqlite3_stmt* stmt) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_BUSY && rc != SQLITE_LOCKED) return rc;
        sqlite3_reset(stmt);
        std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
    }
    return SQLITE_BUSY;
}

// Step a write statement that must finish with SQLITE_DONE
inline void sql_step_done(sqlite3* db, sqlite3_stmt* stmt, const char* what) {
    int rc = sql_step_retry(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
    }
}

inline sqlite3_stmt* sql_prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("Cannot prepare statement: ") + sqlite3_errmsg(db));
    }
    return stmt;
}

inline std::string column_string(sqlite3_stmt* stmt, int col) {
    auto text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

inline void bind_text(sqlite3_stmt* stmt, int idx, const std::string& value) {
    sqlite3_bind_text(stmt, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

// Open a database with the WAL pragmas shared by the catalog and the cache index
inline sqlite3* open_database(const std::string& path, const char* schema) {
    sqlite3* db = nullptr;
    int rc = sqlite3_open(path.c_str(), &db);
    if (rc != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
        if (db) sqlite3_close(db);
        throw std::runtime_error("Cannot open " + path + ": " + msg);
    }

    sql_exec(db, "PRAGMA journal_mode=WAL");
    sql_exec(db, "PRAGMA synchronous=NORMAL");
    sql_exec(db, "PRAGMA busy_timeout=5000");
    if (!sql_exec(db, schema)) {
        sqlite3_close(db);
        throw std::runtime_error("Cannot create schema in " + path);
    }
    return db;
}

}  // namespace mediasync::detail
