#include "mediasync/catalog_store.hpp"
#include "mediasync/errors.hpp"
#include "mediasync/log.hpp"
#include "sqlite_util.hpp"

#include <sqlite3.h>

namespace mediasync {

using detail::bind_text;
using detail::column_string;
using detail::from_millis;
using detail::sql_exec;
using detail::sql_prepare;
using detail::sql_step_done;
using detail::sql_step_retry;
using detail::to_millis;

namespace {

constexpr const char* CATALOG_SCHEMA = R"(
CREATE TABLE IF NOT EXISTS providers (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    kind INTEGER NOT NULL,
    name TEXT NOT NULL,
    enabled INTEGER NOT NULL DEFAULT 1,
    configuration TEXT,
    last_sync INTEGER
);

CREATE TABLE IF NOT EXISTS catalog_items (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    provider_id INTEGER,
    provider_file_id TEXT NOT NULL,
    filename TEXT NOT NULL,
    file_path TEXT NOT NULL,
    size INTEGER NOT NULL,
    media_kind INTEGER NOT NULL,
    width INTEGER NOT NULL DEFAULT 0,
    height INTEGER NOT NULL DEFAULT 0,
    date_taken INTEGER,
    first_seen INTEGER NOT NULL,
    updated_at INTEGER NOT NULL
);

CREATE UNIQUE INDEX IF NOT EXISTS idx_catalog_origin
    ON catalog_items(provider_id, provider_file_id);
)";

constexpr const char* PROVIDER_COLUMNS = "id, kind, name, enabled, configuration, last_sync";
constexpr const char* ITEM_COLUMNS =
    "id, provider_id, provider_file_id, filename, file_path, size, media_kind, "
    "width, height, date_taken, first_seen, updated_at";

// Rows between stop-token checks inside apply_changes
constexpr size_t CANCEL_CHECK_INTERVAL = 64;

ProviderRecord read_provider(sqlite3_stmt* stmt) {
    ProviderRecord r;
    r.id = sqlite3_column_int64(stmt, 0);
    r.kind = static_cast<BackendKind>(sqlite3_column_int(stmt, 1));
    r.name = column_string(stmt, 2);
    r.enabled = sqlite3_column_int(stmt, 3) != 0;
    r.configuration = column_string(stmt, 4);
    if (sqlite3_column_type(stmt, 5) != SQLITE_NULL) {
        r.last_sync = from_millis(sqlite3_column_int64(stmt, 5));
    }
    return r;
}

CatalogItem read_item(sqlite3_stmt* stmt) {
    CatalogItem item;
    item.id = sqlite3_column_int64(stmt, 0);
    if (sqlite3_column_type(stmt, 1) != SQLITE_NULL) {
        item.provider_id = sqlite3_column_int64(stmt, 1);
    }
    item.provider_file_id = column_string(stmt, 2);
    item.filename = column_string(stmt, 3);
    item.file_path = column_string(stmt, 4);
    item.size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 5));
    item.media_kind = static_cast<MediaKind>(sqlite3_column_int(stmt, 6));
    item.width = sqlite3_column_int(stmt, 7);
    item.height = sqlite3_column_int(stmt, 8);
    if (sqlite3_column_type(stmt, 9) != SQLITE_NULL) {
        item.date_taken = from_millis(sqlite3_column_int64(stmt, 9));
    }
    item.first_seen = from_millis(sqlite3_column_int64(stmt, 10));
    item.updated_at = from_millis(sqlite3_column_int64(stmt, 11));
    return item;
}

}  // namespace

SqliteCatalogStore::SqliteCatalogStore(const std::filesystem::path& db_path) {
    if (db_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(db_path.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Cannot create catalog directory: " + ec.message());
        }
    }
    db_ = detail::open_database(db_path.string(), CATALOG_SCHEMA);
    try {
        prepare_statements();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteCatalogStore::~SqliteCatalogStore() {
    for (auto* stmt : {stmt_find_provider_, stmt_enabled_providers_, stmt_all_providers_,
                       stmt_insert_provider_, stmt_update_provider_, stmt_touch_sync_,
                       stmt_find_item_, stmt_items_for_provider_, stmt_count_items_,
                       stmt_upsert_item_, stmt_update_item_, stmt_remove_item_,
                       stmt_remove_item_by_id_}) {
        if (stmt) sqlite3_finalize(stmt);
    }

    if (db_) {
        sqlite3_exec(db_, "PRAGMA wal_checkpoint(TRUNCATE)", nullptr, nullptr, nullptr);
        sqlite3_close(db_);
    }
}

void SqliteCatalogStore::prepare_statements() {
    std::string providers = PROVIDER_COLUMNS;
    std::string items = ITEM_COLUMNS;

    stmt_find_provider_ = sql_prepare(db_,
        ("SELECT " + providers + " FROM providers WHERE id = ?1").c_str());
    stmt_enabled_providers_ = sql_prepare(db_,
        ("SELECT " + providers + " FROM providers WHERE enabled = 1 ORDER BY id").c_str());
    stmt_all_providers_ = sql_prepare(db_,
        ("SELECT " + providers + " FROM providers ORDER BY id").c_str());
    stmt_insert_provider_ = sql_prepare(db_,
        "INSERT INTO providers (kind, name, enabled, configuration, last_sync) "
        "VALUES (?1, ?2, ?3, ?4, ?5)");
    stmt_update_provider_ = sql_prepare(db_,
        "UPDATE providers SET kind = ?2, name = ?3, enabled = ?4, configuration = ?5, "
        "last_sync = ?6 WHERE id = ?1");
    stmt_touch_sync_ = sql_prepare(db_,
        "UPDATE providers SET last_sync = ?2 WHERE id = ?1");

    stmt_find_item_ = sql_prepare(db_,
        ("SELECT " + items + " FROM catalog_items "
         "WHERE provider_id = ?1 AND provider_file_id = ?2").c_str());
    stmt_items_for_provider_ = sql_prepare(db_,
        ("SELECT " + items + " FROM catalog_items WHERE provider_id = ?1 ORDER BY id").c_str());
    stmt_count_items_ = sql_prepare(db_,
        "SELECT COUNT(*) FROM catalog_items WHERE provider_id = ?1");
    stmt_upsert_item_ = sql_prepare(db_,
        "INSERT INTO catalog_items (provider_id, provider_file_id, filename, file_path, size, "
        "media_kind, width, height, date_taken, first_seen, updated_at) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11) "
        "ON CONFLICT(provider_id, provider_file_id) DO UPDATE SET "
        "filename = excluded.filename, file_path = excluded.file_path, size = excluded.size, "
        "media_kind = excluded.media_kind, width = excluded.width, height = excluded.height, "
        "date_taken = excluded.date_taken, updated_at = excluded.updated_at "
        "RETURNING id");
    stmt_update_item_ = sql_prepare(db_,
        "UPDATE catalog_items SET filename = ?2, file_path = ?3, size = ?4, media_kind = ?5, "
        "width = ?6, height = ?7, date_taken = ?8, updated_at = ?9 WHERE id = ?1");
    stmt_remove_item_ = sql_prepare(db_,
        "DELETE FROM catalog_items WHERE provider_id = ?1 AND provider_file_id = ?2");
    stmt_remove_item_by_id_ = sql_prepare(db_,
        "DELETE FROM catalog_items WHERE id = ?1");
}

// --- Providers ---

std::vector<ProviderRecord> SqliteCatalogStore::collect_providers(sqlite3_stmt* stmt) {
    std::vector<ProviderRecord> out;
    sqlite3_reset(stmt);
    int rc;
    while ((rc = sql_step_retry(stmt)) == SQLITE_ROW) {
        out.push_back(read_provider(stmt));
    }
    sqlite3_reset(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("Provider query failed: ") + sqlite3_errmsg(db_));
    }
    return out;
}

std::optional<ProviderRecord> SqliteCatalogStore::find_provider(int64_t id) {
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    sqlite3_reset(stmt_find_provider_);
    sqlite3_bind_int64(stmt_find_provider_, 1, id);
    std::optional<ProviderRecord> record;
    if (sql_step_retry(stmt_find_provider_) == SQLITE_ROW) {
        record = read_provider(stmt_find_provider_);
    }
    // Release the read snapshot before returning
    sqlite3_reset(stmt_find_provider_);
    return record;
}

std::vector<ProviderRecord> SqliteCatalogStore::enabled_providers() {
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    return collect_providers(stmt_enabled_providers_);
}

std::vector<ProviderRecord> SqliteCatalogStore::all_providers() {
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    return collect_providers(stmt_all_providers_);
}

int64_t SqliteCatalogStore::insert_provider(const ProviderRecord& record) {
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    auto* stmt = stmt_insert_provider_;
    sqlite3_reset(stmt);
    sqlite3_bind_int(stmt, 1, static_cast<int>(record.kind));
    bind_text(stmt, 2, record.name);
    sqlite3_bind_int(stmt, 3, record.enabled ? 1 : 0);
    bind_text(stmt, 4, record.configuration);
    if (record.last_sync) {
        sqlite3_bind_int64(stmt, 5, to_millis(*record.last_sync));
    } else {
        sqlite3_bind_null(stmt, 5);
    }
    sql_step_done(db_, stmt, "Insert provider failed");
    return sqlite3_last_insert_rowid(db_);
}

void SqliteCatalogStore::update_provider(const ProviderRecord& record) {
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    auto* stmt = stmt_update_provider_;
    sqlite3_reset(stmt);
    sqlite3_bind_int64(stmt, 1, record.id);
    sqlite3_bind_int(stmt, 2, static_cast<int>(record.kind));
    bind_text(stmt, 3, record.name);
    sqlite3_bind_int(stmt, 4, record.enabled ? 1 : 0);
    bind_text(stmt, 5, record.configuration);
    if (record.last_sync) {
        sqlite3_bind_int64(stmt, 6, to_millis(*record.last_sync));
    } else {
        sqlite3_bind_null(stmt, 6);
    }
    sql_step_done(db_, stmt, "Update provider failed");
    if (sqlite3_changes(db_) == 0) {
        throw NotFoundError("Storage provider " + std::to_string(record.id) + " not found");
    }
}

bool SqliteCatalogStore::delete_provider(int64_t id, bool keep_files) {
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    if (!sql_exec(db_, "BEGIN IMMEDIATE")) {
        throw std::runtime_error("Cannot begin transaction");
    }

    auto run = [&](const char* sql) {
        sqlite3_stmt* stmt = sql_prepare(db_, sql);
        sqlite3_bind_int64(stmt, 1, id);
        int rc = sql_step_retry(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            sql_exec(db_, "ROLLBACK");
            throw std::runtime_error(std::string("Delete provider failed: ") + sqlite3_errmsg(db_));
        }
        return sqlite3_changes(db_);
    };

    if (keep_files) {
        run("UPDATE catalog_items SET provider_id = NULL WHERE provider_id = ?1");
    } else {
        run("DELETE FROM catalog_items WHERE provider_id = ?1");
    }
    int removed = run("DELETE FROM providers WHERE id = ?1");

    if (!sql_exec(db_, "COMMIT")) {
        sql_exec(db_, "ROLLBACK");
        throw std::runtime_error("Cannot commit provider deletion");
    }
    return removed > 0;
}

void SqliteCatalogStore::touch_last_sync(int64_t id, TimePoint when) {
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    sqlite3_reset(stmt_touch_sync_);
    sqlite3_bind_int64(stmt_touch_sync_, 1, id);
    sqlite3_bind_int64(stmt_touch_sync_, 2, to_millis(when));
    sql_step_done(db_, stmt_touch_sync_, "Update last sync failed");
}

// --- Catalog items ---

std::optional<CatalogItem> SqliteCatalogStore::find_item(int64_t provider_id,
                                                         const std::string& provider_file_id) {
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    sqlite3_reset(stmt_find_item_);
    sqlite3_bind_int64(stmt_find_item_, 1, provider_id);
    bind_text(stmt_find_item_, 2, provider_file_id);
    std::optional<CatalogItem> item;
    if (sql_step_retry(stmt_find_item_) == SQLITE_ROW) {
        item = read_item(stmt_find_item_);
    }
    sqlite3_reset(stmt_find_item_);
    return item;
}

std::vector<CatalogItem> SqliteCatalogStore::items_for_provider(int64_t provider_id) {
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    std::vector<CatalogItem> out;
    sqlite3_reset(stmt_items_for_provider_);
    sqlite3_bind_int64(stmt_items_for_provider_, 1, provider_id);
    int rc;
    while ((rc = sql_step_retry(stmt_items_for_provider_)) == SQLITE_ROW) {
        out.push_back(read_item(stmt_items_for_provider_));
    }
    sqlite3_reset(stmt_items_for_provider_);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("Catalog query failed: ") + sqlite3_errmsg(db_));
    }
    return out;
}

size_t SqliteCatalogStore::count_for_provider(int64_t provider_id) {
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    sqlite3_reset(stmt_count_items_);
    sqlite3_bind_int64(stmt_count_items_, 1, provider_id);
    size_t count = 0;
    if (sql_step_retry(stmt_count_items_) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt_count_items_, 0));
    }
    sqlite3_reset(stmt_count_items_);
    return count;
}

std::vector<CatalogItem> SqliteCatalogStore::detached_items() {
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    std::vector<CatalogItem> out;
    sqlite3_stmt* stmt = sql_prepare(db_,
        (std::string("SELECT ") + ITEM_COLUMNS +
         " FROM catalog_items WHERE provider_id IS NULL ORDER BY id").c_str());
    while (sql_step_retry(stmt) == SQLITE_ROW) {
        out.push_back(read_item(stmt));
    }
    sqlite3_finalize(stmt);
    return out;
}

void SqliteCatalogStore::bind_item(sqlite3_stmt* stmt, const CatalogItem& item) {
    sqlite3_reset(stmt);
    if (item.provider_id) {
        sqlite3_bind_int64(stmt, 1, *item.provider_id);
    } else {
        sqlite3_bind_null(stmt, 1);
    }
    bind_text(stmt, 2, item.provider_file_id);
    bind_text(stmt, 3, item.filename);
    bind_text(stmt, 4, item.file_path);
    sqlite3_bind_int64(stmt, 5, static_cast<int64_t>(item.size));
    sqlite3_bind_int(stmt, 6, static_cast<int>(item.media_kind));
    sqlite3_bind_int(stmt, 7, item.width);
    sqlite3_bind_int(stmt, 8, item.height);
    if (item.date_taken) {
        sqlite3_bind_int64(stmt, 9, to_millis(*item.date_taken));
    } else {
        sqlite3_bind_null(stmt, 9);
    }
    sqlite3_bind_int64(stmt, 10, to_millis(item.first_seen));
    sqlite3_bind_int64(stmt, 11, to_millis(item.updated_at));
}

int64_t SqliteCatalogStore::upsert_item(const CatalogItem& item) {
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    bind_item(stmt_upsert_item_, item);
    int rc = sql_step_retry(stmt_upsert_item_);
    if (rc != SQLITE_ROW) {
        throw std::runtime_error(std::string("Upsert catalog item failed: ") + sqlite3_errmsg(db_));
    }
    int64_t id = sqlite3_column_int64(stmt_upsert_item_, 0);
    sqlite3_reset(stmt_upsert_item_);
    return id;
}

bool SqliteCatalogStore::remove_item(int64_t provider_id, const std::string& provider_file_id) {
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    sqlite3_reset(stmt_remove_item_);
    sqlite3_bind_int64(stmt_remove_item_, 1, provider_id);
    bind_text(stmt_remove_item_, 2, provider_file_id);
    sql_step_done(db_, stmt_remove_item_, "Remove catalog item failed");
    return sqlite3_changes(db_) > 0;
}

void SqliteCatalogStore::apply_changes(const CatalogChanges& changes, std::stop_token stop) {
    std::lock_guard<std::mutex> db_lock(db_mutex_);

    if (!sql_exec(db_, "BEGIN IMMEDIATE")) {
        throw std::runtime_error("Cannot begin catalog transaction");
    }

    size_t rows = 0;
    auto checkpoint = [&]() {
        if (++rows % CANCEL_CHECK_INTERVAL == 0 && stop.stop_requested()) {
            throw OperationCancelled();
        }
    };

    try {
        if (stop.stop_requested()) throw OperationCancelled();

        for (const auto& item : changes.adds) {
            bind_item(stmt_upsert_item_, item);
            if (sql_step_retry(stmt_upsert_item_) != SQLITE_ROW) {
                throw std::runtime_error(std::string("Insert catalog item failed: ") +
                                         sqlite3_errmsg(db_));
            }
            sqlite3_reset(stmt_upsert_item_);
            checkpoint();
        }

        for (const auto& item : changes.updates) {
            auto* stmt = stmt_update_item_;
            sqlite3_reset(stmt);
            sqlite3_bind_int64(stmt, 1, item.id);
            bind_text(stmt, 2, item.filename);
            bind_text(stmt, 3, item.file_path);
            sqlite3_bind_int64(stmt, 4, static_cast<int64_t>(item.size));
            sqlite3_bind_int(stmt, 5, static_cast<int>(item.media_kind));
            sqlite3_bind_int(stmt, 6, item.width);
            sqlite3_bind_int(stmt, 7, item.height);
            if (item.date_taken) {
                sqlite3_bind_int64(stmt, 8, to_millis(*item.date_taken));
            } else {
                sqlite3_bind_null(stmt, 8);
            }
            sqlite3_bind_int64(stmt, 9, to_millis(item.updated_at));
            sql_step_done(db_, stmt, "Update catalog item failed");
            checkpoint();
        }

        for (auto id : changes.removes) {
            sqlite3_reset(stmt_remove_item_by_id_);
            sqlite3_bind_int64(stmt_remove_item_by_id_, 1, id);
            sql_step_done(db_, stmt_remove_item_by_id_, "Remove catalog item failed");
            checkpoint();
        }

        if (stop.stop_requested()) throw OperationCancelled();
    } catch (...) {
        sqlite3_reset(stmt_upsert_item_);
        if (!sql_exec(db_, "ROLLBACK")) {
            log_error("Catalog rollback failed: %s", sqlite3_errmsg(db_));
        }
        throw;
    }

    if (!sql_exec(db_, "COMMIT")) {
        sql_exec(db_, "ROLLBACK");
        throw std::runtime_error("Cannot commit catalog changes");
    }
}

}  // namespace mediasync
