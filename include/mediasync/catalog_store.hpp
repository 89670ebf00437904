#pragma once

#include "mediasync/types.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

// Forward declarations
struct sqlite3;
struct sqlite3_stmt;

namespace mediasync {

/// Read/write access to provider configuration records.
class ProviderStore {
public:
    virtual ~ProviderStore() = default;

    virtual std::optional<ProviderRecord> find_provider(int64_t id) = 0;
    virtual std::vector<ProviderRecord> enabled_providers() = 0;
    virtual std::vector<ProviderRecord> all_providers() = 0;

    /// Insert a new record. Returns the assigned id.
    virtual int64_t insert_provider(const ProviderRecord& record) = 0;
    virtual void update_provider(const ProviderRecord& record) = 0;

    /// Delete a provider. With keep_files, its catalog items are detached
    /// (provider id set to null) instead of deleted.
    virtual bool delete_provider(int64_t id, bool keep_files) = 0;

    virtual void touch_last_sync(int64_t id, TimePoint when) = 0;
};

/// Mutations staged by one sync run, applied in a single transaction.
struct CatalogChanges {
    std::vector<CatalogItem> adds;
    std::vector<CatalogItem> updates;   // matched by item id
    std::vector<int64_t> removes;       // item ids
};

/// Catalog persistence keyed by (provider id, remote file id).
class CatalogStore {
public:
    virtual ~CatalogStore() = default;

    virtual std::optional<CatalogItem> find_item(int64_t provider_id,
                                                 const std::string& provider_file_id) = 0;
    virtual std::vector<CatalogItem> items_for_provider(int64_t provider_id) = 0;
    virtual size_t count_for_provider(int64_t provider_id) = 0;

    /// Insert or update by (provider id, remote file id). Returns the item id.
    virtual int64_t upsert_item(const CatalogItem& item) = 0;
    virtual bool remove_item(int64_t provider_id, const std::string& provider_file_id) = 0;

    /// Apply all changes atomically. Checks the stop token between rows; on
    /// cancellation the transaction is rolled back and OperationCancelled thrown.
    virtual void apply_changes(const CatalogChanges& changes, std::stop_token stop) = 0;
};

/// SQLite-backed implementation of both stores (one database file).
class SqliteCatalogStore : public CatalogStore, public ProviderStore {
public:
    /// Opens (or creates) the database. Throws std::runtime_error on failure.
    explicit SqliteCatalogStore(const std::filesystem::path& db_path);
    ~SqliteCatalogStore() override;

    SqliteCatalogStore(const SqliteCatalogStore&) = delete;
    SqliteCatalogStore& operator=(const SqliteCatalogStore&) = delete;

    // ProviderStore
    std::optional<ProviderRecord> find_provider(int64_t id) override;
    std::vector<ProviderRecord> enabled_providers() override;
    std::vector<ProviderRecord> all_providers() override;
    int64_t insert_provider(const ProviderRecord& record) override;
    void update_provider(const ProviderRecord& record) override;
    bool delete_provider(int64_t id, bool keep_files) override;
    void touch_last_sync(int64_t id, TimePoint when) override;

    // CatalogStore
    std::optional<CatalogItem> find_item(int64_t provider_id,
                                         const std::string& provider_file_id) override;
    std::vector<CatalogItem> items_for_provider(int64_t provider_id) override;
    size_t count_for_provider(int64_t provider_id) override;
    int64_t upsert_item(const CatalogItem& item) override;
    bool remove_item(int64_t provider_id, const std::string& provider_file_id) override;
    void apply_changes(const CatalogChanges& changes, std::stop_token stop) override;

    /// Items whose provider was deleted with keep_files.
    std::vector<CatalogItem> detached_items();

private:
    void prepare_statements();
    std::vector<ProviderRecord> collect_providers(sqlite3_stmt* stmt);
    void bind_item(sqlite3_stmt* stmt, const CatalogItem& item);

    std::mutex db_mutex_;  // Protects prepared statement usage
    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_find_provider_ = nullptr;
    sqlite3_stmt* stmt_enabled_providers_ = nullptr;
    sqlite3_stmt* stmt_all_providers_ = nullptr;
    sqlite3_stmt* stmt_insert_provider_ = nullptr;
    sqlite3_stmt* stmt_update_provider_ = nullptr;
    sqlite3_stmt* stmt_touch_sync_ = nullptr;
    sqlite3_stmt* stmt_find_item_ = nullptr;
    sqlite3_stmt* stmt_items_for_provider_ = nullptr;
    sqlite3_stmt* stmt_count_items_ = nullptr;
    sqlite3_stmt* stmt_upsert_item_ = nullptr;
    sqlite3_stmt* stmt_update_item_ = nullptr;
    sqlite3_stmt* stmt_remove_item_ = nullptr;
    sqlite3_stmt* stmt_remove_item_by_id_ = nullptr;
};

}  // namespace mediasync
