#pragma once

#include "mediasync/types.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <future>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>

// Forward declarations
struct sqlite3;
struct sqlite3_stmt;

namespace mediasync {

struct CacheOptions {
    std::filesystem::path directory;
    uint64_t max_size_bytes = 5ULL * 1024 * 1024 * 1024;  // 5 GB

    // After a write pushes the total over max_size_bytes, evict down to
    // max_size_bytes * evict_ratio.
    double evict_ratio = 0.8;
};

struct CacheEntry {
    std::string hash;
    std::filesystem::path local_path;  // absolute
    uint64_t size = 0;
    std::string origin_url;
    std::optional<int64_t> provider_id;
    std::optional<std::string> provider_file_id;
    std::string content_type;
    TimePoint cached_at;
    TimePoint last_access;
    uint64_t access_count = 0;
};

struct CacheStatus {
    uint64_t total_size_bytes = 0;
    uint64_t file_count = 0;
    uint64_t max_size_bytes = 0;
    double usage_percent = 0.0;
};

struct CacheEntryPage {
    std::vector<CacheEntry> entries;
    uint64_t total_count = 0;
    int page = 1;
    int page_size = 0;
};

/// Content-addressed byte cache.
///
/// Blobs live at <dir>/<h[0:2]>/<h[2:4]>/<hash><ext>, keyed by the SHA-256 of
/// their contents. Bookkeeping (size, origin, LRU timestamp) is kept in a
/// SQLite index at <dir>/cache.db. Writing a hash that already exists is a
/// lookup and nothing else; concurrent writes of the same hash collapse into a
/// single disk write.
///
/// Eviction renames a blob to a tombstone before deleting its row. A crash can
/// leave a tombstone, a temp file, or a renamed blob whose row was never
/// inserted. The next startup removes all three, together with rows whose
/// blob is gone.
class ContentCache {
public:
    /// Opens the index and runs crash recovery. Throws std::runtime_error on failure.
    explicit ContentCache(CacheOptions options);
    ~ContentCache();

    ContentCache(const ContentCache&) = delete;
    ContentCache& operator=(const ContentCache&) = delete;

    /// SHA-256 of the remaining stream contents as lowercase hex. The read
    /// position is restored afterwards; the stream must be seekable.
    static std::string compute_hash(std::istream& data, std::stop_token stop = {});

    /// Store the stream's remaining bytes under `hash`. No-op if the hash is
    /// already cached. Throws std::invalid_argument for a malformed hash and
    /// std::runtime_error if the bytes don't hash to `hash` or I/O fails.
    CacheEntry cache_file(const std::string& hash,
                          std::istream& data,
                          const std::string& origin_url,
                          std::optional<int64_t> provider_id,
                          const std::optional<std::string>& provider_file_id,
                          const std::string& content_type,
                          std::stop_token stop = {});

    /// Open a cached blob and mark it as recently used. Throws NotFoundError.
    std::unique_ptr<std::istream> get_cached_stream(const std::string& hash,
                                                    std::stop_token stop = {});

    /// Look up an entry by hash or by origin, marking it as recently used.
    std::optional<CacheEntry> find_entry(const std::string& hash);
    std::optional<CacheEntry> find_by_origin(int64_t provider_id,
                                             const std::string& provider_file_id);

    /// Evict least-recently-used entries until the total size is <= target.
    /// Returns the number of entries removed.
    int evict_lru(uint64_t target_size_bytes, std::stop_token stop = {});

    void clear_cache(std::stop_token stop = {});
    int clear_provider_cache(int64_t provider_id, std::stop_token stop = {});
    bool delete_entry(const std::string& hash);

    /// Most recently used first. `page` is 1-based.
    CacheEntryPage list_entries(int page, int page_size);

    uint64_t cache_size();
    uint64_t cache_count();
    CacheStatus status();
    uint64_t max_size_bytes() const { return options_.max_size_bytes; }
    const std::filesystem::path& directory() const { return options_.directory; }

    static std::string extension_for_content_type(const std::string& content_type);
    static bool is_valid_hash(const std::string& hash);

    struct Stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t writes = 0;
        uint64_t dedup_hits = 0;
        uint64_t bytes_written = 0;
        uint64_t evictions = 0;
        uint64_t eviction_bytes = 0;
    };
    Stats get_stats() const;

private:
    void init_index();
    void close_index();
    void crash_recovery();
    size_t remove_unindexed_files();  // Shard files with no index row

    std::string relative_blob_path(const std::string& hash, const std::string& content_type) const;
    uint64_t write_blob(const std::string& hash, std::istream& data,
                        const std::filesystem::path& final_path, std::stop_token stop);

    std::optional<CacheEntry> lookup_locked(const std::string& hash);
    void touch_locked(const std::string& hash);
    bool remove_entry(const std::string& hash, const std::filesystem::path& path, uint64_t size);
    void maybe_auto_evict();
    int64_t next_access_stamp();

    struct EvictCandidate {
        std::string hash;
        std::filesystem::path path;
        uint64_t size;
    };
    std::vector<EvictCandidate> select_candidates(const char* where_clause,
                                                  std::optional<int64_t> provider_id);

    CacheOptions options_;

    // In-flight write deduplication
    struct PendingWrite {
        std::shared_future<bool> result;
    };
    std::mutex pending_mutex_;
    std::unordered_map<std::string, PendingWrite> pending_writes_;

    // Serializes eviction passes
    std::mutex evict_mutex_;

    std::mutex db_mutex_;  // Protects prepared statement usage
    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_insert_ = nullptr;
    sqlite3_stmt* stmt_get_entry_ = nullptr;
    sqlite3_stmt* stmt_get_by_origin_ = nullptr;
    sqlite3_stmt* stmt_touch_ = nullptr;
    sqlite3_stmt* stmt_set_file_id_ = nullptr;
    sqlite3_stmt* stmt_delete_ = nullptr;
    sqlite3_stmt* stmt_get_evict_candidates_ = nullptr;
    sqlite3_stmt* stmt_totals_ = nullptr;

    std::atomic<int64_t> last_stamp_{0};
    std::atomic<uint64_t> temp_counter_{0};

    mutable std::mutex stats_mutex_;
    Stats stats_;
};

}  // namespace mediasync
