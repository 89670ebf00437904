#include "mediasync/content_cache.hpp"
#include "mediasync/errors.hpp"
#include "mediasync/log.hpp"
#include "sqlite_util.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <sqlite3.h>
#include <unordered_set>

namespace mediasync {

using detail::bind_text;
using detail::column_string;
using detail::from_millis;
using detail::sql_exec;
using detail::sql_prepare;
using detail::sql_step_done;
using detail::sql_step_retry;
using detail::to_millis;

namespace fs = std::filesystem;

namespace {

constexpr const char* INDEX_SCHEMA = R"(
CREATE TABLE IF NOT EXISTS cache_entries (
    hash TEXT PRIMARY KEY,
    local_path TEXT NOT NULL,
    size INTEGER NOT NULL,
    origin_url TEXT,
    provider_id INTEGER,
    provider_file_id TEXT,
    content_type TEXT,
    cached_at INTEGER NOT NULL,
    last_access INTEGER NOT NULL,
    access_count INTEGER NOT NULL DEFAULT 0
) WITHOUT ROWID;

CREATE INDEX IF NOT EXISTS idx_lru
    ON cache_entries(last_access);

CREATE INDEX IF NOT EXISTS idx_origin
    ON cache_entries(provider_id, provider_file_id);
)";

constexpr const char* ENTRY_COLUMNS =
    "hash, local_path, size, origin_url, provider_id, provider_file_id, content_type, "
    "cached_at, last_access, access_count";

constexpr size_t CHUNK_SIZE = 64 * 1024;
constexpr const char* TEMP_MARKER = ".tmp.";
constexpr const char* TOMBSTONE_SUFFIX = ".evict";

int64_t now_micros() {
    return std::chrono::duration_cast<std::chrono::microseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// Incremental SHA-256 over OpenSSL EVP
class Sha256 {
public:
    Sha256() : ctx_(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {
        if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("Failed to initialize SHA-256 context");
        }
    }

    void update(const char* data, size_t len) {
        if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
            throw std::runtime_error("SHA-256 update failed");
        }
    }

    std::string final_hex() {
        unsigned char digest[SHA256_DIGEST_LENGTH];
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), digest, &len) != 1) {
            throw std::runtime_error("SHA-256 finalize failed");
        }
        static const char hex[] = "0123456789abcdef";
        std::string out;
        out.reserve(len * 2);
        for (unsigned int i = 0; i < len; ++i) {
            out.push_back(hex[digest[i] >> 4]);
            out.push_back(hex[digest[i] & 0x0f]);
        }
        return out;
    }

private:
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx_;
};

}  // namespace

ContentCache::ContentCache(CacheOptions options) : options_(std::move(options)) {
    if (options_.directory.empty()) {
        throw std::runtime_error("Cache directory is required");
    }
    std::error_code ec;
    fs::create_directories(options_.directory, ec);
    if (ec) {
        throw std::runtime_error("Cannot create cache directory: " + ec.message());
    }
    options_.directory = fs::canonical(options_.directory);

    init_index();
    try {
        crash_recovery();
    } catch (const std::exception&) {
        close_index();
        throw;
    }

    log_info("Content cache ready: %s (%lu entries, %lu bytes, max %lu bytes)",
             options_.directory.c_str(),
             static_cast<unsigned long>(cache_count()),
             static_cast<unsigned long>(cache_size()),
             static_cast<unsigned long>(options_.max_size_bytes));
}

ContentCache::~ContentCache() {
    close_index();
}

void ContentCache::close_index() {
    for (auto* stmt : {stmt_insert_, stmt_get_entry_, stmt_get_by_origin_, stmt_touch_,
                       stmt_set_file_id_, stmt_delete_, stmt_get_evict_candidates_,
                       stmt_totals_}) {
        if (stmt) sqlite3_finalize(stmt);
    }

    if (db_) {
        sqlite3_exec(db_, "PRAGMA wal_checkpoint(TRUNCATE)", nullptr, nullptr, nullptr);
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

// --- Index ---

void ContentCache::init_index() {
    db_ = detail::open_database((options_.directory / "cache.db").string(), INDEX_SCHEMA);

    std::string cols = ENTRY_COLUMNS;
    try {
        stmt_insert_ = sql_prepare(db_,
            "INSERT OR IGNORE INTO cache_entries (hash, local_path, size, origin_url, provider_id, "
            "provider_file_id, content_type, cached_at, last_access, access_count) "
            "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, 0)");
        stmt_get_entry_ = sql_prepare(db_,
            ("SELECT " + cols + " FROM cache_entries WHERE hash = ?1").c_str());
        stmt_get_by_origin_ = sql_prepare(db_,
            ("SELECT " + cols + " FROM cache_entries "
             "WHERE provider_id = ?1 AND provider_file_id = ?2 "
             "ORDER BY last_access DESC LIMIT 1").c_str());
        stmt_touch_ = sql_prepare(db_,
            "UPDATE cache_entries SET last_access = ?2, access_count = access_count + 1 "
            "WHERE hash = ?1");
        stmt_set_file_id_ = sql_prepare(db_,
            "UPDATE cache_entries SET provider_file_id = ?2 "
            "WHERE hash = ?1 AND provider_file_id IS NULL");
        stmt_delete_ = sql_prepare(db_,
            "DELETE FROM cache_entries WHERE hash = ?1");
        stmt_get_evict_candidates_ = sql_prepare(db_,
            "SELECT hash, local_path, size FROM cache_entries ORDER BY last_access ASC LIMIT ?1");
        stmt_totals_ = sql_prepare(db_,
            "SELECT COUNT(*), COALESCE(SUM(size), 0), COALESCE(MAX(last_access), 0) "
            "FROM cache_entries");
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

void ContentCache::crash_recovery() {
    // Leftovers of interrupted writes and evictions
    std::vector<fs::path> stale;
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(options_.directory, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (!it->is_regular_file()) continue;
        auto name = it->path().filename().string();
        if (name.find(TEMP_MARKER) != std::string::npos || name.ends_with(TOMBSTONE_SUFFIX)) {
            stale.push_back(it->path());
        }
    }
    size_t leftovers = 0;
    for (auto& p : stale) {
        std::error_code rm_ec;
        if (fs::remove(p, rm_ec)) ++leftovers;
    }

    // Rows whose blob vanished
    std::vector<std::string> orphans;
    {
        std::lock_guard<std::mutex> db_lock(db_mutex_);
        sqlite3_stmt* stmt = sql_prepare(db_, "SELECT hash, local_path FROM cache_entries");
        while (sql_step_retry(stmt) == SQLITE_ROW) {
            auto path = options_.directory / column_string(stmt, 1);
            std::error_code exists_ec;
            if (!fs::exists(path, exists_ec)) {
                orphans.push_back(column_string(stmt, 0));
            }
        }
        sqlite3_finalize(stmt);

        if (!orphans.empty()) {
            if (!sql_exec(db_, "BEGIN IMMEDIATE")) {
                throw std::runtime_error(std::string("Cache recovery failed: ") +
                                         sqlite3_errmsg(db_));
            }
            for (auto& hash : orphans) {
                sqlite3_reset(stmt_delete_);
                bind_text(stmt_delete_, 1, hash);
                if (sql_step_retry(stmt_delete_) != SQLITE_DONE) {
                    log_warn("Cache recovery: cannot drop row %s: %s", hash.c_str(),
                             sqlite3_errmsg(db_));
                }
            }
            sqlite3_reset(stmt_delete_);
            if (!sql_exec(db_, "COMMIT")) {
                sql_exec(db_, "ROLLBACK");
                throw std::runtime_error(std::string("Cache recovery commit failed: ") +
                                         sqlite3_errmsg(db_));
            }
        }

        sqlite3_reset(stmt_totals_);
        if (sql_step_retry(stmt_totals_) == SQLITE_ROW) {
            last_stamp_ = sqlite3_column_int64(stmt_totals_, 2);
        }
        sqlite3_reset(stmt_totals_);
    }

    // Blobs renamed into place whose row was never inserted
    leftovers += remove_unindexed_files();

    if (leftovers > 0 || !orphans.empty()) {
        log_info("Cache recovery: removed %zu leftover files, %zu orphan rows",
                 leftovers, orphans.size());
    }
}

size_t ContentCache::remove_unindexed_files() {
    std::unordered_set<std::string> indexed;
    {
        std::lock_guard<std::mutex> db_lock(db_mutex_);
        sqlite3_stmt* stmt = sql_prepare(db_, "SELECT local_path FROM cache_entries");
        int rc;
        while ((rc = sql_step_retry(stmt)) == SQLITE_ROW) {
            indexed.insert(column_string(stmt, 0));
        }
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            throw std::runtime_error(std::string("Cache index scan failed: ") +
                                     sqlite3_errmsg(db_));
        }
    }

    // Blobs only live two levels down: <h[0:2]>/<h[2:4]>/<file>
    std::vector<fs::path> unindexed;
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(options_.directory, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it.depth() != 2 || !it->is_regular_file()) continue;
        auto rel = fs::relative(it->path(), options_.directory).generic_string();
        if (indexed.count(rel)) continue;

        // A write between rename and INSERT owns its file
        auto name = it->path().filename().string();
        if (name.size() >= 64 && is_valid_hash(name.substr(0, 64))) {
            std::lock_guard lock(pending_mutex_);
            if (pending_writes_.count(name.substr(0, 64))) continue;
        }
        unindexed.push_back(it->path());
    }

    size_t removed = 0;
    for (auto& p : unindexed) {
        std::error_code rm_ec;
        if (fs::remove(p, rm_ec)) {
            ++removed;
        } else if (rm_ec) {
            log_warn("Cannot remove unindexed cache file %s: %s", p.c_str(),
                     rm_ec.message().c_str());
        }
    }
    return removed;
}

int64_t ContentCache::next_access_stamp() {
    // Strictly increasing so LRU order is total even within one clock tick
    int64_t prev = last_stamp_.load();
    int64_t next;
    do {
        next = std::max(now_micros(), prev + 1);
    } while (!last_stamp_.compare_exchange_weak(prev, next));
    return next;
}

// --- Helpers ---

bool ContentCache::is_valid_hash(const std::string& hash) {
    if (hash.size() != 64) return false;
    return std::all_of(hash.begin(), hash.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

std::string ContentCache::extension_for_content_type(const std::string& content_type) {
    std::string ct = content_type.substr(0, content_type.find(';'));
    std::transform(ct.begin(), ct.end(), ct.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    while (!ct.empty() && ct.back() == ' ') ct.pop_back();

    if (ct == "image/jpeg" || ct == "image/jpg") return ".jpg";
    if (ct == "image/png") return ".png";
    if (ct == "image/gif") return ".gif";
    if (ct == "image/webp") return ".webp";
    if (ct == "image/bmp") return ".bmp";
    if (ct == "video/mp4") return ".mp4";
    if (ct == "video/mpeg") return ".mpeg";
    if (ct == "video/quicktime") return ".mov";
    if (ct == "video/x-msvideo") return ".avi";
    return ".bin";
}

std::string ContentCache::relative_blob_path(const std::string& hash,
                                             const std::string& content_type) const {
    return hash.substr(0, 2) + "/" + hash.substr(2, 2) + "/" + hash +
           extension_for_content_type(content_type);
}

std::string ContentCache::compute_hash(std::istream& data, std::stop_token stop) {
    auto start = data.tellg();
    if (start == std::streampos(-1)) {
        throw std::invalid_argument("compute_hash requires a seekable stream");
    }

    Sha256 sha;
    std::vector<char> buf(CHUNK_SIZE);
    while (data) {
        if (stop.stop_requested()) {
            data.clear();
            data.seekg(start);
            throw OperationCancelled();
        }
        data.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        auto n = data.gcount();
        if (n > 0) sha.update(buf.data(), static_cast<size_t>(n));
    }
    bool failed = data.bad();

    data.clear();
    data.seekg(start);
    if (failed) {
        throw std::runtime_error("Read error while hashing stream");
    }
    return sha.final_hex();
}

std::optional<CacheEntry> ContentCache::lookup_locked(const std::string& hash) {
    sqlite3_reset(stmt_get_entry_);
    bind_text(stmt_get_entry_, 1, hash);
    if (sql_step_retry(stmt_get_entry_) != SQLITE_ROW) {
        sqlite3_reset(stmt_get_entry_);
        return std::nullopt;
    }

    auto* s = stmt_get_entry_;
    CacheEntry e;
    e.hash = column_string(s, 0);
    e.local_path = options_.directory / column_string(s, 1);
    e.size = static_cast<uint64_t>(sqlite3_column_int64(s, 2));
    e.origin_url = column_string(s, 3);
    if (sqlite3_column_type(s, 4) != SQLITE_NULL) e.provider_id = sqlite3_column_int64(s, 4);
    if (sqlite3_column_type(s, 5) != SQLITE_NULL) e.provider_file_id = column_string(s, 5);
    e.content_type = column_string(s, 6);
    e.cached_at = from_millis(sqlite3_column_int64(s, 7));
    e.last_access = TimePoint(std::chrono::microseconds(sqlite3_column_int64(s, 8)));
    e.access_count = static_cast<uint64_t>(sqlite3_column_int64(s, 9));
    sqlite3_reset(stmt_get_entry_);
    return e;
}

void ContentCache::touch_locked(const std::string& hash) {
    sqlite3_reset(stmt_touch_);
    bind_text(stmt_touch_, 1, hash);
    sqlite3_bind_int64(stmt_touch_, 2, next_access_stamp());
    sql_step_done(db_, stmt_touch_, "Update cache access time failed");
}

// --- Write path ---

uint64_t ContentCache::write_blob(const std::string& hash, std::istream& data,
                                  const fs::path& final_path, std::stop_token stop) {
    fs::create_directories(final_path.parent_path());

    auto tmp_path = final_path;
    tmp_path += TEMP_MARKER + std::to_string(temp_counter_.fetch_add(1));

    uint64_t written = 0;
    try {
        std::ofstream ofs(tmp_path, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            throw std::runtime_error("Cannot create cache file: " + tmp_path.string());
        }

        Sha256 sha;
        std::vector<char> buf(CHUNK_SIZE);
        while (data) {
            if (stop.stop_requested()) throw OperationCancelled();
            data.read(buf.data(), static_cast<std::streamsize>(buf.size()));
            auto n = data.gcount();
            if (n <= 0) continue;
            sha.update(buf.data(), static_cast<size_t>(n));
            ofs.write(buf.data(), n);
            written += static_cast<uint64_t>(n);
        }
        if (data.bad()) {
            throw std::runtime_error("Read error while caching " + hash);
        }
        ofs.close();
        if (!ofs.good()) {
            throw std::runtime_error("Write failed for cache file: " + tmp_path.string());
        }

        auto actual = sha.final_hex();
        if (actual != hash) {
            throw std::runtime_error("Content hash mismatch: expected " + hash + ", got " + actual);
        }

        fs::rename(tmp_path, final_path);
    } catch (...) {
        std::error_code ec;
        fs::remove(tmp_path, ec);
        throw;
    }
    return written;
}

CacheEntry ContentCache::cache_file(const std::string& hash,
                                    std::istream& data,
                                    const std::string& origin_url,
                                    std::optional<int64_t> provider_id,
                                    const std::optional<std::string>& provider_file_id,
                                    const std::string& content_type,
                                    std::stop_token stop) {
    if (!is_valid_hash(hash)) {
        throw std::invalid_argument("Invalid content hash: " + hash);
    }

    auto existing_entry = [&]() -> std::optional<CacheEntry> {
        std::lock_guard<std::mutex> db_lock(db_mutex_);
        auto e = lookup_locked(hash);
        if (e && provider_file_id && !e->provider_file_id) {
            sqlite3_reset(stmt_set_file_id_);
            bind_text(stmt_set_file_id_, 1, hash);
            bind_text(stmt_set_file_id_, 2, *provider_file_id);
            sql_step_done(db_, stmt_set_file_id_, "Update cache origin failed");
            e->provider_file_id = provider_file_id;
        }
        return e;
    };

    if (auto e = existing_entry()) {
        std::lock_guard lock(stats_mutex_);
        stats_.dedup_hits++;
        return *e;
    }

    // Deduplicate concurrent writes of the same content
    std::shared_future<bool> in_flight;
    std::shared_ptr<std::promise<bool>> promise;
    {
        std::lock_guard lock(pending_mutex_);
        auto it = pending_writes_.find(hash);
        if (it != pending_writes_.end()) {
            in_flight = it->second.result;
        } else {
            promise = std::make_shared<std::promise<bool>>();
            pending_writes_[hash] = {promise->get_future().share()};
        }
    }

    if (!promise) {
        in_flight.get();  // rethrows the writer's failure
        if (auto e = existing_entry()) {
            std::lock_guard lock(stats_mutex_);
            stats_.dedup_hits++;
            return *e;
        }
        throw std::runtime_error("Concurrent cache write produced no entry for " + hash);
    }

    auto release = [&]() {
        std::lock_guard lock(pending_mutex_);
        pending_writes_.erase(hash);
    };

    CacheEntry entry;
    try {
        // A writer may have finished between the first lookup and registration
        if (auto e = existing_entry()) {
            promise->set_value(true);
            release();
            std::lock_guard lock(stats_mutex_);
            stats_.dedup_hits++;
            return *e;
        }

        auto rel = relative_blob_path(hash, content_type);
        auto full = options_.directory / rel;
        uint64_t size = write_blob(hash, data, full, stop);

        auto now = Clock::now();
        auto stamp = next_access_stamp();
        {
            std::lock_guard<std::mutex> db_lock(db_mutex_);
            auto* s = stmt_insert_;
            sqlite3_reset(s);
            bind_text(s, 1, hash);
            bind_text(s, 2, rel);
            sqlite3_bind_int64(s, 3, static_cast<int64_t>(size));
            bind_text(s, 4, origin_url);
            if (provider_id) {
                sqlite3_bind_int64(s, 5, *provider_id);
            } else {
                sqlite3_bind_null(s, 5);
            }
            if (provider_file_id) {
                bind_text(s, 6, *provider_file_id);
            } else {
                sqlite3_bind_null(s, 6);
            }
            bind_text(s, 7, content_type);
            sqlite3_bind_int64(s, 8, to_millis(now));
            sqlite3_bind_int64(s, 9, stamp);
            int rc = sql_step_retry(s);
            if (rc != SQLITE_DONE) {
                std::error_code ec;
                fs::remove(full, ec);
                throw std::runtime_error(std::string("Cannot record cache entry: ") +
                                         sqlite3_errmsg(db_));
            }
        }

        entry.hash = hash;
        entry.local_path = full;
        entry.size = size;
        entry.origin_url = origin_url;
        entry.provider_id = provider_id;
        entry.provider_file_id = provider_file_id;
        entry.content_type = content_type;
        entry.cached_at = now;
        entry.last_access = TimePoint(std::chrono::microseconds(stamp));

        {
            std::lock_guard lock(stats_mutex_);
            stats_.writes++;
            stats_.bytes_written += size;
        }
        log_debug("Cached %s (%lu bytes)", hash.c_str(), static_cast<unsigned long>(size));

        promise->set_value(true);
    } catch (...) {
        promise->set_exception(std::current_exception());
        release();
        throw;
    }
    release();

    maybe_auto_evict();
    return entry;
}

void ContentCache::maybe_auto_evict() {
    if (options_.max_size_bytes == 0) return;
    if (cache_size() <= options_.max_size_bytes) return;

    auto target = static_cast<uint64_t>(
        static_cast<double>(options_.max_size_bytes) * options_.evict_ratio);
    try {
        int n = evict_lru(target);
        log_info("Cache over budget: evicted %d entries down to %lu bytes",
                 n, static_cast<unsigned long>(cache_size()));
    } catch (const std::exception& e) {
        log_error("Automatic cache eviction failed: %s", e.what());
    }
}

// --- Read path ---

std::unique_ptr<std::istream> ContentCache::get_cached_stream(const std::string& hash,
                                                              std::stop_token stop) {
    if (stop.stop_requested()) throw OperationCancelled();
    if (!is_valid_hash(hash)) {
        throw NotFoundError("Cache entry not found: " + hash);
    }

    fs::path path;
    {
        std::lock_guard<std::mutex> db_lock(db_mutex_);
        auto e = lookup_locked(hash);
        if (!e) {
            std::lock_guard lock(stats_mutex_);
            stats_.misses++;
            throw NotFoundError("Cache entry not found: " + hash);
        }

        std::error_code ec;
        if (!fs::exists(e->local_path, ec)) {
            sqlite3_reset(stmt_delete_);
            bind_text(stmt_delete_, 1, hash);
            if (sql_step_retry(stmt_delete_) != SQLITE_DONE) {
                log_warn("Cannot drop cache row %s: %s", hash.c_str(), sqlite3_errmsg(db_));
            }
            sqlite3_reset(stmt_delete_);
            log_warn("Cached file missing on disk, dropped entry %s", hash.c_str());
            std::lock_guard lock(stats_mutex_);
            stats_.misses++;
            throw NotFoundError("Cached file missing: " + hash);
        }

        touch_locked(hash);
        path = e->local_path;
    }

    // An eviction may have taken the blob since the row was touched
    auto stream = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!*stream) {
        std::lock_guard lock(stats_mutex_);
        stats_.misses++;
        throw NotFoundError("Cached file missing: " + hash);
    }
    {
        std::lock_guard lock(stats_mutex_);
        stats_.hits++;
    }
    return stream;
}

std::optional<CacheEntry> ContentCache::find_entry(const std::string& hash) {
    if (!is_valid_hash(hash)) return std::nullopt;
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    auto e = lookup_locked(hash);
    if (e) touch_locked(hash);
    return e;
}

std::optional<CacheEntry> ContentCache::find_by_origin(int64_t provider_id,
                                                       const std::string& provider_file_id) {
    std::string hash;
    {
        std::lock_guard<std::mutex> db_lock(db_mutex_);
        sqlite3_reset(stmt_get_by_origin_);
        sqlite3_bind_int64(stmt_get_by_origin_, 1, provider_id);
        bind_text(stmt_get_by_origin_, 2, provider_file_id);
        if (sql_step_retry(stmt_get_by_origin_) == SQLITE_ROW) {
            hash = column_string(stmt_get_by_origin_, 0);
        }
        sqlite3_reset(stmt_get_by_origin_);
    }
    if (hash.empty()) return std::nullopt;
    return find_entry(hash);
}

// --- Eviction ---

bool ContentCache::remove_entry(const std::string& hash, const fs::path& path, uint64_t size) {
    auto tombstone = path;
    tombstone += TOMBSTONE_SUFFIX;

    std::error_code ec;
    bool had_file = fs::exists(path, ec);
    if (had_file) {
        fs::rename(path, tombstone, ec);
        if (ec) {
            log_error("Cannot evict %s: %s", path.c_str(), ec.message().c_str());
            return false;
        }
    }

    bool row_deleted = false;
    {
        std::lock_guard<std::mutex> db_lock(db_mutex_);
        sqlite3_reset(stmt_delete_);
        bind_text(stmt_delete_, 1, hash);
        row_deleted = sql_step_retry(stmt_delete_) == SQLITE_DONE;
        if (!row_deleted) {
            log_error("Cannot delete cache row %s: %s", hash.c_str(), sqlite3_errmsg(db_));
        }
    }

    if (!row_deleted) {
        if (had_file) {
            std::error_code back_ec;
            fs::rename(tombstone, path, back_ec);
        }
        return false;
    }

    if (had_file) {
        fs::remove(tombstone, ec);
        if (ec) {
            log_warn("Tombstone left behind: %s (%s)", tombstone.c_str(), ec.message().c_str());
        }
    }

    std::lock_guard lock(stats_mutex_);
    stats_.evictions++;
    stats_.eviction_bytes += size;
    return true;
}

std::vector<ContentCache::EvictCandidate> ContentCache::select_candidates(
        const char* where_clause, std::optional<int64_t> provider_id) {
    std::vector<EvictCandidate> out;
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    std::string sql = "SELECT hash, local_path, size FROM cache_entries";
    if (where_clause) {
        sql += " WHERE ";
        sql += where_clause;
    }
    sqlite3_stmt* stmt = sql_prepare(db_, sql.c_str());
    if (provider_id) sqlite3_bind_int64(stmt, 1, *provider_id);
    while (sql_step_retry(stmt) == SQLITE_ROW) {
        out.push_back({column_string(stmt, 0),
                       options_.directory / column_string(stmt, 1),
                       static_cast<uint64_t>(sqlite3_column_int64(stmt, 2))});
    }
    sqlite3_finalize(stmt);
    return out;
}

int ContentCache::evict_lru(uint64_t target_size_bytes, std::stop_token stop) {
    std::lock_guard evict_lock(evict_mutex_);

    int evicted = 0;
    uint64_t total = cache_size();
    while (total > target_size_bytes) {
        if (stop.stop_requested()) throw OperationCancelled();

        std::vector<EvictCandidate> candidates;
        {
            std::lock_guard<std::mutex> db_lock(db_mutex_);
            sqlite3_reset(stmt_get_evict_candidates_);
            sqlite3_bind_int(stmt_get_evict_candidates_, 1, 100);
            while (sql_step_retry(stmt_get_evict_candidates_) == SQLITE_ROW) {
                candidates.push_back({column_string(stmt_get_evict_candidates_, 0),
                                      options_.directory /
                                          column_string(stmt_get_evict_candidates_, 1),
                                      static_cast<uint64_t>(
                                          sqlite3_column_int64(stmt_get_evict_candidates_, 2))});
            }
            sqlite3_reset(stmt_get_evict_candidates_);
        }
        if (candidates.empty()) break;

        int round = 0;
        for (auto& c : candidates) {
            if (total <= target_size_bytes) break;
            if (stop.stop_requested()) throw OperationCancelled();
            if (remove_entry(c.hash, c.path, c.size)) {
                total = total > c.size ? total - c.size : 0;
                ++evicted;
                ++round;
                log_debug("Evicted %s (%lu bytes)", c.hash.c_str(),
                          static_cast<unsigned long>(c.size));
            }
        }
        if (round == 0) {
            log_error("Eviction made no progress; %lu bytes remain",
                      static_cast<unsigned long>(total));
            break;
        }
        total = cache_size();
    }
    return evicted;
}

void ContentCache::clear_cache(std::stop_token stop) {
    std::lock_guard evict_lock(evict_mutex_);

    auto entries = select_candidates(nullptr, std::nullopt);
    size_t failed = 0;
    for (auto& c : entries) {
        if (stop.stop_requested()) throw OperationCancelled();
        if (!remove_entry(c.hash, c.path, c.size)) ++failed;
    }

    size_t stray = remove_unindexed_files();
    if (stray > 0) {
        log_info("Removed %zu unindexed cache files", stray);
    }

    // Drop now-empty shard directories
    std::vector<fs::path> shards;
    std::error_code ec;
    for (auto& shard : fs::directory_iterator(options_.directory, ec)) {
        if (shard.is_directory()) shards.push_back(shard.path());
    }
    for (auto& shard : shards) {
        std::vector<fs::path> subs;
        for (auto& sub : fs::directory_iterator(shard, ec)) {
            if (sub.is_directory()) subs.push_back(sub.path());
        }
        std::error_code rm_ec;
        for (auto& sub : subs) fs::remove(sub, rm_ec);
        fs::remove(shard, rm_ec);
    }

    if (failed > 0) {
        throw std::runtime_error("Failed to remove " + std::to_string(failed) + " cache entries");
    }
    log_info("Cache cleared (%zu entries)", entries.size());
}

int ContentCache::clear_provider_cache(int64_t provider_id, std::stop_token stop) {
    std::lock_guard evict_lock(evict_mutex_);

    auto entries = select_candidates("provider_id = ?1", provider_id);
    int removed = 0;
    for (auto& c : entries) {
        if (stop.stop_requested()) throw OperationCancelled();
        if (remove_entry(c.hash, c.path, c.size)) ++removed;
    }
    log_info("Cleared %d cache entries for provider %ld", removed, static_cast<long>(provider_id));
    return removed;
}

bool ContentCache::delete_entry(const std::string& hash) {
    if (!is_valid_hash(hash)) return false;

    std::optional<CacheEntry> e;
    {
        std::lock_guard<std::mutex> db_lock(db_mutex_);
        e = lookup_locked(hash);
    }
    if (!e) return false;

    std::lock_guard evict_lock(evict_mutex_);
    return remove_entry(hash, e->local_path, e->size);
}

// --- Queries ---

CacheEntryPage ContentCache::list_entries(int page, int page_size) {
    CacheEntryPage result;
    result.page = std::max(page, 1);
    result.page_size = std::clamp(page_size, 1, 1000);

    std::vector<std::string> hashes;
    {
        std::lock_guard<std::mutex> db_lock(db_mutex_);
        sqlite3_stmt* stmt = sql_prepare(db_,
            "SELECT hash FROM cache_entries ORDER BY last_access DESC LIMIT ?1 OFFSET ?2");
        sqlite3_bind_int(stmt, 1, result.page_size);
        sqlite3_bind_int64(stmt, 2, static_cast<int64_t>(result.page - 1) * result.page_size);
        while (sql_step_retry(stmt) == SQLITE_ROW) {
            hashes.push_back(column_string(stmt, 0));
        }
        sqlite3_finalize(stmt);

        for (auto& h : hashes) {
            if (auto e = lookup_locked(h)) result.entries.push_back(std::move(*e));
        }
    }
    result.total_count = cache_count();
    return result;
}

uint64_t ContentCache::cache_size() {
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    sqlite3_reset(stmt_totals_);
    uint64_t total = 0;
    if (sql_step_retry(stmt_totals_) == SQLITE_ROW) {
        total = static_cast<uint64_t>(sqlite3_column_int64(stmt_totals_, 1));
    }
    sqlite3_reset(stmt_totals_);
    return total;
}

uint64_t ContentCache::cache_count() {
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    sqlite3_reset(stmt_totals_);
    uint64_t count = 0;
    if (sql_step_retry(stmt_totals_) == SQLITE_ROW) {
        count = static_cast<uint64_t>(sqlite3_column_int64(stmt_totals_, 0));
    }
    sqlite3_reset(stmt_totals_);
    return count;
}

CacheStatus ContentCache::status() {
    CacheStatus s;
    s.total_size_bytes = cache_size();
    s.file_count = cache_count();
    s.max_size_bytes = options_.max_size_bytes;
    if (s.max_size_bytes > 0) {
        s.usage_percent = static_cast<double>(s.total_size_bytes) * 100.0 /
                          static_cast<double>(s.max_size_bytes);
    }
    return s;
}

ContentCache::Stats ContentCache::get_stats() const {
    std::lock_guard lock(stats_mutex_);
    return stats_;
}

}  // namespace mediasync
