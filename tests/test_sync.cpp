// Test suite for mediasync.
//
// Tests:
//   1. SqliteCatalogStore: providers, items, batched changes
//   2. Local backend: listing, upload, path sandbox
//   3. Remote picker backend: read-only contract, credentials, cached retrieval
//   4. Backend factory and registry: instance caching and invalidation
//   5. ContentCache: content addressing, dedup, LRU eviction, recovery
//   6. SyncEngine: diffing, caps, single-flight, cancellation, scan, sync-all
//   7. AppConfig CLI parsing, JSON loading and validation
//   8. Metrics textfile export
//   9. HttpFetcher offline behaviour
//  10. Cancellable worker runner

#include "mediasync/backend_registry.hpp"
#include "mediasync/cancellable.hpp"
#include "mediasync/catalog_store.hpp"
#include "mediasync/config.hpp"
#include "mediasync/content_cache.hpp"
#include "mediasync/errors.hpp"
#include "mediasync/http_fetcher.hpp"
#include "mediasync/metrics.hpp"
#include "mediasync/storage_backend.hpp"
#include "mediasync/sync_engine.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stop_token>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;
using namespace mediasync;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name)                                                    \
    do {                                                              \
        std::cout << "  " << #name << "... " << std::flush;          \
    } while (0)

#define PASS()                                                        \
    do {                                                              \
        std::cout << "OK" << std::endl;                               \
        ++tests_passed;                                               \
    } while (0)

#define FAIL(msg)                                                     \
    do {                                                              \
        std::cout << "FAIL: " << msg << std::endl;                    \
        ++tests_failed;                                               \
    } while (0)

#define ASSERT_TRUE(cond, msg)                                        \
    do {                                                              \
        if (!(cond)) { FAIL(msg); return; }                           \
    } while (0)

#define ASSERT_EQ(a, b, msg)                                          \
    do {                                                              \
        if ((a) != (b)) {                                             \
            std::cout << "FAIL: " << msg << " (got \"" << (a)        \
                      << "\", expected \"" << (b) << "\")"            \
                      << std::endl;                                   \
            ++tests_failed;                                           \
            return;                                                   \
        }                                                             \
    } while (0)

#define ASSERT_EMPTY(s, msg)                                          \
    ASSERT_TRUE((s).empty(), msg ": " + (s))

#define ASSERT_NOT_EMPTY(s, msg)                                      \
    ASSERT_TRUE(!(s).empty(), msg)

// Evaluates `expr` and fails unless it throws exactly `ExType` (or a subclass)
#define ASSERT_THROWS(expr, ExType, msg)                              \
    do {                                                              \
        bool thrown_ = false;                                         \
        try {                                                         \
            (void)(expr);                                             \
        } catch (const ExType&) {                                     \
            thrown_ = true;                                           \
        } catch (const std::exception& e_) {                          \
            FAIL(msg << " (threw other: " << e_.what() << ")");       \
            return;                                                   \
        }                                                             \
        ASSERT_TRUE(thrown_, msg);                                    \
    } while (0)

/// Create a unique temp directory under /tmp.
static fs::path make_temp_dir(const std::string& prefix) {
    auto path = fs::temp_directory_path() / (prefix + "-XXXXXX");
    std::string tpl = path.string();
    char* result = mkdtemp(tpl.data());
    if (!result) throw std::runtime_error("mkdtemp failed");
    return fs::path(result);
}

/// Write binary content to a file.
static void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs.write(content.data(), content.size());
}

/// Read entire file into a string.
static std::string read_file(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(ifs)),
                       std::istreambuf_iterator<char>());
}

static std::string read_stream(std::istream& in) {
    return std::string((std::istreambuf_iterator<char>(in)),
                       std::istreambuf_iterator<char>());
}

/// Wait for a condition with timeout (milliseconds). Returns true if met.
static bool wait_for(std::function<bool()> cond, int timeout_ms = 5000) {
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (cond()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return cond();
}

static int64_t add_provider(ProviderStore& store, BackendKind kind, const std::string& name,
                            const std::string& config = "{}", bool enabled = true) {
    ProviderRecord r;
    r.kind = kind;
    r.name = name;
    r.enabled = enabled;
    r.configuration = config;
    return store.insert_provider(r);
}

static std::string local_config(const fs::path& root, bool organize_by_date = false) {
    return nlohmann::json{
        {"base_path", root.string()},
        {"organize_by_date", organize_by_date},
    }.dump();
}

static CatalogItem make_item(int64_t provider_id, const std::string& file_id, uint64_t size) {
    CatalogItem item;
    item.provider_id = provider_id;
    item.provider_file_id = file_id;
    item.filename = fs::path(file_id).filename().string();
    item.file_path = file_id;
    item.size = size;
    item.first_seen = Clock::now();
    item.updated_at = item.first_seen;
    return item;
}

static FileDescriptor make_fd(const std::string& file_id, uint64_t size) {
    FileDescriptor fd;
    fd.file_id = file_id;
    fd.name = fs::path(file_id).filename().string();
    fd.full_path = "/remote/" + file_id;
    fd.size = size;
    fd.media_kind = MediaKind::Photo;
    fd.content_type = "image/jpeg";
    return fd;
}

/// Hash and store `content` in the cache.
static CacheEntry cache_string(ContentCache& cache, const std::string& content,
                               const std::string& origin = "test://origin") {
    std::istringstream in(content);
    auto hash = ContentCache::compute_hash(in);
    return cache.cache_file(hash, in, origin, std::nullopt, std::nullopt, "image/jpeg");
}

// ---------------------------------------------------------------------------
// Scripted backend: listing comes from a shared script, optionally gated so a
// test can hold a sync inside list_files.
// ---------------------------------------------------------------------------

struct Script {
    std::mutex mutex;
    std::condition_variable_any cv;
    std::vector<FileDescriptor> files;
    bool gated = false;
    bool entered = false;
    std::atomic<int> list_calls{0};

    // Non-empty: list_files throws std::runtime_error with this message,
    // for every provider or only for `fail_provider` when it is non-zero
    std::string fail_with;
    int64_t fail_provider = 0;

    void fail_listing(std::string message, int64_t provider_id = 0) {
        std::lock_guard<std::mutex> lock(mutex);
        fail_with = std::move(message);
        fail_provider = provider_id;
    }

    void set_files(std::vector<FileDescriptor> f) {
        std::lock_guard<std::mutex> lock(mutex);
        files = std::move(f);
    }
    void close_gate() {
        std::lock_guard<std::mutex> lock(mutex);
        gated = true;
        entered = false;
    }
    void open_gate() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            gated = false;
        }
        cv.notify_all();
    }
    bool wait_entered() {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, std::chrono::seconds(5), [this] { return entered; });
    }
};

class ScriptedBackend : public StorageBackend {
public:
    explicit ScriptedBackend(std::shared_ptr<Script> script) : script_(std::move(script)) {}

    BackendKind kind() const override { return BackendKind::Local; }
    std::string type_name() const override { return "scripted"; }

    void initialize(int64_t provider_id, const std::string& display_name,
                    const std::string&) override {
        provider_id_ = provider_id;
        display_name_ = display_name;
    }

    std::vector<FileDescriptor> list_files(const ListOptions&, std::stop_token stop) override {
        script_->list_calls++;
        std::unique_lock<std::mutex> lock(script_->mutex);
        if (script_->gated) {
            script_->entered = true;
            script_->cv.notify_all();
            script_->cv.wait(lock, stop, [this] { return !script_->gated; });
        }
        if (stop.stop_requested()) throw OperationCancelled();
        if (!script_->fail_with.empty() &&
            (script_->fail_provider == 0 || script_->fail_provider == provider_id_)) {
            throw std::runtime_error(script_->fail_with);
        }
        return script_->files;
    }

    UploadResult upload(const std::string&, std::istream&, const std::string&,
                        std::stop_token) override {
        throw NotSupportedError("scripted backend is read-only");
    }
    std::vector<uint8_t> download(const std::string& id, std::stop_token) override {
        throw NotFoundError(id);
    }
    std::unique_ptr<std::istream> open_read_stream(const std::string& id,
                                                   std::stop_token) override {
        throw NotFoundError(id);
    }
    bool delete_file(const std::string&, std::stop_token) override {
        throw NotSupportedError("scripted backend is read-only");
    }
    bool file_exists(const std::string&, std::stop_token) override { return false; }
    bool test_connection(std::stop_token) override { return true; }
    bool supports_upload() const override { return false; }
    bool supports_watch() const override { return false; }

private:
    std::shared_ptr<Script> script_;
};

/// Catalog + registry + engine wired to a scripted backend.
struct SyncFixture {
    explicit SyncFixture(const std::string& prefix, size_t concurrency = 2)
        : dir(make_temp_dir(prefix))
        , store(dir / "catalog.db")
        , script(std::make_shared<Script>())
        , registry(store, BackendDependencies{&store, nullptr, nullptr, dir / "photos"})
        , engine(registry, store, store, SyncEngineOptions{concurrency}) {
        auto s = script;
        registry.set_factory([s](BackendKind) {
            return std::make_unique<ScriptedBackend>(s);
        });
        provider_id = add_provider(store, BackendKind::Local, "scripted");
    }
    ~SyncFixture() {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    fs::path dir;
    SqliteCatalogStore store;
    std::shared_ptr<Script> script;
    BackendRegistry registry;
    SyncEngine engine;
    int64_t provider_id = 0;
};

// ---------------------------------------------------------------------------
// 1. Catalog store
// ---------------------------------------------------------------------------

static void test_catalog_store() {
    std::cout << "\n=== Catalog store ===" << std::endl;

    auto tmpdir = make_temp_dir("mediasync-catalog");

    {
        TEST(provider_insert_find_update);
        SqliteCatalogStore store(tmpdir / "providers.db");
        auto id = add_provider(store, BackendKind::GooglePhotos, "Photos", "{\"a\":1}");
        ASSERT_TRUE(id > 0, "id should be assigned");

        auto rec = store.find_provider(id);
        ASSERT_TRUE(rec.has_value(), "provider should be found");
        ASSERT_EQ(rec->name, "Photos", "name");
        ASSERT_TRUE(rec->kind == BackendKind::GooglePhotos, "kind");
        ASSERT_EQ(rec->configuration, "{\"a\":1}", "configuration");
        ASSERT_TRUE(!rec->last_sync.has_value(), "never synced");

        rec->name = "Renamed";
        rec->enabled = false;
        store.update_provider(*rec);
        auto again = store.find_provider(id);
        ASSERT_EQ(again->name, "Renamed", "updated name");
        ASSERT_TRUE(!again->enabled, "disabled");
        ASSERT_TRUE(store.enabled_providers().empty(), "no enabled providers");
        ASSERT_EQ(store.all_providers().size(), 1u, "one provider in total");
        PASS();
    }
    {
        TEST(update_missing_provider_throws);
        SqliteCatalogStore store(tmpdir / "missing.db");
        ProviderRecord r;
        r.id = 4242;
        r.name = "ghost";
        ASSERT_THROWS(store.update_provider(r), NotFoundError, "should throw NotFoundError");
        PASS();
    }
    {
        TEST(upsert_is_keyed_by_remote_id);
        SqliteCatalogStore store(tmpdir / "upsert.db");
        auto pid = add_provider(store, BackendKind::Local, "local");
        auto first = store.upsert_item(make_item(pid, "a.jpg", 10));
        auto second = store.upsert_item(make_item(pid, "a.jpg", 20));
        ASSERT_EQ(first, second, "same row id");
        ASSERT_EQ(store.count_for_provider(pid), 1u, "one item");
        ASSERT_EQ(store.find_item(pid, "a.jpg")->size, 20u, "size updated");
        ASSERT_TRUE(store.remove_item(pid, "a.jpg"), "remove existing");
        ASSERT_TRUE(!store.remove_item(pid, "a.jpg"), "remove missing");
        PASS();
    }
    {
        TEST(apply_changes_add_update_remove);
        SqliteCatalogStore store(tmpdir / "changes.db");
        auto pid = add_provider(store, BackendKind::Local, "local");
        store.upsert_item(make_item(pid, "keep.jpg", 1));
        store.upsert_item(make_item(pid, "gone.jpg", 2));

        CatalogChanges changes;
        changes.adds.push_back(make_item(pid, "new.jpg", 3));
        auto keep = *store.find_item(pid, "keep.jpg");
        keep.size = 100;
        changes.updates.push_back(keep);
        changes.removes.push_back(store.find_item(pid, "gone.jpg")->id);
        store.apply_changes(changes, {});

        ASSERT_EQ(store.count_for_provider(pid), 2u, "two items");
        ASSERT_EQ(store.find_item(pid, "keep.jpg")->size, 100u, "updated size");
        ASSERT_TRUE(store.find_item(pid, "new.jpg").has_value(), "added");
        ASSERT_TRUE(!store.find_item(pid, "gone.jpg").has_value(), "removed");
        PASS();
    }
    {
        TEST(apply_changes_cancelled_rolls_back);
        SqliteCatalogStore store(tmpdir / "rollback.db");
        auto pid = add_provider(store, BackendKind::Local, "local");
        CatalogChanges changes;
        for (int i = 0; i < 200; ++i) {
            changes.adds.push_back(make_item(pid, "f" + std::to_string(i) + ".jpg", 1));
        }
        std::stop_source ss;
        ss.request_stop();
        ASSERT_THROWS(store.apply_changes(changes, ss.get_token()), OperationCancelled,
                      "should be cancelled");
        ASSERT_EQ(store.count_for_provider(pid), 0u, "nothing persisted");

        // The store remains usable after rollback
        store.apply_changes(changes, {});
        ASSERT_EQ(store.count_for_provider(pid), 200u, "all persisted");
        PASS();
    }
    {
        TEST(delete_provider_keep_files_detaches);
        SqliteCatalogStore store(tmpdir / "detach.db");
        auto keep_pid = add_provider(store, BackendKind::Local, "keep");
        auto drop_pid = add_provider(store, BackendKind::Local, "drop");
        store.upsert_item(make_item(keep_pid, "k.jpg", 1));
        store.upsert_item(make_item(drop_pid, "d.jpg", 1));

        ASSERT_TRUE(store.delete_provider(keep_pid, true), "delete with keep_files");
        ASSERT_TRUE(store.delete_provider(drop_pid, false), "delete without keep_files");
        ASSERT_TRUE(!store.delete_provider(drop_pid, false), "second delete is a no-op");

        auto detached = store.detached_items();
        ASSERT_EQ(detached.size(), 1u, "one detached item");
        ASSERT_EQ(detached[0].provider_file_id, "k.jpg", "kept item");
        ASSERT_TRUE(!detached[0].provider_id.has_value(), "provider id cleared");
        PASS();
    }
    {
        TEST(reads_see_writes_from_other_connection);
        auto db = tmpdir / "shared.db";
        SqliteCatalogStore a(db);
        SqliteCatalogStore b(db);
        auto first = add_provider(a, BackendKind::Local, "first");

        // Single-row reads must not pin a snapshot on `a`
        ASSERT_TRUE(a.find_provider(first).has_value(), "find on a");
        ASSERT_TRUE(!a.find_item(first, "x.jpg").has_value(), "find_item on a");
        ASSERT_EQ(a.count_for_provider(first), 0u, "count on a");

        auto second = add_provider(b, BackendKind::Local, "second");
        b.upsert_item(make_item(first, "x.jpg", 5));

        ASSERT_EQ(a.enabled_providers().size(), 2u, "a sees provider inserted by b");
        ASSERT_TRUE(a.find_provider(second).has_value(), "a finds b's provider");
        ASSERT_EQ(a.count_for_provider(first), 1u, "a sees item inserted by b");

        CatalogChanges changes;
        changes.adds.push_back(make_item(second, "y.jpg", 1));
        a.apply_changes(changes, {});
        ASSERT_EQ(b.count_for_provider(second), 1u, "b sees a's batch");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 2. Local backend
// ---------------------------------------------------------------------------

static void test_local_backend() {
    std::cout << "\n=== Local backend ===" << std::endl;

    auto tmpdir = make_temp_dir("mediasync-local");
    auto root = tmpdir / "root";
    auto outside = tmpdir / "outside";
    write_file(root / "a.jpg", "aaaa");
    write_file(root / "sub" / "b.PNG", "bb");
    write_file(root / "sub" / "clip.mp4", "video");
    write_file(root / "notes.txt", "not media");
    write_file(root / ".hidden.jpg", "hidden");
    write_file(root / ".thumbnails" / "t.jpg", "thumb");
    write_file(outside / "secret.jpg", "secret");

    BackendDependencies deps;
    deps.default_local_path = tmpdir / "default";
    auto backend = StorageBackendFactory::create(BackendKind::Local, deps);
    backend->initialize(7, "Local", local_config(root));

    {
        TEST(list_returns_media_only);
        auto files = backend->list_files(ListOptions{}, {});
        ASSERT_EQ(files.size(), 3u, "three media files");
        std::map<std::string, FileDescriptor> by_id;
        for (auto& f : files) by_id[f.file_id] = f;
        ASSERT_TRUE(by_id.count("a.jpg"), "a.jpg listed");
        ASSERT_TRUE(by_id.count("sub/b.PNG"), "sub/b.PNG listed with relative id");
        ASSERT_TRUE(by_id["sub/clip.mp4"].media_kind == MediaKind::Video, "mp4 is video");
        ASSERT_EQ(by_id["a.jpg"].size, 4u, "size");
        ASSERT_EQ(by_id["sub/b.PNG"].parent_folder_id.value_or(""), "sub", "parent folder");
        ASSERT_EQ(by_id["a.jpg"].content_type, "image/jpeg", "content type");
        PASS();
    }
    {
        TEST(list_non_recursive_and_folder);
        ListOptions top;
        top.recursive = false;
        ASSERT_EQ(backend->list_files(top, {}).size(), 1u, "only top level");

        ListOptions sub;
        sub.folder_id = "sub";
        ASSERT_EQ(backend->list_files(sub, {}).size(), 2u, "sub folder");

        ListOptions missing;
        missing.folder_id = "nope";
        ASSERT_TRUE(backend->list_files(missing, {}).empty(), "missing folder is empty");

        ListOptions escape;
        escape.folder_id = "../outside";
        ASSERT_TRUE(backend->list_files(escape, {}).empty(), "escaping folder is empty");
        PASS();
    }
    {
        TEST(list_honours_cancellation);
        std::stop_source ss;
        ss.request_stop();
        ASSERT_THROWS(backend->list_files(ListOptions{}, ss.get_token()), OperationCancelled,
                      "should be cancelled");
        PASS();
    }
    {
        TEST(download_and_stream);
        auto bytes = backend->download("sub/b.PNG", {});
        ASSERT_EQ(std::string(bytes.begin(), bytes.end()), "bb", "download content");
        auto stream = backend->open_read_stream("a.jpg", {});
        ASSERT_EQ(read_stream(*stream), "aaaa", "stream content");
        ASSERT_THROWS(backend->download("missing.jpg", {}), NotFoundError, "missing file");
        ASSERT_TRUE(backend->file_exists("a.jpg", {}), "exists");
        ASSERT_TRUE(!backend->file_exists("missing.jpg", {}), "does not exist");
        PASS();
    }
    {
        TEST(sandbox_rejects_traversal_and_absolute);
        const char* bad_ids[] = {
            "../outside/secret.jpg",
            "sub/../../outside/secret.jpg",
            "..\\outside\\secret.jpg",
            "/etc/passwd",
            "\\etc\\passwd",
            "C:\\Windows\\win.ini",
            "C:/Windows/win.ini",
        };
        for (const char* id : bad_ids) {
            ASSERT_THROWS(backend->download(id, {}), AccessDeniedError,
                          "download should be denied for " << id);
            ASSERT_THROWS(backend->open_read_stream(id, {}), AccessDeniedError,
                          "stream should be denied for " << id);
            ASSERT_THROWS(backend->delete_file(id, {}), AccessDeniedError,
                          "delete should be denied for " << id);
            ASSERT_THROWS(backend->file_exists(id, {}), AccessDeniedError,
                          "exists should be denied for " << id);
        }
        std::istringstream data("x");
        ASSERT_THROWS(backend->upload("../evil.jpg", data, "image/jpeg", {}), AccessDeniedError,
                      "upload traversal denied");
        ASSERT_THROWS(backend->upload("/tmp/evil.jpg", data, "image/jpeg", {}),
                      AccessDeniedError, "upload absolute denied");
        ASSERT_EQ(read_file(outside / "secret.jpg"), "secret", "outside file untouched");
        PASS();
    }
    {
        TEST(sandbox_rejects_symlink_escape);
        std::error_code ec;
        fs::create_directory_symlink(outside, root / "link", ec);
        ASSERT_TRUE(!ec, "symlink created");
        ASSERT_THROWS(backend->download("link/secret.jpg", {}), AccessDeniedError,
                      "symlink escape denied");
        fs::remove(root / "link", ec);
        PASS();
    }
    {
        TEST(upload_unique_names);
        std::istringstream d1("one");
        auto r1 = backend->upload("photo.jpg", d1, "image/jpeg", {});
        ASSERT_TRUE(r1.success, "first upload: " + r1.error_message);
        ASSERT_EQ(r1.file_id, "photo.jpg", "file id");
        std::istringstream d2("two");
        auto r2 = backend->upload("photo.jpg", d2, "image/jpeg", {});
        ASSERT_TRUE(r2.success, "second upload");
        ASSERT_EQ(r2.file_id, "photo_1.jpg", "unique name");
        ASSERT_EQ(r2.file_size, 3u, "size");
        ASSERT_EQ(read_file(root / "photo_1.jpg"), "two", "content");
        PASS();
    }
    {
        TEST(upload_rejects_unsupported_type);
        std::istringstream data("text");
        auto r = backend->upload("readme.txt", data, "text/plain", {});
        ASSERT_TRUE(!r.success, "should fail");
        ASSERT_TRUE(r.error_message.find("Unsupported file type") != std::string::npos,
                    "error message");
        PASS();
    }
    {
        TEST(upload_organized_by_date);
        auto dated = StorageBackendFactory::create(BackendKind::Local, deps);
        dated->initialize(8, "Dated", local_config(tmpdir / "dated", true));
        std::istringstream data("d");
        auto r = dated->upload("x.jpg", data, "", {});
        ASSERT_TRUE(r.success, "upload");
        ASSERT_TRUE(r.file_id.size() == std::string("YYYY/MM/x.jpg").size(),
                    "placed under year/month: " + r.file_id);
        ASSERT_EQ(r.content_type, "image/jpeg", "content type from extension");
        ASSERT_TRUE(dated->delete_file(r.file_id, {}), "delete");
        ASSERT_TRUE(!dated->delete_file(r.file_id, {}), "delete missing returns false");
        PASS();
    }
    {
        TEST(malformed_config_uses_defaults);
        auto b = StorageBackendFactory::create(BackendKind::Local, deps);
        b->initialize(9, "Broken", "{not json");
        b->initialize(9, "Broken", "[1,2,3]");
        b->initialize(9, "Broken", "");
        ASSERT_TRUE(b->test_connection({}), "default path is usable");
        ASSERT_TRUE(fs::is_directory(deps.default_local_path), "default root created");
        PASS();
    }
    {
        TEST(capabilities);
        ASSERT_TRUE(backend->supports_upload(), "upload");
        ASSERT_TRUE(backend->supports_watch(), "watch");
        ASSERT_TRUE(backend->has_capability(Capability::Delete), "delete capability");
        ASSERT_TRUE(!backend->has_capability(Capability::OAuthDisconnect), "no oauth");
        ProviderRecord r;
        ASSERT_THROWS(backend->disconnect(r), NotSupportedError, "disconnect unsupported");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 3. Remote picker backend
// ---------------------------------------------------------------------------

static const char* PICKER_SCOPE =
    "https://www.googleapis.com/auth/photospicker.mediaitems.readonly";

static void test_remote_picker_backend() {
    std::cout << "\n=== Remote picker backend ===" << std::endl;

    auto tmpdir = make_temp_dir("mediasync-picker");
    SqliteCatalogStore store(tmpdir / "catalog.db");
    ContentCache cache(CacheOptions{tmpdir / "cache", 1024 * 1024, 0.8});

    nlohmann::json cfg = {
        {"client_id", "id"},
        {"client_secret", "secret"},
        {"refresh_token", "refresh"},
        {"access_token", "access"},
        {"granted_scopes", nlohmann::json::array({PICKER_SCOPE})},
    };
    auto pid = add_provider(store, BackendKind::GooglePhotos, "Picked", cfg.dump());

    BackendDependencies deps{&store, &cache, nullptr, tmpdir / "photos"};
    auto backend = StorageBackendFactory::create(BackendKind::GooglePhotos, deps);
    backend->initialize(pid, "Picked", cfg.dump());

    auto origin = tmpdir / "origin" / "IMG_1.jpg";
    write_file(origin, "picked-bytes");
    auto item = make_item(pid, "media-1", 12);
    item.filename = "IMG_1.jpg";
    item.file_path = origin.string();
    store.upsert_item(item);

    {
        TEST(read_only_operations_throw);
        std::istringstream data("x");
        try {
            backend->upload("a.jpg", data, "image/jpeg", {});
            FAIL("upload should throw");
            return;
        } catch (const NotSupportedError& e) {
            ASSERT_TRUE(std::string(e.what()).find("read-only") != std::string::npos,
                        "message mentions read-only");
        }
        ASSERT_THROWS(backend->delete_file("media-1", {}), NotSupportedError, "delete");
        ASSERT_TRUE(!backend->supports_upload(), "no upload");
        ASSERT_TRUE(!backend->has_capability(Capability::Delete), "no delete capability");
        ASSERT_TRUE(backend->has_capability(Capability::OAuthDisconnect), "oauth capability");
        PASS();
    }
    {
        TEST(test_connection_requires_scope);
        ASSERT_TRUE(backend->test_connection({}), "credentials with scope");

        auto no_scope = cfg;
        no_scope["granted_scopes"] = "https://www.googleapis.com/auth/drive.readonly";
        auto b = StorageBackendFactory::create(BackendKind::GooglePhotos, deps);
        b->initialize(pid, "Picked", no_scope.dump());
        ASSERT_TRUE(!b->test_connection({}), "missing scope");

        auto space_separated = cfg;
        space_separated["granted_scopes"] = std::string("openid ") + PICKER_SCOPE;
        b->initialize(pid, "Picked", space_separated.dump());
        ASSERT_TRUE(b->test_connection({}), "space separated scopes");

        auto no_creds = cfg;
        no_creds.erase("refresh_token");
        b->initialize(pid, "Picked", no_creds.dump());
        ASSERT_TRUE(!b->test_connection({}), "missing refresh token");
        PASS();
    }
    {
        TEST(list_serves_catalog_rows);
        auto files = backend->list_files(ListOptions{}, {});
        ASSERT_EQ(files.size(), 1u, "one file");
        ASSERT_EQ(files[0].file_id, "media-1", "file id");
        ASSERT_EQ(files[0].name, "IMG_1.jpg", "name");
        ASSERT_TRUE(backend->file_exists("media-1", {}), "exists");
        ASSERT_TRUE(!backend->file_exists("media-2", {}), "unknown id");
        PASS();
    }
    {
        TEST(download_populates_cache);
        auto bytes = backend->download("media-1", {});
        ASSERT_EQ(std::string(bytes.begin(), bytes.end()), "picked-bytes", "content");
        ASSERT_EQ(cache.cache_count(), 1u, "one cache entry");
        auto entry = cache.find_by_origin(pid, "media-1");
        ASSERT_TRUE(entry.has_value(), "entry keyed by origin");
        ASSERT_EQ(entry->local_path.extension().string(), ".jpg", "extension from type");

        // Served from the cache once the origin is gone
        fs::remove(origin);
        auto hits_before = cache.get_stats().hits;
        auto stream = backend->open_read_stream("media-1", {});
        ASSERT_EQ(read_stream(*stream), "picked-bytes", "cached content");
        ASSERT_EQ(cache.get_stats().hits, hits_before + 1, "cache hit");
        ASSERT_EQ(cache.cache_count(), 1u, "still one entry");
        PASS();
    }
    {
        TEST(refetch_when_cached_blob_vanishes);
        write_file(origin, "picked-bytes");
        auto entry = cache.find_by_origin(pid, "media-1");
        ASSERT_TRUE(entry.has_value(), "cached before");
        fs::remove(entry->local_path);

        auto misses_before = cache.get_stats().misses;
        auto bytes = backend->download("media-1", {});
        ASSERT_EQ(std::string(bytes.begin(), bytes.end()), "picked-bytes", "refetched content");
        ASSERT_EQ(cache.get_stats().misses, misses_before + 1, "vanished blob is a miss");
        ASSERT_TRUE(fs::exists(entry->local_path), "blob written again");
        ASSERT_EQ(cache.cache_count(), 1u, "one entry");
        PASS();
    }
    {
        TEST(http_origin_failure_is_an_error);
        auto http_item = make_item(pid, "media-http", 3);
        http_item.filename = "remote.jpg";
        http_item.file_path = "http://127.0.0.1:1/remote.jpg";
        store.upsert_item(http_item);

        HttpFetcher fetcher(HttpFetcherConfig{std::chrono::milliseconds(2000),
                                              std::chrono::milliseconds(5000)});
        BackendDependencies http_deps{&store, &cache, &fetcher, tmpdir / "photos"};
        auto b = StorageBackendFactory::create(BackendKind::GooglePhotos, http_deps);
        b->initialize(pid, "Picked", cfg.dump());
        try {
            b->download("media-http", {});
            FAIL("download from closed port should throw");
            return;
        } catch (const NotFoundError&) {
            FAIL("connection failure is not a missing file");
            return;
        } catch (const std::runtime_error& e) {
            ASSERT_TRUE(std::string(e.what()).find("media-http") != std::string::npos,
                        "message names the file");
        }
        std::stop_source ss;
        ss.request_stop();
        ASSERT_THROWS(b->download("media-http", ss.get_token()), OperationCancelled,
                      "stopped token cancels");
        PASS();
    }
    {
        TEST(download_unknown_id_not_found);
        ASSERT_THROWS(backend->download("media-404", {}), NotFoundError, "unknown id");
        PASS();
    }
    {
        TEST(disconnect_clears_credentials);
        auto rec = *store.find_provider(pid);
        ASSERT_TRUE(backend->disconnect(rec), "disconnect");
        ASSERT_TRUE(!rec.enabled, "disabled");
        auto j = nlohmann::json::parse(rec.configuration);
        ASSERT_TRUE(!j.contains("access_token"), "access token removed");
        ASSERT_TRUE(!j.contains("refresh_token"), "refresh token removed");
        ASSERT_TRUE(!j.contains("granted_scopes"), "scopes removed");
        ASSERT_EQ(j.value("client_id", ""), "id", "client id kept");
        ASSERT_TRUE(!backend->test_connection({}), "no longer connected");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 4. Backend factory and registry
// ---------------------------------------------------------------------------

static void test_backend_registry() {
    std::cout << "\n=== Backend factory and registry ===" << std::endl;

    auto tmpdir = make_temp_dir("mediasync-registry");
    SqliteCatalogStore store(tmpdir / "catalog.db");
    BackendDependencies deps{&store, nullptr, nullptr, tmpdir / "photos"};

    {
        TEST(factory_unimplemented_vs_invalid);
        ASSERT_THROWS(StorageBackendFactory::create(BackendKind::GoogleDrive, deps),
                      NotImplementedError, "google drive not implemented");
        ASSERT_THROWS(StorageBackendFactory::create(BackendKind::OneDrive, deps),
                      NotImplementedError, "onedrive not implemented");
        ASSERT_THROWS(StorageBackendFactory::create(static_cast<BackendKind>(42), deps),
                      std::out_of_range, "invalid kind");
        auto local = StorageBackendFactory::create(BackendKind::Local, deps);
        ASSERT_TRUE(local->kind() == BackendKind::Local, "local kind");
        PASS();
    }
    {
        TEST(same_instance_until_cleared);
        BackendRegistry registry(store, deps);
        auto id = add_provider(store, BackendKind::Local, "one", local_config(tmpdir / "one"));
        auto a = registry.get_backend(id);
        auto b = registry.get_backend(id);
        ASSERT_TRUE(a != nullptr, "backend resolved");
        ASSERT_TRUE(a == b, "same instance");
        ASSERT_EQ(a->provider_id(), id, "provider id bound");
        ASSERT_EQ(a->display_name(), "one", "display name bound");

        auto gen = registry.generation();
        registry.clear_cache();
        ASSERT_EQ(registry.cached_count(), 0u, "cache empty");
        ASSERT_EQ(registry.generation(), gen + 1, "generation bumped");
        auto c = registry.get_backend(id);
        ASSERT_TRUE(c != a, "new instance after clear");
        PASS();
    }
    {
        TEST(missing_or_disabled_is_null);
        BackendRegistry registry(store, deps);
        auto id = add_provider(store, BackendKind::Local, "off", "{}", false);
        ASSERT_TRUE(registry.get_backend(id) == nullptr, "disabled");
        ASSERT_TRUE(registry.get_backend(99999) == nullptr, "missing");
        PASS();
    }
    {
        TEST(unimplemented_provider_propagates);
        BackendRegistry registry(store, deps);
        auto id = add_provider(store, BackendKind::OneDrive, "cloud");
        ASSERT_THROWS(registry.get_backend(id), NotImplementedError, "not implemented");
        ASSERT_THROWS(registry.create_backend(BackendKind::GoogleDrive), NotImplementedError,
                      "create not implemented");

        // get_all_backends skips it instead
        auto all = registry.get_all_backends();
        for (auto& b : all) {
            ASSERT_TRUE(b->kind() != BackendKind::OneDrive, "onedrive skipped");
        }
        ProviderRecord rec = *store.find_provider(id);
        rec.enabled = false;
        store.update_provider(rec);
        PASS();
    }
    {
        TEST(backends_by_kind);
        BackendRegistry registry(store, deps);
        auto locals = registry.get_backends_by_kind(BackendKind::Local);
        ASSERT_EQ(locals.size(), 1u, "one enabled local provider");
        ASSERT_TRUE(registry.get_backends_by_kind(BackendKind::GooglePhotos).empty(),
                    "no picker providers");
        PASS();
    }
    {
        TEST(default_local_backend_created_once);
        SqliteCatalogStore fresh(tmpdir / "fresh.db");
        BackendRegistry registry(fresh, BackendDependencies{&fresh, nullptr, nullptr,
                                                            tmpdir / "default-photos"});
        auto a = registry.get_or_create_default_local_backend();
        auto b = registry.get_or_create_default_local_backend();
        ASSERT_TRUE(a != nullptr, "created");
        ASSERT_TRUE(a == b, "same instance");
        auto providers = fresh.all_providers();
        ASSERT_EQ(providers.size(), 1u, "one provider persisted");
        ASSERT_EQ(providers[0].name, "Local Storage", "default name");
        ASSERT_TRUE(a->test_connection({}), "default path usable");
        ASSERT_TRUE(fs::is_directory(tmpdir / "default-photos"), "default path created");
        PASS();
    }
    {
        TEST(disconnect_provider);
        BackendRegistry registry(store, deps);
        auto local_id = add_provider(store, BackendKind::Local, "plain");
        ASSERT_THROWS(registry.disconnect_provider(local_id), NotSupportedError,
                      "local cannot disconnect");
        ASSERT_THROWS(registry.disconnect_provider(123456), NotFoundError, "missing provider");

        auto picker_id = add_provider(store, BackendKind::GooglePhotos, "picker",
                                      "{\"access_token\":\"t\",\"client_id\":\"c\"}");
        auto before = registry.get_backend(picker_id);
        ASSERT_TRUE(before != nullptr, "picker resolved");
        registry.disconnect_provider(picker_id);
        auto rec = store.find_provider(picker_id);
        ASSERT_TRUE(!rec->enabled, "disabled");
        ASSERT_TRUE(rec->configuration.find("access_token") == std::string::npos,
                    "token cleared");
        ASSERT_TRUE(registry.get_backend(picker_id) == nullptr, "no longer resolvable");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 5. Content cache
// ---------------------------------------------------------------------------

static void test_content_cache() {
    std::cout << "\n=== Content cache ===" << std::endl;

    auto tmpdir = make_temp_dir("mediasync-cache");

    {
        TEST(compute_hash_restores_position);
        std::istringstream in("xxhello");
        in.seekg(2);
        auto hash = ContentCache::compute_hash(in);
        ASSERT_EQ(hash, "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824",
                  "sha256 of remaining bytes");
        ASSERT_EQ(static_cast<int>(in.tellg()), 2, "position restored");
        PASS();
    }
    {
        TEST(cache_file_is_idempotent);
        ContentCache cache(CacheOptions{tmpdir / "idem"});
        auto e1 = cache_string(cache, "same bytes");
        auto e2 = cache_string(cache, "same bytes");
        ASSERT_EQ(e1.hash, e2.hash, "same hash");
        ASSERT_EQ(e1.local_path.string(), e2.local_path.string(), "same path");
        ASSERT_EQ(cache.cache_count(), 1u, "one entry");
        ASSERT_EQ(cache.cache_size(), 10u, "size counted once");
        ASSERT_EQ(cache.get_stats().writes, 1u, "one write");
        ASSERT_EQ(read_file(e1.local_path), "same bytes", "blob content");
        auto rel = fs::relative(e1.local_path, cache.directory()).generic_string();
        ASSERT_EQ(rel, e1.hash.substr(0, 2) + "/" + e1.hash.substr(2, 2) + "/" + e1.hash + ".jpg",
                  "sharded layout");
        PASS();
    }
    {
        TEST(rejects_bad_hashes);
        ContentCache cache(CacheOptions{tmpdir / "bad"});
        std::istringstream in("data");
        ASSERT_THROWS(cache.cache_file("not-a-hash", in, "o", std::nullopt, std::nullopt, ""),
                      std::invalid_argument, "malformed hash");
        std::string wrong(64, 'a');
        ASSERT_THROWS(cache.cache_file(wrong, in, "o", std::nullopt, std::nullopt, ""),
                      std::runtime_error, "digest mismatch");
        ASSERT_EQ(cache.cache_count(), 0u, "nothing stored");
        PASS();
    }
    {
        TEST(missing_entry_not_found);
        ContentCache cache(CacheOptions{tmpdir / "missing"});
        ASSERT_THROWS(cache.get_cached_stream(std::string(64, 'b')), NotFoundError, "missing");
        auto e = cache_string(cache, "vanishing");
        fs::remove(e.local_path);
        ASSERT_THROWS(cache.get_cached_stream(e.hash), NotFoundError, "file gone");
        ASSERT_EQ(cache.cache_count(), 0u, "row dropped");
        PASS();
    }
    {
        TEST(lru_evicts_oldest_access_first);
        ContentCache cache(CacheOptions{tmpdir / "lru"});
        auto a = cache_string(cache, "AAAAAAAAAA");
        auto b = cache_string(cache, "BBBBBBBBBB");
        auto c = cache_string(cache, "CCCCCCCCCC");
        auto stream = cache.get_cached_stream(a.hash);  // a becomes most recent
        stream.reset();

        int removed = cache.evict_lru(20);
        ASSERT_EQ(removed, 1, "one entry evicted");
        ASSERT_TRUE(!cache.find_entry(b.hash).has_value(), "b evicted");
        ASSERT_TRUE(cache.find_entry(a.hash).has_value(), "a kept");
        ASSERT_TRUE(cache.find_entry(c.hash).has_value(), "c kept");
        ASSERT_TRUE(!fs::exists(b.local_path), "b blob removed");

        removed = cache.evict_lru(0);
        ASSERT_EQ(removed, 2, "rest evicted");
        ASSERT_EQ(cache.cache_size(), 0u, "empty");
        PASS();
    }
    {
        TEST(concurrent_writes_deduplicate);
        ContentCache cache(CacheOptions{tmpdir / "dedup"});
        std::string content(256 * 1024, 'z');
        std::vector<std::thread> threads;
        std::atomic<int> errors{0};
        for (int i = 0; i < 8; ++i) {
            threads.emplace_back([&]() {
                try {
                    cache_string(cache, content);
                } catch (const std::exception&) {
                    errors++;
                }
            });
        }
        for (auto& t : threads) t.join();
        ASSERT_EQ(errors.load(), 0, "no errors");
        ASSERT_EQ(cache.cache_count(), 1u, "one entry");
        ASSERT_EQ(cache.get_stats().writes, 1u, "one disk write");
        ASSERT_EQ(cache.cache_size(), content.size(), "size");
        PASS();
    }
    {
        TEST(auto_eviction_after_overflow);
        ContentCache cache(CacheOptions{tmpdir / "auto", 100, 0.5});
        cache_string(cache, std::string(40, '1'));
        cache_string(cache, std::string(40, '2'));
        ASSERT_EQ(cache.cache_count(), 2u, "under budget");
        cache_string(cache, std::string(40, '3'));
        ASSERT_TRUE(cache.cache_size() <= 50, "evicted down to ratio");
        ASSERT_EQ(cache.cache_count(), 1u, "newest entry kept");
        ASSERT_TRUE(cache.get_stats().evictions >= 2, "evictions counted");
        PASS();
    }
    {
        TEST(status_and_listing);
        ContentCache cache(CacheOptions{tmpdir / "status", 1000});
        cache_string(cache, std::string(100, 'x'));
        cache_string(cache, std::string(150, 'y'));
        auto st = cache.status();
        ASSERT_EQ(st.file_count, 2u, "count");
        ASSERT_EQ(st.total_size_bytes, 250u, "size");
        ASSERT_EQ(st.max_size_bytes, 1000u, "max");
        ASSERT_TRUE(st.usage_percent > 24.9 && st.usage_percent < 25.1, "usage percent");
        auto page = cache.list_entries(1, 1);
        ASSERT_EQ(page.entries.size(), 1u, "page size respected");
        ASSERT_EQ(page.total_count, 2u, "total count");
        ASSERT_EQ(page.entries[0].size, 150u, "most recent first");
        PASS();
    }
    {
        TEST(provider_scoped_clear_and_delete);
        ContentCache cache(CacheOptions{tmpdir / "scoped"});
        std::istringstream a("provider-one");
        auto ha = ContentCache::compute_hash(a);
        cache.cache_file(ha, a, "o1", int64_t{1}, std::string("f1"), "image/png");
        std::istringstream b("provider-two");
        auto hb = ContentCache::compute_hash(b);
        cache.cache_file(hb, b, "o2", int64_t{2}, std::string("f2"), "image/png");

        ASSERT_EQ(cache.clear_provider_cache(1), 1, "one entry for provider 1");
        ASSERT_TRUE(!cache.find_by_origin(1, "f1").has_value(), "provider 1 cleared");
        ASSERT_TRUE(cache.find_by_origin(2, "f2").has_value(), "provider 2 kept");
        ASSERT_TRUE(cache.delete_entry(hb), "delete entry");
        ASSERT_TRUE(!cache.delete_entry(hb), "second delete");
        ASSERT_EQ(cache.cache_count(), 0u, "empty");
        PASS();
    }
    {
        TEST(clear_cache_removes_everything);
        ContentCache cache(CacheOptions{tmpdir / "clear"});
        auto e = cache_string(cache, "one");
        cache_string(cache, "two");
        cache.clear_cache();
        ASSERT_EQ(cache.cache_count(), 0u, "no rows");
        ASSERT_EQ(cache.cache_size(), 0u, "no bytes");
        ASSERT_TRUE(!fs::exists(e.local_path), "blob removed");
        PASS();
    }
    {
        TEST(recovery_removes_leftovers);
        auto dir = tmpdir / "recover";
        std::string kept_hash;
        fs::path orphan_path;
        {
            ContentCache cache(CacheOptions{dir});
            kept_hash = cache_string(cache, "kept").hash;
            orphan_path = cache_string(cache, "orphan").local_path;
        }
        write_file(dir / "ab" / "cd" / "partial.tmp.3", "partial");
        write_file(dir / "ab" / "cd" / "old.jpg.evict", "tombstone");
        fs::remove(orphan_path);

        ContentCache cache(CacheOptions{dir});
        ASSERT_TRUE(!fs::exists(dir / "ab" / "cd" / "partial.tmp.3"), "temp file removed");
        ASSERT_TRUE(!fs::exists(dir / "ab" / "cd" / "old.jpg.evict"), "tombstone removed");
        ASSERT_EQ(cache.cache_count(), 1u, "orphan row dropped");
        ASSERT_TRUE(cache.find_entry(kept_hash).has_value(), "intact entry kept");
        PASS();
    }
    {
        TEST(recovery_removes_unindexed_blobs);
        auto dir = tmpdir / "unindexed";
        std::string kept_hash;
        {
            ContentCache cache(CacheOptions{dir});
            kept_hash = cache_string(cache, "indexed").hash;
        }
        // Renamed into place but never recorded in the index
        std::istringstream stray_in("stray");
        auto stray_hash = ContentCache::compute_hash(stray_in);
        auto stray = dir / stray_hash.substr(0, 2) / stray_hash.substr(2, 2) / (stray_hash + ".jpg");
        write_file(stray, "stray");

        ContentCache cache(CacheOptions{dir});
        ASSERT_TRUE(!fs::exists(stray), "unindexed blob removed");
        ASSERT_EQ(cache.cache_count(), 1u, "indexed entry kept");
        ASSERT_TRUE(cache.find_entry(kept_hash).has_value(), "indexed entry intact");
        ASSERT_TRUE(fs::exists(cache.find_entry(kept_hash)->local_path), "indexed blob intact");
        PASS();
    }
    {
        TEST(clear_cache_removes_unindexed_blobs);
        auto dir = tmpdir / "clear-unindexed";
        ContentCache cache(CacheOptions{dir});
        cache_string(cache, "indexed");
        auto stray = dir / "aa" / "bb" / (std::string(64, 'a') + ".png");
        write_file(stray, "stray");

        cache.clear_cache();
        ASSERT_TRUE(!fs::exists(stray), "unindexed blob removed");
        ASSERT_TRUE(!fs::exists(dir / "aa"), "shard directory removed");
        ASSERT_EQ(cache.cache_count(), 0u, "no rows");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 6. Sync engine
// ---------------------------------------------------------------------------

static void test_sync_engine() {
    std::cout << "\n=== Sync engine ===" << std::endl;

    {
        TEST(resync_is_idempotent);
        SyncFixture fx("mediasync-sync-idem");
        fx.script->set_files({make_fd("a.jpg", 1), make_fd("b.jpg", 2), make_fd("c.jpg", 3)});
        auto first = fx.engine.sync_provider(fx.provider_id, SyncRequest{});
        ASSERT_TRUE(first.success, "first sync: " + first.error_message);
        ASSERT_EQ(first.files_added, 3, "added");
        ASSERT_EQ(first.total_files_found, 3, "found");

        auto second = fx.engine.sync_provider(fx.provider_id, SyncRequest{});
        ASSERT_TRUE(second.success, "second sync");
        ASSERT_EQ(second.files_added, 0, "nothing added");
        ASSERT_EQ(second.files_updated, 0, "nothing updated");
        ASSERT_EQ(second.files_removed, 0, "nothing removed");
        ASSERT_EQ(second.files_skipped, 3, "all skipped");
        ASSERT_EQ(second.total_files_processed, 3, "processed");
        ASSERT_EQ(fx.store.count_for_provider(fx.provider_id), 3u, "catalog unchanged");
        PASS();
    }
    {
        TEST(new_file_added_known_skipped);
        SyncFixture fx("mediasync-sync-new");
        fx.script->set_files({make_fd("a.jpg", 1), make_fd("b.jpg", 2)});
        fx.engine.sync_provider(fx.provider_id, SyncRequest{});
        fx.script->set_files({make_fd("a.jpg", 1), make_fd("b.jpg", 2), make_fd("c.jpg", 3)});
        auto r = fx.engine.sync_provider(fx.provider_id, SyncRequest{});
        ASSERT_EQ(r.files_added, 1, "one added");
        ASSERT_EQ(r.files_skipped, 2, "two skipped");
        auto item = fx.store.find_item(fx.provider_id, "c.jpg");
        ASSERT_TRUE(item.has_value(), "new item persisted");
        ASSERT_EQ(item->file_path, "/remote/c.jpg", "origin path recorded");
        PASS();
    }
    {
        TEST(changed_size_updates_when_not_skipping);
        SyncFixture fx("mediasync-sync-update");
        fx.script->set_files({make_fd("a.jpg", 1), make_fd("b.jpg", 2)});
        fx.engine.sync_provider(fx.provider_id, SyncRequest{});
        fx.script->set_files({make_fd("a.jpg", 100), make_fd("b.jpg", 2)});

        auto skipping = fx.engine.sync_provider(fx.provider_id, SyncRequest{});
        ASSERT_EQ(skipping.files_updated, 0, "skip_existing ignores changes");

        SyncRequest req;
        req.skip_existing = false;
        auto r = fx.engine.sync_provider(fx.provider_id, req);
        ASSERT_EQ(r.files_updated, 1, "one updated");
        ASSERT_EQ(r.files_skipped, 1, "unchanged skipped");
        ASSERT_EQ(fx.store.find_item(fx.provider_id, "a.jpg")->size, 100u, "size persisted");
        PASS();
    }
    {
        TEST(removal_on_and_off);
        SyncFixture fx("mediasync-sync-remove");
        fx.script->set_files({make_fd("a.jpg", 1), make_fd("b.jpg", 2)});
        fx.engine.sync_provider(fx.provider_id, SyncRequest{});
        fx.script->set_files({make_fd("a.jpg", 1)});

        SyncRequest keep;
        keep.remove_deleted = false;
        auto kept = fx.engine.sync_provider(fx.provider_id, keep);
        ASSERT_EQ(kept.files_removed, 0, "nothing removed");
        ASSERT_EQ(fx.store.count_for_provider(fx.provider_id), 2u, "catalog kept");

        auto removed = fx.engine.sync_provider(fx.provider_id, SyncRequest{});
        ASSERT_EQ(removed.files_removed, 1, "one removed");
        ASSERT_TRUE(!fx.store.find_item(fx.provider_id, "b.jpg").has_value(), "b gone");
        PASS();
    }
    {
        TEST(max_files_caps_adds);
        SyncFixture fx("mediasync-sync-cap");
        std::vector<FileDescriptor> files;
        for (int i = 0; i < 5; ++i) files.push_back(make_fd("f" + std::to_string(i) + ".jpg", 1));
        fx.script->set_files(files);
        SyncRequest req;
        req.max_files = 2;
        auto r = fx.engine.sync_provider(fx.provider_id, req);
        ASSERT_TRUE(r.success, "success");
        ASSERT_EQ(r.files_added, 2, "capped adds");
        ASSERT_EQ(r.total_files_found, 5, "all found");
        ASSERT_EQ(fx.store.count_for_provider(fx.provider_id), 2u, "two persisted");
        PASS();
    }
    {
        TEST(per_file_problems_do_not_fail_run);
        SyncFixture fx("mediasync-sync-errors");
        auto folder = make_fd("album", 0);
        folder.is_folder = true;
        fx.script->set_files({make_fd("a.jpg", 1), make_fd("a.jpg", 1), make_fd("", 1), folder});
        auto r = fx.engine.sync_provider(fx.provider_id, SyncRequest{});
        ASSERT_TRUE(r.success, "success");
        ASSERT_EQ(r.files_added, 1, "one added");
        ASSERT_EQ(r.errors.size(), 2u, "duplicate and empty id reported");
        ASSERT_EQ(r.total_files_found, 3, "folders not counted");
        PASS();
    }
    {
        TEST(single_flight_rejects_second_sync);
        SyncFixture fx("mediasync-sync-flight");
        fx.script->set_files({make_fd("a.jpg", 1)});
        fx.script->close_gate();

        SyncResult first;
        std::thread t([&] { first = fx.engine.sync_provider(fx.provider_id, SyncRequest{}); });
        bool entered = fx.script->wait_entered();
        if (!entered) {
            fx.script->open_gate();
            t.join();
            FAIL("first sync never reached listing");
            return;
        }

        auto status = fx.engine.get_sync_status(fx.provider_id);
        auto second = fx.engine.sync_provider(fx.provider_id, SyncRequest{});
        fx.script->open_gate();
        t.join();

        ASSERT_TRUE(status.is_in_progress, "in progress while gated");
        ASSERT_EQ(status.current_operation, "Scanning files...", "operation");
        ASSERT_TRUE(!second.success, "second rejected");
        ASSERT_TRUE(second.error_kind == SyncErrorKind::AlreadyRunning, "already running");
        ASSERT_EQ(second.error_message, "A sync is already in progress for this provider",
                  "message");
        ASSERT_EQ(fx.script->list_calls.load(), 1, "backend listed once");
        ASSERT_TRUE(first.success, "first completed");
        ASSERT_EQ(first.files_added, 1, "first added");

        auto after = fx.engine.get_sync_status(fx.provider_id);
        ASSERT_TRUE(!after.is_in_progress, "idle afterwards");
        ASSERT_EQ(after.progress_percent, 100, "complete");
        ASSERT_TRUE(after.last_result.has_value() && after.last_result->success,
                    "last result recorded");
        PASS();
    }
    {
        TEST(cancel_releases_run);
        SyncFixture fx("mediasync-sync-cancel");
        fx.script->set_files({make_fd("a.jpg", 1)});
        fx.script->close_gate();

        SyncResult cancelled;
        std::thread t([&] {
            cancelled = fx.engine.sync_provider(fx.provider_id, SyncRequest{});
        });
        if (!fx.script->wait_entered()) {
            fx.script->open_gate();
            t.join();
            FAIL("sync never reached listing");
            return;
        }
        bool requested = fx.engine.cancel_sync(fx.provider_id);
        t.join();

        ASSERT_TRUE(requested, "cancel found the run");
        ASSERT_TRUE(!cancelled.success, "cancelled run failed");
        ASSERT_TRUE(cancelled.error_kind == SyncErrorKind::Cancelled, "cancelled kind");
        ASSERT_EQ(cancelled.error_message, "Sync was cancelled", "message");
        ASSERT_TRUE(!fx.engine.cancel_sync(fx.provider_id), "nothing left to cancel");
        ASSERT_EQ(fx.store.count_for_provider(fx.provider_id), 0u, "nothing persisted");

        fx.script->open_gate();
        auto again = fx.engine.sync_provider(fx.provider_id, SyncRequest{});
        ASSERT_TRUE(again.success, "guard released");
        ASSERT_EQ(again.files_added, 1, "added after retry");
        PASS();
    }
    {
        TEST(caller_token_cancels);
        SyncFixture fx("mediasync-sync-token");
        fx.script->set_files({make_fd("a.jpg", 1)});
        std::stop_source ss;
        ss.request_stop();
        auto r = fx.engine.sync_provider(fx.provider_id, SyncRequest{}, ss.get_token());
        ASSERT_TRUE(r.error_kind == SyncErrorKind::Cancelled, "cancelled");
        ASSERT_EQ(fx.engine.get_stats().syncs_cancelled, 1u, "cancel counted");
        PASS();
    }
    {
        TEST(missing_provider_not_found);
        SyncFixture fx("mediasync-sync-missing");
        auto r = fx.engine.sync_provider(777, SyncRequest{});
        ASSERT_TRUE(!r.success, "failed");
        ASSERT_TRUE(r.error_kind == SyncErrorKind::NotFound, "not found kind");
        ASSERT_EQ(r.error_message, "Storage provider not found or disabled", "message");
        PASS();
    }
    {
        TEST(unimplemented_backend_fails_run);
        auto dir = make_temp_dir("mediasync-sync-unimpl");
        {
            SqliteCatalogStore store(dir / "catalog.db");
            BackendRegistry registry(store, BackendDependencies{&store, nullptr, nullptr, dir});
            SyncEngine engine(registry, store, store);
            auto id = add_provider(store, BackendKind::GoogleDrive, "drive");
            auto r = engine.sync_provider(id, SyncRequest{});
            ASSERT_TRUE(!r.success, "failed");
            ASSERT_TRUE(r.error_kind == SyncErrorKind::BackendError, "backend error");
        }
        fs::remove_all(dir);
        PASS();
    }
    {
        TEST(last_sync_timestamp_updated);
        SyncFixture fx("mediasync-sync-stamp");
        auto before = Clock::now() - std::chrono::seconds(1);
        fx.script->set_files({make_fd("a.jpg", 1)});
        fx.engine.sync_provider(fx.provider_id, SyncRequest{});
        auto rec = fx.store.find_provider(fx.provider_id);
        ASSERT_TRUE(rec->last_sync.has_value(), "last sync set");
        ASSERT_TRUE(*rec->last_sync >= before, "recent timestamp");
        PASS();
    }
    {
        TEST(scan_counts_without_writing);
        SyncFixture fx("mediasync-sync-scan");
        fx.script->set_files({make_fd("a.jpg", 5)});
        fx.engine.sync_provider(fx.provider_id, SyncRequest{});

        std::vector<FileDescriptor> files = {make_fd("a.jpg", 5)};
        for (int i = 0; i < 15; ++i) files.push_back(make_fd("n" + std::to_string(i) + ".jpg", 10));
        fx.script->set_files(files);

        auto scan = fx.engine.scan_provider(fx.provider_id);
        ASSERT_TRUE(scan.success, "scan: " + scan.error_message);
        ASSERT_EQ(scan.total_files_found, 16, "total");
        ASSERT_EQ(scan.new_files_count, 15, "new");
        ASSERT_EQ(scan.existing_files_count, 1, "existing");
        ASSERT_EQ(scan.new_files_total_size, 150u, "new size");
        ASSERT_EQ(scan.sample_new_files.size(), 10u, "sample capped");
        ASSERT_EQ(fx.store.count_for_provider(fx.provider_id), 1u, "catalog untouched");

        auto missing = fx.engine.scan_provider(555);
        ASSERT_TRUE(!missing.success, "missing provider");
        ASSERT_EQ(missing.error_message, "Storage provider not found or disabled", "message");
        PASS();
    }
    {
        TEST(sync_all_runs_every_enabled_provider);
        SyncFixture fx("mediasync-sync-all", 2);
        add_provider(fx.store, BackendKind::Local, "second");
        add_provider(fx.store, BackendKind::Local, "third");
        add_provider(fx.store, BackendKind::Local, "disabled", "{}", false);
        fx.script->set_files({make_fd("a.jpg", 1), make_fd("b.jpg", 1)});

        auto results = fx.engine.sync_all_providers(SyncRequest{});
        ASSERT_EQ(results.size(), 3u, "one result per enabled provider");
        for (auto& r : results) {
            ASSERT_TRUE(r.success, "provider " << r.provider_id << ": " << r.error_message);
            ASSERT_EQ(r.files_added, 2, "two added");
        }
        ASSERT_EQ(fx.engine.get_stats().syncs_completed, 3u, "stats");

        std::stop_source ss;
        ss.request_stop();
        auto stopped = fx.engine.sync_all_providers(SyncRequest{}, ss.get_token());
        ASSERT_EQ(stopped.size(), 3u, "results for all");
        for (auto& r : stopped) {
            ASSERT_TRUE(r.error_kind == SyncErrorKind::Cancelled, "cancelled before start");
        }
        PASS();
    }
    {
        TEST(listing_failure_reports_backend_error);
        SyncFixture fx("mediasync-sync-listfail");
        fx.script->set_files({make_fd("a.jpg", 1)});
        fx.script->fail_listing("listing request failed: HTTP 503");

        auto r = fx.engine.sync_provider(fx.provider_id, SyncRequest{});
        ASSERT_TRUE(!r.success, "failed");
        ASSERT_TRUE(r.error_kind == SyncErrorKind::BackendError, "backend error kind");
        ASSERT_EQ(r.error_message, "listing request failed: HTTP 503", "underlying message");
        ASSERT_EQ(fx.store.count_for_provider(fx.provider_id), 0u, "catalog untouched");
        ASSERT_TRUE(!fx.store.find_provider(fx.provider_id)->last_sync.has_value(),
                    "last sync not stamped");
        ASSERT_EQ(fx.engine.get_stats().syncs_failed, 1u, "failure counted");

        auto status = fx.engine.get_sync_status(fx.provider_id);
        ASSERT_TRUE(!status.is_in_progress, "run released");
        ASSERT_TRUE(status.last_result.has_value() && !status.last_result->success,
                    "failure recorded as last result");

        fx.script->fail_listing("");
        auto again = fx.engine.sync_provider(fx.provider_id, SyncRequest{});
        ASSERT_TRUE(again.success, "follow-up sync: " + again.error_message);
        ASSERT_EQ(again.files_added, 1, "added after recovery");
        PASS();
    }
    {
        TEST(sync_all_continues_past_failing_provider);
        SyncFixture fx("mediasync-sync-all-fail", 2);
        auto second = add_provider(fx.store, BackendKind::Local, "second");
        auto third = add_provider(fx.store, BackendKind::Local, "third");
        fx.script->set_files({make_fd("a.jpg", 1), make_fd("b.jpg", 1)});
        fx.script->fail_listing("connection reset", second);

        auto results = fx.engine.sync_all_providers(SyncRequest{});
        ASSERT_EQ(results.size(), 3u, "one result per provider");
        int ok = 0;
        for (auto& r : results) {
            if (r.provider_id == second) {
                ASSERT_TRUE(!r.success, "second failed");
                ASSERT_TRUE(r.error_kind == SyncErrorKind::BackendError, "backend error");
                ASSERT_EQ(r.error_message, "connection reset", "message");
            } else {
                ASSERT_TRUE(r.success, "provider " << r.provider_id << ": " << r.error_message);
                ASSERT_EQ(r.files_added, 2, "two added");
                ++ok;
            }
        }
        ASSERT_EQ(ok, 2, "others synced");
        ASSERT_EQ(fx.store.count_for_provider(third), 2u, "third persisted");
        ASSERT_EQ(fx.store.count_for_provider(second), 0u, "second untouched");

        fx.script->fail_listing("");
        auto retry = fx.engine.sync_provider(second, SyncRequest{});
        ASSERT_TRUE(retry.success, "second recovers");
        PASS();
    }
    {
        TEST(sync_local_directory_end_to_end);
        auto dir = make_temp_dir("mediasync-sync-local");
        {
            write_file(dir / "photos" / "2024" / "one.jpg", "1");
            write_file(dir / "photos" / "two.heic", "22");
            SqliteCatalogStore store(dir / "catalog.db");
            BackendRegistry registry(store,
                                     BackendDependencies{&store, nullptr, nullptr, dir / "photos"});
            SyncEngine engine(registry, store, store, SyncEngineOptions{1});
            auto backend = registry.get_or_create_default_local_backend();
            auto r = engine.sync_provider(backend->provider_id(), SyncRequest{});
            ASSERT_TRUE(r.success, "sync: " + r.error_message);
            ASSERT_EQ(r.files_added, 2, "two added");
            ASSERT_TRUE(store.find_item(backend->provider_id(), "2024/one.jpg").has_value(),
                        "relative id");

            fs::remove(dir / "photos" / "two.heic");
            auto again = engine.sync_provider(backend->provider_id(), SyncRequest{});
            ASSERT_EQ(again.files_removed, 1, "deleted file removed");
        }
        fs::remove_all(dir);
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 7. Configuration
// ---------------------------------------------------------------------------

static void test_config() {
    std::cout << "\n=== AppConfig ===" << std::endl;

    {
        TEST(cli_command_and_flags);
        const char* args[] = {
            "mediasync",
            "--data-dir", "/tmp/ms",
            "--max-cache-gb", "2",
            "--sync-concurrency", "4",
            "--verbose",
            "sync", "12",
        };
        auto cfg = AppConfig::from_args(10, const_cast<char**>(args));
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->command, "sync", "command");
        ASSERT_EQ(cfg->args.size(), 1u, "one arg");
        ASSERT_EQ(cfg->args[0], "12", "provider arg");
        ASSERT_EQ(cfg->max_cache_bytes, 2ULL * 1024 * 1024 * 1024, "max cache");
        ASSERT_EQ(cfg->sync_concurrency, 4u, "concurrency");
        ASSERT_TRUE(cfg->verbose, "verbose");
        ASSERT_EQ(cfg->catalog_db.string(), "/tmp/ms/catalog.db", "derived catalog path");
        ASSERT_EQ(cfg->cache_dir.string(), "/tmp/ms/cache", "derived cache dir");
        ASSERT_EQ(cfg->default_local_path.string(), "/tmp/ms/photos", "derived local path");
        ASSERT_EMPTY(cfg->validate(), "valid config");
        PASS();
    }
    {
        TEST(cli_rejects_bad_input);
        const char* unknown[] = {"mediasync", "--bogus", "providers"};
        ASSERT_TRUE(!AppConfig::from_args(3, const_cast<char**>(unknown)).has_value(),
                    "unknown option");
        const char* missing[] = {"mediasync", "providers", "--data-dir"};
        ASSERT_TRUE(!AppConfig::from_args(3, const_cast<char**>(missing)).has_value(),
                    "missing value");
        const char* numeric[] = {"mediasync", "--max-cache-gb", "lots", "providers"};
        ASSERT_TRUE(!AppConfig::from_args(4, const_cast<char**>(numeric)).has_value(),
                    "non-numeric value");
        const char* help[] = {"mediasync", "--help"};
        ASSERT_TRUE(!AppConfig::from_args(2, const_cast<char**>(help)).has_value(), "help");
        const char* none[] = {"mediasync"};
        ASSERT_TRUE(!AppConfig::from_args(1, const_cast<char**>(none)).has_value(),
                    "no command");
        PASS();
    }
    {
        TEST(validation_errors);
        AppConfig cfg;
        cfg.apply_defaults();
        ASSERT_NOT_EMPTY(cfg.validate(), "command required");
        cfg.command = "teleport";
        ASSERT_TRUE(cfg.validate().find("unknown command") != std::string::npos, "unknown");
        cfg.command = "add-local";
        cfg.args = {"only-name"};
        ASSERT_TRUE(cfg.validate().find("argument") != std::string::npos, "arity");
        cfg.args = {"name", "/tmp"};
        ASSERT_EMPTY(cfg.validate(), "add-local valid");
        cfg.cache_evict_ratio = 1.5;
        ASSERT_TRUE(cfg.validate().find("cache_evict_ratio") != std::string::npos, "ratio");
        cfg.cache_evict_ratio = 0.8;
        cfg.daemonize = true;
        ASSERT_NOT_EMPTY(cfg.validate(), "daemon only for serve");
        cfg.command = "serve";
        cfg.args.clear();
        ASSERT_EMPTY(cfg.validate(), "serve as daemon");
        cfg.sync_concurrency = 0;
        ASSERT_NOT_EMPTY(cfg.validate(), "zero concurrency");
        PASS();
    }
    {
        TEST(json_overlay);
        auto dir = make_temp_dir("mediasync-config");
        write_file(dir / "config.json", R"({
            "data_dir": "/var/lib/mediasync",
            "max_cache_bytes": 1048576,
            "cache_evict_ratio": 0.5,
            "sync_interval": 60,
            "metrics_file": "/tmp/ms.prom"
        })");
        auto path = (dir / "config.json").string();
        const char* args[] = {"mediasync", "--config", path.c_str(), "--sync-concurrency", "3",
                              "serve"};
        auto cfg = AppConfig::from_args(6, const_cast<char**>(args));
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->data_dir.string(), "/var/lib/mediasync", "data dir");
        ASSERT_EQ(cfg->max_cache_bytes, 1048576u, "max cache");
        ASSERT_EQ(cfg->sync_interval_secs, 60u, "interval");
        ASSERT_EQ(cfg->sync_concurrency, 3u, "cli after config wins");
        ASSERT_EQ(cfg->metrics_file.string(), "/tmp/ms.prom", "metrics file");
        ASSERT_EQ(cfg->catalog_db.string(), "/var/lib/mediasync/catalog.db", "derived");

        write_file(dir / "bad.json", "{ not json");
        AppConfig bad;
        ASSERT_TRUE(!bad.load_json(dir / "bad.json"), "malformed file rejected");
        ASSERT_TRUE(!bad.load_json(dir / "missing.json"), "missing file rejected");
        fs::remove_all(dir);
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 8. Metrics
// ---------------------------------------------------------------------------

static void test_metrics() {
    std::cout << "\n=== Metrics ===" << std::endl;

    auto tmpdir = make_temp_dir("mediasync-metrics");
    auto prom_path = tmpdir / "test.prom";

    {
        TEST(creates_prom_file);
        std::map<std::string, std::string> labels = {{"host", "test"}};
        MetricsExporter exporter(prom_path, std::chrono::seconds(1), labels);
        exporter.start();

        bool created = wait_for([&] { return fs::exists(prom_path); }, 5000);
        exporter.stop();

        ASSERT_TRUE(created, ".prom file should be created");
        auto content = read_file(prom_path);
        ASSERT_TRUE(!content.empty(), ".prom file should not be empty");
        ASSERT_TRUE(content.find("mediasync_syncs_total") != std::string::npos,
                    "should contain mediasync_syncs_total");
        ASSERT_TRUE(content.find("mediasync_cache_bytes") != std::string::npos,
                    "should contain mediasync_cache_bytes");
        ASSERT_TRUE(content.find("mediasync_sync_duration_seconds") != std::string::npos,
                    "should contain mediasync_sync_duration_seconds");
        ASSERT_TRUE(content.find("host=\"test\"") != std::string::npos,
                    "should contain constant label");
        auto tmp_path = prom_path;
        tmp_path += ".tmp";
        ASSERT_TRUE(!fs::exists(tmp_path), ".tmp file should not persist");
        PASS();
    }

    fs::remove(prom_path);

    {
        TEST(engine_and_cache_stats_exported);
        SyncFixture fx("mediasync-metrics-sync");
        ContentCache cache(CacheOptions{fx.dir / "cache", 4096});
        cache_string(cache, "metric bytes");

        MetricsExporter exporter(prom_path, std::chrono::seconds(60), {});
        exporter.set_cache(&cache);
        exporter.set_sync_engine(&fx.engine);
        fx.engine.set_metrics(&exporter);

        fx.script->set_files({make_fd("a.jpg", 1), make_fd("b.jpg", 1)});
        auto r = fx.engine.sync_provider(fx.provider_id, SyncRequest{});
        ASSERT_TRUE(r.success, "sync");
        exporter.stop();
        fx.engine.set_metrics(nullptr);

        auto content = read_file(prom_path);
        ASSERT_TRUE(content.find("mediasync_syncs_total{result=\"success\"} 1") !=
                        std::string::npos,
                    "success counter");
        ASSERT_TRUE(content.find("mediasync_sync_files_total{action=\"added\"} 2") !=
                        std::string::npos,
                    "added counter");
        ASSERT_TRUE(content.find("mediasync_sync_duration_seconds_count 1") != std::string::npos,
                    "duration observed");
        ASSERT_TRUE(content.find("mediasync_cache_entries 1") != std::string::npos,
                    "cache entries gauge");
        ASSERT_TRUE(content.find("mediasync_cache_max_bytes 4096") != std::string::npos,
                    "cache max gauge");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 9. HttpFetcher
// ---------------------------------------------------------------------------

static void test_http_fetcher() {
    std::cout << "\n=== HttpFetcher ===" << std::endl;

    HttpFetcher fetcher(HttpFetcherConfig{std::chrono::milliseconds(2000),
                                          std::chrono::milliseconds(5000)});

    {
        TEST(stopped_token_cancels_before_request);
        std::stop_source ss;
        ss.request_stop();
        auto r = fetcher.get("http://127.0.0.1:1/never", "token", ss.get_token());
        ASSERT_TRUE(r.cancelled, "cancelled");
        ASSERT_TRUE(!r.success, "not successful");
        ASSERT_EQ(r.status_code, 0L, "no status");
        ASSERT_TRUE(r.body.empty(), "no body");
        PASS();
    }
    {
        TEST(closed_port_reports_failure);
        auto r = fetcher.get("http://127.0.0.1:1/photo.jpg", "");
        ASSERT_TRUE(!r.success, "not successful");
        ASSERT_TRUE(!r.cancelled, "not cancelled");
        ASSERT_EQ(r.status_code, 0L, "no HTTP status");
        ASSERT_NOT_EMPTY(r.error_message, "error message set");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 10. Cancellable runner
// ---------------------------------------------------------------------------

static void test_cancellable() {
    std::cout << "\n=== Cancellable runner ===" << std::endl;

    auto tmpdir = make_temp_dir("mediasync-cancellable");
    const auto poll = std::chrono::milliseconds(5);

    {
        TEST(completes_without_stop);
        int value = 0;
        run_cancellable([&](std::stop_token) { value = 42; }, [] { return false; }, poll);
        ASSERT_EQ(value, 42, "worker ran");
        PASS();
    }
    {
        TEST(cancellation_reaches_caller);
        ContentCache cache(CacheOptions{tmpdir / "cache"});
        cache_string(cache, "one");
        cache_string(cache, "two");
        cache_string(cache, "three");

        bool cancelled = false;
        try {
            run_cancellable([&](std::stop_token stop) {
                while (!stop.stop_requested()) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(1));
                }
                cache.evict_lru(0, stop);
            }, [] { return true; }, poll);
        } catch (const OperationCancelled&) {
            cancelled = true;
        }
        ASSERT_TRUE(cancelled, "OperationCancelled rethrown on caller");
        ASSERT_EQ(cache.cache_count(), 3u, "nothing evicted");
        PASS();
    }
    {
        TEST(worker_error_reaches_caller);
        std::string message;
        try {
            run_cancellable([](std::stop_token) {
                throw std::runtime_error("Failed to remove 2 cache entries");
            }, [] { return false; }, poll);
        } catch (const std::runtime_error& e) {
            message = e.what();
        }
        ASSERT_EQ(message, "Failed to remove 2 cache entries", "error rethrown");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main() {
    std::cout << "mediasync test suite" << std::endl;
    std::cout << "====================" << std::endl;

    test_catalog_store();
    test_local_backend();
    test_remote_picker_backend();
    test_backend_registry();
    test_content_cache();
    test_sync_engine();
    test_config();
    test_metrics();
    test_http_fetcher();
    test_cancellable();

    std::cout << "\n====================" << std::endl;
    std::cout << "Results: " << tests_passed << " passed, "
              << tests_failed << " failed" << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
