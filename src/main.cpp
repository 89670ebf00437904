#include "mediasync/backend_registry.hpp"
#include "mediasync/cancellable.hpp"
#include "mediasync/catalog_store.hpp"
#include "mediasync/config.hpp"
#include "mediasync/content_cache.hpp"
#include "mediasync/errors.hpp"
#include "mediasync/http_fetcher.hpp"
#include "mediasync/log.hpp"
#include "mediasync/metrics.hpp"
#include "mediasync/sync_engine.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <ctime>
#include <fcntl.h>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <thread>
#include <unistd.h>

using namespace mediasync;

namespace {
volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int sig) {
    (void)sig;
    g_shutdown_requested = 1;
}

bool daemonize() {
    pid_t pid = fork();
    if (pid < 0) return false;
    if (pid > 0) _exit(0);  // Parent exits

    if (setsid() < 0) return false;

    // Second fork to prevent acquiring a controlling terminal
    pid = fork();
    if (pid < 0) return false;
    if (pid > 0) _exit(0);

    // Redirect stdin to /dev/null; stdout/stderr will be redirected
    // to log file after this function returns.
    close(STDIN_FILENO);
    open("/dev/null", O_RDONLY);  // stdin = fd 0

    return true;
}

void write_pid_file(const std::filesystem::path& path) {
    std::ofstream ofs(path);
    if (ofs) {
        ofs << getpid() << "\n";
    }
}

void install_signal_handlers() {
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

std::string format_time(TimePoint tp) {
    std::time_t t = Clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

std::string format_bytes(uint64_t bytes) {
    char buf[32];
    if (bytes >= 1024ULL * 1024 * 1024) {
        std::snprintf(buf, sizeof(buf), "%.2f GB", bytes / (1024.0 * 1024 * 1024));
    } else if (bytes >= 1024ULL * 1024) {
        std::snprintf(buf, sizeof(buf), "%.2f MB", bytes / (1024.0 * 1024));
    } else {
        std::snprintf(buf, sizeof(buf), "%lu bytes", static_cast<unsigned long>(bytes));
    }
    return buf;
}

bool parse_id(const std::string& s, int64_t& id) {
    try {
        size_t pos = 0;
        id = std::stoll(s, &pos);
        return pos == s.size() && id > 0;
    } catch (const std::logic_error&) {
        return false;
    }
}

bool shutdown_requested() {
    return g_shutdown_requested != 0;
}

void print_result(const SyncResult& r) {
    if (r.success) {
        std::cout << "provider " << r.provider_id << " (" << r.provider_name << "): "
                  << r.files_added << " added, " << r.files_updated << " updated, "
                  << r.files_removed << " removed, " << r.files_skipped << " skipped ("
                  << r.total_files_found << " found, " << r.duration.count() << " ms)"
                  << std::endl;
        for (const auto& e : r.errors) {
            std::cout << "  warning: " << e << std::endl;
        }
    } else {
        std::cout << "provider " << r.provider_id;
        if (!r.provider_name.empty()) std::cout << " (" << r.provider_name << ")";
        std::cout << ": FAILED [" << sync_error_kind_name(r.error_kind) << "] "
                  << r.error_message << std::endl;
    }
}

// Everything a command needs, built from the config
struct Services {
    explicit Services(const AppConfig& config)
        : store(config.catalog_db)
        , cache(CacheOptions{config.cache_dir, config.max_cache_bytes, config.cache_evict_ratio})
        , registry(store, BackendDependencies{&store, &cache, &fetcher, config.default_local_path})
        , engine(registry, store, store, SyncEngineOptions{config.sync_concurrency}) {}

    SqliteCatalogStore store;
    ContentCache cache;
    HttpFetcher fetcher;
    BackendRegistry registry;
    SyncEngine engine;
};

int cmd_sync(Services& s, const AppConfig& config) {
    int64_t id = 0;
    if (!parse_id(config.args[0], id)) {
        std::cerr << "Invalid provider id: " << config.args[0] << std::endl;
        return 1;
    }
    SyncResult result;
    run_cancellable([&](std::stop_token stop) {
        result = s.engine.sync_provider(id, SyncRequest{}, stop);
    }, shutdown_requested);
    print_result(result);
    return result.success ? 0 : 1;
}

int cmd_sync_all(Services& s) {
    std::vector<SyncResult> results;
    run_cancellable([&](std::stop_token stop) {
        results = s.engine.sync_all_providers(SyncRequest{}, stop);
    }, shutdown_requested);
    if (results.empty()) {
        std::cout << "No enabled providers" << std::endl;
    }
    int failures = 0;
    for (const auto& r : results) {
        print_result(r);
        if (!r.success) ++failures;
    }
    return failures == 0 ? 0 : 1;
}

int cmd_scan(Services& s, const AppConfig& config) {
    int64_t id = 0;
    if (!parse_id(config.args[0], id)) {
        std::cerr << "Invalid provider id: " << config.args[0] << std::endl;
        return 1;
    }
    ScanResult result;
    run_cancellable([&](std::stop_token stop) {
        result = s.engine.scan_provider(id, stop);
    }, shutdown_requested);
    if (!result.success) {
        std::cout << "scan failed: " << result.error_message << std::endl;
        return 1;
    }
    std::cout << "total: " << result.total_files_found << std::endl;
    std::cout << "new: " << result.new_files_count << " ("
              << format_bytes(result.new_files_total_size) << ")" << std::endl;
    std::cout << "existing: " << result.existing_files_count << std::endl;
    for (const auto& fd : result.sample_new_files) {
        std::cout << "  + " << fd.file_id << " (" << format_bytes(fd.size) << ")" << std::endl;
    }
    return 0;
}

int cmd_status(Services& s, const AppConfig& config) {
    int64_t id = 0;
    if (!parse_id(config.args[0], id)) {
        std::cerr << "Invalid provider id: " << config.args[0] << std::endl;
        return 1;
    }
    auto record = s.store.find_provider(id);
    if (!record) {
        std::cout << "Provider " << id << " not found" << std::endl;
        return 1;
    }
    std::cout << "id: " << record->id << std::endl;
    std::cout << "name: " << record->name << std::endl;
    std::cout << "type: " << backend_kind_name(record->kind) << std::endl;
    std::cout << "enabled: " << (record->enabled ? "yes" : "no") << std::endl;
    std::cout << "items: " << s.store.count_for_provider(id) << std::endl;
    std::cout << "last-sync: "
              << (record->last_sync ? format_time(*record->last_sync) : std::string("never"))
              << std::endl;
    return 0;
}

int cmd_providers(Services& s) {
    auto providers = s.store.all_providers();
    if (providers.empty()) {
        std::cout << "No providers configured" << std::endl;
        return 0;
    }
    for (const auto& p : providers) {
        std::cout << p.id << "\t" << backend_kind_name(p.kind) << "\t"
                  << (p.enabled ? "enabled " : "disabled") << "\t" << p.name << std::endl;
    }
    return 0;
}

int cmd_add_local(Services& s, const AppConfig& config) {
    ProviderRecord record;
    record.kind = BackendKind::Local;
    record.name = config.args[0];
    record.enabled = true;

    std::error_code ec;
    auto path = std::filesystem::absolute(config.args[1], ec);
    if (ec) path = config.args[1];
    record.configuration = nlohmann::json{{"base_path", path.string()}}.dump();

    auto id = s.store.insert_provider(record);
    auto backend = s.registry.get_backend(id);
    if (!backend || !backend->test_connection({})) {
        std::cout << "Added provider " << id << " (warning: " << path.string()
                  << " is not writable)" << std::endl;
        return 0;
    }
    std::cout << "Added provider " << id << std::endl;
    return 0;
}

int cmd_cache_status(Services& s) {
    auto st = s.cache.status();
    std::cout << "directory: " << s.cache.directory().string() << std::endl;
    std::cout << "entries: " << st.file_count << std::endl;
    std::cout << "size: " << format_bytes(st.total_size_bytes) << " / "
              << format_bytes(st.max_size_bytes) << std::endl;
    char pct[16];
    std::snprintf(pct, sizeof(pct), "%.1f%%", st.usage_percent);
    std::cout << "usage: " << pct << std::endl;
    return 0;
}

int cmd_cache_evict(Services& s, const AppConfig& config) {
    uint64_t target = 0;
    try {
        target = std::stoull(config.args[0]);
    } catch (const std::logic_error&) {
        std::cerr << "Invalid byte count: " << config.args[0] << std::endl;
        return 1;
    }
    int removed = 0;
    run_cancellable([&](std::stop_token stop) {
        removed = s.cache.evict_lru(target, stop);
    }, shutdown_requested);
    std::cout << "Evicted " << removed << " entries, cache now "
              << format_bytes(s.cache.cache_size()) << std::endl;
    return 0;
}

int cmd_cache_clear(Services& s) {
    run_cancellable([&](std::stop_token stop) {
        s.cache.clear_cache(stop);
    }, shutdown_requested);
    std::cout << "Cache cleared" << std::endl;
    return 0;
}

int cmd_serve(Services& s, const AppConfig& config) {
    std::cout << "mediasync running (PID " << getpid() << ")" << std::endl;

    std::jthread syncer([&](std::stop_token stop) {
        while (!stop.stop_requested()) {
            try {
                auto results = s.engine.sync_all_providers(SyncRequest{}, stop);
                for (const auto& r : results) {
                    if (!r.success) {
                        log_warn("Sync of provider %ld failed: %s",
                                 static_cast<long>(r.provider_id), r.error_message.c_str());
                    }
                }
            } catch (const OperationCancelled&) {
                break;
            } catch (const std::exception& e) {
                // Retried on the next pass
                log_error("Sync pass failed: %s", e.what());
            }
            auto deadline = std::chrono::steady_clock::now() +
                            std::chrono::seconds(config.sync_interval_secs);
            while (!stop.stop_requested() && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
        }
    });

    // Wait until shutdown signal, then stop outside signal context.
    auto next_stats = std::chrono::steady_clock::now() +
                      std::chrono::seconds(config.stats_interval_secs);
    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (config.stats_interval_secs > 0 && std::chrono::steady_clock::now() >= next_stats) {
            auto es = s.engine.get_stats();
            auto cs = s.cache.get_stats();
            log_info("stats: syncs ok=%lu failed=%lu cancelled=%lu running=%lu | "
                     "files +%lu ~%lu -%lu | cache %lu bytes, hits=%lu misses=%lu evictions=%lu",
                     static_cast<unsigned long>(es.syncs_completed),
                     static_cast<unsigned long>(es.syncs_failed),
                     static_cast<unsigned long>(es.syncs_cancelled),
                     static_cast<unsigned long>(es.in_progress),
                     static_cast<unsigned long>(es.files_added),
                     static_cast<unsigned long>(es.files_updated),
                     static_cast<unsigned long>(es.files_removed),
                     static_cast<unsigned long>(s.cache.cache_size()),
                     static_cast<unsigned long>(cs.hits),
                     static_cast<unsigned long>(cs.misses),
                     static_cast<unsigned long>(cs.evictions));
            next_stats = std::chrono::steady_clock::now() +
                         std::chrono::seconds(config.stats_interval_secs);
        }
    }

    syncer.request_stop();
    syncer.join();
    return 0;
}

int dispatch(Services& s, const AppConfig& config) {
    const auto& cmd = config.command;
    if (cmd == "sync") return cmd_sync(s, config);
    if (cmd == "sync-all") return cmd_sync_all(s);
    if (cmd == "scan") return cmd_scan(s, config);
    if (cmd == "status") return cmd_status(s, config);
    if (cmd == "providers") return cmd_providers(s);
    if (cmd == "add-local") return cmd_add_local(s, config);
    if (cmd == "cache-status") return cmd_cache_status(s);
    if (cmd == "cache-evict") return cmd_cache_evict(s, config);
    if (cmd == "cache-clear") return cmd_cache_clear(s);
    if (cmd == "serve") return cmd_serve(s, config);
    std::cerr << "Unknown command: " << cmd << std::endl;
    return 1;
}
}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = AppConfig::from_args(argc, argv);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    set_verbose_logging(config.verbose);

    // Daemonize if requested (before log redirect so we fork first)
    if (config.daemonize) {
        if (!daemonize()) {
            std::cerr << "Failed to daemonize" << std::endl;
            return 1;
        }
    }

    // Redirect log output if log file specified (after daemonize)
    if (!config.log_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(
            std::filesystem::path(config.log_file).parent_path(), ec);
        FILE* log = fopen(config.log_file.c_str(), "a");
        if (log) {
            dup2(fileno(log), STDOUT_FILENO);
            dup2(fileno(log), STDERR_FILENO);
            fclose(log);
        }
    }

    std::error_code ec;
    std::filesystem::create_directories(config.data_dir, ec);
    if (ec) {
        std::cerr << "Cannot create data directory " << config.data_dir << ": "
                  << ec.message() << std::endl;
        return 1;
    }
    std::filesystem::create_directories(config.catalog_db.parent_path(), ec);

    if (config.command == "serve") {
        std::cout << "mediasync starting..." << std::endl;
        std::cout << "  data-dir: " << config.data_dir << std::endl;
        std::cout << "  catalog-db: " << config.catalog_db << std::endl;
        std::cout << "  cache-dir: " << config.cache_dir << std::endl;
        std::cout << "  max-cache: " << format_bytes(config.max_cache_bytes) << std::endl;
        std::cout << "  sync-concurrency: " << config.sync_concurrency << std::endl;
        std::cout << "  sync-interval: " << config.sync_interval_secs << "s" << std::endl;
        if (!config.metrics_file.empty()) {
            std::cout << "  metrics-file: " << config.metrics_file << std::endl;
        }
    }

    if (!config.pid_file.empty()) {
        std::filesystem::create_directories(
            std::filesystem::path(config.pid_file).parent_path(), ec);
        write_pid_file(config.pid_file);
    }

    install_signal_handlers();

    int rc = 0;
    try {
        Services services(config);

        std::unique_ptr<MetricsExporter> metrics;
        if (!config.metrics_file.empty()) {
            metrics = std::make_unique<MetricsExporter>(
                config.metrics_file, std::chrono::seconds(config.metrics_interval_secs),
                std::map<std::string, std::string>{});
            metrics->set_cache(&services.cache);
            metrics->set_sync_engine(&services.engine);
            services.engine.set_metrics(metrics.get());
            metrics->start();
        }

        rc = dispatch(services, config);

        if (metrics) {
            metrics->stop();
            services.engine.set_metrics(nullptr);
        }
    } catch (const OperationCancelled&) {
        std::cerr << config.command << ": cancelled" << std::endl;
        rc = 1;
    } catch (const std::exception& e) {
        log_error("%s", e.what());
        rc = 1;
    }

    // Remove PID file
    if (!config.pid_file.empty()) {
        unlink(config.pid_file.c_str());
    }

    if (config.command == "serve") {
        std::cout << "mediasync exited cleanly" << std::endl;
    }
    return rc;
}
