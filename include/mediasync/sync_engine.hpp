#pragma once

#include "mediasync/types.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <stop_token>
#include <unordered_map>
#include <vector>

namespace mediasync {

class BackendRegistry;
class CatalogStore;
class MetricsExporter;
class ProviderStore;

/// Per-provider single-flight registry of running syncs.
///
/// Registration is an atomic check-and-insert under one mutex. Each run owns
/// its own stop_source and a small mutex guarding its progress snapshot, so
/// status readers never wait on the sync itself.
class SyncRunRegistry {
public:
    struct Run {
        int64_t provider_id = 0;
        std::stop_source stop;
        std::mutex mutex;  // Guards status
        SyncStatus status;
    };

    /// Releases the registration on destruction.
    class RunGuard {
    public:
        RunGuard(SyncRunRegistry& registry, std::shared_ptr<Run> run)
            : registry_(registry), run_(std::move(run)) {}
        ~RunGuard() { registry_.release(run_); }

        RunGuard(const RunGuard&) = delete;
        RunGuard& operator=(const RunGuard&) = delete;

        Run& run() { return *run_; }

    private:
        SyncRunRegistry& registry_;
        std::shared_ptr<Run> run_;
    };

    /// Null if a run for this provider is already registered.
    std::unique_ptr<RunGuard> try_acquire(int64_t provider_id);

    std::shared_ptr<Run> find(int64_t provider_id) const;
    size_t active_count() const;

private:
    void release(const std::shared_ptr<Run>& run);

    mutable std::mutex mutex_;
    std::unordered_map<int64_t, std::shared_ptr<Run>> runs_;
};

struct SyncEngineOptions {
    size_t sync_concurrency = 2;  // workers used by sync_all_providers
};

/// Reconciles provider listings into the catalog.
///
/// A sync lists the backend, diffs every descriptor against the catalog rows
/// of that provider and persists all adds, updates and removals in one
/// transaction. Only one sync per provider runs at a time; a second request
/// fails immediately without touching the backend or the catalog.
class SyncEngine {
public:
    SyncEngine(BackendRegistry& backends,
               CatalogStore& catalog,
               ProviderStore& providers,
               SyncEngineOptions options = {},
               std::shared_ptr<SyncRunRegistry> runs = nullptr);

    SyncEngine(const SyncEngine&) = delete;
    SyncEngine& operator=(const SyncEngine&) = delete;

    void set_metrics(MetricsExporter* metrics) { metrics_ = metrics; }

    /// Never throws for backend or catalog failures; they come back as a
    /// failed result with error_kind set.
    SyncResult sync_provider(int64_t provider_id,
                             const SyncRequest& request,
                             std::stop_token stop = {});

    /// One result per enabled provider, in provider order.
    std::vector<SyncResult> sync_all_providers(const SyncRequest& request,
                                               std::stop_token stop = {});

    SyncStatus get_sync_status(int64_t provider_id);

    /// Request stop of a running sync. Returns false if none is running.
    bool cancel_sync(int64_t provider_id);

    /// Dry run: count new and existing files without writing anything.
    ScanResult scan_provider(int64_t provider_id, std::stop_token stop = {});

    struct Stats {
        uint64_t syncs_completed = 0;
        uint64_t syncs_failed = 0;
        uint64_t syncs_cancelled = 0;
        uint64_t files_added = 0;
        uint64_t files_updated = 0;
        uint64_t files_removed = 0;
        uint64_t files_skipped = 0;
        uint64_t in_progress = 0;
    };
    Stats get_stats() const;

private:
    SyncResult run_sync(SyncRunRegistry::Run& run, const SyncRequest& request,
                        std::stop_token stop, TimePoint start_time);
    void record_result(const SyncResult& result);

    BackendRegistry& backends_;
    CatalogStore& catalog_;
    ProviderStore& providers_;
    SyncEngineOptions options_;
    std::shared_ptr<SyncRunRegistry> runs_;
    MetricsExporter* metrics_ = nullptr;

    mutable std::mutex results_mutex_;
    std::unordered_map<int64_t, SyncResult> last_results_;

    mutable std::mutex stats_mutex_;
    Stats stats_;
};

}  // namespace mediasync
