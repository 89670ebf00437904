#include "mediasync/sync_engine.hpp"
#include "mediasync/backend_registry.hpp"
#include "mediasync/catalog_store.hpp"
#include "mediasync/errors.hpp"
#include "mediasync/log.hpp"
#include "mediasync/metrics.hpp"

#include "meridian/core/thread_pool.hpp"

#include <algorithm>
#include <future>
#include <optional>
#include <unordered_set>

namespace mediasync {

namespace {

constexpr const char* MSG_ALREADY_RUNNING = "A sync is already in progress for this provider";
constexpr const char* MSG_NOT_FOUND = "Storage provider not found or disabled";
constexpr const char* MSG_CANCELLED = "Sync was cancelled";

constexpr size_t SCAN_SAMPLE_SIZE = 10;

SyncResult failed_result(int64_t provider_id, const std::string& provider_name,
                         SyncErrorKind kind, const std::string& message, TimePoint start_time) {
    SyncResult result;
    result.success = false;
    result.error_kind = kind;
    result.provider_id = provider_id;
    result.provider_name = provider_name;
    result.start_time = start_time;
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now() - start_time);
    result.error_message = message;
    return result;
}

bool differs(const FileDescriptor& fd, const CatalogItem& item) {
    return fd.size != item.size ||
           fd.media_kind != item.media_kind ||
           fd.width.value_or(0) != item.width ||
           fd.height.value_or(0) != item.height;
}

CatalogItem new_item(int64_t provider_id, const FileDescriptor& fd, TimePoint now) {
    CatalogItem item;
    item.provider_id = provider_id;
    item.provider_file_id = fd.file_id;
    item.filename = fd.name;
    item.file_path = fd.full_path.empty() ? fd.file_id : fd.full_path;
    item.size = fd.size;
    item.media_kind = fd.media_kind;
    item.width = fd.width.value_or(0);
    item.height = fd.height.value_or(0);
    item.date_taken = fd.created;
    item.first_seen = now;
    item.updated_at = now;
    return item;
}

void set_progress(SyncRunRegistry::Run& run, int percent, std::string operation,
                  int processed, int total) {
    std::lock_guard<std::mutex> lock(run.mutex);
    run.status.progress_percent = percent;
    run.status.current_operation = std::move(operation);
    run.status.files_processed = processed;
    run.status.total_files = total;
}

}  // namespace

// --- SyncRunRegistry ---

std::unique_ptr<SyncRunRegistry::RunGuard> SyncRunRegistry::try_acquire(int64_t provider_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto run = std::make_shared<Run>();
    run->provider_id = provider_id;
    auto [it, inserted] = runs_.try_emplace(provider_id, run);
    if (!inserted) {
        return nullptr;
    }
    return std::make_unique<RunGuard>(*this, std::move(run));
}

void SyncRunRegistry::release(const std::shared_ptr<Run>& run) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run->provider_id);
    if (it != runs_.end() && it->second == run) {
        runs_.erase(it);
    }
}

std::shared_ptr<SyncRunRegistry::Run> SyncRunRegistry::find(int64_t provider_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(provider_id);
    return it == runs_.end() ? nullptr : it->second;
}

size_t SyncRunRegistry::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return runs_.size();
}

// --- SyncEngine ---

SyncEngine::SyncEngine(BackendRegistry& backends,
                       CatalogStore& catalog,
                       ProviderStore& providers,
                       SyncEngineOptions options,
                       std::shared_ptr<SyncRunRegistry> runs)
    : backends_(backends)
    , catalog_(catalog)
    , providers_(providers)
    , options_(options)
    , runs_(runs ? std::move(runs) : std::make_shared<SyncRunRegistry>()) {
    if (options_.sync_concurrency == 0) {
        options_.sync_concurrency = 1;
    }
}

SyncResult SyncEngine::sync_provider(int64_t provider_id,
                                     const SyncRequest& request,
                                     std::stop_token stop) {
    auto start_time = Clock::now();

    auto guard = runs_->try_acquire(provider_id);
    if (!guard) {
        log_warn("Sync for provider %ld rejected: already running",
                 static_cast<long>(provider_id));
        auto result = failed_result(provider_id, "", SyncErrorKind::AlreadyRunning,
                                    MSG_ALREADY_RUNNING, start_time);
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.syncs_failed++;
        }
        return result;
    }

    auto& run = guard->run();
    {
        std::lock_guard<std::mutex> lock(run.mutex);
        run.status.provider_id = provider_id;
        run.status.is_in_progress = true;
        run.status.progress_percent = 0;
        run.status.current_operation = "Scanning files...";
        run.status.start_time = start_time;
    }

    // Either the caller or cancel_sync() can stop the run
    std::stop_callback link(stop, [&run] { run.stop.request_stop(); });

    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->sync_duration());

    auto result = run_sync(run, request, run.stop.get_token(), start_time);
    record_result(result);
    return result;
}

SyncResult SyncEngine::run_sync(SyncRunRegistry::Run& run, const SyncRequest& request,
                                std::stop_token stop, TimePoint start_time) {
    const int64_t provider_id = run.provider_id;
    std::string provider_name;

    try {
        auto backend = backends_.get_backend(provider_id, stop);
        if (!backend) {
            return failed_result(provider_id, "", SyncErrorKind::NotFound, MSG_NOT_FOUND,
                                 start_time);
        }
        provider_name = backend->display_name();
        log_info("Starting sync for provider %ld (%s)", static_cast<long>(provider_id),
                 provider_name.c_str());

        ListOptions list_options;
        list_options.folder_id = request.folder_id;
        list_options.recursive = request.recursive;
        auto listing = backend->list_files(list_options, stop);

        std::vector<const FileDescriptor*> files;
        files.reserve(listing.size());
        for (const auto& fd : listing) {
            if (!fd.is_folder) files.push_back(&fd);
        }
        const int total = static_cast<int>(files.size());
        set_progress(run, 10, "Found " + std::to_string(total) + " files, processing...", 0, total);

        std::unordered_map<std::string, CatalogItem> existing;
        for (auto& item : catalog_.items_for_provider(provider_id)) {
            existing.emplace(item.provider_file_id, std::move(item));
        }

        SyncResult result;
        result.provider_id = provider_id;
        result.provider_name = provider_name;
        result.start_time = start_time;
        result.total_files_found = total;

        CatalogChanges changes;
        std::unordered_set<std::string> seen;
        const auto now = Clock::now();
        const bool compare_existing = request.full_sync || !request.skip_existing;

        int processed = 0;
        for (const auto* fd : files) {
            if (stop.stop_requested()) throw OperationCancelled();
            ++processed;

            if (fd->file_id.empty()) {
                result.errors.push_back("Error processing " + fd->name + ": empty file id");
            } else if (!seen.insert(fd->file_id).second) {
                result.errors.push_back("Error processing " + fd->name + ": duplicate file id " +
                                        fd->file_id);
            } else if (auto it = existing.find(fd->file_id); it == existing.end()) {
                if (request.max_files <= 0 ||
                    static_cast<int>(changes.adds.size()) < request.max_files) {
                    changes.adds.push_back(new_item(provider_id, *fd, now));
                }
            } else if (compare_existing && differs(*fd, it->second)) {
                auto updated = it->second;
                updated.size = fd->size;
                updated.media_kind = fd->media_kind;
                updated.width = fd->width.value_or(0);
                updated.height = fd->height.value_or(0);
                updated.updated_at = now;
                changes.updates.push_back(std::move(updated));
            } else {
                result.files_skipped++;
            }

            set_progress(run, 10 + 80 * processed / std::max(total, 1),
                         "Processing files (" + std::to_string(processed) + "/" +
                             std::to_string(total) + ")...",
                         processed, total);
        }

        if (request.remove_deleted) {
            set_progress(run, 95, "Checking for deleted files...", processed, total);
            for (const auto& [file_id, item] : existing) {
                if (!seen.count(file_id)) {
                    changes.removes.push_back(item.id);
                }
            }
        }

        for (const auto& error : result.errors) {
            log_warn("Provider %ld: %s", static_cast<long>(provider_id), error.c_str());
        }

        if (!changes.adds.empty() || !changes.updates.empty() || !changes.removes.empty()) {
            catalog_.apply_changes(changes, stop);
        }
        providers_.touch_last_sync(provider_id, Clock::now());

        result.success = true;
        result.files_added = static_cast<int>(changes.adds.size());
        result.files_updated = static_cast<int>(changes.updates.size());
        result.files_removed = static_cast<int>(changes.removes.size());
        result.total_files_processed = result.files_added + result.files_updated +
                                       result.files_removed + result.files_skipped;
        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            Clock::now() - start_time);

        set_progress(run, 100, "Completed", processed, total);
        log_info("Sync completed for provider %ld: %d added, %d updated, %d removed, %d skipped",
                 static_cast<long>(provider_id), result.files_added, result.files_updated,
                 result.files_removed, result.files_skipped);
        return result;
    } catch (const OperationCancelled&) {
        log_info("Sync for provider %ld cancelled", static_cast<long>(provider_id));
        return failed_result(provider_id, provider_name, SyncErrorKind::Cancelled, MSG_CANCELLED,
                             start_time);
    } catch (const std::exception& e) {
        log_error("Error syncing provider %ld: %s", static_cast<long>(provider_id), e.what());
        return failed_result(provider_id, provider_name, SyncErrorKind::BackendError, e.what(),
                             start_time);
    }
}

void SyncEngine::record_result(const SyncResult& result) {
    {
        std::lock_guard<std::mutex> lock(results_mutex_);
        last_results_[result.provider_id] = result;
    }

    std::lock_guard<std::mutex> lock(stats_mutex_);
    if (result.success) {
        stats_.syncs_completed++;
        stats_.files_added += static_cast<uint64_t>(result.files_added);
        stats_.files_updated += static_cast<uint64_t>(result.files_updated);
        stats_.files_removed += static_cast<uint64_t>(result.files_removed);
        stats_.files_skipped += static_cast<uint64_t>(result.files_skipped);
    } else if (result.error_kind == SyncErrorKind::Cancelled) {
        stats_.syncs_cancelled++;
    } else {
        stats_.syncs_failed++;
    }
}

std::vector<SyncResult> SyncEngine::sync_all_providers(const SyncRequest& request,
                                                       std::stop_token stop) {
    auto providers = providers_.enabled_providers();
    std::vector<SyncResult> results;
    results.reserve(providers.size());

    auto sync_one = [this, &request, stop](const ProviderRecord& record) {
        if (stop.stop_requested()) {
            return failed_result(record.id, record.name, SyncErrorKind::Cancelled, MSG_CANCELLED,
                                 Clock::now());
        }
        return sync_provider(record.id, request, stop);
    };

    if (options_.sync_concurrency <= 1 || providers.size() <= 1) {
        for (const auto& record : providers) {
            results.push_back(sync_one(record));
        }
        return results;
    }

    meridian::ThreadPool pool(std::min(options_.sync_concurrency, providers.size()));
    std::vector<std::future<SyncResult>> futures;
    futures.reserve(providers.size());
    for (const auto& record : providers) {
        futures.push_back(pool.submit([&sync_one, &record]() {
            return sync_one(record);
        }));
    }

    for (size_t i = 0; i < futures.size(); ++i) {
        try {
            results.push_back(futures[i].get());
        } catch (const std::exception& e) {
            log_error("Sync task for provider %ld failed: %s",
                      static_cast<long>(providers[i].id), e.what());
            results.push_back(failed_result(providers[i].id, providers[i].name,
                                            SyncErrorKind::BackendError, e.what(), Clock::now()));
        }
    }
    pool.shutdown(true);
    return results;
}

SyncStatus SyncEngine::get_sync_status(int64_t provider_id) {
    SyncStatus status;
    if (auto run = runs_->find(provider_id)) {
        std::lock_guard<std::mutex> lock(run->mutex);
        status = run->status;
    } else {
        status.provider_id = provider_id;
        status.is_in_progress = false;
    }

    std::lock_guard<std::mutex> lock(results_mutex_);
    auto it = last_results_.find(provider_id);
    if (it != last_results_.end()) {
        status.last_result = it->second;
        if (!status.is_in_progress) status.progress_percent = 100;
    }
    return status;
}

bool SyncEngine::cancel_sync(int64_t provider_id) {
    auto run = runs_->find(provider_id);
    if (!run) {
        return false;
    }
    run->stop.request_stop();
    log_info("Cancellation requested for provider %ld", static_cast<long>(provider_id));
    return true;
}

ScanResult SyncEngine::scan_provider(int64_t provider_id, std::stop_token stop) {
    ScanResult result;
    result.provider_id = provider_id;

    try {
        auto backend = backends_.get_backend(provider_id, stop);
        if (!backend) {
            result.error_message = MSG_NOT_FOUND;
            return result;
        }

        auto listing = backend->list_files(ListOptions{}, stop);

        std::unordered_set<std::string> known;
        for (const auto& item : catalog_.items_for_provider(provider_id)) {
            known.insert(item.provider_file_id);
        }

        for (auto& fd : listing) {
            if (stop.stop_requested()) throw OperationCancelled();
            if (fd.is_folder) continue;
            result.total_files_found++;
            if (known.count(fd.file_id)) {
                result.existing_files_count++;
                continue;
            }
            result.new_files_count++;
            result.new_files_total_size += fd.size;
            if (result.sample_new_files.size() < SCAN_SAMPLE_SIZE) {
                result.sample_new_files.push_back(std::move(fd));
            }
        }
        result.success = true;
    } catch (const OperationCancelled&) {
        result.error_message = "Scan was cancelled";
    } catch (const std::exception& e) {
        log_error("Error scanning provider %ld: %s", static_cast<long>(provider_id), e.what());
        result.error_message = e.what();
    }
    return result;
}

SyncEngine::Stats SyncEngine::get_stats() const {
    Stats s;
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        s = stats_;
    }
    s.in_progress = runs_->active_count();
    return s;
}

}  // namespace mediasync
