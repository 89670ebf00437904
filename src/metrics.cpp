#include "mediasync/metrics.hpp"
#include "mediasync/content_cache.hpp"
#include "mediasync/log.hpp"
#include "mediasync/sync_engine.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace mediasync {

namespace {

// Increment `counter` by how far `current` moved past `prev`
void advance(prometheus::Counter& counter, uint64_t current, uint64_t& prev) {
    if (current > prev) {
        counter.Increment(static_cast<double>(current - prev));
        prev = current;
    }
}

}  // namespace

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& syncs_family = prometheus::BuildCounter()
        .Name("mediasync_syncs_total")
        .Help("Total provider syncs finished")
        .Labels(labels)
        .Register(*registry_);
    syncs_success_ = &syncs_family.Add({{"result", "success"}});
    syncs_failure_ = &syncs_family.Add({{"result", "failure"}});
    syncs_cancelled_ = &syncs_family.Add({{"result", "cancelled"}});

    auto& files_family = prometheus::BuildCounter()
        .Name("mediasync_sync_files_total")
        .Help("Catalog changes applied by syncs")
        .Labels(labels)
        .Register(*registry_);
    files_added_ = &files_family.Add({{"action", "added"}});
    files_updated_ = &files_family.Add({{"action", "updated"}});
    files_removed_ = &files_family.Add({{"action", "removed"}});
    files_skipped_ = &files_family.Add({{"action", "skipped"}});

    cache_hits_ = &prometheus::BuildCounter()
        .Name("mediasync_cache_hits_total")
        .Help("Content cache lookups served from disk")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    cache_misses_ = &prometheus::BuildCounter()
        .Name("mediasync_cache_misses_total")
        .Help("Content cache lookups that missed")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    evictions_total_ = &prometheus::BuildCounter()
        .Name("mediasync_evictions_total")
        .Help("Total cache entries evicted")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Gauges ---

    auto gauge_reg = [&](const std::string& name, const std::string& help) -> prometheus::Gauge& {
        return prometheus::BuildGauge()
            .Name(name)
            .Help(help)
            .Labels(labels)
            .Register(*registry_)
            .Add({});
    };

    cache_bytes_ = &gauge_reg("mediasync_cache_bytes", "Current cache size in bytes");
    cache_entries_ = &gauge_reg("mediasync_cache_entries", "Number of cached blobs");
    cache_max_bytes_ = &gauge_reg("mediasync_cache_max_bytes", "Maximum cache size in bytes");
    syncs_in_progress_ = &gauge_reg("mediasync_syncs_in_progress", "Provider syncs currently running");

    // --- Histograms ---

    sync_duration_ = &prometheus::BuildHistogram()
        .Name("mediasync_sync_duration_seconds")
        .Help("Provider sync duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.05, 0.1, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300, 900});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
    }
    // Always write a final snapshot
    update_gauges();
    write_file();
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        update_gauges();
        write_file();
    }
}

void MetricsExporter::update_gauges() {
    std::lock_guard lock(snapshot_mutex_);

    if (cache_) {
        auto status = cache_->status();
        cache_bytes_->Set(static_cast<double>(status.total_size_bytes));
        cache_entries_->Set(static_cast<double>(status.file_count));
        cache_max_bytes_->Set(static_cast<double>(status.max_size_bytes));

        auto cs = cache_->get_stats();
        advance(*cache_hits_, cs.hits, prev_cache_hits_);
        advance(*cache_misses_, cs.misses, prev_cache_misses_);
        advance(*evictions_total_, cs.evictions, prev_evictions_);
    }

    if (engine_) {
        auto ss = engine_->get_stats();
        syncs_in_progress_->Set(static_cast<double>(ss.in_progress));
        advance(*syncs_success_, ss.syncs_completed, prev_syncs_completed_);
        advance(*syncs_failure_, ss.syncs_failed, prev_syncs_failed_);
        advance(*syncs_cancelled_, ss.syncs_cancelled, prev_syncs_cancelled_);
        advance(*files_added_, ss.files_added, prev_files_added_);
        advance(*files_updated_, ss.files_updated, prev_files_updated_);
        advance(*files_removed_, ss.files_removed, prev_files_removed_);
        advance(*files_skipped_, ss.files_skipped, prev_files_skipped_);
    }
}

void MetricsExporter::write_file() {
    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) {
        log_warn("Cannot write metrics file %s", tmp_path.c_str());
        return;
    }
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) return;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    if (ec) {
        log_warn("Cannot replace metrics file %s: %s", prom_file_path_.c_str(),
                 ec.message().c_str());
    }
}

}  // namespace mediasync
