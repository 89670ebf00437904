#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace mediasync {

class ContentCache;
class SyncEngine;

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        double secs = std::chrono::duration<double>(elapsed).count();
        histogram_.Observe(secs);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports mediasync metrics to a Prometheus textfile for node_exporter pickup.
///
/// Sync and cache counters are driven from the get_stats() snapshots of the
/// attached SyncEngine and ContentCache; the writer thread turns their deltas
/// into counter increments before each write. The file is replaced with an
/// atomic temp+rename.
class MetricsExporter {
public:
    /// @param prom_file_path  Path to the .prom output file.
    /// @param write_interval  How often to write the file.
    /// @param labels          Constant labels applied to all metrics.
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Set pointers for snapshots (not owned).
    void set_cache(ContentCache* cache) { cache_ = cache; }
    void set_sync_engine(SyncEngine* engine) { engine_ = engine; }

    /// Start the background writer thread.
    void start();

    /// Stop the background writer thread (writes one final snapshot).
    void stop();

    prometheus::Histogram& sync_duration() { return *sync_duration_; }

private:
    void writer_loop();
    void update_gauges();
    void write_file();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    ContentCache* cache_ = nullptr;
    SyncEngine* engine_ = nullptr;

    // Previous stats for delta computation
    std::mutex snapshot_mutex_;
    uint64_t prev_syncs_completed_ = 0;
    uint64_t prev_syncs_failed_ = 0;
    uint64_t prev_syncs_cancelled_ = 0;
    uint64_t prev_files_added_ = 0;
    uint64_t prev_files_updated_ = 0;
    uint64_t prev_files_removed_ = 0;
    uint64_t prev_files_skipped_ = 0;
    uint64_t prev_cache_hits_ = 0;
    uint64_t prev_cache_misses_ = 0;
    uint64_t prev_evictions_ = 0;

    // --- Counters ---
    prometheus::Counter* syncs_success_;
    prometheus::Counter* syncs_failure_;
    prometheus::Counter* syncs_cancelled_;
    prometheus::Counter* files_added_;
    prometheus::Counter* files_updated_;
    prometheus::Counter* files_removed_;
    prometheus::Counter* files_skipped_;
    prometheus::Counter* cache_hits_;
    prometheus::Counter* cache_misses_;
    prometheus::Counter* evictions_total_;

    // --- Gauges ---
    prometheus::Gauge* cache_bytes_;
    prometheus::Gauge* cache_entries_;
    prometheus::Gauge* cache_max_bytes_;
    prometheus::Gauge* syncs_in_progress_;

    // --- Histograms ---
    prometheus::Histogram* sync_duration_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace mediasync
