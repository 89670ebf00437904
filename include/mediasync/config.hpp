#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mediasync {

/// Configuration for the mediasync command line tool and daemon.
struct AppConfig {
    // Root of all state; catalog_db, cache_dir and default_local_path
    // default to locations beneath it.
    std::filesystem::path data_dir;
    std::filesystem::path catalog_db;
    std::filesystem::path cache_dir;
    std::filesystem::path default_local_path;

    // Content cache
    uint64_t max_cache_bytes = 5ULL * 1024 * 1024 * 1024;  // 5 GB
    double cache_evict_ratio = 0.8;

    // Sync
    size_t sync_concurrency = 2;
    size_t sync_interval_secs = 900;  // serve: period between sync-all passes
    size_t stats_interval_secs = 60;

    // Daemon
    bool daemonize = false;
    bool verbose = false;
    std::filesystem::path pid_file;
    std::filesystem::path log_file;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = 15;

    // Command and its positional arguments
    std::string command;
    std::vector<std::string> args;

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error (prints usage to stderr).
    static std::optional<AppConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill in derived paths based on data_dir.
    void apply_defaults();

    /// Validate the command and limits. Returns error message or empty string.
    std::string validate() const;
};

}  // namespace mediasync
