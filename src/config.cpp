#include "mediasync/config.hpp"

#include <fstream>
#include <iostream>
#include <map>
#include <nlohmann/json.hpp>

namespace mediasync {

namespace {

// Number of positional arguments each command takes
const std::map<std::string, size_t>& command_arity() {
    static const std::map<std::string, size_t> arity = {
        {"sync", 1},
        {"sync-all", 0},
        {"scan", 1},
        {"status", 1},
        {"providers", 0},
        {"add-local", 2},
        {"cache-status", 0},
        {"cache-evict", 1},
        {"cache-clear", 0},
        {"serve", 0},
    };
    return arity;
}

void print_usage() {
    std::cerr <<
        "Usage: mediasync [options] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  sync <provider-id>               Sync one provider into the catalog\n"
        "  sync-all                         Sync every enabled provider\n"
        "  scan <provider-id>               Count new files without changing the catalog\n"
        "  status <provider-id>             Show provider details and last sync\n"
        "  providers                        List configured providers\n"
        "  add-local <name> <path>          Register a local directory provider\n"
        "  cache-status                     Show content cache usage\n"
        "  cache-evict <bytes>              Evict cached blobs down to <bytes>\n"
        "  cache-clear                      Remove all cached blobs\n"
        "  serve                            Run periodic sync-all until SIGTERM\n"
        "\n"
        "Options:\n"
        "  --config <path>                  JSON config file\n"
        "  --data-dir <path>                State directory (default: ./mediasync-data)\n"
        "  --catalog-db <path>              Catalog database (default: <data-dir>/catalog.db)\n"
        "  --cache-dir <path>               Content cache (default: <data-dir>/cache)\n"
        "  --local-path <path>              Default local storage (default: <data-dir>/photos)\n"
        "  --max-cache-gb <N>               Max cache size in GB (default: 5)\n"
        "  --max-cache-bytes <N>            Max cache size in bytes\n"
        "  --evict-ratio <R>                Auto-eviction target as fraction of max (default: 0.8)\n"
        "  --sync-concurrency <N>           Providers synced in parallel (default: 2)\n"
        "  --sync-interval <secs>           serve: seconds between sync passes (default: 900)\n"
        "  --stats-interval <secs>          serve: stats reporting interval (default: 60)\n"
        "  --daemon                         Run as daemon\n"
        "  --verbose                        Verbose output\n"
        "  --pid-file <path>                PID file path\n"
        "  --log-file <path>                Log file path\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
        "  --help                           Show this help\n";
}

}  // namespace

std::optional<AppConfig> AppConfig::from_args(int argc, char* argv[]) {
    AppConfig config;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--config") {
                auto* v = next_arg(i, "--config");
                if (!v) return std::nullopt;
                if (!config.load_json(v)) return std::nullopt;
            } else if (arg == "--data-dir") {
                auto* v = next_arg(i, "--data-dir");
                if (!v) return std::nullopt;
                config.data_dir = v;
            } else if (arg == "--catalog-db") {
                auto* v = next_arg(i, "--catalog-db");
                if (!v) return std::nullopt;
                config.catalog_db = v;
            } else if (arg == "--cache-dir") {
                auto* v = next_arg(i, "--cache-dir");
                if (!v) return std::nullopt;
                config.cache_dir = v;
            } else if (arg == "--local-path") {
                auto* v = next_arg(i, "--local-path");
                if (!v) return std::nullopt;
                config.default_local_path = v;
            } else if (arg == "--max-cache-gb") {
                auto* v = next_arg(i, "--max-cache-gb");
                if (!v) return std::nullopt;
                config.max_cache_bytes = std::stoull(v) * 1024ULL * 1024 * 1024;
            } else if (arg == "--max-cache-bytes") {
                auto* v = next_arg(i, "--max-cache-bytes");
                if (!v) return std::nullopt;
                config.max_cache_bytes = std::stoull(v);
            } else if (arg == "--evict-ratio") {
                auto* v = next_arg(i, "--evict-ratio");
                if (!v) return std::nullopt;
                config.cache_evict_ratio = std::stod(v);
            } else if (arg == "--sync-concurrency") {
                auto* v = next_arg(i, "--sync-concurrency");
                if (!v) return std::nullopt;
                config.sync_concurrency = std::stoull(v);
            } else if (arg == "--sync-interval") {
                auto* v = next_arg(i, "--sync-interval");
                if (!v) return std::nullopt;
                config.sync_interval_secs = std::stoull(v);
            } else if (arg == "--stats-interval") {
                auto* v = next_arg(i, "--stats-interval");
                if (!v) return std::nullopt;
                config.stats_interval_secs = std::stoull(v);
            } else if (arg == "--daemon") {
                config.daemonize = true;
            } else if (arg == "--verbose") {
                config.verbose = true;
            } else if (arg == "--pid-file") {
                auto* v = next_arg(i, "--pid-file");
                if (!v) return std::nullopt;
                config.pid_file = v;
            } else if (arg == "--log-file") {
                auto* v = next_arg(i, "--log-file");
                if (!v) return std::nullopt;
                config.log_file = v;
            } else if (arg == "--metrics-file") {
                auto* v = next_arg(i, "--metrics-file");
                if (!v) return std::nullopt;
                config.metrics_file = v;
            } else if (arg == "--metrics-interval") {
                auto* v = next_arg(i, "--metrics-interval");
                if (!v) return std::nullopt;
                config.metrics_interval_secs = std::stoull(v);
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return std::nullopt;
            } else if (arg.size() > 1 && arg[0] == '-') {
                std::cerr << "Error: unknown option: " << arg << "\n";
                return std::nullopt;
            } else if (config.command.empty()) {
                config.command = arg;
            } else {
                config.args.push_back(arg);
            }
        }
    } catch (const std::logic_error& e) {
        // std::stoull / std::stod on a non-numeric value
        std::cerr << "Error: invalid numeric argument (" << e.what() << ")\n";
        return std::nullopt;
    }

    if (config.command.empty()) {
        print_usage();
        return std::nullopt;
    }

    config.apply_defaults();
    return config;
}

bool AppConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("data_dir")) data_dir = j["data_dir"].get<std::string>();
        if (j.contains("catalog_db")) catalog_db = j["catalog_db"].get<std::string>();
        if (j.contains("cache_dir")) cache_dir = j["cache_dir"].get<std::string>();
        if (j.contains("default_local_path"))
            default_local_path = j["default_local_path"].get<std::string>();
        if (j.contains("max_cache_gb"))
            max_cache_bytes = j["max_cache_gb"].get<uint64_t>() * 1024ULL * 1024 * 1024;
        if (j.contains("max_cache_bytes")) max_cache_bytes = j["max_cache_bytes"].get<uint64_t>();
        if (j.contains("cache_evict_ratio")) cache_evict_ratio = j["cache_evict_ratio"].get<double>();
        if (j.contains("sync_concurrency")) sync_concurrency = j["sync_concurrency"].get<size_t>();
        if (j.contains("sync_interval")) sync_interval_secs = j["sync_interval"].get<size_t>();
        if (j.contains("stats_interval")) stats_interval_secs = j["stats_interval"].get<size_t>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("pid_file")) pid_file = j["pid_file"].get<std::string>();
        if (j.contains("log_file")) log_file = j["log_file"].get<std::string>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void AppConfig::apply_defaults() {
    if (data_dir.empty()) {
        data_dir = "mediasync-data";
    }
    if (catalog_db.empty()) catalog_db = data_dir / "catalog.db";
    if (cache_dir.empty()) cache_dir = data_dir / "cache";
    if (default_local_path.empty()) default_local_path = data_dir / "photos";
}

std::string AppConfig::validate() const {
    if (command.empty()) return "a command is required";
    auto it = command_arity().find(command);
    if (it == command_arity().end()) return "unknown command: " + command;
    if (args.size() != it->second) {
        return command + " takes " + std::to_string(it->second) + " argument(s), got " +
               std::to_string(args.size());
    }
    if (daemonize && command != "serve") return "--daemon is only valid with serve";
    if (max_cache_bytes == 0) return "max_cache_bytes must be > 0";
    if (cache_evict_ratio <= 0.0 || cache_evict_ratio > 1.0)
        return "cache_evict_ratio must be in (0, 1]";
    if (sync_concurrency == 0) return "sync_concurrency must be > 0";
    if (command == "serve" && sync_interval_secs == 0) return "sync_interval must be > 0";
    return {};
}

}  // namespace mediasync
