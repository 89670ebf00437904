#include "mediasync/catalog_store.hpp"
#include "mediasync/content_cache.hpp"
#include "mediasync/errors.hpp"
#include "mediasync/http_fetcher.hpp"
#include "mediasync/log.hpp"
#include "mediasync/storage_backend.hpp"
#include "backends.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace mediasync {

namespace fs = std::filesystem;

namespace {

constexpr const char* PICKER_SCOPE =
    "https://www.googleapis.com/auth/photospicker.mediaitems.readonly";

// Configuration keys holding credentials; removed on disconnect
constexpr const char* CREDENTIAL_KEYS[] = {
    "access_token", "refresh_token", "access_token_expiry", "granted_scopes",
};

bool is_http_url(const std::string& s) {
    return s.starts_with("http://") || s.starts_with("https://");
}

std::vector<std::string> split_scopes(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream in(s);
    std::string scope;
    while (in >> scope) out.push_back(scope);
    return out;
}

std::string lower_extension(const std::string& name) {
    auto ext = fs::path(name).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

// Read-only backend over media picked in a remote photo service. Listing is
// served from the catalog; bytes are pulled from the origin once and then
// served from the content cache.
class RemotePickerBackend : public StorageBackend {
public:
    explicit RemotePickerBackend(const BackendDependencies& deps)
        : catalog_(deps.catalog), cache_(deps.cache), fetcher_(deps.fetcher) {}

    BackendKind kind() const override { return BackendKind::GooglePhotos; }
    std::string type_name() const override { return "google_photos"; }

    void initialize(int64_t provider_id,
                    const std::string& display_name,
                    const std::string& config_json) override {
        provider_id_ = provider_id;
        display_name_ = display_name;
        settings_ = Settings{};

        if (config_json.empty()) return;

        auto j = nlohmann::json::parse(config_json, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            log_warn("Provider %ld: malformed picker configuration, using defaults",
                     static_cast<long>(provider_id));
            return;
        }

        try {
            settings_.client_id = j.value("client_id", std::string());
            settings_.client_secret = j.value("client_secret", std::string());
            settings_.refresh_token = j.value("refresh_token", std::string());
            settings_.access_token = j.value("access_token", std::string());
            settings_.access_token_expiry = j.value("access_token_expiry", std::string());
            settings_.enable_local_cache = j.value("enable_local_cache", true);
            settings_.max_cache_size_bytes = j.value("max_cache_size_bytes", uint64_t{0});

            if (j.contains("granted_scopes")) {
                const auto& scopes = j["granted_scopes"];
                if (scopes.is_array()) {
                    for (const auto& s : scopes) {
                        if (s.is_string()) settings_.granted_scopes.push_back(s.get<std::string>());
                    }
                } else if (scopes.is_string()) {
                    settings_.granted_scopes = split_scopes(scopes.get<std::string>());
                }
            }
        } catch (const nlohmann::json::exception& e) {
            log_warn("Provider %ld: invalid picker configuration (%s), using defaults",
                     static_cast<long>(provider_id), e.what());
            settings_ = Settings{};
        }
    }

    std::vector<FileDescriptor> list_files(const ListOptions& options,
                                           std::stop_token stop) override {
        (void)options;  // picked media has no folder structure
        std::vector<FileDescriptor> files;
        if (!catalog_) return files;

        for (const auto& item : catalog_->items_for_provider(provider_id_)) {
            if (stop.stop_requested()) throw OperationCancelled();
            FileDescriptor fd;
            fd.file_id = item.provider_file_id;
            fd.name = item.filename;
            fd.full_path = item.file_path;
            fd.size = item.size;
            fd.media_kind = item.media_kind;
            fd.content_type = content_type_for_extension(lower_extension(item.filename));
            if (item.width > 0) fd.width = item.width;
            if (item.height > 0) fd.height = item.height;
            fd.created = item.date_taken;
            fd.modified = item.updated_at;
            files.push_back(std::move(fd));
        }
        return files;
    }

    UploadResult upload(const std::string& file_name,
                        std::istream& data,
                        const std::string& content_type,
                        std::stop_token stop) override {
        (void)file_name;
        (void)data;
        (void)content_type;
        (void)stop;
        throw NotSupportedError("Google Photos storage is read-only; upload is not supported");
    }

    std::vector<uint8_t> download(const std::string& file_id, std::stop_token stop) override {
        auto stream = open_read_stream(file_id, stop);
        std::vector<uint8_t> data((std::istreambuf_iterator<char>(*stream)),
                                  std::istreambuf_iterator<char>());
        return data;
    }

    std::unique_ptr<std::istream> open_read_stream(const std::string& file_id,
                                                   std::stop_token stop) override {
        if (stop.stop_requested()) throw OperationCancelled();

        auto item = lookup(file_id);
        bool use_cache = settings_.enable_local_cache && cache_ != nullptr;

        if (use_cache) {
            if (auto entry = cache_->find_by_origin(provider_id_, file_id)) {
                try {
                    return cache_->get_cached_stream(entry->hash, stop);
                } catch (const NotFoundError&) {
                    log_debug("Cache entry for %s vanished, refetching", file_id.c_str());
                }
            }
        }

        auto bytes = fetch_origin(item, stop);
        auto content = std::make_unique<std::istringstream>(
            std::string(bytes.begin(), bytes.end()), std::ios::binary);

        bool within_limit = settings_.max_cache_size_bytes == 0 ||
                            bytes.size() <= settings_.max_cache_size_bytes;
        if (use_cache && within_limit) {
            auto hash = ContentCache::compute_hash(*content, stop);
            cache_->cache_file(hash, *content, item.file_path, provider_id_, file_id,
                               content_type_for_extension(lower_extension(item.filename)), stop);
            content->clear();
            content->seekg(0);
        }
        return content;
    }

    bool delete_file(const std::string& file_id, std::stop_token stop) override {
        (void)file_id;
        (void)stop;
        throw NotSupportedError("Google Photos storage is read-only; delete is not supported");
    }

    bool file_exists(const std::string& file_id, std::stop_token stop) override {
        (void)stop;
        if (!catalog_) return false;
        return catalog_->find_item(provider_id_, file_id).has_value();
    }

    bool test_connection(std::stop_token stop) override {
        if (stop.stop_requested()) return false;
        if (settings_.client_id.empty() || settings_.client_secret.empty() ||
            settings_.refresh_token.empty()) {
            log_debug("Provider %ld: missing OAuth credentials", static_cast<long>(provider_id_));
            return false;
        }
        const auto& scopes = settings_.granted_scopes;
        if (std::find(scopes.begin(), scopes.end(), PICKER_SCOPE) == scopes.end()) {
            log_debug("Provider %ld: picker scope not granted", static_cast<long>(provider_id_));
            return false;
        }
        return true;
    }

    bool supports_upload() const override { return false; }
    bool supports_watch() const override { return false; }

    bool has_capability(Capability capability) const override {
        if (capability == Capability::OAuthDisconnect) return true;
        return StorageBackend::has_capability(capability);
    }

    bool disconnect(ProviderRecord& record) override {
        auto j = nlohmann::json::parse(record.configuration, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            j = nlohmann::json::object();
        }
        for (const char* key : CREDENTIAL_KEYS) {
            j.erase(key);
        }
        record.configuration = j.dump();
        record.enabled = false;

        settings_.access_token.clear();
        settings_.refresh_token.clear();
        settings_.access_token_expiry.clear();
        settings_.granted_scopes.clear();
        log_info("Disconnected provider %ld (%s)", static_cast<long>(record.id),
                 record.name.c_str());
        return true;
    }

private:
    struct Settings {
        std::string client_id;
        std::string client_secret;
        std::string refresh_token;
        std::string access_token;
        std::string access_token_expiry;
        std::vector<std::string> granted_scopes;
        bool enable_local_cache = true;
        uint64_t max_cache_size_bytes = 0;  // 0 = no per-file limit
    };

    CatalogItem lookup(const std::string& file_id) {
        if (!catalog_) {
            throw NotFoundError("File not found: " + file_id);
        }
        auto item = catalog_->find_item(provider_id_, file_id);
        if (!item) {
            throw NotFoundError("File not found: " + file_id);
        }
        return *item;
    }

    std::vector<uint8_t> fetch_origin(const CatalogItem& item, std::stop_token stop) {
        const auto& origin = item.file_path;

        if (is_http_url(origin)) {
            if (!fetcher_) {
                throw std::runtime_error("No HTTP fetcher configured for " + origin);
            }
            auto result = fetcher_->get(origin, settings_.access_token, stop);
            if (result.cancelled) throw OperationCancelled();
            if (result.status_code == 404) {
                throw NotFoundError("File not found at origin: " + item.provider_file_id);
            }
            if (!result.success) {
                throw std::runtime_error("Failed to fetch " + item.provider_file_id + ": " +
                                         result.error_message);
            }
            log_debug("Fetched %s (%zu bytes)", item.provider_file_id.c_str(), result.body.size());
            return std::move(result.body);
        }

        std::error_code ec;
        if (origin.empty() || !fs::is_regular_file(origin, ec)) {
            throw NotFoundError("File not found at origin: " + item.provider_file_id);
        }
        std::ifstream file(origin, std::ios::binary);
        if (!file) {
            throw NotFoundError("File not found at origin: " + item.provider_file_id);
        }
        std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                                  std::istreambuf_iterator<char>());
        if (file.bad()) {
            throw std::runtime_error("Failed to read " + origin);
        }
        if (stop.stop_requested()) throw OperationCancelled();
        return data;
    }

    CatalogStore* catalog_;
    ContentCache* cache_;
    HttpFetcher* fetcher_;
    Settings settings_;
};

}  // namespace

namespace detail {

std::unique_ptr<StorageBackend> make_remote_picker_backend(const BackendDependencies& deps) {
    return std::make_unique<RemotePickerBackend>(deps);
}

}  // namespace detail

}  // namespace mediasync
