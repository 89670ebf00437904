#pragma once

#include "mediasync/types.hpp"

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace mediasync {

class CatalogStore;
class ContentCache;
class HttpFetcher;

// Optional capabilities a backend may implement. Callers query these
// instead of inspecting the concrete type.
enum class Capability {
    Upload,
    Delete,
    Watch,
    OAuthDisconnect,
};

// Abstract interface for one storage origin (local tree, remote picker service)
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    virtual BackendKind kind() const = 0;

    // Get the backend type name (for logging/debugging)
    virtual std::string type_name() const = 0;

    int64_t provider_id() const { return provider_id_; }
    const std::string& display_name() const { return display_name_; }

    // Bind provider identity and parse the JSON configuration blob.
    // Empty or malformed configuration falls back to defaults; never throws
    // for bad input. Safe to call more than once.
    virtual void initialize(int64_t provider_id,
                            const std::string& display_name,
                            const std::string& config_json) = 0;

    // List media files. Throws OperationCancelled when `stop` is requested.
    virtual std::vector<FileDescriptor> list_files(const ListOptions& options,
                                                   std::stop_token stop) = 0;

    // Throws NotSupportedError on read-only backends.
    virtual UploadResult upload(const std::string& file_name,
                                std::istream& data,
                                const std::string& content_type,
                                std::stop_token stop) = 0;

    // Both throw NotFoundError for unknown ids.
    virtual std::vector<uint8_t> download(const std::string& file_id, std::stop_token stop) = 0;
    virtual std::unique_ptr<std::istream> open_read_stream(const std::string& file_id,
                                                           std::stop_token stop) = 0;

    // Returns false if the file does not exist. Throws NotSupportedError on
    // read-only backends.
    virtual bool delete_file(const std::string& file_id, std::stop_token stop) = 0;

    virtual bool file_exists(const std::string& file_id, std::stop_token stop) = 0;

    // Ordinary connectivity or credential problems return false.
    virtual bool test_connection(std::stop_token stop) = 0;

    virtual bool supports_upload() const = 0;
    virtual bool supports_watch() const = 0;

    virtual bool has_capability(Capability capability) const;

    // Revoke stored credentials in `record` (the caller persists it).
    // Backends without Capability::OAuthDisconnect throw NotSupportedError.
    virtual bool disconnect(ProviderRecord& record);

protected:
    int64_t provider_id_ = 0;
    std::string display_name_;
};

// Collaborators handed to backends at construction
struct BackendDependencies {
    CatalogStore* catalog = nullptr;   // RemotePicker listing and lookup
    ContentCache* cache = nullptr;     // RemotePicker retrieval, may be null
    HttpFetcher* fetcher = nullptr;    // RemotePicker remote origins, may be null
    std::filesystem::path default_local_path;
};

// Factory for creating storage backends by kind
class StorageBackendFactory {
public:
    // Throws NotImplementedError for declared but unsupported kinds and
    // std::out_of_range for values outside BackendKind.
    static std::unique_ptr<StorageBackend> create(BackendKind kind,
                                                  const BackendDependencies& deps);
};

}  // namespace mediasync
