#pragma once

#include "mediasync/storage_backend.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stop_token>
#include <unordered_map>
#include <vector>

namespace mediasync {

class ProviderStore;

/// Resolves provider ids to initialized backend instances.
///
/// Instances are cached per provider and shared: repeated lookups return the
/// same object until clear_cache() is called. Lookups take a shared lock;
/// creation and invalidation take it exclusively. Each clear bumps a
/// generation counter, and an instance built under an older generation is
/// handed to its caller but never inserted into the cache.
class BackendRegistry {
public:
    using Factory = std::function<std::unique_ptr<StorageBackend>(BackendKind)>;

    BackendRegistry(ProviderStore& providers, BackendDependencies deps);

    BackendRegistry(const BackendRegistry&) = delete;
    BackendRegistry& operator=(const BackendRegistry&) = delete;

    /// Replace the construction function (defaults to StorageBackendFactory).
    void set_factory(Factory factory);

    /// Null if the provider is missing or disabled. Construction errors
    /// (NotImplementedError for unsupported kinds) propagate.
    std::shared_ptr<StorageBackend> get_backend(int64_t provider_id, std::stop_token stop = {});

    /// All enabled providers. Providers whose backend cannot be built are
    /// logged and skipped.
    std::vector<std::shared_ptr<StorageBackend>> get_all_backends(std::stop_token stop = {});
    std::vector<std::shared_ptr<StorageBackend>> get_backends_by_kind(BackendKind kind,
                                                                      std::stop_token stop = {});

    void clear_cache();

    /// Uninitialized instance. Throws NotImplementedError or std::out_of_range.
    std::unique_ptr<StorageBackend> create_backend(BackendKind kind) const;

    /// First enabled Local provider, or a newly persisted "Local Storage"
    /// provider rooted at the configured default path.
    std::shared_ptr<StorageBackend> get_or_create_default_local_backend(std::stop_token stop = {});

    /// Revoke credentials of a provider whose backend supports it, disable the
    /// provider and invalidate the cache. Throws NotFoundError or NotSupportedError.
    void disconnect_provider(int64_t provider_id);

    size_t cached_count() const;
    uint64_t generation() const;

private:
    std::shared_ptr<StorageBackend> resolve(const ProviderRecord& record);

    struct CachedBackend {
        std::shared_ptr<StorageBackend> backend;
        uint64_t generation = 0;
    };

    ProviderStore& providers_;
    BackendDependencies deps_;
    Factory factory_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<int64_t, CachedBackend> cache_;
    uint64_t generation_ = 0;

    std::mutex default_local_mutex_;  // Serializes default provider creation
};

}  // namespace mediasync
