#include "mediasync/backend_registry.hpp"
#include "mediasync/catalog_store.hpp"
#include "mediasync/errors.hpp"
#include "mediasync/log.hpp"

#include <nlohmann/json.hpp>

namespace mediasync {

BackendRegistry::BackendRegistry(ProviderStore& providers, BackendDependencies deps)
    : providers_(providers), deps_(std::move(deps)) {
    factory_ = [this](BackendKind kind) {
        return StorageBackendFactory::create(kind, deps_);
    };
}

void BackendRegistry::set_factory(Factory factory) {
    std::unique_lock lock(mutex_);
    factory_ = std::move(factory);
}

std::unique_ptr<StorageBackend> BackendRegistry::create_backend(BackendKind kind) const {
    Factory factory;
    {
        std::shared_lock lock(mutex_);
        factory = factory_;
    }
    return factory(kind);
}

std::shared_ptr<StorageBackend> BackendRegistry::get_backend(int64_t provider_id,
                                                             std::stop_token stop) {
    if (stop.stop_requested()) throw OperationCancelled();

    auto record = providers_.find_provider(provider_id);
    if (!record || !record->enabled) {
        return nullptr;
    }
    return resolve(*record);
}

std::shared_ptr<StorageBackend> BackendRegistry::resolve(const ProviderRecord& record) {
    uint64_t gen;
    {
        std::shared_lock lock(mutex_);
        auto it = cache_.find(record.id);
        if (it != cache_.end()) {
            return it->second.backend;
        }
        gen = generation_;
    }

    // Build outside the lock; initialization may touch the filesystem
    std::shared_ptr<StorageBackend> backend = create_backend(record.kind);
    backend->initialize(record.id, record.name, record.configuration);

    std::unique_lock lock(mutex_);
    if (generation_ != gen) {
        // Cleared while we were building; hand out without caching
        log_debug("Registry cleared during creation of provider %ld",
                  static_cast<long>(record.id));
        return backend;
    }
    auto [it, inserted] = cache_.try_emplace(record.id, CachedBackend{backend, gen});
    if (!inserted) {
        return it->second.backend;
    }
    log_debug("Created %s backend for provider %ld (%s)", backend->type_name().c_str(),
              static_cast<long>(record.id), record.name.c_str());
    return backend;
}

std::vector<std::shared_ptr<StorageBackend>> BackendRegistry::get_all_backends(std::stop_token stop) {
    std::vector<std::shared_ptr<StorageBackend>> backends;
    for (const auto& record : providers_.enabled_providers()) {
        if (stop.stop_requested()) throw OperationCancelled();
        try {
            backends.push_back(resolve(record));
        } catch (const NotImplementedError& e) {
            log_warn("Skipping provider %ld (%s): %s", static_cast<long>(record.id),
                     record.name.c_str(), e.what());
        }
    }
    return backends;
}

std::vector<std::shared_ptr<StorageBackend>> BackendRegistry::get_backends_by_kind(
    BackendKind kind, std::stop_token stop) {
    std::vector<std::shared_ptr<StorageBackend>> backends;
    for (const auto& record : providers_.enabled_providers()) {
        if (stop.stop_requested()) throw OperationCancelled();
        if (record.kind != kind) continue;
        try {
            backends.push_back(resolve(record));
        } catch (const NotImplementedError& e) {
            log_warn("Skipping provider %ld (%s): %s", static_cast<long>(record.id),
                     record.name.c_str(), e.what());
        }
    }
    return backends;
}

void BackendRegistry::clear_cache() {
    std::unique_lock lock(mutex_);
    cache_.clear();
    ++generation_;
}

std::shared_ptr<StorageBackend> BackendRegistry::get_or_create_default_local_backend(
    std::stop_token stop) {
    std::lock_guard<std::mutex> guard(default_local_mutex_);

    for (const auto& record : providers_.enabled_providers()) {
        if (record.kind == BackendKind::Local) {
            return get_backend(record.id, stop);
        }
    }

    ProviderRecord record;
    record.kind = BackendKind::Local;
    record.name = "Local Storage";
    record.enabled = true;
    record.configuration = nlohmann::json{
        {"base_path", deps_.default_local_path.string()},
    }.dump();

    auto id = providers_.insert_provider(record);
    log_info("Created default local storage provider %ld at %s", static_cast<long>(id),
             deps_.default_local_path.c_str());
    return get_backend(id, stop);
}

void BackendRegistry::disconnect_provider(int64_t provider_id) {
    auto record = providers_.find_provider(provider_id);
    if (!record) {
        throw NotFoundError("Provider not found: " + std::to_string(provider_id));
    }

    auto backend = create_backend(record->kind);
    backend->initialize(record->id, record->name, record->configuration);
    if (!backend->has_capability(Capability::OAuthDisconnect)) {
        throw NotSupportedError(backend->type_name() +
                                " backend does not support disconnecting credentials");
    }

    backend->disconnect(*record);
    providers_.update_provider(*record);
    clear_cache();
}

size_t BackendRegistry::cached_count() const {
    std::shared_lock lock(mutex_);
    return cache_.size();
}

uint64_t BackendRegistry::generation() const {
    std::shared_lock lock(mutex_);
    return generation_;
}

}  // namespace mediasync
