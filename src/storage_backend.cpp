#include "mediasync/storage_backend.hpp"
#include "mediasync/errors.hpp"
#include "backends.hpp"

#include <stdexcept>

namespace mediasync {

bool StorageBackend::has_capability(Capability capability) const {
    switch (capability) {
        case Capability::Upload:
        case Capability::Delete:
            return supports_upload();
        case Capability::Watch:
            return supports_watch();
        case Capability::OAuthDisconnect:
            return false;
    }
    return false;
}

bool StorageBackend::disconnect(ProviderRecord& record) {
    (void)record;
    throw NotSupportedError(type_name() + " backend does not support disconnecting credentials");
}

std::unique_ptr<StorageBackend> StorageBackendFactory::create(BackendKind kind,
                                                              const BackendDependencies& deps) {
    switch (kind) {
        case BackendKind::Local:
            return detail::make_local_backend(deps);
        case BackendKind::GooglePhotos:
            return detail::make_remote_picker_backend(deps);
        case BackendKind::GoogleDrive:
            throw NotImplementedError("Google Drive storage is not implemented yet");
        case BackendKind::OneDrive:
            throw NotImplementedError("OneDrive storage is not implemented yet");
    }
    throw std::out_of_range("Unknown storage backend kind: " +
                            std::to_string(static_cast<int>(kind)));
}

}  // namespace mediasync
