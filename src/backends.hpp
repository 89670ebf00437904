#pragma once

#include "mediasync/storage_backend.hpp"

#include <memory>

namespace mediasync::detail {

std::unique_ptr<StorageBackend> make_local_backend(const BackendDependencies& deps);
std::unique_ptr<StorageBackend> make_remote_picker_backend(const BackendDependencies& deps);

}  // namespace mediasync::detail
