// local_storage_backend.cpp - Storage backend on the local filesystem
#include "storage/local_storage_backend.h"
#include <spdlog/spdlog.h>

namespace coderoom::server::storage {

LocalStorageBackend::LocalStorageBackend(const std::string& data_dir)
    : data_dir_(data_dir),
      revisions_(std::make_unique<LocalRevisionRepository>(data_dir)) {
}

bool LocalStorageBackend::Initialize() {
    if (!revisions_->Initialize()) {
        spdlog::error("LocalStorageBackend: Revision store failed to initialize in {}", data_dir_);
        return false;
    }
    spdlog::info("LocalStorageBackend: Using data directory {}", data_dir_);
    return true;
}

} // namespace coderoom::server::storage
