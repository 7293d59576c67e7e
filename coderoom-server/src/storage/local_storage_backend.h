// local_storage_backend.h - Storage backend on the local filesystem
#pragma once

#include "storage/local_revision_repository.h"
#include <memory>
#include <string>

namespace coderoom::server::storage {

class LocalStorageBackend : public StorageBackend {
public:
    explicit LocalStorageBackend(const std::string& data_dir);
    ~LocalStorageBackend() override = default;

    bool Initialize();

    RevisionRepository& Revisions() override { return *revisions_; }
    LocalRevisionRepository& LocalRevisions() { return *revisions_; }

    const std::string& GetDataDir() const { return data_dir_; }

private:
    std::string data_dir_;
    std::unique_ptr<LocalRevisionRepository> revisions_;
};

} // namespace coderoom::server::storage
