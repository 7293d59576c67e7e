// local_revision_repository.h - File-backed JSON revision store
#pragma once

#include "storage/storage_backend.h"
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace coderoom::server::storage {

/**
 * LocalRevisionRepository - Keeps every revision in <data_dir>/revisions.json
 *
 * Revisions are grouped per "session:student" key in save order. The whole
 * file is rewritten on every change, so this store suits a single classroom
 * server, not a shared deployment. Saving a revision whose id is already
 * stored for the same student is a no-op, which makes retried flushes safe.
 */
class LocalRevisionRepository : public RevisionRepository {
public:
    explicit LocalRevisionRepository(const std::string& data_dir);
    ~LocalRevisionRepository() override = default;

    // Create the data directory and read any existing file
    bool Initialize();

    void SaveRevision(const CodeRevision& revision) override;
    std::vector<CodeRevision> GetRevisions(const std::string& session_id,
                                           const std::string& student_id) override;
    std::optional<CodeRevision> GetLatestRevision(const std::string& session_id,
                                                  const std::string& student_id) override;
    size_t CountRevisions(const std::string& session_id,
                          const std::string& student_id) override;
    void DeleteRevisions(const std::string& session_id,
                         const std::optional<std::string>& student_id = std::nullopt) override;

    std::optional<CodeRevision> GetRevision(const std::string& revision_id);

    // student_id -> revisions for every student of the session
    std::map<std::string, std::vector<CodeRevision>> GetSessionRevisions(const std::string& session_id);

    const std::string& GetFilePath() const { return file_path_; }

private:
    static std::string MakeKey(const std::string& session_id, const std::string& student_id);

    // Both require mutex_ held
    bool LoadFromDisk();
    void WriteToDisk() const;

    std::string data_dir_;
    std::string file_path_;
    std::map<std::string, std::vector<CodeRevision>> revisions_;
    mutable std::mutex mutex_;
};

} // namespace coderoom::server::storage
