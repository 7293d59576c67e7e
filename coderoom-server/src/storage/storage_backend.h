// storage_backend.h - Persistence interfaces used by the revision buffer
#pragma once

#include "revision/revision_types.h"
#include <optional>
#include <string>
#include <vector>

namespace coderoom::server::storage {

using revision::CodeRevision;
using revision::StorageError;

/**
 * RevisionRepository - Durable store for code revisions
 *
 * SaveRevision throws revision::StorageError when the write fails. Writes are
 * at-least-once: a revision whose id is already stored may be saved again
 * after a retried flush.
 */
class RevisionRepository {
public:
    virtual ~RevisionRepository() = default;

    virtual void SaveRevision(const CodeRevision& revision) = 0;

    // Revisions for one student in timestamp order
    virtual std::vector<CodeRevision> GetRevisions(const std::string& session_id,
                                                   const std::string& student_id) = 0;

    virtual std::optional<CodeRevision> GetLatestRevision(const std::string& session_id,
                                                          const std::string& student_id) = 0;

    virtual size_t CountRevisions(const std::string& session_id,
                                  const std::string& student_id) = 0;

    // Deletes every revision of the session, or of one student when given
    virtual void DeleteRevisions(const std::string& session_id,
                                 const std::optional<std::string>& student_id = std::nullopt) = 0;
};

// Aggregates the repositories of one storage deployment
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    virtual RevisionRepository& Revisions() = 0;
};

} // namespace coderoom::server::storage
