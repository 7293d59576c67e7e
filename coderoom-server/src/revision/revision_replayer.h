// revision_replayer.h - Rebuilds code from a stored revision chain
#pragma once

#include "revision/diff_engine.h"
#include "revision/revision_types.h"
#include <stdexcept>
#include <string>
#include <vector>

namespace coderoom::server::revision {

class ReplayError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * RevisionReplayer - Applies snapshots and diffs in order
 *
 * A snapshot replaces the working text; a diff is applied to the text
 * produced by the revision before it. Throws ReplayError if the chain starts
 * with a diff, a revision lacks its payload, or a patch does not apply.
 */
class RevisionReplayer {
public:
    RevisionReplayer() = default;
    explicit RevisionReplayer(const DiffEngine& engine) : engine_(engine) {}

    // Code after each revision, same order as the input
    std::vector<std::string> Replay(const std::vector<CodeRevision>& revisions) const;

    std::string ReconstructLatest(const std::vector<CodeRevision>& revisions) const;

private:
    DiffEngine engine_;
};

} // namespace coderoom::server::revision
