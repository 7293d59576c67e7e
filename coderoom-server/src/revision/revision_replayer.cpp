// revision_replayer.cpp - Rebuilds code from a stored revision chain
#include "revision/revision_replayer.h"
#include <cstddef>

namespace coderoom::server::revision {

std::vector<std::string> RevisionReplayer::Replay(const std::vector<CodeRevision>& revisions) const {
    std::vector<std::string> result;
    result.reserve(revisions.size());

    for (size_t i = 0; i < revisions.size(); ++i) {
        const auto& revision = revisions[i];

        if (!revision.is_diff) {
            if (!revision.full_code) {
                throw ReplayError("Snapshot revision " + revision.id + " has no code");
            }
            result.push_back(*revision.full_code);
            continue;
        }

        if (result.empty()) {
            throw ReplayError("Revision chain starts with diff " + revision.id);
        }
        if (!revision.diff) {
            throw ReplayError("Diff revision " + revision.id + " has no patch");
        }

        try {
            result.push_back(engine_.ApplyPatch(*revision.diff, result.back()));
        } catch (const PatchError& e) {
            throw ReplayError("Revision " + revision.id + " (#" + std::to_string(i + 1) +
                              ") does not apply: " + e.what());
        }
    }

    return result;
}

std::string RevisionReplayer::ReconstructLatest(const std::vector<CodeRevision>& revisions) const {
    if (revisions.empty()) {
        return std::string();
    }

    // Start from the nearest snapshot instead of the whole chain
    size_t start = revisions.size();
    while (start > 0 && revisions[start - 1].is_diff) {
        --start;
    }
    if (start > 0) {
        --start;
    }

    std::vector<CodeRevision> tail(revisions.begin() + static_cast<std::ptrdiff_t>(start), revisions.end());
    return Replay(tail).back();
}

} // namespace coderoom::server::revision
