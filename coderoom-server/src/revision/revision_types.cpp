// revision_types.cpp - Revision record helpers
#include "revision/revision_types.h"
#include <chrono>

namespace coderoom::server::revision {

Timestamp NowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

CodeRevision BufferedRevision::ToCodeRevision() const {
    CodeRevision revision;
    revision.id = id;
    revision.session_id = session_id;
    revision.student_id = student_id;
    revision.timestamp = timestamp;
    revision.is_diff = is_diff;
    if (is_diff) {
        revision.diff = diff;
    } else {
        revision.full_code = code;
    }
    return revision;
}

} // namespace coderoom::server::revision
