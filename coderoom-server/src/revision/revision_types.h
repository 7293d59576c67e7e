// revision_types.h - Revision records shared by the buffer and storage
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace coderoom::server::revision {

// Milliseconds since the Unix epoch
using Timestamp = int64_t;

Timestamp NowMillis();

/**
 * CodeRevision - One persisted revision of a student's code
 *
 * Exactly one of diff / full_code is set: diff when is_diff is true,
 * full_code otherwise.
 */
struct CodeRevision {
    std::string id;
    std::string session_id;
    std::string student_id;
    Timestamp timestamp = 0;
    bool is_diff = false;
    std::optional<std::string> diff;
    std::optional<std::string> full_code;
};

// Revision held in memory until the next flush
struct BufferedRevision {
    std::string id;
    std::string session_id;
    std::string student_id;
    std::string code;
    Timestamp timestamp = 0;
    bool is_diff = false;
    std::optional<std::string> diff;
    uint64_t revision_count = 0;

    CodeRevision ToCodeRevision() const;
};

class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace coderoom::server::revision
