// revision_buffer.h - Buffered capture of student code revisions
#pragma once

#include "core/scheduler.h"
#include "revision/diff_engine.h"
#include "revision/revision_types.h"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace coderoom::server::storage {
class StorageBackend;
}

namespace coderoom::server::revision {

struct RevisionBufferConfig {
    // Flush a student's buffer after this long without edits
    std::chrono::milliseconds idle_flush_delay{5000};

    // Interval of the background sweep started by StartAutoFlush()
    std::chrono::milliseconds periodic_flush_interval{30000};

    // Every Nth revision is stored as a full snapshot
    uint64_t snapshot_interval = 10;

    // Diffs changing more bytes than this are stored as snapshots
    size_t large_change_threshold = 1000;

    // Buffer length that forces an immediate flush
    size_t max_buffer_size = 100;
};

/**
 * RevisionBuffer - Turns full-code edits into snapshot/diff revisions
 *
 * Every (session, student) pair owns a baseline, a revision counter and a
 * buffer of revisions not yet persisted. Buffers are flushed to storage when
 * the student stops typing, when a buffer fills up, on the periodic sweep,
 * at session end and at shutdown.
 *
 * Storage calls run without holding the state lock, so a slow store never
 * blocks AddRevision for any student. Flushes, resets and session flushes of
 * the same student are serialized. A failed flush leaves the unsaved
 * revisions in the buffer for the next trigger.
 */
class RevisionBuffer {
public:
    RevisionBuffer(storage::StorageBackend& storage, core::TaskScheduler& scheduler,
                   const RevisionBufferConfig& config = RevisionBufferConfig());
    ~RevisionBuffer();

    RevisionBuffer(const RevisionBuffer&) = delete;
    RevisionBuffer& operator=(const RevisionBuffer&) = delete;

    void AddRevision(const std::string& session_id, const std::string& student_id,
                     const std::string& new_code);

    // Returns true when nothing is left to persist for the student
    bool FlushBuffer(const std::string& session_id, const std::string& student_id);

    void FlushAll();

    // Flushes every student of the session and drops their state
    void FlushSession(const std::string& session_id);

    // Flushes, then rebases the student on current_code with a fresh counter
    void ResetStudent(const std::string& session_id, const std::string& student_id,
                      const std::string& current_code);

    void StartAutoFlush();
    void StopAutoFlush();
    bool IsAutoFlushRunning() const;

    // Stops the sweep, flushes everything and clears all state
    void Shutdown();

    size_t PendingCount(const std::string& session_id, const std::string& student_id) const;
    size_t TrackedStudentCount() const;

    const RevisionBufferConfig& GetConfig() const { return config_; }

private:
    using Key = std::pair<std::string, std::string>;

    struct StudentState {
        std::mutex flush_mutex;  // serializes flush and reset for this student

        std::mutex mutex;        // guards everything below
        std::string previous_code;
        uint64_t revision_count = 0;
        std::vector<BufferedRevision> buffer;
        core::TaskId flush_timer = core::kInvalidTaskId;
        bool closed = false;     // session ended while revisions were unsaved
        bool evicted = false;    // removed from states_, must not be reused
    };

    std::shared_ptr<StudentState> GetOrCreateState(const Key& key);
    std::shared_ptr<StudentState> FindState(const Key& key) const;
    std::vector<Key> KeysMatching(const std::string* session_id) const;

    // Requires state.flush_mutex. Stores the idle timer to cancel in idle_timer
    // when the buffer ends up empty.
    bool FlushState(const Key& key, StudentState& state, core::TaskId& idle_timer);

    // Requires state.flush_mutex. Drops the state if its buffer is empty.
    // Returns the idle timer to cancel.
    core::TaskId EvictIfIdle(const Key& key, const std::shared_ptr<StudentState>& state);

    void CancelTimer(core::TaskId id);

    storage::StorageBackend& storage_;
    core::TaskScheduler& scheduler_;
    RevisionBufferConfig config_;
    DiffEngine diff_engine_;

    mutable std::mutex states_mutex_;
    std::map<Key, std::shared_ptr<StudentState>> states_;

    mutable std::mutex auto_flush_mutex_;
    core::TaskId auto_flush_task_ = core::kInvalidTaskId;
};

} // namespace coderoom::server::revision
