// revision_buffer.cpp - Buffered capture of student code revisions
#include "revision/revision_buffer.h"
#include "core/id_generator.h"
#include "storage/storage_backend.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>

namespace coderoom::server::revision {

namespace {

DiffEngine::Options MakeDiffOptions(const RevisionBufferConfig& config) {
    DiffEngine::Options options;
    // Past the cap the diff volume only grows, so a cap at or above the
    // threshold never turns a small edit into a snapshot.
    options.max_edit_distance = std::max(options.max_edit_distance, config.large_change_threshold);
    return options;
}

} // anonymous namespace

RevisionBuffer::RevisionBuffer(storage::StorageBackend& storage, core::TaskScheduler& scheduler,
                               const RevisionBufferConfig& config)
    : storage_(storage),
      scheduler_(scheduler),
      config_(config),
      diff_engine_(MakeDiffOptions(config)) {
    if (config_.snapshot_interval == 0) {
        spdlog::warn("RevisionBuffer: snapshot_interval 0 is invalid, using 10");
        config_.snapshot_interval = 10;
    }
    if (config_.max_buffer_size == 0) {
        spdlog::warn("RevisionBuffer: max_buffer_size 0 is invalid, using 100");
        config_.max_buffer_size = 100;
    }
}

RevisionBuffer::~RevisionBuffer() {
    Shutdown();
}

// ========== State Map ==========

std::shared_ptr<RevisionBuffer::StudentState> RevisionBuffer::GetOrCreateState(const Key& key) {
    std::lock_guard<std::mutex> lock(states_mutex_);
    auto& state = states_[key];
    if (!state) {
        state = std::make_shared<StudentState>();
    }
    return state;
}

std::shared_ptr<RevisionBuffer::StudentState> RevisionBuffer::FindState(const Key& key) const {
    std::lock_guard<std::mutex> lock(states_mutex_);
    auto it = states_.find(key);
    return it == states_.end() ? nullptr : it->second;
}

std::vector<RevisionBuffer::Key> RevisionBuffer::KeysMatching(const std::string* session_id) const {
    std::lock_guard<std::mutex> lock(states_mutex_);
    std::vector<Key> keys;
    for (const auto& [key, state] : states_) {
        if (!session_id || key.first == *session_id) {
            keys.push_back(key);
        }
    }
    return keys;
}

void RevisionBuffer::CancelTimer(core::TaskId id) {
    if (id != core::kInvalidTaskId) {
        scheduler_.Cancel(id);
    }
}

// ========== Revisions ==========

void RevisionBuffer::AddRevision(const std::string& session_id, const std::string& student_id,
                                 const std::string& new_code) {
    const Key key(session_id, student_id);
    std::shared_ptr<StudentState> state;
    core::TaskId stale_timer = core::kInvalidTaskId;
    bool buffer_full = false;

    while (true) {
        state = GetOrCreateState(key);
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->evicted) {
            continue;
        }

        if (new_code == state->previous_code) {
            return;
        }

        ++state->revision_count;

        BufferedRevision revision;
        revision.id = core::GenerateUUID();
        revision.session_id = session_id;
        revision.student_id = student_id;
        revision.code = new_code;
        revision.timestamp = NowMillis();
        revision.revision_count = state->revision_count;

        if (state->revision_count == 1 || state->revision_count % config_.snapshot_interval == 0) {
            revision.is_diff = false;
        } else {
            DiffList diffs = diff_engine_.ComputeDiff(state->previous_code, new_code);
            size_t volume = DiffEngine::ChangedVolume(diffs);
            if (volume > config_.large_change_threshold) {
                spdlog::debug("RevisionBuffer: {} bytes changed for {}/{}, storing snapshot",
                              volume, session_id, student_id);
                revision.is_diff = false;
            } else {
                revision.is_diff = true;
                revision.diff = diff_engine_.MakePatch(state->previous_code, diffs);
            }
        }

        state->buffer.push_back(std::move(revision));
        state->previous_code = new_code;
        buffer_full = state->buffer.size() >= config_.max_buffer_size;
        stale_timer = std::exchange(state->flush_timer, core::kInvalidTaskId);
        break;
    }

    CancelTimer(stale_timer);

    if (buffer_full && FlushBuffer(session_id, student_id)) {
        return;
    }

    // Restart the idle countdown; a failed size flush is retried by it too
    core::TaskId timer = scheduler_.ScheduleAfter(config_.idle_flush_delay, [this, key]() {
        FlushBuffer(key.first, key.second);
    });

    core::TaskId displaced;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->evicted) {
            displaced = timer;
        } else {
            displaced = std::exchange(state->flush_timer, timer);
        }
    }
    CancelTimer(displaced);
}

// ========== Flushing ==========

bool RevisionBuffer::FlushState(const Key& key, StudentState& state, core::TaskId& idle_timer) {
    std::vector<BufferedRevision> pending;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        if (state.buffer.empty()) {
            idle_timer = std::exchange(state.flush_timer, core::kInvalidTaskId);
            return true;
        }
        pending = state.buffer;
    }

    size_t saved = 0;
    try {
        auto& repository = storage_.Revisions();
        for (const auto& revision : pending) {
            repository.SaveRevision(revision.ToCodeRevision());
            ++saved;
        }
    } catch (const std::exception& e) {
        spdlog::error("RevisionBuffer: Error flushing buffer for {}/{} ({} of {} saved): {}",
                      key.first, key.second, saved, pending.size(), e.what());
    }

    std::lock_guard<std::mutex> lock(state.mutex);
    // Only the snapshot taken above is removed; edits made meanwhile stay queued
    state.buffer.erase(state.buffer.begin(), state.buffer.begin() + static_cast<std::ptrdiff_t>(saved));
    if (state.buffer.empty()) {
        idle_timer = std::exchange(state.flush_timer, core::kInvalidTaskId);
    }

    if (saved == pending.size()) {
        spdlog::debug("RevisionBuffer: Flushed {} revisions for {}/{}", saved, key.first, key.second);
        return true;
    }
    return false;
}

core::TaskId RevisionBuffer::EvictIfIdle(const Key& key, const std::shared_ptr<StudentState>& state) {
    std::lock_guard<std::mutex> map_lock(states_mutex_);
    std::lock_guard<std::mutex> lock(state->mutex);

    auto it = states_.find(key);
    if (it == states_.end() || it->second != state || !state->buffer.empty()) {
        return core::kInvalidTaskId;
    }

    state->evicted = true;
    states_.erase(it);
    return std::exchange(state->flush_timer, core::kInvalidTaskId);
}

bool RevisionBuffer::FlushBuffer(const std::string& session_id, const std::string& student_id) {
    const Key key(session_id, student_id);
    auto state = FindState(key);
    if (!state) {
        return true;
    }

    core::TaskId idle_timer = core::kInvalidTaskId;
    core::TaskId evicted_timer = core::kInvalidTaskId;
    bool ok;
    {
        std::lock_guard<std::mutex> flush_lock(state->flush_mutex);
        ok = FlushState(key, *state, idle_timer);

        bool closed;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            closed = state->closed && !state->evicted;
        }
        if (ok && closed) {
            evicted_timer = EvictIfIdle(key, state);
        }
    }

    CancelTimer(idle_timer);
    CancelTimer(evicted_timer);
    return ok;
}

void RevisionBuffer::FlushAll() {
    auto keys = KeysMatching(nullptr);
    if (keys.empty()) {
        return;
    }

    size_t failed = 0;
    for (const auto& key : keys) {
        if (!FlushBuffer(key.first, key.second)) {
            ++failed;
        }
    }

    if (failed > 0) {
        spdlog::warn("RevisionBuffer: {} of {} students still have unsaved revisions", failed, keys.size());
    }
}

void RevisionBuffer::FlushSession(const std::string& session_id) {
    auto keys = KeysMatching(&session_id);

    for (const auto& key : keys) {
        auto state = FindState(key);
        if (!state) {
            continue;
        }

        core::TaskId idle_timer = core::kInvalidTaskId;
        core::TaskId evicted_timer = core::kInvalidTaskId;
        {
            std::lock_guard<std::mutex> flush_lock(state->flush_mutex);
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                if (state->evicted) {
                    continue;
                }
                state->closed = true;
            }

            if (FlushState(key, *state, idle_timer)) {
                evicted_timer = EvictIfIdle(key, state);
            } else {
                spdlog::warn("RevisionBuffer: Keeping unsaved revisions of {}/{} after session end",
                             key.first, key.second);
            }
        }

        CancelTimer(idle_timer);
        CancelTimer(evicted_timer);
    }

    spdlog::debug("RevisionBuffer: Flushed session {} ({} students)", session_id, keys.size());
}

void RevisionBuffer::ResetStudent(const std::string& session_id, const std::string& student_id,
                                  const std::string& current_code) {
    const Key key(session_id, student_id);
    core::TaskId idle_timer = core::kInvalidTaskId;
    core::TaskId stale_timer = core::kInvalidTaskId;

    while (true) {
        auto state = GetOrCreateState(key);
        std::lock_guard<std::mutex> flush_lock(state->flush_mutex);
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->evicted) {
                continue;
            }
        }

        if (!FlushState(key, *state, idle_timer)) {
            spdlog::warn("RevisionBuffer: Resetting {}/{} with unsaved revisions pending",
                         session_id, student_id);
        }

        std::lock_guard<std::mutex> lock(state->mutex);
        state->previous_code = current_code;
        state->revision_count = 0;
        state->closed = false;
        if (state->buffer.empty()) {
            stale_timer = std::exchange(state->flush_timer, core::kInvalidTaskId);
        }
        break;
    }

    CancelTimer(idle_timer);
    CancelTimer(stale_timer);
}

// ========== Lifecycle ==========

void RevisionBuffer::StartAutoFlush() {
    std::lock_guard<std::mutex> lock(auto_flush_mutex_);
    if (auto_flush_task_ != core::kInvalidTaskId) {
        return;
    }

    auto_flush_task_ = scheduler_.ScheduleEvery(config_.periodic_flush_interval, [this]() {
        FlushAll();
    });
    spdlog::info("RevisionBuffer: Periodic flush every {}ms", config_.periodic_flush_interval.count());
}

void RevisionBuffer::StopAutoFlush() {
    core::TaskId task;
    {
        std::lock_guard<std::mutex> lock(auto_flush_mutex_);
        task = std::exchange(auto_flush_task_, core::kInvalidTaskId);
    }
    if (task != core::kInvalidTaskId) {
        scheduler_.Cancel(task);
        spdlog::info("RevisionBuffer: Periodic flush stopped");
    }
}

bool RevisionBuffer::IsAutoFlushRunning() const {
    std::lock_guard<std::mutex> lock(auto_flush_mutex_);
    return auto_flush_task_ != core::kInvalidTaskId;
}

void RevisionBuffer::Shutdown() {
    StopAutoFlush();
    FlushAll();

    std::map<Key, std::shared_ptr<StudentState>> states;
    {
        std::lock_guard<std::mutex> lock(states_mutex_);
        states.swap(states_);
    }

    std::vector<core::TaskId> timers;
    size_t dropped = 0;
    for (auto& [key, state] : states) {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->evicted = true;
        dropped += state->buffer.size();
        timers.push_back(std::exchange(state->flush_timer, core::kInvalidTaskId));
    }
    for (auto id : timers) {
        CancelTimer(id);
    }

    if (dropped > 0) {
        spdlog::error("RevisionBuffer: Shutdown discarded {} unsaved revisions", dropped);
    }
}

size_t RevisionBuffer::PendingCount(const std::string& session_id, const std::string& student_id) const {
    auto state = FindState(Key(session_id, student_id));
    if (!state) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->buffer.size();
}

size_t RevisionBuffer::TrackedStudentCount() const {
    std::lock_guard<std::mutex> lock(states_mutex_);
    return states_.size();
}

} // namespace coderoom::server::revision
