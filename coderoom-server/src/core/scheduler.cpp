// scheduler.cpp - Delayed and periodic task scheduling implementation
#include "core/scheduler.h"
#include <spdlog/spdlog.h>
#include <exception>

namespace coderoom::server::core {

// ============================================================================
// ThreadedScheduler Implementation
// ============================================================================

ThreadedScheduler::ThreadedScheduler() {
    worker_ = std::thread([this]() { WorkerLoop(); });
    spdlog::debug("ThreadedScheduler started");
}

ThreadedScheduler::~ThreadedScheduler() {
    Shutdown();
}

void ThreadedScheduler::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            return;
        }
        shutdown_ = true;
        entries_.clear();
    }
    cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }
    spdlog::debug("ThreadedScheduler stopped");
}

TaskId ThreadedScheduler::ScheduleAfter(std::chrono::milliseconds delay, TaskFunction task) {
    return Schedule(Clock::now() + delay, std::chrono::milliseconds(0), std::move(task));
}

TaskId ThreadedScheduler::ScheduleEvery(std::chrono::milliseconds interval, TaskFunction task) {
    if (interval.count() <= 0) {
        spdlog::warn("ThreadedScheduler: rejecting periodic task with interval {}ms", interval.count());
        return kInvalidTaskId;
    }
    return Schedule(Clock::now() + interval, interval, std::move(task));
}

TaskId ThreadedScheduler::Schedule(Clock::time_point due, std::chrono::milliseconds interval,
                                   TaskFunction task) {
    TaskId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            return kInvalidTaskId;
        }
        id = next_id_++;
        entries_.emplace(id, Entry{due, interval, std::move(task)});
    }
    cv_.notify_all();
    return id;
}

bool ThreadedScheduler::Cancel(TaskId id) {
    if (id == kInvalidTaskId) {
        return false;
    }

    std::unique_lock<std::mutex> lock(mutex_);
    bool removed = entries_.erase(id) > 0;

    // A task cancelling itself must not wait on its own completion
    if (!OnWorkerThread()) {
        idle_cv_.wait(lock, [this, id]() { return running_id_ != id; });
    }

    if (removed) {
        cv_.notify_all();
    }
    return removed;
}

size_t ThreadedScheduler::PendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

bool ThreadedScheduler::OnWorkerThread() const {
    return std::this_thread::get_id() == worker_.get_id();
}

void ThreadedScheduler::WorkerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (!shutdown_) {
        if (entries_.empty()) {
            cv_.wait(lock, [this]() { return shutdown_ || !entries_.empty(); });
            continue;
        }

        auto next = entries_.begin();
        for (auto it = entries_.begin(); it != entries_.end(); ++it) {
            if (it->second.due < next->second.due) {
                next = it;
            }
        }

        auto now = Clock::now();
        if (next->second.due > now) {
            cv_.wait_until(lock, next->second.due);
            continue;
        }

        TaskId id = next->first;
        TaskFunction task;
        if (next->second.interval.count() > 0) {
            task = next->second.task;
            next->second.due = now + next->second.interval;
        } else {
            task = std::move(next->second.task);
            entries_.erase(next);
        }

        running_id_ = id;
        lock.unlock();

        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("ThreadedScheduler: task {} threw: {}", id, e.what());
        }

        lock.lock();
        running_id_ = kInvalidTaskId;
        idle_cv_.notify_all();
    }
}

// ============================================================================
// ManualScheduler Implementation
// ============================================================================

TaskId ManualScheduler::ScheduleAfter(std::chrono::milliseconds delay, TaskFunction task) {
    std::lock_guard<std::mutex> lock(mutex_);
    TaskId id = next_id_++;
    entries_.emplace(id, Entry{now_ + delay, std::chrono::milliseconds(0), std::move(task)});
    return id;
}

TaskId ManualScheduler::ScheduleEvery(std::chrono::milliseconds interval, TaskFunction task) {
    if (interval.count() <= 0) {
        return kInvalidTaskId;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    TaskId id = next_id_++;
    entries_.emplace(id, Entry{now_ + interval, interval, std::move(task)});
    return id;
}

bool ManualScheduler::Cancel(TaskId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.erase(id) > 0;
}

size_t ManualScheduler::PendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::chrono::milliseconds ManualScheduler::Now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
}

void ManualScheduler::AdvanceBy(std::chrono::milliseconds delta) {
    std::unique_lock<std::mutex> lock(mutex_);
    const auto target = now_ + delta;

    while (true) {
        auto next = entries_.end();
        for (auto it = entries_.begin(); it != entries_.end(); ++it) {
            if (it->second.due > target) {
                continue;
            }
            if (next == entries_.end() || it->second.due < next->second.due) {
                next = it;
            }
        }
        if (next == entries_.end()) {
            break;
        }

        now_ = next->second.due;
        TaskFunction task;
        if (next->second.interval.count() > 0) {
            task = next->second.task;
            next->second.due += next->second.interval;
        } else {
            task = std::move(next->second.task);
            entries_.erase(next);
        }

        lock.unlock();
        task();
        lock.lock();
    }

    now_ = target;
}

} // namespace coderoom::server::core
