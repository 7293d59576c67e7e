// scheduler.h - Delayed and periodic task scheduling
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

namespace coderoom::server::core {

using TaskId = uint64_t;
using TaskFunction = std::function<void()>;

// Id 0 never refers to a scheduled task
constexpr TaskId kInvalidTaskId = 0;

/**
 * TaskScheduler - Runs callbacks after a delay or on a fixed interval
 *
 * Implementations run callbacks one at a time. Cancel() removes a pending
 * task; when called from outside the scheduler while that task is running,
 * it blocks until the running invocation returns. Callers must therefore not
 * hold locks that the task itself takes when they cancel it.
 */
class TaskScheduler {
public:
    virtual ~TaskScheduler() = default;

    virtual TaskId ScheduleAfter(std::chrono::milliseconds delay, TaskFunction task) = 0;
    virtual TaskId ScheduleEvery(std::chrono::milliseconds interval, TaskFunction task) = 0;

    // Returns true if the task was pending or periodic and is now removed
    virtual bool Cancel(TaskId id) = 0;

    virtual size_t PendingCount() const = 0;
};

// Single worker thread driven by a time-ordered queue
class ThreadedScheduler final : public TaskScheduler {
public:
    ThreadedScheduler();
    ~ThreadedScheduler() override;

    ThreadedScheduler(const ThreadedScheduler&) = delete;
    ThreadedScheduler& operator=(const ThreadedScheduler&) = delete;

    TaskId ScheduleAfter(std::chrono::milliseconds delay, TaskFunction task) override;
    TaskId ScheduleEvery(std::chrono::milliseconds interval, TaskFunction task) override;
    bool Cancel(TaskId id) override;
    size_t PendingCount() const override;

    // Drops pending tasks and joins the worker. Called by the destructor.
    void Shutdown();

private:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        Clock::time_point due;
        std::chrono::milliseconds interval{0};  // zero = one-shot
        TaskFunction task;
    };

    TaskId Schedule(Clock::time_point due, std::chrono::milliseconds interval, TaskFunction task);
    void WorkerLoop();
    bool OnWorkerThread() const;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::map<TaskId, Entry> entries_;
    TaskId next_id_ = 1;
    TaskId running_id_ = kInvalidTaskId;
    bool shutdown_ = false;
    std::thread worker_;
};

/**
 * ManualScheduler - Virtual-clock scheduler for deterministic tests
 *
 * Nothing runs until AdvanceBy() moves the clock; due tasks then run on the
 * calling thread in due-time order (ties in scheduling order).
 */
class ManualScheduler final : public TaskScheduler {
public:
    ManualScheduler() = default;

    TaskId ScheduleAfter(std::chrono::milliseconds delay, TaskFunction task) override;
    TaskId ScheduleEvery(std::chrono::milliseconds interval, TaskFunction task) override;
    bool Cancel(TaskId id) override;
    size_t PendingCount() const override;

    void AdvanceBy(std::chrono::milliseconds delta);
    std::chrono::milliseconds Now() const;

private:
    struct Entry {
        std::chrono::milliseconds due{0};
        std::chrono::milliseconds interval{0};
        TaskFunction task;
    };

    mutable std::mutex mutex_;
    std::map<TaskId, Entry> entries_;
    std::chrono::milliseconds now_{0};
    TaskId next_id_ = 1;
};

} // namespace coderoom::server::core
