// child_process.h - One interpreter process with staged termination
#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace coderoom::server::execution {

enum class ProcessState {
    NotStarted,
    Spawned,
    TerminatingSoft,   // SIGTERM sent after the timeout
    TerminatingHard,   // SIGKILL sent after the grace period
    Exited
};

const char* ProcessStateName(ProcessState state);

using StateObserver = std::function<void(ProcessState)>;

struct SpawnOptions {
    std::string executable;              // absolute path
    std::vector<std::string> args;       // argv[1..]
    std::vector<std::string> env;        // complete environment, KEY=VALUE
    std::string working_dir;
};

struct ProcessOutcome {
    bool spawned = false;
    std::string spawn_error;

    bool timed_out = false;
    int exit_code = -1;      // -1 unless the process exited normally
    int term_signal = 0;     // signal that ended the process, if any

    std::string stdout_data;
    std::string stderr_data;

    std::chrono::milliseconds elapsed{0};
};

/**
 * ChildProcess - fork/exec wrapper driving a single run to completion
 *
 * The child gets its own process group, so signals reach anything it
 * starts. Run() feeds stdin, collects both output streams and walks the
 * state machine:
 *
 *   Spawned --timeout--> TerminatingSoft --grace--> TerminatingHard
 *      \                       |                         |
 *       +----------------------+-------------------------+--> Exited
 *
 * Each transition is reported to the observer on the calling thread.
 */
class ChildProcess {
public:
    explicit ChildProcess(SpawnOptions options);
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    void SetStateObserver(StateObserver observer) { observer_ = std::move(observer); }

    // stdin_data absent: the pipe stays open and unwritten until the run ends.
    // Each output stream keeps at most capture_limit bytes plus a few spare
    // bytes so callers can detect overflow.
    ProcessOutcome Run(const std::optional<std::string>& stdin_data,
                       std::chrono::milliseconds timeout,
                       std::chrono::milliseconds kill_grace,
                       size_t capture_limit);

    ProcessState GetState() const { return state_; }
    pid_t GetPid() const { return pid_; }

private:
    bool Spawn(std::string& error);
    void SetState(ProcessState state);
    void SignalGroup(int sig);
    void CloseFd(int& fd);

    SpawnOptions options_;
    StateObserver observer_;
    ProcessState state_ = ProcessState::NotStarted;

    pid_t pid_ = -1;
    bool reaped_ = false;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
};

} // namespace coderoom::server::execution
