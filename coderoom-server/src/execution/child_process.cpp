// child_process.cpp - One interpreter process with staged termination
#include "execution/child_process.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace coderoom::server::execution {

namespace {

using Clock = std::chrono::steady_clock;

constexpr size_t kCaptureSpare = 4;
constexpr std::chrono::milliseconds kReapPollInterval{20};

void IgnoreSigpipe() {
    static std::once_flag once;
    std::call_once(once, []() {
        // Writes to a child that exited must fail with EPIPE, not kill the server
        std::signal(SIGPIPE, SIG_IGN);
    });
}

void SetNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

// Writes errno to the status pipe and exits; only async-signal-safe calls
[[noreturn]] void ChildFail(int status_fd) {
    int err = errno;
    ssize_t ignored = write(status_fd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

// Returns false on EOF or a read error
bool DrainFd(int fd, std::string& sink, size_t limit) {
    char buffer[8192];
    while (true) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            size_t room = sink.size() < limit ? limit - sink.size() : 0;
            sink.append(buffer, std::min(room, static_cast<size_t>(n)));
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

} // anonymous namespace

const char* ProcessStateName(ProcessState state) {
    switch (state) {
        case ProcessState::NotStarted: return "not_started";
        case ProcessState::Spawned: return "spawned";
        case ProcessState::TerminatingSoft: return "terminating_soft";
        case ProcessState::TerminatingHard: return "terminating_hard";
        case ProcessState::Exited: return "exited";
    }
    return "unknown";
}

ChildProcess::ChildProcess(SpawnOptions options)
    : options_(std::move(options)) {
}

ChildProcess::~ChildProcess() {
    CloseFd(stdin_fd_);
    CloseFd(stdout_fd_);
    CloseFd(stderr_fd_);

    if (pid_ > 0 && !reaped_) {
        SignalGroup(SIGKILL);
        waitpid(pid_, nullptr, 0);
        reaped_ = true;
    }
}

void ChildProcess::CloseFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

void ChildProcess::SetState(ProcessState state) {
    if (state_ == state) {
        return;
    }
    spdlog::debug("ChildProcess {}: {} -> {}", pid_, ProcessStateName(state_), ProcessStateName(state));
    state_ = state;
    if (observer_) {
        observer_(state);
    }
}

void ChildProcess::SignalGroup(int sig) {
    if (pid_ <= 0) {
        return;
    }
    if (kill(-pid_, sig) == -1 && errno != ESRCH) {
        spdlog::warn("ChildProcess {}: kill({}) failed: {}", pid_, sig, strerror(errno));
    }
}

bool ChildProcess::Spawn(std::string& error) {
    IgnoreSigpipe();

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    auto close_all = [&]() {
        for (int* p : {in_pipe, out_pipe, err_pipe, status_pipe}) {
            if (p[0] >= 0) close(p[0]);
            if (p[1] >= 0) close(p[1]);
        }
    };

    if (pipe2(in_pipe, O_CLOEXEC) == -1 || pipe2(out_pipe, O_CLOEXEC) == -1 ||
        pipe2(err_pipe, O_CLOEXEC) == -1 || pipe2(status_pipe, O_CLOEXEC) == -1) {
        error = std::string("pipe failed: ") + strerror(errno);
        close_all();
        return false;
    }

    // Everything the child touches is built before fork
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(options_.executable.c_str()));
    for (auto& arg : options_.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<char*> envp;
    for (auto& entry : options_.env) {
        envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);

    const char* working_dir = options_.working_dir.empty() ? nullptr : options_.working_dir.c_str();

    pid_ = fork();
    if (pid_ == -1) {
        error = std::string("fork failed: ") + strerror(errno);
        close_all();
        return false;
    }

    if (pid_ == 0) {
        setpgid(0, 0);

        sigset_t empty;
        sigemptyset(&empty);
        sigprocmask(SIG_SETMASK, &empty, nullptr);
        signal(SIGPIPE, SIG_DFL);

        if (dup2(in_pipe[0], STDIN_FILENO) == -1 ||
            dup2(out_pipe[1], STDOUT_FILENO) == -1 ||
            dup2(err_pipe[1], STDERR_FILENO) == -1) {
            ChildFail(status_pipe[1]);
        }
        if (working_dir && chdir(working_dir) == -1) {
            ChildFail(status_pipe[1]);
        }

        execve(argv[0], argv.data(), envp.data());
        ChildFail(status_pipe[1]);
    }

    // Parent also sets the group so signals work before the child runs
    setpgid(pid_, pid_);

    close(in_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[1]);
    close(status_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n == -1 && errno == EINTR);
    close(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        // exec never happened
        close(in_pipe[1]);
        close(out_pipe[0]);
        close(err_pipe[0]);
        waitpid(pid_, nullptr, 0);
        reaped_ = true;
        error = std::string(strerror(child_errno));
        return false;
    }

    stdin_fd_ = in_pipe[1];
    stdout_fd_ = out_pipe[0];
    stderr_fd_ = err_pipe[0];
    SetNonBlocking(stdin_fd_);
    SetNonBlocking(stdout_fd_);
    SetNonBlocking(stderr_fd_);
    return true;
}

ProcessOutcome ChildProcess::Run(const std::optional<std::string>& stdin_data,
                                 std::chrono::milliseconds timeout,
                                 std::chrono::milliseconds kill_grace,
                                 size_t capture_limit) {
    ProcessOutcome outcome;
    const auto start = Clock::now();
    const size_t limit = capture_limit + kCaptureSpare;

    if (state_ != ProcessState::NotStarted) {
        outcome.spawn_error = "process already started";
        return outcome;
    }

    if (!Spawn(outcome.spawn_error)) {
        spdlog::warn("ChildProcess: Failed to start {}: {}", options_.executable, outcome.spawn_error);
        outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
        return outcome;
    }
    outcome.spawned = true;
    SetState(ProcessState::Spawned);

    size_t stdin_offset = 0;
    bool feeding = stdin_data.has_value();
    if (feeding && stdin_data->empty()) {
        CloseFd(stdin_fd_);
        feeding = false;
    }

    const auto soft_deadline = start + timeout;
    auto hard_deadline = Clock::time_point::max();
    auto abandon_deadline = Clock::time_point::max();
    int status = 0;

    while (true) {
        if (!reaped_) {
            pid_t r = waitpid(pid_, &status, WNOHANG);
            if (r == pid_) {
                reaped_ = true;
                if (WIFEXITED(status)) {
                    outcome.exit_code = WEXITSTATUS(status);
                } else if (WIFSIGNALED(status)) {
                    outcome.term_signal = WTERMSIG(status);
                }
                SetState(ProcessState::Exited);
            }
        }

        if (reaped_ && stdout_fd_ < 0 && stderr_fd_ < 0) {
            break;
        }

        const auto now = Clock::now();
        if (state_ == ProcessState::Spawned && now >= soft_deadline) {
            outcome.timed_out = true;
            SetState(ProcessState::TerminatingSoft);
            SignalGroup(SIGTERM);
            hard_deadline = now + kill_grace;
        } else if (state_ == ProcessState::TerminatingSoft && now >= hard_deadline) {
            SetState(ProcessState::TerminatingHard);
            SignalGroup(SIGKILL);
        }

        if (reaped_ && abandon_deadline == Clock::time_point::max()) {
            // Output pipes held open by processes the child left behind
            abandon_deadline = std::max(now, hard_deadline == Clock::time_point::max()
                                                 ? soft_deadline : hard_deadline) + kill_grace;
        }
        if (reaped_ && now >= abandon_deadline) {
            spdlog::warn("ChildProcess {}: Output still open after exit, killing process group", pid_);
            SignalGroup(SIGKILL);
            break;
        }

        std::vector<pollfd> fds;
        if (stdout_fd_ >= 0) fds.push_back({stdout_fd_, POLLIN, 0});
        if (stderr_fd_ >= 0) fds.push_back({stderr_fd_, POLLIN, 0});
        if (feeding && stdin_fd_ >= 0) fds.push_back({stdin_fd_, POLLOUT, 0});

        auto next_deadline = state_ == ProcessState::Spawned ? soft_deadline
                           : state_ == ProcessState::TerminatingSoft ? hard_deadline
                           : abandon_deadline;
        auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(next_deadline - now) +
                    std::chrono::milliseconds(1);
        if (!reaped_) {
            wait = std::min(wait, kReapPollInterval);
        }
        wait = std::max(wait, std::chrono::milliseconds(0));

        int ready = poll(fds.data(), fds.size(), static_cast<int>(wait.count()));
        if (ready == -1) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("ChildProcess {}: poll failed: {}", pid_, strerror(errno));
            SignalGroup(SIGKILL);
            break;
        }

        for (const auto& p : fds) {
            if (p.revents == 0) {
                continue;
            }
            if (p.fd == stdout_fd_) {
                if (!DrainFd(stdout_fd_, outcome.stdout_data, limit)) CloseFd(stdout_fd_);
            } else if (p.fd == stderr_fd_) {
                if (!DrainFd(stderr_fd_, outcome.stderr_data, limit)) CloseFd(stderr_fd_);
            } else if (p.fd == stdin_fd_) {
                if (p.revents & (POLLERR | POLLHUP)) {
                    CloseFd(stdin_fd_);
                    feeding = false;
                    continue;
                }
                ssize_t n = write(stdin_fd_, stdin_data->data() + stdin_offset,
                                  stdin_data->size() - stdin_offset);
                if (n > 0) {
                    stdin_offset += static_cast<size_t>(n);
                } else if (n == -1 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                    // EPIPE: the program stopped reading
                    CloseFd(stdin_fd_);
                    feeding = false;
                }
                if (feeding && stdin_offset == stdin_data->size()) {
                    CloseFd(stdin_fd_);
                    feeding = false;
                }
            }
        }
    }

    if (!reaped_) {
        SignalGroup(SIGKILL);
        waitpid(pid_, &status, 0);
        reaped_ = true;
        SetState(ProcessState::Exited);
    }

    CloseFd(stdin_fd_);
    CloseFd(stdout_fd_);
    CloseFd(stderr_fd_);

    outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
    spdlog::debug("ChildProcess {}: exit={} signal={} timed_out={} elapsed={}ms", pid_,
                  outcome.exit_code, outcome.term_signal, outcome.timed_out, outcome.elapsed.count());
    return outcome;
}

} // namespace coderoom::server::execution
