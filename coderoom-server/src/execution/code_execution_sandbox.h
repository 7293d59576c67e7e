// code_execution_sandbox.h - Isolated execution of student Python code
#pragma once

#include "execution/child_process.h"
#include "execution/execution_limits.h"
#include "execution/execution_types.h"
#include "execution/nsjail_command.h"
#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace coderoom::server::execution {

enum class IsolationMode {
    None,    // plain child process in a private temp directory
    Nsjail   // wrapped in nsjail namespaces and rlimits
};

const char* IsolationModeName(IsolationMode mode);
std::optional<IsolationMode> ParseIsolationMode(const std::string& name);

struct SandboxConfig {
    std::string interpreter = "python3";
    std::string temp_root;                 // empty = system temp directory
    std::chrono::milliseconds default_timeout = kDefaultTimeout;
    std::chrono::milliseconds kill_grace = kDefaultKillGrace;

    // Execution is disabled on the hosted platform unless its sandbox is enabled
    bool hosted_platform = false;
    bool hosted_sandbox_enabled = false;

    IsolationMode isolation = IsolationMode::None;
    NsjailOptions nsjail;
};

/**
 * CodeExecutionSandbox - Runs one submission per call in its own process
 *
 * Each call validates the request, stages attached files in a fresh temp
 * directory, runs the interpreter there with a minimal environment and
 * returns a bounded result. Calls never throw and never share state, so any
 * number may run concurrently; limiting concurrency is the caller's job.
 */
class CodeExecutionSandbox {
public:
    CodeExecutionSandbox();
    explicit CodeExecutionSandbox(const SandboxConfig& config);
    ~CodeExecutionSandbox() = default;

    ExecutionResult ExecuteCode(const ExecutionRequest& request,
                                std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // ExecuteCode with server paths and errno numbers stripped from the error
    ExecutionResult ExecuteCodeSafe(const ExecutionRequest& request,
                                    std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    static std::string SanitizeError(const std::string& text);

    bool IsExecutionEnabled() const;

    // Receives every process state change of every run, on the running thread
    void SetStateObserver(StateObserver observer);

    const SandboxConfig& GetConfig() const { return config_; }

    static const char* const kNotAvailableMessage;
    static const char* const kChildPath;
    static const char* const kWorkspaceFailedMessage;

private:
    bool BuildSpawnOptions(const std::string& source, const std::string& working_dir,
                           std::chrono::milliseconds timeout, SpawnOptions& options,
                           std::string& error) const;

    SandboxConfig config_;

    mutable std::mutex observer_mutex_;
    StateObserver observer_;
};

} // namespace coderoom::server::execution
