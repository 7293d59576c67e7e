// code_execution_sandbox.cpp - Isolated execution of student Python code
#include "execution/code_execution_sandbox.h"
#include "execution/temp_workspace.h"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <cstring>

namespace coderoom::server::execution {

const char* const CodeExecutionSandbox::kNotAvailableMessage =
    "Code execution is not yet available in production. Coming soon!";

const char* const CodeExecutionSandbox::kChildPath = "/usr/bin:/bin";

const char* const CodeExecutionSandbox::kWorkspaceFailedMessage =
    "Failed to execute code: could not create workspace";

namespace {

using Clock = std::chrono::steady_clock;

std::vector<std::string> MinimalEnvironment() {
    return {
        std::string("PATH=") + CodeExecutionSandbox::kChildPath,
        "HOME=/tmp",
        "PYTHONDONTWRITEBYTECODE=1",
        "PYTHONUNBUFFERED=1",
    };
}

std::chrono::milliseconds Since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

} // anonymous namespace

const char* IsolationModeName(IsolationMode mode) {
    switch (mode) {
        case IsolationMode::None: return "none";
        case IsolationMode::Nsjail: return "nsjail";
    }
    return "none";
}

std::optional<IsolationMode> ParseIsolationMode(const std::string& name) {
    if (name == "none") return IsolationMode::None;
    if (name == "nsjail") return IsolationMode::Nsjail;
    return std::nullopt;
}

CodeExecutionSandbox::CodeExecutionSandbox()
    : CodeExecutionSandbox(SandboxConfig()) {
}

CodeExecutionSandbox::CodeExecutionSandbox(const SandboxConfig& config)
    : config_(config) {
    if (config_.default_timeout.count() <= 0) {
        config_.default_timeout = kDefaultTimeout;
    }
    if (config_.kill_grace.count() <= 0) {
        config_.kill_grace = kDefaultKillGrace;
    }
    spdlog::debug("CodeExecutionSandbox: interpreter={} isolation={} enabled={}",
                  config_.interpreter, IsolationModeName(config_.isolation), IsExecutionEnabled());
}

bool CodeExecutionSandbox::IsExecutionEnabled() const {
    return !config_.hosted_platform || config_.hosted_sandbox_enabled;
}

void CodeExecutionSandbox::SetStateObserver(StateObserver observer) {
    std::lock_guard<std::mutex> lock(observer_mutex_);
    observer_ = std::move(observer);
}

std::string CodeExecutionSandbox::SanitizeError(const std::string& text) {
    return execution::SanitizeError(text);
}

bool CodeExecutionSandbox::BuildSpawnOptions(const std::string& source, const std::string& working_dir,
                                             std::chrono::milliseconds timeout, SpawnOptions& options,
                                             std::string& error) const {
    // Resolve against the child's PATH, not the server's
    auto interpreter = FindExecutable(config_.interpreter, kChildPath);
    if (!interpreter) {
        error = "spawn " + config_.interpreter + " ENOENT";
        return false;
    }

    std::vector<std::string> args = {"-c", source};
    options.working_dir = working_dir;

    if (config_.isolation == IsolationMode::None) {
        options.executable = *interpreter;
        options.args = std::move(args);
        options.env = MinimalEnvironment();
        return true;
    }

    NsjailCommand nsjail(config_.nsjail);
    if (!nsjail.Resolve(error)) {
        return false;
    }
    options.executable = nsjail.GetNsjailPath();
    options.args = nsjail.BuildArgs(*interpreter, args, working_dir, MinimalEnvironment(), timeout);
    options.env = MinimalEnvironment();
    return true;
}

ExecutionResult CodeExecutionSandbox::ExecuteCode(const ExecutionRequest& request,
                                                  std::optional<std::chrono::milliseconds> timeout) {
    ExecutionResult result;
    result.stdin_data = request.stdin_data;

    if (!IsExecutionEnabled()) {
        result.error = kNotAvailableMessage;
        return result;
    }

    const auto start = Clock::now();
    const auto run_timeout = (timeout && timeout->count() > 0) ? *timeout : config_.default_timeout;
    std::string error;

    // Nothing touches the filesystem until the request is known to be valid
    if (!ValidateCodeSize(request.code, error) ||
        (request.stdin_data && !ValidateStdinSize(*request.stdin_data, error))) {
        result.error = error;
        result.execution_time = Since(start);
        return result;
    }
    if (!ValidateAttachedFiles(request.attached_files, error)) {
        result.error = "File attachment error: " + error;
        result.execution_time = Since(start);
        return result;
    }

    TempWorkspace workspace;
    if (!workspace.Create(config_.temp_root, error)) {
        // Workspace errors name server paths, so they stay in the log
        spdlog::error("CodeExecutionSandbox: {}", error);
        result.error = kWorkspaceFailedMessage;
        result.execution_time = Since(start);
        return result;
    }

    for (const auto& file : request.attached_files) {
        if (!workspace.WriteFile(SanitizeFilename(file.name), file.content, error)) {
            result.error = "File attachment error: " + error;
            result.execution_time = Since(start);
            return result;
        }
    }

    std::string source = request.code;
    if (request.random_seed) {
        source = "import random\nrandom.seed(" + std::to_string(*request.random_seed) + ")\n" + request.code;
    }

    SpawnOptions options;
    if (!BuildSpawnOptions(source, workspace.GetPath().string(), run_timeout, options, error)) {
        spdlog::warn("CodeExecutionSandbox: Cannot start interpreter: {}", error);
        result.error = "Failed to execute code: " + error;
        result.execution_time = Since(start);
        return result;
    }

    ChildProcess child(std::move(options));
    {
        std::lock_guard<std::mutex> lock(observer_mutex_);
        child.SetStateObserver(observer_);
    }

    ProcessOutcome outcome = child.Run(request.stdin_data, run_timeout, config_.kill_grace, kOutputMaxBytes);
    workspace.Remove();

    result.output = TruncateOutput(outcome.stdout_data);
    result.execution_time = Since(start);

    if (!outcome.spawned) {
        result.error = "Failed to execute code: " + outcome.spawn_error;
        return result;
    }

    if (outcome.timed_out) {
        result.timed_out = true;
        result.error = "Execution timed out after " + std::to_string(run_timeout.count()) + "ms";
        spdlog::info("CodeExecutionSandbox: Run timed out after {}ms", run_timeout.count());
        return result;
    }

    result.success = outcome.exit_code == 0 && outcome.stderr_data.empty();
    result.error = TruncateOutput(outcome.stderr_data);

    if (outcome.term_signal != 0 && outcome.stderr_data.empty()) {
        result.error = fmt::format("Process terminated by signal {} ({})", outcome.term_signal,
                                   strsignal(outcome.term_signal));
    }

    const auto& stderr_text = outcome.stderr_data;
    if (stderr_text.find("EOFError") != std::string::npos &&
        stderr_text.find("reading a line") != std::string::npos) {
        result.error = kWaitingForInputMessage;
    }

    spdlog::debug("CodeExecutionSandbox: exit={} success={} time={}ms", outcome.exit_code,
                  result.success, result.execution_time.count());
    return result;
}

ExecutionResult CodeExecutionSandbox::ExecuteCodeSafe(const ExecutionRequest& request,
                                                      std::optional<std::chrono::milliseconds> timeout) {
    ExecutionResult result = ExecuteCode(request, timeout);
    result.error = SanitizeError(result.error);
    return result;
}

} // namespace coderoom::server::execution
