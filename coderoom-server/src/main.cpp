// main.cpp - Entry point for coderoom-server
// Hosts the revision buffer and code execution sandbox for a classroom server

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <thread>

#include "core/config_manager.h"
#include "core/logging.h"
#include "core/scheduler.h"
#include "execution/code_execution_sandbox.h"
#include "revision/revision_buffer.h"
#include "storage/local_storage_backend.h"

#ifndef CODEROOM_VERSION
#define CODEROOM_VERSION "0.0.0"
#endif

using namespace coderoom::server;

// Global flag for shutdown
std::atomic<bool> g_shutdown{false};

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown = true;
    }
}

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  --config=PATH      Path to config file (default: ./config/server_config.yaml)\n"
              << "  --data-dir=DIR     Directory for the local revision store\n"
              << "  --log-level=LEVEL  trace, debug, info, warn, error, critical or off\n"
              << "  --run=FILE         Execute a Python file through the sandbox and exit\n"
              << "  --stdin=FILE       Input fed to the program started by --run\n"
              << "  --seed=N           Random seed for --run\n"
              << "  --timeout=MS       Timeout for --run in milliseconds\n"
              << "  --help             Show this help message\n"
              << std::endl;
}

// Command-line overrides; empty fields keep the config file value
struct CommandLine {
    std::string config_path;
    std::string data_dir;
    std::string log_level;
    std::string run_file;
    std::string stdin_file;
    std::optional<int64_t> seed;
    int64_t timeout_ms = 0;
};

bool ReadFile(const std::string& path, std::string& content) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    content = ss.str();
    return true;
}

bool ParseArgs(int argc, char** argv, CommandLine& cli) {
    for (int i = 1; i < argc; ++i) {
        try {
            if (std::strncmp(argv[i], "--config=", 9) == 0) {
                cli.config_path = argv[i] + 9;
            } else if (std::strncmp(argv[i], "--data-dir=", 11) == 0) {
                cli.data_dir = argv[i] + 11;
            } else if (std::strncmp(argv[i], "--log-level=", 12) == 0) {
                cli.log_level = argv[i] + 12;
            } else if (std::strncmp(argv[i], "--run=", 6) == 0) {
                cli.run_file = argv[i] + 6;
            } else if (std::strncmp(argv[i], "--stdin=", 8) == 0) {
                cli.stdin_file = argv[i] + 8;
            } else if (std::strncmp(argv[i], "--seed=", 7) == 0) {
                cli.seed = std::stoll(argv[i] + 7);
            } else if (std::strncmp(argv[i], "--timeout=", 10) == 0) {
                cli.timeout_ms = std::stoll(argv[i] + 10);
            } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
                PrintUsage(argv[0]);
                std::exit(0);
            } else {
                std::cerr << "Unknown option: " << argv[i] << "\n";
                return false;
            }
        } catch (const std::exception& e) {
            std::cerr << "Invalid value in " << argv[i] << ": " << e.what() << "\n";
            return false;
        }
    }
    return true;
}

int RunOnce(const core::ServerConfig& config, const CommandLine& cli) {
    execution::ExecutionRequest request;
    if (!ReadFile(cli.run_file, request.code)) {
        spdlog::error("Cannot read {}", cli.run_file);
        return 2;
    }
    if (!cli.stdin_file.empty()) {
        std::string input;
        if (!ReadFile(cli.stdin_file, input)) {
            spdlog::error("Cannot read {}", cli.stdin_file);
            return 2;
        }
        request.stdin_data = std::move(input);
    }
    request.random_seed = cli.seed;

    execution::CodeExecutionSandbox sandbox(config.execution);
    sandbox.SetStateObserver([](execution::ProcessState state) {
        spdlog::debug("Process state: {}", execution::ProcessStateName(state));
    });

    std::optional<std::chrono::milliseconds> timeout;
    if (cli.timeout_ms > 0) {
        timeout = std::chrono::milliseconds(cli.timeout_ms);
    }

    auto result = sandbox.ExecuteCodeSafe(request, timeout);

    nlohmann::json j = {
        {"success", result.success},
        {"output", result.output},
        {"error", result.error},
        {"execution_time_ms", result.execution_time.count()},
        {"timed_out", result.timed_out}
    };
    j["stdin"] = result.stdin_data ? nlohmann::json(*result.stdin_data) : nlohmann::json(nullptr);

    std::cout << j.dump(2) << std::endl;
    return result.success ? 0 : 1;
}

int main(int argc, char** argv) {
    CommandLine cli;
    if (!ParseArgs(argc, argv, cli)) {
        PrintUsage(argv[0]);
        return 2;
    }

    // Load config file first, then apply command-line overrides
    core::ConfigManager config_manager;
    std::string config_path = cli.config_path.empty() ? core::ConfigManager::FindConfigFile()
                                                      : cli.config_path;
    config_manager.Load(config_path);
    core::ServerConfig config = config_manager.GetConfig();

    if (!cli.data_dir.empty()) config.data_dir = cli.data_dir;
    if (!cli.log_level.empty()) config.log_level = cli.log_level;

    core::InitLogging(config.log_level, config.log_file);

    if (!cli.run_file.empty()) {
        return RunOnce(config, cli);
    }

    spdlog::info("CodeRoom Server v{}", CODEROOM_VERSION);
    spdlog::info("========================================");

    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);

    try {
        storage::LocalStorageBackend storage(config.data_dir);
        if (!storage.Initialize()) {
            spdlog::error("Failed to initialize storage in {}", config.data_dir);
            return 1;
        }

        core::ThreadedScheduler scheduler;
        revision::RevisionBuffer revision_buffer(storage, scheduler, config.revisions);
        if (config.auto_flush) {
            revision_buffer.StartAutoFlush();
        }

        execution::CodeExecutionSandbox sandbox(config.execution);

        spdlog::info("========================================");
        spdlog::info("Server is ready!");
        spdlog::info("  Data directory:   {}", config.data_dir);
        spdlog::info("  Idle flush:       {}ms", config.revisions.idle_flush_delay.count());
        spdlog::info("  Periodic flush:   {}", config.auto_flush ? "ENABLED" : "DISABLED");
        spdlog::info("  Code execution:   {}", sandbox.IsExecutionEnabled() ? "ENABLED" : "DISABLED");
        spdlog::info("  Isolation:        {}", execution::IsolationModeName(config.execution.isolation));
        spdlog::info("========================================");
        spdlog::info("Press Ctrl+C to shutdown");

        // Main loop - wait for shutdown signal
        while (!g_shutdown) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        spdlog::info("Shutting down gracefully...");

        spdlog::info("Flushing buffered revisions...");
        revision_buffer.Shutdown();

        spdlog::info("Stopping scheduler...");
        scheduler.Shutdown();

        spdlog::info("Server shutdown complete");

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }

    return 0;
}
