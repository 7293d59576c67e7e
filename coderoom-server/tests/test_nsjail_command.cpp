// test_nsjail_command.cpp - Unit tests for nsjail command construction

#include <catch2/catch.hpp>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "../src/execution/code_execution_sandbox.h"
#include "../src/execution/nsjail_command.h"

using namespace coderoom::server::execution;
using namespace std::chrono_literals;

namespace {

// Value following the first occurrence of flag, or "" if absent
std::string FlagValue(const std::vector<std::string>& args, const std::string& flag) {
    auto it = std::find(args.begin(), args.end(), flag);
    if (it == args.end() || it + 1 == args.end()) {
        return "";
    }
    return *(it + 1);
}

bool HasPair(const std::vector<std::string>& args, const std::string& flag, const std::string& value) {
    for (size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == flag && args[i + 1] == value) {
            return true;
        }
    }
    return false;
}

} // anonymous namespace

// ========== Executable Lookup Tests ==========

TEST_CASE("NsjailCommand - Executable lookup", "[nsjail]") {
    SECTION("Found in the search path") {
        auto found = FindExecutable("sh", "/nonexistent:/bin:/usr/bin");
        REQUIRE(found.has_value());
        REQUIRE(found->ends_with("/sh"));
    }

    SECTION("Missing executable") {
        REQUIRE_FALSE(FindExecutable("definitely-not-installed", "/usr/bin:/bin").has_value());
        REQUIRE_FALSE(FindExecutable("", "/usr/bin:/bin").has_value());
    }

    SECTION("Absolute paths are checked directly") {
        REQUIRE(FindExecutable("/bin/sh", "") == std::optional<std::string>("/bin/sh"));
        REQUIRE_FALSE(FindExecutable("/nonexistent/python3", "/usr/bin").has_value());
    }
}

TEST_CASE("NsjailCommand - Resolve", "[nsjail]") {
    NsjailOptions options;
    options.nsjail_path = "/nonexistent/nsjail";
    NsjailCommand command(options);

    std::string error;
    REQUIRE_FALSE(command.Resolve(error));
    REQUIRE(error == "Sandbox (nsjail) is required but not available");
}

// ========== Argument Tests ==========

TEST_CASE("NsjailCommand - Arguments", "[nsjail]") {
    NsjailOptions options;
    options.memory_limit_mb = 256;
    options.max_pids = 4;
    options.extra_ro_mounts = {"/opt/libs"};
    NsjailCommand command(options);

    auto args = command.BuildArgs("/usr/bin/python3", {"-c", "print(1)"}, "/tmp/coding-tool-abc123",
                                  {"PATH=/usr/bin:/bin", "HOME=/tmp"}, 1500ms);

    SECTION("One-shot mode with rlimits") {
        REQUIRE(FlagValue(args, "--mode") == "o");
        REQUIRE(FlagValue(args, "--rlimit_as") == "256");
        REQUIRE(FlagValue(args, "--rlimit_nproc") == "4");
        REQUIRE(FlagValue(args, "--rlimit_cpu") == "2");
        REQUIRE(FlagValue(args, "--time_limit") == "2");
    }

    SECTION("Mounts") {
        REQUIRE(HasPair(args, "--bindmount_ro", "/usr"));
        REQUIRE(HasPair(args, "--bindmount_ro", "/opt/libs"));
        REQUIRE(HasPair(args, "--bindmount", "/tmp/coding-tool-abc123"));
        REQUIRE(FlagValue(args, "--cwd") == "/tmp/coding-tool-abc123");
    }

    SECTION("Environment and command come last") {
        REQUIRE(HasPair(args, "--env", "PATH=/usr/bin:/bin"));
        REQUIRE(HasPair(args, "--env", "HOME=/tmp"));

        auto separator = std::find(args.begin(), args.end(), "--");
        REQUIRE(separator != args.end());
        REQUIRE(std::vector<std::string>(separator + 1, args.end()) ==
                std::vector<std::string>{"/usr/bin/python3", "-c", "print(1)"});
    }

    SECTION("Short timeouts still get one second") {
        auto quick = command.BuildArgs("/usr/bin/python3", {}, "", {}, 10ms);
        REQUIRE(FlagValue(quick, "--time_limit") == "1");
        REQUIRE(FlagValue(quick, "--cwd") == "/tmp");
    }
}

TEST_CASE("NsjailCommand - Sandbox fails closed without nsjail", "[nsjail][sandbox]") {
    SandboxConfig config;
    config.temp_root = "test_sandbox_nsjail";
    config.isolation = IsolationMode::Nsjail;
    config.nsjail.nsjail_path = "/nonexistent/nsjail";
    CodeExecutionSandbox sandbox(config);

    ExecutionRequest request;
    request.code = "print('should not run')";
    auto result = sandbox.ExecuteCode(request);

    REQUIRE_FALSE(result.success);
    REQUIRE(result.output.empty());
    REQUIRE(result.error == "Failed to execute code: Sandbox (nsjail) is required but not available");

    std::filesystem::remove_all("test_sandbox_nsjail");
}
