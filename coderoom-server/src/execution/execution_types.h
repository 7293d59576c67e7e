// execution_types.h - Requests and results of sandboxed code runs
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace coderoom::server::execution {

struct AttachedFile {
    std::string name;
    std::string content;
};

struct ExecutionRequest {
    std::string code;
    std::optional<std::string> stdin_data;
    std::optional<int64_t> random_seed;  // 0 is a valid seed
    std::vector<AttachedFile> attached_files;
};

struct ExecutionResult {
    bool success = false;
    std::string output;
    std::string error;
    std::chrono::milliseconds execution_time{0};
    std::optional<std::string> stdin_data;  // echo of the request

    // Set when the run was stopped by the timeout
    bool timed_out = false;
};

} // namespace coderoom::server::execution
