// nsjail_command.h - Optional nsjail wrapping of the interpreter command
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace coderoom::server::execution {

struct NsjailOptions {
    std::string nsjail_path;          // empty = search the PATH
    size_t memory_limit_mb = 128;
    size_t max_file_size_mb = 10;
    size_t max_open_files = 32;
    size_t max_pids = 10;
    std::vector<std::string> extra_ro_mounts;
};

// Absolute path of an executable found in a colon separated search path
std::optional<std::string> FindExecutable(const std::string& name, const std::string& search_path);

/**
 * NsjailCommand - Builds an nsjail one-shot command line
 *
 * The jail has no network, read-only system directories, a read-write bind
 * of the working directory and rlimits on memory, cpu time, file size, open
 * files and processes. The cpu and wall limits back up the caller's own
 * timeout.
 */
class NsjailCommand {
public:
    explicit NsjailCommand(NsjailOptions options);

    // Locates nsjail; false when it is not installed
    bool Resolve(std::string& error);

    const std::string& GetNsjailPath() const { return nsjail_path_; }

    std::vector<std::string> BuildArgs(const std::string& interpreter,
                                       const std::vector<std::string>& args,
                                       const std::string& working_dir,
                                       const std::vector<std::string>& env,
                                       std::chrono::milliseconds timeout) const;

private:
    NsjailOptions options_;
    std::string nsjail_path_;
};

} // namespace coderoom::server::execution
