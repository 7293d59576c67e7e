// nsjail_command.cpp - Optional nsjail wrapping of the interpreter command
#include "execution/nsjail_command.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <sstream>
#include <unistd.h>

namespace coderoom::server::execution {

std::optional<std::string> FindExecutable(const std::string& name, const std::string& search_path) {
    if (name.empty()) {
        return std::nullopt;
    }
    if (name.find('/') != std::string::npos) {
        if (access(name.c_str(), X_OK) == 0) {
            return name;
        }
        return std::nullopt;
    }

    std::istringstream dirs(search_path);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        std::filesystem::path candidate = std::filesystem::path(dir) / name;
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0) {
            return candidate.string();
        }
    }
    return std::nullopt;
}

NsjailCommand::NsjailCommand(NsjailOptions options)
    : options_(std::move(options)) {
}

bool NsjailCommand::Resolve(std::string& error) {
    auto found = FindExecutable(options_.nsjail_path.empty() ? "nsjail" : options_.nsjail_path,
                                "/usr/local/bin:/usr/bin:/bin:/usr/sbin:/sbin");
    if (!found) {
        error = "Sandbox (nsjail) is required but not available";
        return false;
    }
    nsjail_path_ = *found;
    return true;
}

std::vector<std::string> NsjailCommand::BuildArgs(const std::string& interpreter,
                                                  const std::vector<std::string>& args,
                                                  const std::string& working_dir,
                                                  const std::vector<std::string>& env,
                                                  std::chrono::milliseconds timeout) const {
    // Whole seconds, rounded up, never below one
    const auto seconds = std::to_string(std::max<long long>(1, (timeout.count() + 999) / 1000));

    std::vector<std::string> out = {
        "--mode", "o",
        "--rlimit_as", std::to_string(options_.memory_limit_mb),
        "--rlimit_cpu", seconds,
        "--rlimit_fsize", std::to_string(options_.max_file_size_mb),
        "--rlimit_nofile", std::to_string(options_.max_open_files),
        "--rlimit_nproc", std::to_string(options_.max_pids),
        "--time_limit", seconds,
        "--really_quiet",
        "--bindmount_ro", "/usr",
        "--bindmount_ro", "/lib",
        "--bindmount_ro", "/bin",
    };

    for (const char* path : {"/lib64", "/etc/alternatives", "/etc/ld.so.cache",
                                 "/etc/ld.so.conf", "/etc/ld.so.conf.d"}) {
        std::error_code ec;
        if (std::filesystem::exists(path, ec)) {
            out.push_back("--bindmount_ro");
            out.push_back(path);
        }
    }

    // Interpreters installed outside /usr need their prefix mounted too
    std::error_code ec;
    auto real = std::filesystem::canonical(interpreter, ec);
    if (!ec) {
        auto prefix = real.parent_path().parent_path();
        if (!prefix.empty() && prefix != "/" && prefix != "/usr") {
            out.push_back("--bindmount_ro");
            out.push_back(prefix.string());
        }
    }

    for (const auto& mount : options_.extra_ro_mounts) {
        out.push_back("--bindmount_ro");
        out.push_back(mount);
    }

    out.insert(out.end(), {"--bindmount_ro", "/dev/null", "--bindmount_ro", "/dev/urandom"});

    if (!working_dir.empty()) {
        out.insert(out.end(), {"--bindmount", working_dir, "--cwd", working_dir});
    } else {
        out.insert(out.end(), {"--tmpfsmount", "/tmp", "--cwd", "/tmp"});
    }

    for (const auto& entry : env) {
        out.push_back("--env");
        out.push_back(entry);
    }

    out.push_back("--");
    out.push_back(interpreter);
    out.insert(out.end(), args.begin(), args.end());

    spdlog::debug("NsjailCommand: {} arguments for {}", out.size(), interpreter);
    return out;
}

} // namespace coderoom::server::execution
