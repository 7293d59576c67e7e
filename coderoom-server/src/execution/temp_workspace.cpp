// temp_workspace.cpp - Scoped per-run working directory
#include "execution/temp_workspace.h"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdlib.h>
#include <vector>

namespace coderoom::server::execution {

TempWorkspace::~TempWorkspace() {
    Remove();
}

bool TempWorkspace::Create(const std::string& root, std::string& error) {
    std::error_code ec;
    std::filesystem::path base = root.empty() ? std::filesystem::temp_directory_path(ec)
                                              : std::filesystem::path(root);
    if (ec) {
        error = "No temporary directory available: " + ec.message();
        return false;
    }
    std::filesystem::create_directories(base, ec);
    if (ec) {
        error = "Cannot create " + base.string() + ": " + ec.message();
        return false;
    }

    std::string pattern = (base / "coding-tool-XXXXXX").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    if (mkdtemp(buffer.data()) == nullptr) {
        error = "mkdtemp failed: " + std::string(std::strerror(errno));
        return false;
    }

    path_ = std::filesystem::canonical(buffer.data(), ec);
    if (ec) {
        path_ = buffer.data();
    }
    spdlog::debug("TempWorkspace: Created {}", path_.string());
    return true;
}

bool TempWorkspace::WriteFile(const std::string& name, const std::string& content, std::string& error) {
    if (!IsCreated()) {
        error = "Workspace not created";
        return false;
    }

    std::filesystem::path target = (path_ / name).lexically_normal();
    if (target.parent_path() != path_) {
        error = "Invalid file name: " + name;
        return false;
    }

    std::ofstream file(target, std::ios::binary | std::ios::trunc);
    if (!file) {
        error = "Cannot create file " + name;
        return false;
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!file) {
        error = "Cannot write file " + name;
        return false;
    }
    return true;
}

void TempWorkspace::Remove() {
    if (path_.empty()) {
        return;
    }

    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        spdlog::error("TempWorkspace: Failed to remove {}: {}", path_.string(), ec.message());
    } else {
        spdlog::debug("TempWorkspace: Removed {}", path_.string());
    }
    path_.clear();
}

} // namespace coderoom::server::execution
