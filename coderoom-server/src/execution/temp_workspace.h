// temp_workspace.h - Scoped per-run working directory
#pragma once

#include <filesystem>
#include <string>

namespace coderoom::server::execution {

/**
 * TempWorkspace - Uniquely named directory removed when the object dies
 *
 * Create() makes "<root>/coding-tool-XXXXXX" with mkdtemp, so concurrent
 * runs never share a directory. The directory and everything written to it
 * is removed by the destructor on every exit path.
 */
class TempWorkspace {
public:
    TempWorkspace() = default;
    ~TempWorkspace();

    TempWorkspace(const TempWorkspace&) = delete;
    TempWorkspace& operator=(const TempWorkspace&) = delete;

    // root empty = system temp directory
    bool Create(const std::string& root, std::string& error);

    // Writes a file whose name has already been sanitized. Fails if the
    // resolved path would land outside the workspace.
    bool WriteFile(const std::string& name, const std::string& content, std::string& error);

    void Remove();

    const std::filesystem::path& GetPath() const { return path_; }
    bool IsCreated() const { return !path_.empty(); }

private:
    std::filesystem::path path_;
};

} // namespace coderoom::server::execution
