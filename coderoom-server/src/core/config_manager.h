// config_manager.h - YAML configuration loading/saving
#pragma once

#include "execution/code_execution_sandbox.h"
#include "revision/revision_buffer.h"
#include <string>

namespace coderoom::server::core {

struct ServerConfig {
    // Revisions
    revision::RevisionBufferConfig revisions;
    bool auto_flush = true;

    // Execution
    execution::SandboxConfig execution;

    // Storage
    std::string data_dir = "./data";

    // Logging
    std::string log_level = "info";
    std::string log_file;
};

class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager() = default;

    // Load config from YAML file into internal cache
    bool Load(const std::string& path);

    // Load config from YAML file, then apply environment overrides
    bool LoadConfig(const std::string& path, ServerConfig& config);

    // Save cached config to file
    bool Save();

    // Save config to YAML file
    bool SaveConfig(const ServerConfig& config, const std::string& path);

    const ServerConfig& GetConfig() const { return cached_config_; }
    void SetConfig(const ServerConfig& config) { cached_config_ = config; }

    static ServerConfig GetDefaultConfig();

    // CODEROOM_HOSTED, CODEROOM_HOSTED_SANDBOX_ENABLED, CODEROOM_DISABLE_NSJAIL
    static void ApplyEnvironmentOverrides(ServerConfig& config);

    // Get config file path (checks multiple locations)
    static std::string FindConfigFile();

private:
    std::string last_loaded_path_;
    ServerConfig cached_config_;
};

} // namespace coderoom::server::core
