// config_manager.cpp - YAML configuration implementation
#include "core/config_manager.h"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>
#include <vector>

namespace coderoom::server::core {

namespace {

bool EnvFlag(const char* name, bool& value) {
    const char* raw = std::getenv(name);
    if (!raw) {
        return false;
    }
    std::string text(raw);
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    value = (text == "1" || text == "true" || text == "yes" || text == "on");
    return true;
}

} // anonymous namespace

ConfigManager::ConfigManager() {
    cached_config_ = GetDefaultConfig();
    spdlog::debug("ConfigManager created");
}

bool ConfigManager::Load(const std::string& path) {
    return LoadConfig(path, cached_config_);
}

bool ConfigManager::Save() {
    if (last_loaded_path_.empty()) {
        last_loaded_path_ = FindConfigFile();
    }
    return SaveConfig(cached_config_, last_loaded_path_);
}

bool ConfigManager::LoadConfig(const std::string& path, ServerConfig& config) {
    try {
        if (!std::filesystem::exists(path)) {
            spdlog::warn("Config file not found: {}, using defaults", path);
            config = GetDefaultConfig();
            ApplyEnvironmentOverrides(config);
            return true;
        }

        YAML::Node yaml = YAML::LoadFile(path);
        last_loaded_path_ = path;
        config = GetDefaultConfig();

        // Revision settings
        if (yaml["revisions"]) {
            auto revisions = yaml["revisions"];
            auto& rc = config.revisions;
            if (revisions["idle_flush_ms"]) rc.idle_flush_delay = std::chrono::milliseconds(revisions["idle_flush_ms"].as<int64_t>());
            if (revisions["periodic_flush_ms"]) rc.periodic_flush_interval = std::chrono::milliseconds(revisions["periodic_flush_ms"].as<int64_t>());
            if (revisions["snapshot_interval"]) rc.snapshot_interval = revisions["snapshot_interval"].as<uint64_t>();
            if (revisions["large_change_threshold"]) rc.large_change_threshold = revisions["large_change_threshold"].as<size_t>();
            if (revisions["max_buffer_size"]) rc.max_buffer_size = revisions["max_buffer_size"].as<size_t>();
            if (revisions["auto_flush"]) config.auto_flush = revisions["auto_flush"].as<bool>();
        }

        // Execution settings
        if (yaml["execution"]) {
            auto exec = yaml["execution"];
            auto& ec = config.execution;
            if (exec["interpreter"]) ec.interpreter = exec["interpreter"].as<std::string>();
            if (exec["temp_root"]) ec.temp_root = exec["temp_root"].as<std::string>();
            if (exec["timeout_ms"]) ec.default_timeout = std::chrono::milliseconds(exec["timeout_ms"].as<int64_t>());
            if (exec["kill_grace_ms"]) ec.kill_grace = std::chrono::milliseconds(exec["kill_grace_ms"].as<int64_t>());
            if (exec["hosted_platform"]) ec.hosted_platform = exec["hosted_platform"].as<bool>();
            if (exec["hosted_sandbox_enabled"]) ec.hosted_sandbox_enabled = exec["hosted_sandbox_enabled"].as<bool>();
            if (exec["isolation"]) {
                auto name = exec["isolation"].as<std::string>();
                auto mode = execution::ParseIsolationMode(name);
                if (mode) {
                    ec.isolation = *mode;
                } else {
                    spdlog::warn("Unknown isolation mode '{}', using none", name);
                }
            }
            if (exec["nsjail"]) {
                auto nsjail = exec["nsjail"];
                auto& nc = ec.nsjail;
                if (nsjail["path"]) nc.nsjail_path = nsjail["path"].as<std::string>();
                if (nsjail["memory_limit_mb"]) nc.memory_limit_mb = nsjail["memory_limit_mb"].as<size_t>();
                if (nsjail["max_file_size_mb"]) nc.max_file_size_mb = nsjail["max_file_size_mb"].as<size_t>();
                if (nsjail["max_open_files"]) nc.max_open_files = nsjail["max_open_files"].as<size_t>();
                if (nsjail["max_pids"]) nc.max_pids = nsjail["max_pids"].as<size_t>();
                if (nsjail["extra_ro_mounts"]) nc.extra_ro_mounts = nsjail["extra_ro_mounts"].as<std::vector<std::string>>();
            }
        }

        // Storage settings
        if (yaml["storage"]) {
            auto storage = yaml["storage"];
            if (storage["data_dir"]) config.data_dir = storage["data_dir"].as<std::string>();
        }

        // Logging settings
        if (yaml["logging"]) {
            auto logging = yaml["logging"];
            if (logging["level"]) config.log_level = logging["level"].as<std::string>();
            if (logging["file"]) config.log_file = logging["file"].as<std::string>();
        }

        ApplyEnvironmentOverrides(config);
        spdlog::info("Config loaded from: {}", path);
        return true;

    } catch (const YAML::Exception& e) {
        spdlog::error("Failed to parse config file: {}", e.what());
        config = GetDefaultConfig();
        ApplyEnvironmentOverrides(config);
        return false;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        config = GetDefaultConfig();
        ApplyEnvironmentOverrides(config);
        return false;
    }
}

bool ConfigManager::SaveConfig(const ServerConfig& config, const std::string& path) {
    try {
        // Create parent directories if needed
        std::filesystem::path file_path(path);
        if (file_path.has_parent_path()) {
            std::filesystem::create_directories(file_path.parent_path());
        }

        const auto& rc = config.revisions;
        const auto& ec = config.execution;

        YAML::Emitter out;
        out << YAML::BeginMap;

        // Revision settings
        out << YAML::Key << "revisions" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "idle_flush_ms" << YAML::Value << static_cast<int64_t>(rc.idle_flush_delay.count());
        out << YAML::Key << "periodic_flush_ms" << YAML::Value << static_cast<int64_t>(rc.periodic_flush_interval.count());
        out << YAML::Key << "snapshot_interval" << YAML::Value << rc.snapshot_interval;
        out << YAML::Key << "large_change_threshold" << YAML::Value << rc.large_change_threshold;
        out << YAML::Key << "max_buffer_size" << YAML::Value << rc.max_buffer_size;
        out << YAML::Key << "auto_flush" << YAML::Value << config.auto_flush;
        out << YAML::EndMap;

        // Execution settings
        out << YAML::Key << "execution" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "interpreter" << YAML::Value << ec.interpreter;
        out << YAML::Key << "temp_root" << YAML::Value << ec.temp_root;
        out << YAML::Key << "timeout_ms" << YAML::Value << static_cast<int64_t>(ec.default_timeout.count());
        out << YAML::Key << "kill_grace_ms" << YAML::Value << static_cast<int64_t>(ec.kill_grace.count());
        out << YAML::Key << "hosted_platform" << YAML::Value << ec.hosted_platform;
        out << YAML::Key << "hosted_sandbox_enabled" << YAML::Value << ec.hosted_sandbox_enabled;
        out << YAML::Key << "isolation" << YAML::Value << execution::IsolationModeName(ec.isolation);
        out << YAML::Key << "nsjail" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "path" << YAML::Value << ec.nsjail.nsjail_path;
        out << YAML::Key << "memory_limit_mb" << YAML::Value << ec.nsjail.memory_limit_mb;
        out << YAML::Key << "max_file_size_mb" << YAML::Value << ec.nsjail.max_file_size_mb;
        out << YAML::Key << "max_open_files" << YAML::Value << ec.nsjail.max_open_files;
        out << YAML::Key << "max_pids" << YAML::Value << ec.nsjail.max_pids;
        out << YAML::Key << "extra_ro_mounts" << YAML::Value << ec.nsjail.extra_ro_mounts;
        out << YAML::EndMap;
        out << YAML::EndMap;

        // Storage settings
        out << YAML::Key << "storage" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "data_dir" << YAML::Value << config.data_dir;
        out << YAML::EndMap;

        // Logging settings
        out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "level" << YAML::Value << config.log_level;
        out << YAML::Key << "file" << YAML::Value << config.log_file;
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream file(path);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", path);
            return false;
        }
        file << out.c_str();
        file.close();

        spdlog::info("Config saved to: {}", path);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

ServerConfig ConfigManager::GetDefaultConfig() {
    return ServerConfig();
}

void ConfigManager::ApplyEnvironmentOverrides(ServerConfig& config) {
    bool flag = false;
    if (EnvFlag("CODEROOM_HOSTED", flag)) {
        config.execution.hosted_platform = flag;
    }
    if (EnvFlag("CODEROOM_HOSTED_SANDBOX_ENABLED", flag)) {
        config.execution.hosted_sandbox_enabled = flag;
    }
    if (EnvFlag("CODEROOM_DISABLE_NSJAIL", flag) && flag &&
        config.execution.isolation == execution::IsolationMode::Nsjail) {
        spdlog::warn("[SECURITY WARNING] nsjail disabled via CODEROOM_DISABLE_NSJAIL - running without isolation");
        config.execution.isolation = execution::IsolationMode::None;
    }
}

std::string ConfigManager::FindConfigFile() {
    // Check in order of priority
    std::vector<std::string> paths = {
        "./config/server_config.yaml",
        "./server_config.yaml",
        "../config/server_config.yaml",
        std::string(getenv("HOME") ? getenv("HOME") : "") + "/.config/coderoom/server_config.yaml",
    };

    for (const auto& path : paths) {
        if (!path.empty() && std::filesystem::exists(path)) {
            return path;
        }
    }

    return "./config/server_config.yaml";  // Default location
}

} // namespace coderoom::server::core
