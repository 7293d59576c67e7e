// local_revision_repository.cpp - File-backed JSON revision store implementation
#include "storage/local_revision_repository.h"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>

namespace coderoom::server::storage {

namespace {

nlohmann::json RevisionToJson(const CodeRevision& revision) {
    nlohmann::json j = {
        {"id", revision.id},
        {"session_id", revision.session_id},
        {"student_id", revision.student_id},
        {"timestamp", revision.timestamp},
        {"is_diff", revision.is_diff}
    };
    if (revision.diff) {
        j["diff"] = *revision.diff;
    }
    if (revision.full_code) {
        j["full_code"] = *revision.full_code;
    }
    return j;
}

CodeRevision RevisionFromJson(const nlohmann::json& data) {
    CodeRevision revision;
    revision.id = data.value("id", "");
    revision.session_id = data.value("session_id", "");
    revision.student_id = data.value("student_id", "");
    revision.timestamp = data.value("timestamp", static_cast<int64_t>(0));
    revision.is_diff = data.value("is_diff", false);
    if (data.contains("diff")) {
        revision.diff = data["diff"].get<std::string>();
    }
    if (data.contains("full_code")) {
        revision.full_code = data["full_code"].get<std::string>();
    }
    return revision;
}

} // anonymous namespace

LocalRevisionRepository::LocalRevisionRepository(const std::string& data_dir)
    : data_dir_(data_dir.empty() ? "./data" : data_dir) {
    file_path_ = (std::filesystem::path(data_dir_) / "revisions.json").string();
}

std::string LocalRevisionRepository::MakeKey(const std::string& session_id,
                                             const std::string& student_id) {
    return session_id + ":" + student_id;
}

bool LocalRevisionRepository::Initialize() {
    try {
        std::filesystem::create_directories(data_dir_);
    } catch (const std::exception& e) {
        spdlog::error("LocalRevisionRepository: Failed to create {}: {}", data_dir_, e.what());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    return LoadFromDisk();
}

bool LocalRevisionRepository::LoadFromDisk() {
    revisions_.clear();

    if (!std::filesystem::exists(file_path_)) {
        spdlog::debug("LocalRevisionRepository: No revision file at {}", file_path_);
        return true;
    }

    try {
        std::ifstream file(file_path_);
        if (!file) {
            spdlog::error("LocalRevisionRepository: Failed to open {}", file_path_);
            return false;
        }

        nlohmann::json j = nlohmann::json::parse(file);
        size_t total = 0;
        for (const auto& [key, list] : j.items()) {
            auto& revisions = revisions_[key];
            for (const auto& data : list) {
                revisions.push_back(RevisionFromJson(data));
                ++total;
            }
        }

        spdlog::info("LocalRevisionRepository: Loaded {} revisions from {}", total, file_path_);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("LocalRevisionRepository: Failed to load {}: {}", file_path_, e.what());
        revisions_.clear();
        return false;
    }
}

void LocalRevisionRepository::WriteToDisk() const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [key, revisions] : revisions_) {
        nlohmann::json list = nlohmann::json::array();
        for (const auto& revision : revisions) {
            list.push_back(RevisionToJson(revision));
        }
        j[key] = std::move(list);
    }

    // Write a sibling file first so a failed write never truncates the store
    const std::string tmp_path = file_path_ + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::trunc);
        if (!file) {
            throw StorageError("Failed to open file for writing: " + tmp_path);
        }
        file << j.dump(2);
        if (!file) {
            throw StorageError("Failed to write revisions to " + tmp_path);
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, file_path_, ec);
    if (ec) {
        throw StorageError("Failed to replace " + file_path_ + ": " + ec.message());
    }
}

void LocalRevisionRepository::SaveRevision(const CodeRevision& revision) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto& revisions = revisions_[MakeKey(revision.session_id, revision.student_id)];
    bool duplicate = std::any_of(revisions.begin(), revisions.end(),
        [&revision](const CodeRevision& r) { return r.id == revision.id; });
    if (duplicate) {
        spdlog::debug("LocalRevisionRepository: Revision {} already stored", revision.id);
        return;
    }

    revisions.push_back(revision);
    try {
        WriteToDisk();
    } catch (const StorageError&) {
        revisions.pop_back();
        throw;
    } catch (const std::exception& e) {
        revisions.pop_back();
        throw StorageError(std::string("Failed to serialize revisions: ") + e.what());
    }
}

std::vector<CodeRevision> LocalRevisionRepository::GetRevisions(const std::string& session_id,
                                                                const std::string& student_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = revisions_.find(MakeKey(session_id, student_id));
    if (it == revisions_.end()) {
        return {};
    }

    std::vector<CodeRevision> result = it->second;
    std::stable_sort(result.begin(), result.end(),
        [](const CodeRevision& a, const CodeRevision& b) { return a.timestamp < b.timestamp; });
    return result;
}

std::optional<CodeRevision> LocalRevisionRepository::GetLatestRevision(const std::string& session_id,
                                                                       const std::string& student_id) {
    auto revisions = GetRevisions(session_id, student_id);
    if (revisions.empty()) {
        return std::nullopt;
    }
    return revisions.back();
}

size_t LocalRevisionRepository::CountRevisions(const std::string& session_id,
                                               const std::string& student_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = revisions_.find(MakeKey(session_id, student_id));
    return it == revisions_.end() ? 0 : it->second.size();
}

void LocalRevisionRepository::DeleteRevisions(const std::string& session_id,
                                              const std::optional<std::string>& student_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (student_id) {
        revisions_.erase(MakeKey(session_id, *student_id));
    } else {
        const std::string prefix = session_id + ":";
        for (auto it = revisions_.begin(); it != revisions_.end();) {
            if (it->first.starts_with(prefix)) {
                it = revisions_.erase(it);
            } else {
                ++it;
            }
        }
    }

    WriteToDisk();
    spdlog::info("LocalRevisionRepository: Deleted revisions for session {}{}", session_id,
                 student_id ? " student " + *student_id : std::string());
}

std::optional<CodeRevision> LocalRevisionRepository::GetRevision(const std::string& revision_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, revisions] : revisions_) {
        for (const auto& revision : revisions) {
            if (revision.id == revision_id) {
                return revision;
            }
        }
    }
    return std::nullopt;
}

std::map<std::string, std::vector<CodeRevision>>
LocalRevisionRepository::GetSessionRevisions(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, std::vector<CodeRevision>> result;
    const std::string prefix = session_id + ":";
    for (const auto& [key, revisions] : revisions_) {
        if (key.starts_with(prefix)) {
            result[key.substr(prefix.size())] = revisions;
        }
    }
    return result;
}

} // namespace coderoom::server::storage
