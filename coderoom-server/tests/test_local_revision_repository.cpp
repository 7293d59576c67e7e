// test_local_revision_repository.cpp - Unit tests for the JSON revision store

#include <catch2/catch.hpp>
#include <filesystem>
#include <fstream>
#include <string>

#include "../src/storage/local_revision_repository.h"
#include "../src/storage/local_storage_backend.h"

using namespace coderoom::server::storage;

namespace {

CodeRevision MakeRevision(const std::string& id, const std::string& session_id,
                          const std::string& student_id, int64_t timestamp,
                          const std::string& code) {
    CodeRevision revision;
    revision.id = id;
    revision.session_id = session_id;
    revision.student_id = student_id;
    revision.timestamp = timestamp;
    revision.is_diff = false;
    revision.full_code = code;
    return revision;
}

} // anonymous namespace

// ========== Repository Tests ==========

TEST_CASE("LocalRevisionRepository - Save and query", "[storage]") {
    std::string test_dir = "test_revision_store";
    std::filesystem::remove_all(test_dir);

    LocalRevisionRepository repository(test_dir);
    REQUIRE(repository.Initialize());
    REQUIRE(std::filesystem::is_directory(test_dir));

    repository.SaveRevision(MakeRevision("r1", "s1", "alice", 100, "a"));
    repository.SaveRevision(MakeRevision("r2", "s1", "alice", 200, "ab"));
    repository.SaveRevision(MakeRevision("r3", "s1", "bob", 150, "b"));

    SECTION("Revisions are grouped per student") {
        auto alice = repository.GetRevisions("s1", "alice");
        REQUIRE(alice.size() == 2);
        REQUIRE(alice[0].id == "r1");
        REQUIRE(alice[1].id == "r2");
        REQUIRE(repository.CountRevisions("s1", "bob") == 1);
        REQUIRE(repository.CountRevisions("s2", "alice") == 0);
        REQUIRE(repository.GetRevisions("s2", "alice").empty());
    }

    SECTION("Latest revision") {
        auto latest = repository.GetLatestRevision("s1", "alice");
        REQUIRE(latest.has_value());
        REQUIRE(latest->id == "r2");
        REQUIRE(latest->full_code == std::optional<std::string>("ab"));
        REQUIRE_FALSE(repository.GetLatestRevision("s1", "nobody").has_value());
    }

    SECTION("Results are ordered by timestamp") {
        repository.SaveRevision(MakeRevision("r0", "s1", "alice", 50, ""));
        auto alice = repository.GetRevisions("s1", "alice");
        REQUIRE(alice.size() == 3);
        REQUIRE(alice[0].id == "r0");
    }

    SECTION("Saving the same id twice is a no-op") {
        repository.SaveRevision(MakeRevision("r2", "s1", "alice", 200, "ab"));
        REQUIRE(repository.CountRevisions("s1", "alice") == 2);
    }

    SECTION("Lookup by id") {
        auto found = repository.GetRevision("r3");
        REQUIRE(found.has_value());
        REQUIRE(found->student_id == "bob");
        REQUIRE_FALSE(repository.GetRevision("missing").has_value());
    }

    SECTION("Session view") {
        repository.SaveRevision(MakeRevision("r4", "s10", "carol", 300, "c"));
        auto session = repository.GetSessionRevisions("s1");
        REQUIRE(session.size() == 2);
        REQUIRE(session["alice"].size() == 2);
        REQUIRE(session["bob"].size() == 1);
    }

    std::filesystem::remove_all(test_dir);
}

TEST_CASE("LocalRevisionRepository - Persistence", "[storage]") {
    std::string test_dir = "test_revision_store_reload";
    std::filesystem::remove_all(test_dir);

    {
        LocalRevisionRepository repository(test_dir);
        REQUIRE(repository.Initialize());

        CodeRevision diff = MakeRevision("r2", "s1", "alice", 200, "");
        diff.is_diff = true;
        diff.full_code.reset();
        diff.diff = "@@ -0,1 +0,2 @@\n a\n+%0A\n";

        repository.SaveRevision(MakeRevision("r1", "s1", "alice", 100, "a"));
        repository.SaveRevision(diff);
    }

    REQUIRE(std::filesystem::exists(std::filesystem::path(test_dir) / "revisions.json"));

    LocalRevisionRepository reloaded(test_dir);
    REQUIRE(reloaded.Initialize());

    auto revisions = reloaded.GetRevisions("s1", "alice");
    REQUIRE(revisions.size() == 2);
    REQUIRE_FALSE(revisions[0].is_diff);
    REQUIRE(revisions[0].full_code == std::optional<std::string>("a"));
    REQUIRE_FALSE(revisions[0].diff.has_value());
    REQUIRE(revisions[1].is_diff);
    REQUIRE(revisions[1].diff == std::optional<std::string>("@@ -0,1 +0,2 @@\n a\n+%0A\n"));
    REQUIRE_FALSE(revisions[1].full_code.has_value());
    REQUIRE(revisions[1].timestamp == 200);

    std::filesystem::remove_all(test_dir);
}

TEST_CASE("LocalRevisionRepository - Delete", "[storage]") {
    std::string test_dir = "test_revision_store_delete";
    std::filesystem::remove_all(test_dir);

    LocalRevisionRepository repository(test_dir);
    REQUIRE(repository.Initialize());
    repository.SaveRevision(MakeRevision("r1", "s1", "alice", 1, "a"));
    repository.SaveRevision(MakeRevision("r2", "s1", "bob", 2, "b"));
    repository.SaveRevision(MakeRevision("r3", "s2", "alice", 3, "c"));

    SECTION("One student") {
        repository.DeleteRevisions("s1", std::string("alice"));
        REQUIRE(repository.CountRevisions("s1", "alice") == 0);
        REQUIRE(repository.CountRevisions("s1", "bob") == 1);
        REQUIRE(repository.CountRevisions("s2", "alice") == 1);
    }

    SECTION("Whole session") {
        repository.DeleteRevisions("s1");
        REQUIRE(repository.CountRevisions("s1", "alice") == 0);
        REQUIRE(repository.CountRevisions("s1", "bob") == 0);
        REQUIRE(repository.CountRevisions("s2", "alice") == 1);

        LocalRevisionRepository reloaded(test_dir);
        REQUIRE(reloaded.Initialize());
        REQUIRE(reloaded.CountRevisions("s1", "bob") == 0);
        REQUIRE(reloaded.CountRevisions("s2", "alice") == 1);
    }

    std::filesystem::remove_all(test_dir);
}

TEST_CASE("LocalRevisionRepository - Corrupt file", "[storage][error]") {
    std::string test_dir = "test_revision_store_corrupt";
    std::filesystem::remove_all(test_dir);
    std::filesystem::create_directories(test_dir);
    {
        std::ofstream file(std::filesystem::path(test_dir) / "revisions.json");
        file << "{ not json";
    }

    LocalRevisionRepository repository(test_dir);
    REQUIRE_FALSE(repository.Initialize());
    REQUIRE(repository.CountRevisions("s1", "alice") == 0);

    std::filesystem::remove_all(test_dir);
}

TEST_CASE("LocalStorageBackend - Exposes the revision repository", "[storage]") {
    std::string test_dir = "test_storage_backend";
    std::filesystem::remove_all(test_dir);

    LocalStorageBackend backend(test_dir);
    REQUIRE(backend.Initialize());
    REQUIRE(backend.GetDataDir() == test_dir);

    backend.Revisions().SaveRevision(MakeRevision("r1", "s1", "alice", 1, "a"));
    REQUIRE(backend.LocalRevisions().CountRevisions("s1", "alice") == 1);

    std::filesystem::remove_all(test_dir);
}
