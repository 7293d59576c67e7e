// test_revision_buffer.cpp - Unit tests for buffered revision capture

#include <catch2/catch.hpp>
#include <chrono>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "../src/core/scheduler.h"
#include "../src/revision/revision_buffer.h"
#include "../src/revision/revision_replayer.h"
#include "fake_storage.h"

using namespace coderoom::server;
using namespace coderoom::server::revision;
using namespace std::chrono_literals;
using coderoom::server::testing::FakeStorage;

// ========== Snapshot Policy Tests ==========

TEST_CASE("RevisionBuffer - Duplicate edits", "[revision-buffer]") {
    FakeStorage storage;
    core::ManualScheduler scheduler;
    RevisionBuffer buffer(storage, scheduler);

    SECTION("Identical consecutive code is buffered once") {
        buffer.AddRevision("s1", "alice", "print(1)");
        buffer.AddRevision("s1", "alice", "print(1)");
        buffer.AddRevision("s1", "alice", "print(1)");
        REQUIRE(buffer.PendingCount("s1", "alice") == 1);

        REQUIRE(buffer.FlushBuffer("s1", "alice"));
        REQUIRE(storage.Repo().All().size() == 1);
    }

    SECTION("Empty code on a fresh student is not a revision") {
        buffer.AddRevision("s1", "alice", "");
        REQUIRE(buffer.PendingCount("s1", "alice") == 0);
    }
}

TEST_CASE("RevisionBuffer - First revision is a snapshot", "[revision-buffer]") {
    FakeStorage storage;
    core::ManualScheduler scheduler;
    RevisionBuffer buffer(storage, scheduler);

    buffer.AddRevision("s1", "alice", "x = 1\n");
    buffer.FlushBuffer("s1", "alice");

    auto saved = storage.Repo().All();
    REQUIRE(saved.size() == 1);
    REQUIRE_FALSE(saved[0].is_diff);
    REQUIRE(saved[0].full_code == std::optional<std::string>("x = 1\n"));
    REQUIRE_FALSE(saved[0].diff.has_value());
    REQUIRE(saved[0].session_id == "s1");
    REQUIRE(saved[0].student_id == "alice");
    REQUIRE(saved[0].id.size() == 36);
}

TEST_CASE("RevisionBuffer - Snapshot cadence", "[revision-buffer]") {
    FakeStorage storage;
    core::ManualScheduler scheduler;
    RevisionBuffer buffer(storage, scheduler);

    for (int k = 1; k <= 25; ++k) {
        buffer.AddRevision("s1", "alice", "total = " + std::to_string(k) + "\n");
    }
    buffer.FlushBuffer("s1", "alice");

    auto saved = storage.Repo().All();
    REQUIRE(saved.size() == 25);
    for (int k = 1; k <= 25; ++k) {
        const auto& revision = saved[k - 1];
        bool snapshot = (k == 1 || k % 10 == 0);
        INFO("revision " << k);
        REQUIRE(revision.is_diff == !snapshot);
        REQUIRE(revision.full_code.has_value() == snapshot);
        REQUIRE(revision.diff.has_value() == !snapshot);
    }
}

TEST_CASE("RevisionBuffer - Large changes become snapshots", "[revision-buffer]") {
    FakeStorage storage;
    core::ManualScheduler scheduler;
    RevisionBuffer buffer(storage, scheduler);

    SECTION("More than 1000 changed bytes") {
        buffer.AddRevision("s1", "alice", "a");
        buffer.AddRevision("s1", "alice", "a" + std::string(1001, 'b'));
        buffer.FlushBuffer("s1", "alice");

        auto saved = storage.Repo().All();
        REQUIRE(saved.size() == 2);
        REQUIRE_FALSE(saved[1].is_diff);
    }

    SECTION("Exactly 1000 changed bytes stays a diff") {
        buffer.AddRevision("s1", "bob", "a");
        buffer.AddRevision("s1", "bob", "a" + std::string(1000, 'b'));
        buffer.FlushBuffer("s1", "bob");

        auto saved = storage.Repo().All();
        REQUIRE(saved.size() == 2);
        REQUIRE(saved[1].is_diff);
    }

    SECTION("Deleting a large block counts too") {
        buffer.AddRevision("s1", "carol", std::string(1500, 'z') + "end");
        buffer.AddRevision("s1", "carol", "end");
        buffer.FlushBuffer("s1", "carol");

        auto saved = storage.Repo().All();
        REQUIRE(saved.size() == 2);
        REQUIRE_FALSE(saved[1].is_diff);
    }
}

TEST_CASE("RevisionBuffer - Stored chain reconstructs every edit", "[revision-buffer]") {
    FakeStorage storage;
    core::ManualScheduler scheduler;
    RevisionBuffer buffer(storage, scheduler);

    std::vector<std::string> codes;
    std::string code = "def main():\n    pass\n";
    for (int k = 0; k < 23; ++k) {
        if (k == 7) {
            code += std::string(1200, '#') + "\n";
        } else if (k == 15) {
            code = "print('rewrite')\n";
        } else {
            code.insert(code.size() / 2, "x" + std::to_string(k));
        }
        codes.push_back(code);
        buffer.AddRevision("s1", "alice", code);
    }
    buffer.FlushBuffer("s1", "alice");

    auto saved = storage.Repo().GetRevisions("s1", "alice");
    REQUIRE(saved.size() == codes.size());

    RevisionReplayer replayer;
    REQUIRE(replayer.Replay(saved) == codes);
    REQUIRE(replayer.ReconstructLatest(saved) == codes.back());
}

// ========== Flush Trigger Tests ==========

TEST_CASE("RevisionBuffer - Nothing is saved before a trigger", "[revision-buffer][flush]") {
    FakeStorage storage;
    core::ManualScheduler scheduler;
    RevisionBuffer buffer(storage, scheduler);

    for (int k = 0; k < 20; ++k) {
        buffer.AddRevision("s1", "alice", "v" + std::to_string(k));
    }
    scheduler.AdvanceBy(4999ms);

    REQUIRE(storage.Repo().SaveCalls() == 0);
    REQUIRE(buffer.PendingCount("s1", "alice") == 20);
}

TEST_CASE("RevisionBuffer - Idle flush is debounced", "[revision-buffer][flush]") {
    FakeStorage storage;
    core::ManualScheduler scheduler;
    RevisionBuffer buffer(storage, scheduler);

    buffer.AddRevision("s1", "alice", "a");
    scheduler.AdvanceBy(3000ms);
    buffer.AddRevision("s1", "alice", "ab");

    // 5s after the first edit
    scheduler.AdvanceBy(2000ms);
    REQUIRE(storage.Repo().SaveCalls() == 0);

    scheduler.AdvanceBy(2999ms);
    REQUIRE(storage.Repo().SaveCalls() == 0);

    // 5s after the second edit
    scheduler.AdvanceBy(1ms);
    REQUIRE(storage.Repo().All().size() == 2);
    REQUIRE(buffer.PendingCount("s1", "alice") == 0);
    REQUIRE(scheduler.PendingCount() == 0);
}

TEST_CASE("RevisionBuffer - Full buffer flushes immediately", "[revision-buffer][flush]") {
    FakeStorage storage;
    core::ManualScheduler scheduler;
    RevisionBuffer buffer(storage, scheduler);

    for (int k = 0; k < 100; ++k) {
        buffer.AddRevision("s1", "alice", "line " + std::to_string(k));
    }

    // Flushed before the 101st call and without any time passing
    REQUIRE(storage.Repo().All().size() == 100);
    REQUIRE(buffer.PendingCount("s1", "alice") == 0);
    REQUIRE(scheduler.PendingCount() == 0);

    buffer.AddRevision("s1", "alice", "line 100");
    REQUIRE(buffer.PendingCount("s1", "alice") == 1);
}

TEST_CASE("RevisionBuffer - Periodic sweep", "[revision-buffer][flush]") {
    FakeStorage storage;
    core::ManualScheduler scheduler;
    RevisionBufferConfig config;
    config.idle_flush_delay = 10min;
    RevisionBuffer buffer(storage, scheduler, config);

    buffer.StartAutoFlush();
    buffer.StartAutoFlush();
    REQUIRE(buffer.IsAutoFlushRunning());
    REQUIRE(scheduler.PendingCount() == 1);

    buffer.AddRevision("s1", "alice", "a");
    buffer.AddRevision("s2", "bob", "b");
    scheduler.AdvanceBy(30s);
    REQUIRE(storage.Repo().All().size() == 2);

    // Empty sweeps are harmless
    scheduler.AdvanceBy(60s);
    REQUIRE(storage.Repo().All().size() == 2);

    buffer.StopAutoFlush();
    buffer.StopAutoFlush();
    REQUIRE_FALSE(buffer.IsAutoFlushRunning());

    buffer.AddRevision("s1", "alice", "ab");
    scheduler.AdvanceBy(30s);
    REQUIRE(storage.Repo().All().size() == 2);
}

// ========== Isolation Tests ==========

TEST_CASE("RevisionBuffer - Students are independent", "[revision-buffer]") {
    FakeStorage storage;
    core::ManualScheduler scheduler;
    RevisionBuffer buffer(storage, scheduler);

    buffer.AddRevision("s1", "alice", "a1");
    buffer.AddRevision("s1", "bob", "b1");
    buffer.AddRevision("s2", "alice", "c1");

    SECTION("Flushing one key leaves the others buffered") {
        buffer.FlushBuffer("s1", "alice");
        REQUIRE(buffer.PendingCount("s1", "alice") == 0);
        REQUIRE(buffer.PendingCount("s1", "bob") == 1);
        REQUIRE(buffer.PendingCount("s2", "alice") == 1);
    }

    SECTION("Resetting one key keeps the others' baselines") {
        buffer.ResetStudent("s1", "alice", "fresh");
        buffer.AddRevision("s1", "bob", "b1");
        REQUIRE(buffer.PendingCount("s1", "bob") == 1);

        buffer.AddRevision("s1", "bob", "b2");
        buffer.FlushBuffer("s1", "bob");
        auto bob = storage.Repo().GetRevisions("s1", "bob");
        REQUIRE(bob.size() == 2);
        REQUIRE(bob[1].is_diff);
    }

    SECTION("Idle timers fire per student") {
        scheduler.AdvanceBy(2000ms);
        buffer.AddRevision("s1", "bob", "b2");
        scheduler.AdvanceBy(3000ms);

        REQUIRE(buffer.PendingCount("s1", "alice") == 0);
        REQUIRE(buffer.PendingCount("s2", "alice") == 0);
        REQUIRE(buffer.PendingCount("s1", "bob") == 2);
    }
}

TEST_CASE("RevisionBuffer - Reset rebases the student", "[revision-buffer]") {
    FakeStorage storage;
    core::ManualScheduler scheduler;
    RevisionBuffer buffer(storage, scheduler);

    buffer.AddRevision("s1", "alice", "one");
    buffer.AddRevision("s1", "alice", "one two");
    buffer.ResetStudent("s1", "alice", "restored code");

    // Pending revisions were flushed first
    REQUIRE(storage.Repo().All().size() == 2);
    REQUIRE(scheduler.PendingCount() == 0);

    // Same code as the new baseline is not a change
    buffer.AddRevision("s1", "alice", "restored code");
    REQUIRE(buffer.PendingCount("s1", "alice") == 0);

    // Counter restarted, so the next edit is a snapshot
    buffer.AddRevision("s1", "alice", "restored code!");
    buffer.FlushBuffer("s1", "alice");
    auto saved = storage.Repo().All();
    REQUIRE(saved.size() == 3);
    REQUIRE_FALSE(saved[2].is_diff);
    REQUIRE(saved[2].full_code == std::optional<std::string>("restored code!"));

    SECTION("Reset of an unknown student creates its baseline") {
        buffer.ResetStudent("s1", "newcomer", "base");
        REQUIRE(buffer.TrackedStudentCount() == 2);
        buffer.AddRevision("s1", "newcomer", "base");
        REQUIRE(buffer.PendingCount("s1", "newcomer") == 0);
    }
}

// ========== Failure Tests ==========

TEST_CASE("RevisionBuffer - Storage failures keep revisions", "[revision-buffer][failure]") {
    FakeStorage storage;
    core::ManualScheduler scheduler;
    RevisionBuffer buffer(storage, scheduler);

    SECTION("Failed idle flush retains the whole buffer") {
        storage.Repo().SetFailing(true);
        buffer.AddRevision("s1", "alice", "a");
        buffer.AddRevision("s1", "alice", "ab");
        buffer.AddRevision("s1", "alice", "abc");
        scheduler.AdvanceBy(5s);

        REQUIRE(storage.Repo().SaveCalls() > 0);
        REQUIRE(storage.Repo().All().empty());
        REQUIRE(buffer.PendingCount("s1", "alice") == 3);

        storage.Repo().SetFailing(false);
        REQUIRE(buffer.FlushBuffer("s1", "alice"));

        auto saved = storage.Repo().All();
        REQUIRE(saved.size() == 3);
        RevisionReplayer replayer;
        REQUIRE(replayer.ReconstructLatest(saved) == "abc");
    }

    SECTION("Partial failure resumes where it stopped") {
        storage.Repo().FailAfter(1);
        buffer.AddRevision("s1", "alice", "a");
        buffer.AddRevision("s1", "alice", "ab");
        buffer.AddRevision("s1", "alice", "abc");

        REQUIRE_FALSE(buffer.FlushBuffer("s1", "alice"));
        REQUIRE(storage.Repo().All().size() == 1);
        REQUIRE(buffer.PendingCount("s1", "alice") == 2);

        storage.Repo().SetFailing(false);
        REQUIRE(buffer.FlushBuffer("s1", "alice"));

        auto saved = storage.Repo().All();
        REQUIRE(saved.size() == 3);
        std::set<std::string> ids;
        for (const auto& r : saved) {
            ids.insert(r.id);
        }
        REQUIRE(ids.size() == 3);
    }

    SECTION("Edits keep working while storage is down") {
        storage.Repo().SetFailing(true);
        for (int k = 0; k < 150; ++k) {
            REQUIRE_NOTHROW(buffer.AddRevision("s1", "alice", "v" + std::to_string(k)));
        }
        REQUIRE(buffer.PendingCount("s1", "alice") == 150);

        storage.Repo().SetFailing(false);
        scheduler.AdvanceBy(5s);
        REQUIRE(storage.Repo().All().size() == 150);
    }
}

// ========== Session Lifecycle Tests ==========

TEST_CASE("RevisionBuffer - Session flush", "[revision-buffer][session]") {
    FakeStorage storage;
    core::ManualScheduler scheduler;
    RevisionBuffer buffer(storage, scheduler);

    buffer.AddRevision("s1", "alice", "a");
    buffer.AddRevision("s1", "bob", "b");
    buffer.AddRevision("s2", "carol", "c");

    SECTION("Flushes and evicts only the ended session") {
        buffer.FlushSession("s1");

        REQUIRE(storage.Repo().All().size() == 2);
        REQUIRE(buffer.TrackedStudentCount() == 1);
        REQUIRE(buffer.PendingCount("s2", "carol") == 1);

        // A later edit starts over with a snapshot
        buffer.AddRevision("s1", "alice", "a");
        REQUIRE(buffer.PendingCount("s1", "alice") == 1);
    }

    SECTION("Students with unsaved revisions are kept until a flush succeeds") {
        storage.Repo().SetFailing(true);
        buffer.FlushSession("s1");
        REQUIRE(buffer.TrackedStudentCount() == 3);
        REQUIRE(buffer.PendingCount("s1", "alice") == 1);

        storage.Repo().SetFailing(false);
        buffer.FlushAll();
        REQUIRE(storage.Repo().All().size() == 3);
        REQUIRE(buffer.TrackedStudentCount() == 1);
    }

    SECTION("Idle timers of the session are cancelled") {
        buffer.FlushSession("s1");
        buffer.FlushSession("s2");
        REQUIRE(scheduler.PendingCount() == 0);
    }
}

TEST_CASE("RevisionBuffer - Shutdown", "[revision-buffer][session]") {
    FakeStorage storage;
    core::ManualScheduler scheduler;
    RevisionBuffer buffer(storage, scheduler);

    buffer.StartAutoFlush();
    buffer.AddRevision("s1", "alice", "a");
    buffer.AddRevision("s1", "bob", "b");

    buffer.Shutdown();

    REQUIRE(storage.Repo().All().size() == 2);
    REQUIRE(buffer.TrackedStudentCount() == 0);
    REQUIRE_FALSE(buffer.IsAutoFlushRunning());
    REQUIRE(scheduler.PendingCount() == 0);
}

TEST_CASE("RevisionBuffer - Concurrent edits with a threaded scheduler", "[revision-buffer][threaded]") {
    FakeStorage storage;
    core::ThreadedScheduler scheduler;
    RevisionBufferConfig config;
    config.idle_flush_delay = 5ms;
    config.periodic_flush_interval = 3ms;

    {
        RevisionBuffer buffer(storage, scheduler, config);
        buffer.StartAutoFlush();

        std::vector<std::thread> students;
        for (int s = 0; s < 4; ++s) {
            students.emplace_back([&buffer, s]() {
                std::string code;
                for (int k = 0; k < 120; ++k) {
                    code += static_cast<char>('a' + (k % 26));
                    buffer.AddRevision("s1", "student" + std::to_string(s), code);
                    if (k % 17 == 0) {
                        std::this_thread::sleep_for(2ms);
                    }
                }
            });
        }
        for (auto& t : students) {
            t.join();
        }

        buffer.Shutdown();
    }

    RevisionReplayer replayer;
    for (int s = 0; s < 4; ++s) {
        auto saved = storage.Repo().GetRevisions("s1", "student" + std::to_string(s));
        REQUIRE(saved.size() == 120);
        REQUIRE(replayer.ReconstructLatest(saved).size() == 120);
    }
}
