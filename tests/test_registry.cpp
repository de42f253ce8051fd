/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swell/errors.hpp"
#include "swell/registry.hpp"
#include <gtest/gtest.h>
#include <iterator>
#include <fstream>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>

using namespace swell;

namespace {

class RegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("swell_registry_" + std::to_string(::getpid()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(dir_);
        path_ = dir_ / ".swell" / "process_registry.json";
    }
    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    void writeRaw(const std::string& text) {
        std::filesystem::create_directories(path_.parent_path());
        std::ofstream(path_) << text;
    }

    std::string readRaw() {
        std::ifstream in(path_);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

    std::filesystem::path dir_;
    std::filesystem::path path_;
};

NativeMode native(int pid, std::uint64_t start = 4242) {
    return NativeMode{pid, pid, start};
}

}

TEST_F(RegistryTest, MissingFileLoadsEmpty) {
    RegistryStore store(path_);
    EXPECT_TRUE(store.load().empty());
}

TEST_F(RegistryTest, RegisterPersistsNamespacedRecord) {
    RegistryStore store(path_);
    ProcessRegistry registry(store);

    auto record = registry.registerTask("T001", native(1234), "python build.py", {"no-secrets"});
    EXPECT_EQ(record.key, "swell:T001");

    // A fresh store over the same file sees everything
    RegistryStore other(path_);
    auto snapshot = other.load();
    ASSERT_EQ(snapshot.count("swell:T001"), 1u);
    const auto& loaded = snapshot.at("swell:T001");
    EXPECT_EQ(loaded.status, RecordStatus::Running);
    EXPECT_EQ(loaded.command, "python build.py");
    EXPECT_EQ(loaded.rules, (std::vector<std::string>{"no-secrets"}));
    ASSERT_TRUE(loaded.isNative());
    EXPECT_EQ(std::get<NativeMode>(loaded.mode).pid, 1234);
    EXPECT_EQ(std::get<NativeMode>(loaded.mode).startTime, 4242u);
    EXPECT_FALSE(loaded.completedAt.has_value());
}

TEST_F(RegistryTest, ContainerRecordKeepsLimits) {
    RegistryStore store(path_);
    ProcessRegistry registry(store, "ci");

    ContainerMode container;
    container.id = "abc123def456";
    container.name = "swell-task-T002";
    container.limits = ResourceLimits{"1g", "2.0"};
    (void)registry.registerTask("T002", container, "pytest");

    auto found = registry.find("T002");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->key, "ci:T002");
    const auto& mode = std::get<ContainerMode>(found->mode);
    EXPECT_EQ(mode.name, "swell-task-T002");
    EXPECT_EQ(mode.limits.memory, "1g");
    EXPECT_EQ(mode.limits.cpu, "2.0");
}

TEST_F(RegistryTest, ReRegisterOverwrites) {
    RegistryStore store(path_);
    ProcessRegistry registry(store);
    (void)registry.registerTask("T001", native(100), "first");
    ASSERT_TRUE(registry.markFailed("T001"));
    (void)registry.registerTask("T001", native(200), "second");

    auto found = registry.find("T001");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->command, "second");
    EXPECT_EQ(found->status, RecordStatus::Running);
    EXPECT_EQ(registry.snapshot().size(), 1u);
}

TEST_F(RegistryTest, TerminalStatesAreFinal) {
    RegistryStore store(path_);
    ProcessRegistry registry(store);
    (void)registry.registerTask("T001", native(100), "cmd");

    EXPECT_TRUE(registry.markCompleted("T001"));
    EXPECT_FALSE(registry.markFailed("T001"));
    EXPECT_FALSE(registry.markCompleted("T001"));

    auto found = registry.find("T001");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->status, RecordStatus::Completed);
    EXPECT_TRUE(found->completedAt.has_value());
}

TEST_F(RegistryTest, MarkingUnknownTaskFails) {
    RegistryStore store(path_);
    ProcessRegistry registry(store);
    EXPECT_FALSE(registry.markCompleted("T999"));
    EXPECT_FALSE(registry.find("T999").has_value());
}

TEST_F(RegistryTest, FailedTransitionRecordsFlags) {
    RegistryStore store(path_);
    ProcessRegistry registry(store);
    (void)registry.registerTask("T001", native(100), "cmd");

    EXPECT_TRUE(registry.markFailed("T001", {flags::Orphaned, flags::PidReused}));
    auto found = registry.find("T001");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->flags, (std::set<std::string>{"orphaned", "pid_reused"}));
}

TEST_F(RegistryTest, QualifiedIdsPassThrough) {
    EXPECT_EQ(qualifyKey("T001", "swell"), "swell:T001");
    EXPECT_EQ(qualifyKey("other:T001", "swell"), "other:T001");
}

TEST_F(RegistryTest, SavedFileIsOwnerOnly) {
    RegistryStore store(path_);
    ProcessRegistry registry(store);
    (void)registry.registerTask("T001", native(100), "cmd");

    struct stat st{};
    ASSERT_EQ(::stat(path_.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);
}

TEST_F(RegistryTest, MalformedJsonIsCorruptionAndFileIsKept) {
    writeRaw("{ \"tasks\": ");
    RegistryStore store(path_);
    ProcessRegistry registry(store);

    EXPECT_THROW((void)store.load(), RegistryCorruption);
    EXPECT_THROW((void)registry.registerTask("T001", native(1), "cmd"), RegistryCorruption);
    EXPECT_EQ(readRaw(), "{ \"tasks\": ");
}

TEST_F(RegistryTest, UnknownStatusIsCorruption) {
    writeRaw(R"({"version": 1, "tasks": {"swell:T001": {
        "mode": "native", "command": "x", "status": "paused", "started_at": "2025-01-01T00:00:00Z",
        "native": {"pid": 1, "pgid": 1, "start_time": 5}}}})");
    try {
        (void)RegistryStore(path_).load();
        FAIL() << "expected RegistryCorruption";
    } catch (const RegistryCorruption& e) {
        EXPECT_NE(std::string(e.what()).find("swell:T001"), std::string::npos);
        EXPECT_EQ(e.path().string(), path_.string());
    }
}

TEST_F(RegistryTest, MissingModePayloadIsCorruption) {
    writeRaw(R"({"version": 1, "tasks": {"swell:T001": {
        "mode": "container", "command": "x", "status": "running", "started_at": "2025-01-01T00:00:00Z"}}})");
    EXPECT_THROW((void)RegistryStore(path_).load(), RegistryCorruption);
}

TEST_F(RegistryTest, BothModePayloadsIsCorruption) {
    writeRaw(R"({"version": 1, "tasks": {"swell:T001": {
        "mode": "native", "command": "x", "status": "running", "started_at": "2025-01-01T00:00:00Z",
        "native": {"pid": 1, "pgid": 1, "start_time": 5},
        "container": {"id": "a", "name": "b"}}}})");
    EXPECT_THROW((void)RegistryStore(path_).load(), RegistryCorruption);
}

TEST_F(RegistryTest, WrongFieldTypeIsCorruption) {
    writeRaw(R"({"version": 1, "tasks": {"swell:T001": {
        "mode": "native", "command": "x", "status": "running", "started_at": "2025-01-01T00:00:00Z",
        "native": {"pid": "1234", "pgid": 1, "start_time": 5}}}})");
    EXPECT_THROW((void)RegistryStore(path_).load(), RegistryCorruption);
}

TEST_F(RegistryTest, ReadsHandWrittenDocument) {
    writeRaw(R"({"version": 1, "tasks": {
        "swell:T001": {"mode": "native", "command": "make", "status": "completed",
                       "started_at": "2025-01-01T00:00:00Z", "completed_at": "2025-01-01T00:02:05Z",
                       "native": {"pid": 10, "pgid": 10, "start_time": 18446744073709551000},
                       "flags": ["zombie_killed"]},
        "tool:T002": {"mode": "container", "command": "pytest", "status": "failed",
                      "started_at": "2025-01-01T00:00:00Z",
                      "container": {"id": "c1", "name": "n1", "resource_limits": {"memory": "256m", "cpu": "0.5"}}}}})");

    auto snapshot = RegistryStore(path_).load();
    ASSERT_EQ(snapshot.size(), 2u);
    const auto& first = snapshot.at("swell:T001");
    EXPECT_EQ(std::get<NativeMode>(first.mode).startTime, 18446744073709551000ULL);
    ASSERT_TRUE(first.completedAt.has_value());
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::seconds>(*first.completedAt - first.startedAt).count(), 125);
    EXPECT_EQ(first.flags, (std::set<std::string>{"zombie_killed"}));
    EXPECT_EQ(snapshot.at("tool:T002").status, RecordStatus::Failed);
}

TEST_F(RegistryTest, TimestampsFormatAsUtc) {
    auto when = std::chrono::system_clock::from_time_t(0) + std::chrono::hours(24 * 365);
    EXPECT_EQ(formatTimestamp(when), "1971-01-01T00:00:00Z");
    auto parsed = parseTimestamp("1971-01-01T00:00:00Z");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, when);
    EXPECT_FALSE(parseTimestamp("1971-01-01 00:00:00").has_value());
    EXPECT_TRUE(parseTimestamp("2025-06-01T10:00:00.123Z").has_value());
}

TEST_F(RegistryTest, StatsCountEachStatus) {
    RegistryStore store(path_);
    ProcessRegistry registry(store);
    (void)registry.registerTask("T001", native(1), "a");
    (void)registry.registerTask("T002", native(2), "b");
    (void)registry.registerTask("T003", native(3), "c");
    (void)registry.markCompleted("T002");
    (void)registry.markFailed("T003");

    auto stats = registry.stats();
    EXPECT_EQ(stats.running, 1u);
    EXPECT_EQ(stats.completed, 1u);
    EXPECT_EQ(stats.failed, 1u);
    EXPECT_EQ(stats.total(), 3u);
}

TEST_F(RegistryTest, CleanupRemovesOnlyOldTerminalRecords) {
    RegistryStore store(path_);
    ProcessRegistry registry(store);
    (void)registry.registerTask("T001", native(1), "a");
    (void)registry.registerTask("T002", native(2), "b");
    (void)registry.registerTask("T003", native(3), "c");
    (void)registry.markCompleted("T001");
    (void)registry.markFailed("T002");

    // Nothing is old enough yet
    EXPECT_EQ(registry.cleanup(7), 0u);

    const auto later = std::chrono::system_clock::now() + std::chrono::hours(24 * 8);
    EXPECT_EQ(registry.cleanup(7, later), 2u);

    auto snapshot = registry.snapshot();
    ASSERT_EQ(snapshot.size(), 1u);
    EXPECT_EQ(snapshot.begin()->first, "swell:T003");
}

TEST_F(RegistryTest, RemoveDeletesRecord) {
    RegistryStore store(path_);
    ProcessRegistry registry(store);
    (void)registry.registerTask("T001", native(1), "a");
    EXPECT_TRUE(registry.remove("T001"));
    EXPECT_FALSE(registry.remove("T001"));
    EXPECT_TRUE(registry.snapshot().empty());
}

TEST_F(RegistryTest, ConcurrentUpdatesAreNotLost) {
    RegistryStore store(path_);
    constexpr int kThreads = 4;
    constexpr int kPerThread = 10;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t]() {
            // Separate store objects, as separate CLI invocations would have
            RegistryStore own(path_);
            ProcessRegistry registry(own);
            for (int i = 0; i < kPerThread; ++i) {
                (void)registry.registerTask("T" + std::to_string(t * 100 + i), native(t * 100 + i + 2), "cmd");
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(store.load().size(), static_cast<std::size_t>(kThreads * kPerThread));
}
