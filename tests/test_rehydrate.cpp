/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swell/errors.hpp"
#include "swell/rehydrate.hpp"
#include <gtest/gtest.h>
#include <fstream>
#include <unistd.h>

using namespace swell;
using namespace std::chrono_literals;

namespace {

ProcessRecord makeRecord(const std::string& key, RecordStatus status, Timestamp started,
                         std::optional<Timestamp> completed = std::nullopt) {
    ProcessRecord record;
    record.key = key;
    record.mode = NativeMode{1234, 1234, 99};
    record.command = "agent " + key;
    record.status = status;
    record.startedAt = started;
    record.completedAt = completed;
    return record;
}

}

TEST(RehydrateTest, GroupsRecordsByStatus) {
    const auto now = std::chrono::system_clock::now();
    RegistrySnapshot snapshot;
    snapshot["swell:T001"] = makeRecord("swell:T001", RecordStatus::Running, now - 90s);
    snapshot["swell:T002"] = makeRecord("swell:T002", RecordStatus::Completed, now - 600s, now - 475s);
    snapshot["swell:T003"] = makeRecord("swell:T003", RecordStatus::Failed, now - 30s, now - 20s);
    snapshot["swell:T003"].flags = {"orphaned"};

    ContainerMode container;
    container.id = "c1";
    container.name = "swell-task-T004";
    snapshot["swell:T004"] = makeRecord("swell:T004", RecordStatus::Running, now - 5s);
    snapshot["swell:T004"].mode = container;

    auto digest = rehydrate(snapshot, now);
    ASSERT_EQ(digest.running.size(), 2u);
    ASSERT_EQ(digest.completed.size(), 1u);
    ASSERT_EQ(digest.failed.size(), 1u);
    EXPECT_EQ(digest.total(), 4u);

    EXPECT_EQ(digest.running[0].elapsed, 90s);
    EXPECT_EQ(digest.running[0].mode, "native pid 1234");
    EXPECT_EQ(digest.running[1].mode, "container swell-task-T004");
    // Terminal records stop the clock at completion
    EXPECT_EQ(digest.completed[0].elapsed, 125s);
    EXPECT_EQ(digest.failed[0].elapsed, 10s);
    EXPECT_EQ(digest.failed[0].flags, (std::set<std::string>{"orphaned"}));
}

TEST(RehydrateTest, RenderListsSectionsAndSummary) {
    const auto now = std::chrono::system_clock::now();
    RegistrySnapshot snapshot;
    snapshot["swell:T001"] = makeRecord("swell:T001", RecordStatus::Running, now - 65s);
    snapshot["swell:T002"] = makeRecord("swell:T002", RecordStatus::Failed, now - 10s, now);
    snapshot["swell:T002"].flags = {"orphaned", "pid_reused"};

    const auto text = rehydrate(snapshot, now).render("registry.json");
    EXPECT_EQ(text.rfind("Context Rehydration Report\n", 0), 0u);
    EXPECT_NE(text.find("RUNNING (1)"), std::string::npos);
    EXPECT_NE(text.find("swell:T001  native pid 1234  1m 5s"), std::string::npos);
    EXPECT_NE(text.find("[orphaned, pid_reused]"), std::string::npos);
    EXPECT_NE(text.find("agent swell:T002"), std::string::npos);
    EXPECT_NE(text.find("Summary: 1 running, 0 completed, 1 failed"), std::string::npos);
    EXPECT_NE(text.find("Source: registry.json"), std::string::npos);
}

TEST(RehydrateTest, EmptyRegistrySaysSo) {
    const auto text = rehydrate(RegistrySnapshot{}).render();
    EXPECT_NE(text.find("No tasks recorded"), std::string::npos);
    EXPECT_NE(text.find("Summary: 0 running, 0 completed, 0 failed"), std::string::npos);
    EXPECT_EQ(text.find("Source:"), std::string::npos);
}

TEST(RehydrateTest, ReadsThroughStore) {
    auto dir = std::filesystem::temp_directory_path() / ("swell_rehydrate_" + std::to_string(::getpid()));
    std::filesystem::create_directories(dir);
    RegistryStore store(dir / "registry.json");

    EXPECT_EQ(rehydrate(store).total(), 0u);

    ProcessRegistry registry(store);
    (void)registry.registerTask("T001", NativeMode{42, 42, 7}, "make");
    (void)registry.markCompleted("T001");
    auto digest = rehydrate(store);
    ASSERT_EQ(digest.completed.size(), 1u);
    EXPECT_EQ(digest.completed[0].key, "swell:T001");

    std::ofstream(store.path()) << "[]";
    EXPECT_THROW((void)rehydrate(store), RegistryCorruption);

    std::filesystem::remove_all(dir);
}

TEST(FormatDurationTest, PicksTwoLargestUnits) {
    EXPECT_EQ(formatDuration(0s), "0s");
    EXPECT_EQ(formatDuration(45s), "45s");
    EXPECT_EQ(formatDuration(125s), "2m 5s");
    EXPECT_EQ(formatDuration(3780s), "1h 3m");
    EXPECT_EQ(formatDuration(90000s), "25h 0m");
    EXPECT_EQ(formatDuration(-5s), "0s");
}
