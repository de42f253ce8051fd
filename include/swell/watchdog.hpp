/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "swell/backend.hpp"
#include "swell/registry.hpp"

namespace swell {

struct WatchdogOptions {
    std::chrono::seconds interval{300};
    std::chrono::seconds inspectTimeout{10};
    std::chrono::seconds guideline{900};
};

enum class EventType : std::uint8_t {
    OrphanDetected,
    ZombieDetected,
    LongRunning,
    InspectFailed,
    SampleFailed
};

[[nodiscard]] const char* toString(EventType type) noexcept;

struct WatchdogEvent {
    EventType type;
    RecordKey key;
    std::string detail;
};

struct SweepReport {
    std::vector<WatchdogEvent> events;
    std::map<RecordKey, ResourceUsage> samples;
    RegistryStats stats;

    [[nodiscard]] std::size_t count(EventType type) const noexcept;
};

// Reconciles registry records against the live process table and container runtime.
// Runs on its own clock; nothing here depends on the scheduler being alive.
class Watchdog {
public:
    using EventCallback = std::function<void(const WatchdogEvent&)>;

    Watchdog(ProcessRegistry& registry, ProcessBackend& processes, ContainerBackend& containers,
             WatchdogOptions options = {});
    ~Watchdog();

    Watchdog(const Watchdog&) = delete;
    Watchdog& operator=(const Watchdog&) = delete;

    // One reconciliation pass. A failure on one record never stops the others.
    // Throws RegistryCorruption if the document itself cannot be read.
    SweepReport sweep();

    [[nodiscard]] bool start();
    void stop() noexcept;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t sweepCount() const noexcept { return sweeps_.load(); }

    // Not synchronized with the loop thread: install before start().
    void onEvent(EventCallback callback) { callback_ = std::move(callback); }

private:
    void loop();
    void emit(SweepReport& report, EventType type, const RecordKey& key, const std::string& detail);
    void checkRunning(const ProcessRecord& record, SweepReport& report);
    void checkCompleted(const ProcessRecord& record, SweepReport& report);
    void checkAge(const ProcessRecord& record, SweepReport& report);

    ProcessRegistry& registry_;
    ProcessBackend& processes_;
    ContainerBackend& containers_;
    WatchdogOptions options_;
    EventCallback callback_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    std::atomic<std::size_t> sweeps_{0};
    std::thread thread_;
};

enum class KillOutcome : std::uint8_t {
    Killed,
    AlreadyGone,
    KillFailed,
    NotFound
};

struct KillResult {
    KillOutcome outcome;
    RecordKey key;
    std::string detail;
};

// Operator kill of a task's worker. A native group is signalled only while the
// stored fingerprint still matches the live process; a reused pid is recorded,
// never signalled.
KillResult killTask(ProcessRegistry& registry, ProcessBackend& processes, ContainerBackend& containers,
                    const std::string& id);

}
