/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include "swell/types.hpp"

namespace swell {

using Timestamp = std::chrono::system_clock::time_point;

// PID reuse guard: a bare pid match never proves the process is ours.
struct Fingerprint {
    int pid = 0;
    std::uint64_t startTime = 0;

    [[nodiscard]] bool matches(const std::optional<std::uint64_t>& liveStartTime) const noexcept {
        return liveStartTime.has_value() && *liveStartTime == startTime;
    }
};

struct NativeMode {
    int pid = 0;
    int pgid = 0;
    std::uint64_t startTime = 0;

    [[nodiscard]] Fingerprint fingerprint() const noexcept { return {pid, startTime}; }
};

struct ContainerMode {
    std::string id;
    std::string name;
    ResourceLimits limits;
};

using ExecutionMode = std::variant<NativeMode, ContainerMode>;

namespace flags {
inline constexpr const char* Orphaned = "orphaned";
inline constexpr const char* PidReused = "pid_reused";
inline constexpr const char* ZombieKilled = "zombie_killed";
inline constexpr const char* Killed = "killed";
}

struct ProcessRecord {
    RecordKey key;
    ExecutionMode mode;
    std::string command;
    RecordStatus status = RecordStatus::Running;
    Timestamp startedAt;
    std::optional<Timestamp> completedAt;
    std::vector<std::string> rules;
    std::set<std::string> flags;

    [[nodiscard]] bool isNative() const noexcept { return std::holds_alternative<NativeMode>(mode); }
};

using RegistrySnapshot = std::map<RecordKey, ProcessRecord>;

// "2025-01-31T12:00:00Z"
[[nodiscard]] std::string formatTimestamp(Timestamp when);
[[nodiscard]] std::optional<Timestamp> parseTimestamp(const std::string& text) noexcept;

[[nodiscard]] std::string registryToJson(const RegistrySnapshot& snapshot);
// Throws RegistryCorruption naming origin and the offending key.
[[nodiscard]] RegistrySnapshot registryFromJson(const std::string& text, const std::filesystem::path& origin);

// The one narrow door to the registry document. Shared by scheduler, watchdog and CLIs;
// it holds no state of its own beyond the path.
class RegistryStore {
public:
    explicit RegistryStore(std::filesystem::path path);

    // Missing file reads as empty. Malformed content throws RegistryCorruption.
    [[nodiscard]] RegistrySnapshot load() const;
    // Atomic replace, then chmod 0600. Throws Error on I/O failure.
    void save(const RegistrySnapshot& snapshot) const;
    // Load, mutate, save while holding an exclusive flock on "<path>.lock".
    RegistrySnapshot update(const std::function<void(RegistrySnapshot&)>& mutate) const;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

[[nodiscard]] RecordKey qualifyKey(const std::string& id, const std::string& ns);

struct RegistryStats {
    std::size_t running = 0;
    std::size_t completed = 0;
    std::size_t failed = 0;
    [[nodiscard]] std::size_t total() const noexcept { return running + completed + failed; }
};

class ProcessRegistry {
public:
    explicit ProcessRegistry(const RegistryStore& store, std::string ns = "swell");

    ProcessRegistry(const ProcessRegistry&) = delete;
    ProcessRegistry& operator=(const ProcessRegistry&) = delete;

    // Overwrites any existing record for the id.
    ProcessRecord registerTask(const std::string& id, ExecutionMode mode, const std::string& command,
                               std::vector<std::string> rules = {});

    // running -> completed / failed. False when the record is missing or already terminal.
    bool markCompleted(const std::string& id);
    bool markFailed(const std::string& id, const std::set<std::string>& addFlags = {});
    bool transition(const RecordKey& key, RecordStatus to, const std::set<std::string>& addFlags = {});
    bool addFlags(const RecordKey& key, const std::set<std::string>& extra);

    bool remove(const std::string& id);
    [[nodiscard]] std::optional<ProcessRecord> find(const std::string& id) const;
    [[nodiscard]] RegistrySnapshot snapshot() const;
    [[nodiscard]] RegistryStats stats() const;

    // Removes terminal records whose completion is older than the cutoff. Operator-triggered only.
    std::size_t cleanup(int days, Timestamp now = std::chrono::system_clock::now());

    [[nodiscard]] RecordKey keyFor(const std::string& id) const { return qualifyKey(id, ns_); }
    [[nodiscard]] const RegistryStore& store() const noexcept { return store_; }

private:
    const RegistryStore& store_;
    std::string ns_;
};

}
