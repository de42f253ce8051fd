/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace swell {

struct CommandResult {
    bool started = false;
    bool timedOut = false;
    int exitCode = -1;      // 128 + signal when killed by a signal
    std::string output;     // stdout and stderr interleaved
    std::string error;      // why the command could not be started
    explicit operator bool() const noexcept { return started && !timedOut && exitCode == 0; }
};

// Runs argv (PATH lookup, no shell) in its own process group and collects its output.
// On timeout the whole group is SIGKILLed. A zero timeout waits indefinitely.
[[nodiscard]] CommandResult runCommand(const std::vector<std::string>& argv,
                                       std::chrono::milliseconds timeout = std::chrono::milliseconds{0},
                                       const std::filesystem::path& workdir = {}) noexcept;

struct SpawnResult {
    bool ok = false;
    int pid = -1;           // also the process group id
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

using EnvironmentOverrides = std::vector<std::pair<std::string, std::string>>;

// Starts argv detached from the caller: new session, own process group, reparented
// to init, so it outlives the scheduler and needs no reaping by it.
[[nodiscard]] SpawnResult spawnDetached(const std::vector<std::string>& argv,
                                        const EnvironmentOverrides& env = {},
                                        const std::filesystem::path& workdir = {}) noexcept;

}
