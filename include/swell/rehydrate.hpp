/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <string>
#include <vector>

#include "swell/registry.hpp"

namespace swell {

struct DigestEntry {
    RecordKey key;
    std::string command;
    std::string mode;          // "native pid 1234" / "container swell-task-T001"
    std::chrono::seconds elapsed{0};
    std::set<std::string> flags;
};

// Situational summary for an orchestrator that lost its working context.
// Built from a registry snapshot alone; it never touches live processes.
struct Digest {
    std::vector<DigestEntry> running;
    std::vector<DigestEntry> completed;
    std::vector<DigestEntry> failed;

    [[nodiscard]] std::size_t total() const noexcept { return running.size() + completed.size() + failed.size(); }
    [[nodiscard]] std::string render(const std::string& source = {}) const;
};

// Elapsed is measured to completion for terminal records, to now for running ones.
[[nodiscard]] Digest rehydrate(const RegistrySnapshot& snapshot,
                               Timestamp now = std::chrono::system_clock::now());
[[nodiscard]] Digest rehydrate(const RegistryStore& store);

// 45s, 2m 5s, 1h 3m
[[nodiscard]] std::string formatDuration(std::chrono::seconds duration);

}
