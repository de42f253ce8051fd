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

#include "swell/plan.hpp"

namespace swell {

// Markdown journal of checkpointed waves. Each append rewrites the file atomically.
class ProgressLog {
public:
    explicit ProgressLog(std::filesystem::path path) : path_(std::move(path)) {}

    // Skips the append when this wave already holds the newest entry.
    // Throws Error if the record cannot be made durable.
    void appendWave(const Wave& wave,
                    std::chrono::system_clock::time_point when = std::chrono::system_clock::now());

    [[nodiscard]] static std::string renderEntry(const Wave& wave, const std::string& timestamp);
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

}
