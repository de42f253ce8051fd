/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

namespace swell {

// Task identifier as assigned by the task list parser ("T001").
using TaskId = std::string;

// Registry key: "<namespace>:<task id>".
using RecordKey = std::string;

// Descriptive only. Actual concurrency belongs to whoever runs the agents.
enum class WaveStrategy : std::uint8_t { Parallel, Sequential };

// Running -> {Completed, Failed}. Both right-hand states are terminal.
enum class RecordStatus : std::uint8_t { Running, Completed, Failed };

// Container limits in docker's own notation ("512m", "1.0").
struct ResourceLimits {
    std::string memory = "512m";
    std::string cpu = "1.0";
};

inline const char* toString(WaveStrategy strategy) noexcept {
    return strategy == WaveStrategy::Parallel ? "PARALLEL" : "SEQUENTIAL";
}

inline const char* toString(RecordStatus status) noexcept {
    switch (status) {
        case RecordStatus::Running: return "running";
        case RecordStatus::Completed: return "completed";
        case RecordStatus::Failed: return "failed";
        default: return "unknown";
    }
}

} // namespace swell
