/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

#include "swell/tasklist.hpp"
#include "swell/types.hpp"

namespace swell {

struct CheckpointPolicy {
    bool enabled = true;
    std::string verificationCriteria;
};

struct Wave {
    int id = 0;
    WaveStrategy strategy = WaveStrategy::Sequential;
    std::vector<Task> tasks;
    std::string rationale;
    CheckpointPolicy checkpoint;

    [[nodiscard]] std::vector<TaskId> taskIds() const;
    [[nodiscard]] std::set<std::string> fileLocks() const;
};

// Hand-off from planning to execution. Never edited in place: a replan writes a new plan.
struct ExecutionPlan {
    std::string phaseId = "default";
    std::vector<Wave> waves;

    [[nodiscard]] std::size_t taskCount() const noexcept;
    [[nodiscard]] const Wave* waveOf(const TaskId& id) const noexcept;
};

[[nodiscard]] std::string completionHandshake(const Task& task);

[[nodiscard]] std::string planToJson(const ExecutionPlan& plan);
// origin is only used to label errors
[[nodiscard]] ExecutionPlan planFromJson(const std::string& text, const std::filesystem::path& origin = "<memory>");

void savePlan(const ExecutionPlan& plan, const std::filesystem::path& path);
[[nodiscard]] ExecutionPlan loadPlan(const std::filesystem::path& path);

}
