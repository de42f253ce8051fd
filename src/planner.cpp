/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swell/planner.hpp"
#include "swell/errors.hpp"
#include "swell/logger.hpp"
#include <set>

namespace swell {

ExecutionPlan WavePlanner::plan(const std::vector<Task>& tasks) const {
    return plan(tasks, DependencyGraph::build(tasks));
}

ExecutionPlan WavePlanner::plan(const std::vector<Task>& tasks, const DependencyGraph& graph) const {
    ExecutionPlan result;
    result.phaseId = phaseId_;

    std::set<TaskId> assigned;
    int waveId = 1;

    while (assigned.size() < tasks.size()) {
        // Prerequisites must be in an earlier wave, not earlier in this pass.
        const std::set<TaskId> settled = assigned;
        std::set<std::string> claimedLocks;
        Wave wave;
        wave.id = waveId;

        for (const auto& task : tasks) {
            if (assigned.count(task.id)) continue;

            const auto& deps = graph.dependenciesOf(task.id);
            bool ready = true;
            for (const auto& dep : deps) {
                if (!settled.count(dep)) {
                    ready = false;
                    break;
                }
            }
            if (!ready) continue;

            bool conflict = false;
            for (const auto& lock : task.fileLocks) {
                if (claimedLocks.count(lock)) {
                    conflict = true;
                    break;
                }
            }
            if (conflict) continue;

            Task placed = task;
            placed.dependencies = deps;
            claimedLocks.insert(task.fileLocks.begin(), task.fileLocks.end());
            assigned.insert(task.id);
            wave.tasks.push_back(std::move(placed));
        }

        if (wave.tasks.empty()) {
            std::vector<TaskId> stuck;
            for (const auto& task : tasks) {
                if (!assigned.count(task.id)) stuck.push_back(task.id);
            }
            LOG_ERROR("Planning failed after " + std::to_string(result.waves.size()) +
                      " wave(s); stuck: " + joinIds(stuck));
            throw PlanningError(std::move(stuck));
        }

        wave.strategy = wave.tasks.size() > 1 ? WaveStrategy::Parallel : WaveStrategy::Sequential;
        wave.rationale = "Wave " + std::to_string(waveId) + ": " + std::to_string(wave.tasks.size()) +
                         " independent task(s) with no file conflicts";
        wave.checkpoint.enabled = true;
        wave.checkpoint.verificationCriteria =
            "Verify all Wave " + std::to_string(waveId) + " tasks are marked [x] in the task list";

        LOG_DEBUG("Wave " + std::to_string(waveId) + " (" + toString(wave.strategy) + "): " +
                  joinIds(wave.taskIds()));
        result.waves.push_back(std::move(wave));
        ++waveId;
    }

    return result;
}

}
