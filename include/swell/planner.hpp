/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>
#include <utility>
#include <vector>

#include "swell/graph.hpp"
#include "swell/plan.hpp"
#include "swell/tasklist.hpp"

namespace swell {

// Greedy partition into waves. Deterministic for a fixed list and order,
// and deliberately not optimal: downstream tooling relies on the numbering.
class WavePlanner {
public:
    explicit WavePlanner(std::string phaseId = "default") : phaseId_(std::move(phaseId)) {}

    // Throws PlanningError (no partial plan) when a pass places nothing.
    [[nodiscard]] ExecutionPlan plan(const std::vector<Task>& tasks) const;
    [[nodiscard]] ExecutionPlan plan(const std::vector<Task>& tasks, const DependencyGraph& graph) const;

private:
    std::string phaseId_;
};

}
