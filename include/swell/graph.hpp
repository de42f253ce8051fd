/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <map>
#include <set>
#include <vector>

#include "swell/tasklist.hpp"
#include "swell/types.hpp"

namespace swell {

// Explicit ("after T###") and implicit (shared file lock) edges merged into one
// map of task -> prerequisites. For a shared lock the task declared earlier in
// the source list is always the prerequisite.
class DependencyGraph {
public:
    [[nodiscard]] static DependencyGraph build(const std::vector<Task>& tasks);

    [[nodiscard]] const std::set<TaskId>& dependenciesOf(const TaskId& id) const;
    [[nodiscard]] bool contains(const TaskId& id) const noexcept { return edges_.count(id) > 0; }
    [[nodiscard]] std::size_t edgeCount() const noexcept;
    [[nodiscard]] std::size_t implicitEdgeCount() const noexcept { return implicitEdges_; }

    // Prerequisites named by some task that are not in the list at all.
    [[nodiscard]] std::set<TaskId> unknownDependencies() const;

private:
    std::map<TaskId, std::set<TaskId>> edges_;
    std::size_t implicitEdges_ = 0;
};

}
