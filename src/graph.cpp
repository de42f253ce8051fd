/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swell/graph.hpp"
#include "swell/logger.hpp"

namespace swell {

DependencyGraph DependencyGraph::build(const std::vector<Task>& tasks) {
    DependencyGraph graph;
    std::map<std::string, std::vector<const Task*>> lockHolders;

    for (const auto& task : tasks) {
        auto& deps = graph.edges_[task.id];
        deps.insert(task.dependencies.begin(), task.dependencies.end());

        // tasks is in source order, so every earlier holder of a lock is a prerequisite
        for (const auto& file : task.fileLocks) {
            auto& holders = lockHolders[file];
            for (const Task* earlier : holders) {
                if (earlier->id != task.id && deps.insert(earlier->id).second) {
                    ++graph.implicitEdges_;
                }
            }
            holders.push_back(&task);
        }
    }

    for (const auto& id : graph.unknownDependencies()) {
        LOG_WARN("Dependency on unknown task " + id + " can never be satisfied");
    }
    LOG_DEBUG("Dependency graph: " + std::to_string(graph.edgeCount()) + " edge(s), " +
              std::to_string(graph.implicitEdges_) + " from file locks");
    return graph;
}

const std::set<TaskId>& DependencyGraph::dependenciesOf(const TaskId& id) const {
    static const std::set<TaskId> none;
    auto it = edges_.find(id);
    return it == edges_.end() ? none : it->second;
}

std::size_t DependencyGraph::edgeCount() const noexcept {
    std::size_t total = 0;
    for (const auto& [id, deps] : edges_) {
        (void)id;
        total += deps.size();
    }
    return total;
}

std::set<TaskId> DependencyGraph::unknownDependencies() const {
    std::set<TaskId> unknown;
    for (const auto& [id, deps] : edges_) {
        (void)id;
        for (const auto& dep : deps) {
            if (edges_.count(dep) == 0) unknown.insert(dep);
        }
    }
    return unknown;
}

}
