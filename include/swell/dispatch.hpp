/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "swell/backend.hpp"
#include "swell/plan.hpp"
#include "swell/registry.hpp"

namespace swell {

// Hands a wave's tasks to whoever does the work. Concurrency is the dispatcher's business.
class Dispatcher {
public:
    virtual ~Dispatcher() = default;
    // Throws Error naming the task that could not be started.
    virtual void dispatch(const Wave& wave, const std::vector<Task>& outstanding) = 0;
};

struct AgentOptions {
    std::string command;          // run through "sh -c"; empty: external agents
    std::string image;            // non-empty: run the command inside a container
    ResourceLimits limits;
    std::filesystem::path workdir;
};

// Starts one agent per task and records it in the registry, detached so that
// agents outlive a restart of the scheduler.
class AgentDispatcher : public Dispatcher {
public:
    AgentDispatcher(ProcessRegistry& registry, ProcessBackend& processes, ContainerBackend& containers,
                    AgentOptions options);

    void dispatch(const Wave& wave, const std::vector<Task>& outstanding) override;

    [[nodiscard]] static std::string containerName(const TaskId& id) { return "swell-task-" + id; }

private:
    void spawnNative(const Task& task);
    void startContainer(const Task& task);

    ProcessRegistry& registry_;
    ProcessBackend& processes_;
    ContainerBackend& containers_;
    AgentOptions options_;
};

}
