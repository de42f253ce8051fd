/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swell/dispatch.hpp"
#include "swell/command.hpp"
#include "swell/errors.hpp"
#include "swell/logger.hpp"

namespace swell {

AgentDispatcher::AgentDispatcher(ProcessRegistry& registry, ProcessBackend& processes,
                                 ContainerBackend& containers, AgentOptions options)
    : registry_(registry), processes_(processes), containers_(containers), options_(std::move(options)) {}

void AgentDispatcher::spawnNative(const Task& task) {
    EnvironmentOverrides env{
        {"SWELL_TASK_ID", task.id},
        {"SWELL_TASK_INSTRUCTION", task.description},
        {"SWELL_TASK_HANDSHAKE", completionHandshake(task)},
    };

    auto spawned = spawnDetached({"sh", "-c", options_.command}, env, options_.workdir);
    if (!spawned) {
        throw Error("Failed to spawn agent for " + task.id + ": " + spawned.error);
    }

    NativeMode native;
    native.pid = spawned.pid;
    native.pgid = spawned.pid;
    if (auto start = processes_.startTime(spawned.pid)) {
        native.startTime = *start;
    } else {
        // Gone already; the zero fingerprint can never match, so the watchdog will settle it
        LOG_WARN("Agent for " + task.id + " (pid " + std::to_string(spawned.pid) + ") exited immediately");
    }

    (void)registry_.registerTask(task.id, native, options_.command, task.policyRules);
}

void AgentDispatcher::startContainer(const Task& task) {
    ContainerSpec spec;
    spec.name = containerName(task.id);
    spec.image = options_.image;
    spec.command = options_.command.empty() ? task.description : options_.command;
    spec.limits = options_.limits;
    spec.workdir = options_.workdir;

    auto id = containers_.start(spec);
    if (!id) {
        throw Error("Failed to start container for " + task.id);
    }

    ContainerMode container;
    container.id = *id;
    container.name = spec.name;
    container.limits = spec.limits;
    (void)registry_.registerTask(task.id, container, spec.command, task.policyRules);
}

void AgentDispatcher::dispatch(const Wave& wave, const std::vector<Task>& outstanding) {
    for (const auto& task : outstanding) {
        LOG_INFO("Agent " + task.role + ": " + task.id + " - " + task.description);
        if (!options_.image.empty()) {
            startContainer(task);
        } else if (!options_.command.empty()) {
            spawnNative(task);
        } else {
            LOG_INFO("  " + completionHandshake(task));
        }
    }
    if (options_.image.empty() && options_.command.empty() && !outstanding.empty()) {
        LOG_INFO("Wave " + std::to_string(wave.id) + " awaiting external agents");
    }
}

}
