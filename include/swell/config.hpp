/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <string>

#include "swell/types.hpp"

namespace swell {

// Settings shared by the three executables. Environment first, command-line flags override.
struct Config {
    std::filesystem::path tasksFile = "tasks.md";
    std::filesystem::path planFile = "execution_plan.json";
    std::filesystem::path registryFile = ".swell/process_registry.json";
    std::filesystem::path progressFile = ".swell/progress.md";
    std::string ns = "swell";

    std::chrono::seconds watchInterval{300};
    std::chrono::seconds inspectTimeout{10};
    std::chrono::seconds pollInterval{5};
    std::chrono::seconds waveTimeout{3600};
    std::chrono::seconds guideline{900};

    std::string agentCommand;     // empty: agents are dispatched by someone else
    std::string agentImage;       // non-empty: agents run in containers
    ResourceLimits limits;
    std::string policyCommand;    // empty: validation skipped
    std::string docker = "docker";

    // Throws ConfigError on a malformed number.
    [[nodiscard]] static Config fromEnv();
};

// Rejects "..", system directories, and anything outside the working directory.
// Returns the absolute, normalized path. Throws ConfigError.
[[nodiscard]] std::filesystem::path validateRegistryPath(const std::filesystem::path& path);

}
