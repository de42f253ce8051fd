/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swell/config.hpp"
#include "swell/errors.hpp"
#include "swell/logger.hpp"
#include <cstdlib>

namespace swell {

namespace {

std::string envString(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return (value && *value) ? std::string(value) : fallback;
}

std::chrono::seconds envSeconds(const char* name, std::chrono::seconds fallback) {
    const char* value = std::getenv(name);
    if (!value || !*value) return fallback;

    std::size_t used = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &used);
    } catch (const std::exception&) {
        throw ConfigError(std::string(name) + " must be a number of seconds, got \"" + value + "\"");
    }
    if (used != std::string(value).size() || parsed < 0) {
        throw ConfigError(std::string(name) + " must be a non-negative number of seconds, got \"" + value + "\"");
    }
    return std::chrono::seconds(parsed);
}

}

Config Config::fromEnv() {
    Config config;
    config.tasksFile = envString("SWELL_TASKS", config.tasksFile.string());
    config.planFile = envString("SWELL_PLAN", config.planFile.string());
    config.registryFile = envString("SWELL_REGISTRY", config.registryFile.string());
    config.progressFile = envString("SWELL_PROGRESS", config.progressFile.string());
    config.ns = envString("SWELL_NAMESPACE", config.ns);

    config.watchInterval = envSeconds("SWELL_WATCH_INTERVAL", config.watchInterval);
    config.inspectTimeout = envSeconds("SWELL_INSPECT_TIMEOUT", config.inspectTimeout);
    config.pollInterval = envSeconds("SWELL_POLL_INTERVAL", config.pollInterval);
    config.waveTimeout = envSeconds("SWELL_WAVE_TIMEOUT", config.waveTimeout);
    config.guideline = envSeconds("SWELL_GUIDELINE", config.guideline);

    config.agentCommand = envString("SWELL_AGENT_CMD", "");
    config.agentImage = envString("SWELL_AGENT_IMAGE", "");
    config.limits.memory = envString("SWELL_CONTAINER_MEMORY", config.limits.memory);
    config.limits.cpu = envString("SWELL_CONTAINER_CPU", config.limits.cpu);
    config.policyCommand = envString("SWELL_POLICY_CMD", "");
    config.docker = envString("SWELL_DOCKER", config.docker);

    if (config.ns.find(':') != std::string::npos) {
        throw ConfigError("SWELL_NAMESPACE must not contain ':'");
    }
    return config;
}

std::filesystem::path validateRegistryPath(const std::filesystem::path& path) {
    for (const auto& part : path) {
        if (part == "..") {
            throw ConfigError("Registry path cannot contain parent directory references (..): " + path.string());
        }
    }

    std::error_code ec;
    const auto cwd = std::filesystem::current_path(ec);
    if (ec) throw ConfigError("Cannot determine working directory: " + ec.message());

    auto absolute = path.is_absolute() ? path : cwd / path;
    // Resolves symlinks for the part that exists, keeps the rest as written
    auto resolved = std::filesystem::weakly_canonical(absolute, ec);
    if (ec) resolved = absolute.lexically_normal();

    const std::string text = resolved.string();
    for (const char* forbidden : {"/etc", "/sys", "/proc", "/boot", "/dev"}) {
        const std::string prefix(forbidden);
        if (text == prefix || text.rfind(prefix + "/", 0) == 0) {
            throw ConfigError("Registry path cannot be in system directory " + prefix);
        }
    }

    auto canonicalCwd = std::filesystem::weakly_canonical(cwd, ec);
    if (ec) canonicalCwd = cwd;
    auto rel = resolved.lexically_relative(canonicalCwd);
    if (rel.empty() || rel == "." || *rel.begin() == "..") {
        throw ConfigError("Registry path must be within the current working directory (" +
                          canonicalCwd.string() + "): " + path.string());
    }

    LOG_TRACE("Registry path " + resolved.string());
    return resolved;
}

}
