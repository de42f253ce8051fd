/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "swell/types.hpp"

namespace swell {

struct ResourceUsage {
    double cpuPercent = 0.0;
    std::uint64_t memoryKb = 0;
};

// Native process side of the backend contract. Every kill targets a whole group.
class ProcessBackend {
public:
    virtual ~ProcessBackend() = default;

    // Kernel start time of pid, nullopt if no such process or it has already exited (zombie state).
    [[nodiscard]] virtual std::optional<std::uint64_t> startTime(int pid) = 0;
    [[nodiscard]] virtual std::optional<ResourceUsage> sample(int pid) = 0;
    [[nodiscard]] virtual bool killGroup(int pgid) = 0;
};

struct ContainerSpec {
    std::string name;
    std::string image;
    std::string command;
    ResourceLimits limits;
    std::filesystem::path workdir;
};

class ContainerBackend {
public:
    virtual ~ContainerBackend() = default;

    // nullopt when the answer is inconclusive (error or timeout).
    [[nodiscard]] virtual std::optional<bool> isRunning(const std::string& id, std::chrono::seconds timeout) = 0;
    [[nodiscard]] virtual std::optional<ResourceUsage> sample(const std::string& id) = 0;
    [[nodiscard]] virtual bool kill(const std::string& id) = 0;
    // Returns the container id.
    [[nodiscard]] virtual std::optional<std::string> start(const ContainerSpec& spec) = 0;
};

// Linux /proc reader plus signal-based group kill.
class ProcfsBackend : public ProcessBackend {
public:
    explicit ProcfsBackend(std::chrono::milliseconds grace = std::chrono::seconds(2),
                           std::filesystem::path procRoot = "/proc");

    std::optional<std::uint64_t> startTime(int pid) override;
    std::optional<ResourceUsage> sample(int pid) override;
    // SIGTERM, wait up to the grace period, then SIGKILL. Refuses pgid <= 1 and the caller's own group.
    bool killGroup(int pgid) override;

private:
    struct StatLine {
        char state = '?';
        int pgrp = 0;
        std::uint64_t utime = 0;
        std::uint64_t stime = 0;
        std::uint64_t starttime = 0;
        std::int64_t rssPages = 0;
    };

    [[nodiscard]] std::optional<StatLine> readStat(int pid) const;
    [[nodiscard]] bool groupAlive(int pgid) const;

    std::chrono::milliseconds grace_;
    std::filesystem::path procRoot_;
};

// Drives the docker CLI (or a compatible one such as podman) through runCommand.
class DockerCliBackend : public ContainerBackend {
public:
    explicit DockerCliBackend(std::string docker = "docker",
                              std::chrono::seconds commandTimeout = std::chrono::seconds(30));

    std::optional<bool> isRunning(const std::string& id, std::chrono::seconds timeout) override;
    std::optional<ResourceUsage> sample(const std::string& id) override;
    bool kill(const std::string& id) override;
    std::optional<std::string> start(const ContainerSpec& spec) override;

private:
    std::string docker_;
    std::chrono::seconds commandTimeout_;
};

// "512m" -> bytes. Accepts b, k, m, g suffixes (either case); nullopt on garbage.
[[nodiscard]] std::optional<std::uint64_t> parseMemoryLimit(const std::string& text) noexcept;

// "12.5MiB / 1.9GiB" -> KiB of the first figure.
[[nodiscard]] std::optional<std::uint64_t> parseMemoryUsage(const std::string& text) noexcept;

}
