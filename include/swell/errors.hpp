/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "swell/types.hpp"

namespace swell {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Cycle or lock deadlock. Raised before any wave exists.
class PlanningError : public Error {
public:
    explicit PlanningError(std::vector<TaskId> stuck);
    [[nodiscard]] const std::vector<TaskId>& stuckTasks() const noexcept { return stuck_; }

private:
    std::vector<TaskId> stuck_;
};

// A wave claimed completion but the marker store disagrees.
class VerificationError : public Error {
public:
    VerificationError(int waveId, std::vector<TaskId> outstanding);
    [[nodiscard]] int waveId() const noexcept { return waveId_; }
    [[nodiscard]] const std::vector<TaskId>& outstanding() const noexcept { return outstanding_; }

private:
    int waveId_;
    std::vector<TaskId> outstanding_;
};

struct Violation {
    std::string file;
    int line = 0;
    std::string rule;
    std::string message;
};

class PolicyViolation : public Error {
public:
    PolicyViolation(int waveId, std::vector<Violation> violations);
    [[nodiscard]] int waveId() const noexcept { return waveId_; }
    [[nodiscard]] const std::vector<Violation>& violations() const noexcept { return violations_; }

private:
    int waveId_;
    std::vector<Violation> violations_;
};

// Progress record or commit step of a checkpoint could not be made durable.
class CheckpointError : public Error {
public:
    CheckpointError(int waveId, int step, const std::string& detail);
    [[nodiscard]] int waveId() const noexcept { return waveId_; }
    [[nodiscard]] int step() const noexcept { return step_; }

private:
    int waveId_;
    int step_;
};

class RegistryCorruption : public Error {
public:
    RegistryCorruption(const std::filesystem::path& path, const std::string& detail);
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

class PlanFormatError : public Error {
public:
    PlanFormatError(const std::filesystem::path& path, const std::string& detail);
};

class ConfigError : public Error {
public:
    using Error::Error;
};

[[nodiscard]] std::string joinIds(const std::vector<TaskId>& ids);

}
