/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swell/errors.hpp"

namespace swell {

namespace {
std::string describeViolations(int waveId, const std::vector<Violation>& violations) {
    std::string msg = "Wave " + std::to_string(waveId) + " checkpoint blocked by " +
                      std::to_string(violations.size()) + " policy violation(s)";
    for (const auto& v : violations) {
        msg += "\n  " + v.file + ":" + std::to_string(v.line) + " - " + v.rule + ": " + v.message;
    }
    return msg;
}
}

std::string joinIds(const std::vector<TaskId>& ids) {
    std::string out;
    for (const auto& id : ids) {
        if (!out.empty()) out += ", ";
        out += id;
    }
    return out;
}

PlanningError::PlanningError(std::vector<TaskId> stuck)
    : Error("Circular dependency or unresolvable file-lock conflict; stuck tasks: " + joinIds(stuck)),
      stuck_(std::move(stuck)) {}

VerificationError::VerificationError(int waveId, std::vector<TaskId> outstanding)
    : Error("Wave " + std::to_string(waveId) + " not complete; outstanding tasks: " + joinIds(outstanding)),
      waveId_(waveId), outstanding_(std::move(outstanding)) {}

PolicyViolation::PolicyViolation(int waveId, std::vector<Violation> violations)
    : Error(describeViolations(waveId, violations)),
      waveId_(waveId), violations_(std::move(violations)) {}

CheckpointError::CheckpointError(int waveId, int step, const std::string& detail)
    : Error("Wave " + std::to_string(waveId) + " checkpoint step " + std::to_string(step) + " failed: " + detail),
      waveId_(waveId), step_(step) {}

RegistryCorruption::RegistryCorruption(const std::filesystem::path& path, const std::string& detail)
    : Error("Registry corrupted (" + path.string() + "): " + detail), path_(path) {}

PlanFormatError::PlanFormatError(const std::filesystem::path& path, const std::string& detail)
    : Error("Invalid execution plan (" + path.string() + "): " + detail) {}

}
