/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <string>
#include <vector>

#include "swell/errors.hpp"

namespace swell {

// File list in, violation list out. Invoked once per checkpoint.
class PolicyValidator {
public:
    virtual ~PolicyValidator() = default;
    // Throws Error when the validator itself could not run.
    [[nodiscard]] virtual std::vector<Violation> validate(const std::vector<std::string>& files) = 0;
};

// Runs an external validator with the files as arguments. Each output line of the
// form "file:line:rule:message" is a violation; a non-zero exit with none is a failure.
class CommandPolicyValidator : public PolicyValidator {
public:
    explicit CommandPolicyValidator(std::string command,
                                    std::chrono::seconds timeout = std::chrono::seconds(300));

    std::vector<Violation> validate(const std::vector<std::string>& files) override;

    [[nodiscard]] static std::vector<Violation> parseViolations(const std::string& output);

private:
    std::string command_;
    std::chrono::seconds timeout_;
};

// Stand-in when no validator is configured. Accepts everything and says so.
class SkipPolicyValidator : public PolicyValidator {
public:
    std::vector<Violation> validate(const std::vector<std::string>& files) override;
};

}
