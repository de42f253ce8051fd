/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swell/policy.hpp"
#include "swell/command.hpp"
#include "swell/logger.hpp"
#include <sstream>

namespace swell {

CommandPolicyValidator::CommandPolicyValidator(std::string command, std::chrono::seconds timeout)
    : command_(std::move(command)), timeout_(timeout) {}

std::vector<Violation> CommandPolicyValidator::parseViolations(const std::string& output) {
    std::vector<Violation> violations;
    std::istringstream in(output);
    for (std::string line; std::getline(in, line);) {
        auto first = line.find(':');
        if (first == std::string::npos) continue;
        auto second = line.find(':', first + 1);
        if (second == std::string::npos) continue;
        auto third = line.find(':', second + 1);
        if (third == std::string::npos) continue;

        const auto lineText = line.substr(first + 1, second - first - 1);
        if (lineText.empty() || lineText.size() > 9 || lineText.find_first_not_of("0123456789") != std::string::npos) continue;

        Violation v;
        v.file = line.substr(0, first);
        v.line = std::stoi(lineText);
        v.rule = line.substr(second + 1, third - second - 1);
        v.message = line.substr(third + 1);
        if (!v.message.empty() && v.message.front() == ' ') v.message.erase(0, 1);
        violations.push_back(std::move(v));
    }
    return violations;
}

std::vector<Violation> CommandPolicyValidator::validate(const std::vector<std::string>& files) {
    if (files.empty()) {
        LOG_INFO("No files to validate");
        return {};
    }

    // Files become "$@" of the validator command
    std::vector<std::string> argv{"sh", "-c", command_ + " \"$@\"", "swell-policy"};
    argv.insert(argv.end(), files.begin(), files.end());

    LOG_INFO("Validating " + std::to_string(files.size()) + " file(s) with: " + command_);
    auto result = runCommand(argv, timeout_);
    if (!result.started) {
        throw Error("Policy validator could not start: " + result.error);
    }
    if (result.timedOut) {
        throw Error("Policy validator timed out after " + std::to_string(timeout_.count()) + "s");
    }

    auto violations = parseViolations(result.output);
    if (result.exitCode != 0 && violations.empty()) {
        throw Error("Policy validator exited with " + std::to_string(result.exitCode) + ": " + result.output);
    }
    return violations;
}

std::vector<Violation> SkipPolicyValidator::validate(const std::vector<std::string>& files) {
    LOG_WARN("No policy validator configured; " + std::to_string(files.size()) + " file(s) accepted unchecked");
    return {};
}

}
