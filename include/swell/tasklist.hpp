/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

#include "swell/types.hpp"

namespace swell {

struct Task {
    TaskId id;
    std::string description;
    std::set<std::string> fileLocks;
    std::set<TaskId> dependencies;
    std::vector<std::string> policyRules;
    bool completed = false;
    std::string role = "Developer";
    std::size_t order = 0;  // position in the source list, tie-break for implicit edges
};

// Reads the markdown task list. Task blocks start with "- [ ]" / "- [x]",
// may carry "- **Constitution**:" and "- **Role**:" lines, and end at a blank line.
class TaskParser {
public:
    TaskParser() = default;

    [[nodiscard]] std::vector<Task> parse(const std::string& content) const;
    [[nodiscard]] std::vector<Task> parseFile(const std::filesystem::path& path) const;

    [[nodiscard]] static std::set<std::string> extractFileReferences(const std::string& text);
    [[nodiscard]] static std::set<TaskId> extractDependencies(const std::string& text);
    [[nodiscard]] static TaskId formatId(std::size_t number);

private:
    [[nodiscard]] Task buildTask(const std::vector<std::string>& lines, std::size_t number) const;
};

}
