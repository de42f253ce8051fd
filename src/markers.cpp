/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swell/markers.hpp"
#include "swell/atomic_file.hpp"
#include "swell/errors.hpp"
#include "swell/logger.hpp"
#include <sstream>

namespace swell {

std::set<TaskId> TaskListMarkers::scan(const std::string& content, const std::vector<Task>& tasks) {
    std::vector<std::string> lines;
    std::istringstream in(content);
    for (std::string line; std::getline(in, line);) lines.push_back(line);

    std::set<TaskId> done;
    for (const auto& task : tasks) {
        if (task.description.empty()) continue;

        bool found = false;
        for (const auto& line : lines) {
            if (line.find(task.description) == std::string::npos) continue;
            found = true;
            if (line.find("[x]") != std::string::npos) done.insert(task.id);
            break;
        }
        if (!found) LOG_DEBUG(task.id + " not found in task list");
    }
    return done;
}

std::set<TaskId> TaskListMarkers::completed(const std::vector<Task>& tasks) {
    auto content = readWholeFile(path_);
    if (!content) {
        throw Error("Cannot read task list " + path_.string());
    }
    return scan(*content, tasks);
}

}
