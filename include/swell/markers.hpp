/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <set>
#include <string>
#include <vector>

#include "swell/tasklist.hpp"

namespace swell {

// Where agents record that a task is done. Read here, written by the agents.
class CompletionSource {
public:
    virtual ~CompletionSource() = default;
    [[nodiscard]] virtual std::set<TaskId> completed(const std::vector<Task>& tasks) = 0;
};

// The task list itself: a task is done when the first line mentioning its
// description carries "[x]".
class TaskListMarkers : public CompletionSource {
public:
    explicit TaskListMarkers(std::filesystem::path path) : path_(std::move(path)) {}

    // Throws Error when the task list cannot be read.
    std::set<TaskId> completed(const std::vector<Task>& tasks) override;

    [[nodiscard]] static std::set<TaskId> scan(const std::string& content, const std::vector<Task>& tasks);

private:
    std::filesystem::path path_;
};

}
