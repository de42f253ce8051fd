/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace swell {

class VersionControl {
public:
    virtual ~VersionControl() = default;
    // Both throw Error on failure.
    [[nodiscard]] virtual std::vector<std::string> changedFiles() = 0;
    virtual void commit(const std::string& message) = 0;
};

class GitVersionControl : public VersionControl {
public:
    explicit GitVersionControl(std::filesystem::path workdir = {}, std::string git = "git",
                               std::chrono::seconds timeout = std::chrono::seconds(120));

    // Tracked files differing from HEAD plus untracked, non-ignored files.
    std::vector<std::string> changedFiles() override;
    // Stages everything and records one commit, even when nothing changed.
    void commit(const std::string& message) override;

private:
    std::vector<std::string> lines(const std::vector<std::string>& args);

    std::filesystem::path workdir_;
    std::string git_;
    std::chrono::seconds timeout_;
};

[[nodiscard]] std::string checkpointMessage(int waveId);

}
