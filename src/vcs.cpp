/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swell/vcs.hpp"
#include "swell/command.hpp"
#include "swell/errors.hpp"
#include "swell/logger.hpp"
#include <set>
#include <sstream>

namespace swell {

GitVersionControl::GitVersionControl(std::filesystem::path workdir, std::string git, std::chrono::seconds timeout)
    : workdir_(std::move(workdir)), git_(std::move(git)), timeout_(timeout) {}

std::vector<std::string> GitVersionControl::lines(const std::vector<std::string>& args) {
    std::vector<std::string> argv{git_};
    argv.insert(argv.end(), args.begin(), args.end());

    auto result = runCommand(argv, timeout_, workdir_);
    if (!result) {
        throw Error(git_ + " " + args.front() + " failed: " +
                    (result.started ? result.output : result.error));
    }

    std::vector<std::string> out;
    std::istringstream in(result.output);
    for (std::string line; std::getline(in, line);) {
        if (!line.empty()) out.push_back(line);
    }
    return out;
}

std::vector<std::string> GitVersionControl::changedFiles() {
    std::set<std::string> files;
    for (auto& f : lines({"diff", "--name-only", "HEAD"})) files.insert(std::move(f));
    for (auto& f : lines({"ls-files", "--others", "--exclude-standard"})) files.insert(std::move(f));
    LOG_DEBUG(std::to_string(files.size()) + " changed file(s) reported by " + git_);
    return {files.begin(), files.end()};
}

void GitVersionControl::commit(const std::string& message) {
    (void)lines({"add", "-A"});
    (void)lines({"commit", "--allow-empty", "-m", message});
    LOG_INFO("Committed: " + message.substr(0, message.find('\n')));
}

std::string checkpointMessage(int waveId) {
    return "[CHECKPOINT] Wave " + std::to_string(waveId) + " Complete\n\nAll tasks verified and validated";
}

}
