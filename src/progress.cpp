/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swell/progress.hpp"
#include "swell/atomic_file.hpp"
#include "swell/errors.hpp"
#include "swell/logger.hpp"
#include <ctime>

namespace swell {

std::string ProgressLog::renderEntry(const Wave& wave, const std::string& timestamp) {
    std::string entry = "\n## Wave " + std::to_string(wave.id) + " Complete - " + timestamp + "\n\n";
    for (const auto& task : wave.tasks) {
        entry += "- [x] " + task.id + ": " + task.description + "\n";
    }
    return entry;
}

void ProgressLog::appendWave(const Wave& wave, std::chrono::system_clock::time_point when) {
    std::string content;
    std::error_code ec;
    if (std::filesystem::exists(path_, ec)) {
        auto existing = readWholeFile(path_);
        if (!existing) {
            throw Error("Cannot read progress record " + path_.string());
        }
        content = std::move(*existing);
        // A resumed wave that halted after this step already has the newest entry
        const std::string heading = "\n## Wave " + std::to_string(wave.id) + " Complete";
        const auto last = content.rfind("\n## Wave ");
        if (last != std::string::npos && content.compare(last, heading.size(), heading) == 0) {
            LOG_INFO("Progress for wave " + std::to_string(wave.id) + " already recorded in " + path_.string());
            return;
        }
    } else {
        content = "# Progress\n";
    }

    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    ::localtime_r(&t, &tm);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm);

    content += renderEntry(wave, stamp);

    std::string error;
    if (!writeFileAtomically(path_, content, error)) {
        throw Error("Cannot write progress record " + path_.string() + ": " + error);
    }
    LOG_INFO("Progress recorded for wave " + std::to_string(wave.id) + " in " + path_.string());
}

}
