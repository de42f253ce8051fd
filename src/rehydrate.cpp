/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swell/rehydrate.hpp"
#include "swell/logger.hpp"
#include <sstream>

namespace swell {

namespace {

std::string describeMode(const ExecutionMode& mode) {
    if (const auto* native = std::get_if<NativeMode>(&mode)) {
        return "native pid " + std::to_string(native->pid);
    }
    return "container " + std::get<ContainerMode>(mode).name;
}

void renderSection(std::ostringstream& out, const char* title, const std::vector<DigestEntry>& entries) {
    out << title << " (" << entries.size() << ")\n";
    for (const auto& e : entries) {
        out << "  " << e.key << "  " << e.mode << "  " << formatDuration(e.elapsed);
        if (!e.flags.empty()) {
            out << "  [";
            bool first = true;
            for (const auto& f : e.flags) {
                if (!first) out << ", ";
                out << f;
                first = false;
            }
            out << "]";
        }
        out << "\n";
        if (!e.command.empty()) out << "    " << e.command << "\n";
    }
    out << "\n";
}

}

std::string formatDuration(std::chrono::seconds duration) {
    auto total = duration.count();
    if (total < 0) total = 0;
    const auto hours = total / 3600;
    const auto minutes = (total % 3600) / 60;
    const auto seconds = total % 60;

    if (hours > 0) return std::to_string(hours) + "h " + std::to_string(minutes) + "m";
    if (minutes > 0) return std::to_string(minutes) + "m " + std::to_string(seconds) + "s";
    return std::to_string(seconds) + "s";
}

Digest rehydrate(const RegistrySnapshot& snapshot, Timestamp now) {
    Digest digest;
    for (const auto& [key, record] : snapshot) {
        DigestEntry entry;
        entry.key = key;
        entry.command = record.command;
        entry.mode = describeMode(record.mode);
        entry.flags = record.flags;

        const auto end = (record.status != RecordStatus::Running && record.completedAt) ? *record.completedAt : now;
        entry.elapsed = std::chrono::duration_cast<std::chrono::seconds>(end - record.startedAt);

        switch (record.status) {
            case RecordStatus::Running: digest.running.push_back(std::move(entry)); break;
            case RecordStatus::Completed: digest.completed.push_back(std::move(entry)); break;
            case RecordStatus::Failed: digest.failed.push_back(std::move(entry)); break;
        }
    }
    return digest;
}

Digest rehydrate(const RegistryStore& store) {
    auto digest = rehydrate(store.load());
    LOG_DEBUG("Rehydrated " + std::to_string(digest.total()) + " record(s) from " + store.path().string());
    return digest;
}

std::string Digest::render(const std::string& source) const {
    std::ostringstream out;
    out << "Context Rehydration Report\n";
    out << "==========================\n\n";
    if (total() == 0) {
        out << "No tasks recorded\n\n";
    } else {
        renderSection(out, "RUNNING", running);
        renderSection(out, "COMPLETED", completed);
        renderSection(out, "FAILED", failed);
    }
    out << "Summary: " << running.size() << " running, " << completed.size() << " completed, "
        << failed.size() << " failed\n";
    if (!source.empty()) out << "Source: " << source << "\n";
    return out.str();
}

}
