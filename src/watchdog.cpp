/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swell/watchdog.hpp"
#include "swell/logger.hpp"
#include "swell/rehydrate.hpp"

namespace swell {

const char* toString(EventType type) noexcept {
    switch (type) {
        case EventType::OrphanDetected: return "OrphanDetected";
        case EventType::ZombieDetected: return "ZombieDetected";
        case EventType::LongRunning: return "LongRunning";
        case EventType::InspectFailed: return "InspectFailed";
        case EventType::SampleFailed: return "SampleFailed";
        default: return "Unknown";
    }
}

std::size_t SweepReport::count(EventType type) const noexcept {
    std::size_t n = 0;
    for (const auto& e : events) {
        if (e.type == type) ++n;
    }
    return n;
}

Watchdog::Watchdog(ProcessRegistry& registry, ProcessBackend& processes, ContainerBackend& containers,
                   WatchdogOptions options)
    : registry_(registry), processes_(processes), containers_(containers), options_(options) {
    LOG_DEBUG("Watchdog created - registry: " + registry_.store().path().string() +
              ", interval: " + std::to_string(options_.interval.count()) + "s");
}

Watchdog::~Watchdog() {
    stop();
}

void Watchdog::emit(SweepReport& report, EventType type, const RecordKey& key, const std::string& detail) {
    WatchdogEvent event{type, key, detail};
    const std::string line = std::string(toString(type)) + " " + key + ": " + detail;
    switch (type) {
        case EventType::OrphanDetected:
        case EventType::ZombieDetected:
        case EventType::InspectFailed:
            LOG_WARN(line);
            break;
        default:
            LOG_INFO(line);
            break;
    }
    if (callback_) callback_(event);
    report.events.push_back(std::move(event));
}

void Watchdog::checkAge(const ProcessRecord& record, SweepReport& report) {
    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now() - record.startedAt);
    if (options_.guideline.count() > 0 && elapsed > options_.guideline) {
        emit(report, EventType::LongRunning, record.key,
             "running for " + formatDuration(elapsed) + " (guideline " + formatDuration(options_.guideline) + ")");
    }
}

void Watchdog::checkRunning(const ProcessRecord& record, SweepReport& report) {
    std::optional<ResourceUsage> usage;

    if (const auto* native = std::get_if<NativeMode>(&record.mode)) {
        const auto live = processes_.startTime(native->pid);
        if (!native->fingerprint().matches(live)) {
            std::set<std::string> marks{flags::Orphaned};
            std::string detail = "pid " + std::to_string(native->pid) + " is gone";
            if (live) {
                marks.insert(flags::PidReused);
                detail = "pid " + std::to_string(native->pid) + " now belongs to another process";
            }
            // Only counts if the record was still running when we got the lock
            if (registry_.transition(record.key, RecordStatus::Failed, marks)) {
                emit(report, EventType::OrphanDetected, record.key, detail);
            }
            return;
        }
        usage = processes_.sample(native->pid);
    } else {
        const auto& container = std::get<ContainerMode>(record.mode);
        const auto running = containers_.isRunning(container.id, options_.inspectTimeout);
        if (!running) {
            emit(report, EventType::InspectFailed, record.key, "inspection of " + container.name + " inconclusive");
            return;
        }
        if (!*running) {
            if (registry_.transition(record.key, RecordStatus::Failed, {flags::Orphaned})) {
                emit(report, EventType::OrphanDetected, record.key, "container " + container.name + " is not running");
            }
            return;
        }
        usage = containers_.sample(container.id);
    }

    if (usage) {
        report.samples[record.key] = *usage;
    } else {
        emit(report, EventType::SampleFailed, record.key, "resource sample unavailable");
    }
    checkAge(record, report);
}

void Watchdog::checkCompleted(const ProcessRecord& record, SweepReport& report) {
    if (const auto* native = std::get_if<NativeMode>(&record.mode)) {
        if (!native->fingerprint().matches(processes_.startTime(native->pid))) return;

        // The group, never the pid alone: children would survive otherwise
        const bool killed = processes_.killGroup(native->pgid);
        if (killed) registry_.addFlags(record.key, {flags::ZombieKilled});
        emit(report, EventType::ZombieDetected, record.key,
             "completed but pid " + std::to_string(native->pid) + " alive; group " +
             std::to_string(native->pgid) + (killed ? " killed" : " kill failed"));
        return;
    }

    const auto& container = std::get<ContainerMode>(record.mode);
    const auto running = containers_.isRunning(container.id, options_.inspectTimeout);
    if (!running) {
        emit(report, EventType::InspectFailed, record.key, "inspection of " + container.name + " inconclusive");
        return;
    }
    if (!*running) return;

    const bool killed = containers_.kill(container.id);
    if (killed) registry_.addFlags(record.key, {flags::ZombieKilled});
    emit(report, EventType::ZombieDetected, record.key,
         "completed but container " + container.name + " alive; " + (killed ? "killed" : "kill failed"));
}

SweepReport Watchdog::sweep() {
    SweepReport report;
    const auto snapshot = registry_.snapshot();

    for (const auto& [key, record] : snapshot) {
        try {
            switch (record.status) {
                case RecordStatus::Running: checkRunning(record, report); break;
                case RecordStatus::Completed: checkCompleted(record, report); break;
                case RecordStatus::Failed: break;
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Watchdog check of " + key + " failed: " + e.what());
        }
    }

    report.stats = registry_.stats();
    ++sweeps_;
    LOG_DEBUG("Sweep complete: " + std::to_string(report.stats.running) + " running, " +
              std::to_string(report.stats.completed) + " completed, " +
              std::to_string(report.stats.failed) + " failed, " +
              std::to_string(report.events.size()) + " event(s)");
    return report;
}

bool Watchdog::start() {
    if (running_.load()) {
        LOG_WARN("Watchdog already running");
        return false;
    }
    shutdown_.store(false);
    running_.store(true);
    thread_ = std::thread(&Watchdog::loop, this);
    LOG_INFO("Watchdog started (interval " + std::to_string(options_.interval.count()) + "s)");
    return true;
}

void Watchdog::stop() noexcept {
    if (!running_.load()) {
        return;
    }
    shutdown_.store(true);
    if (thread_.joinable()) {
        thread_.join();
    }
    running_.store(false);
    LOG_INFO("Watchdog stopped");
}

void Watchdog::loop() {
    setThreadName("Watchdog");
    LOG_DEBUG("Watchdog loop started");

    while (!shutdown_.load()) {
        try {
            (void)sweep();
        } catch (const std::exception& e) {
            // Registry unreadable: report and keep watching, never reset it
            LOG_ERROR("Watchdog sweep error: " + std::string(e.what()));
        }

        auto sleepEnd = std::chrono::steady_clock::now() + options_.interval;
        while (std::chrono::steady_clock::now() < sleepEnd && !shutdown_.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    LOG_DEBUG("Watchdog loop stopped");
}

KillResult killTask(ProcessRegistry& registry, ProcessBackend& processes, ContainerBackend& containers,
                    const std::string& id) {
    auto record = registry.find(id);
    if (!record) {
        return {KillOutcome::NotFound, registry.keyFor(id), "no record"};
    }
    const auto& key = record->key;

    const auto settle = [&](const std::set<std::string>& marks) {
        if (!registry.transition(key, RecordStatus::Failed, marks)) {
            (void)registry.addFlags(key, marks);
        }
    };

    if (const auto* native = std::get_if<NativeMode>(&record->mode)) {
        const auto live = processes.startTime(native->pid);
        if (!native->fingerprint().matches(live)) {
            std::set<std::string> marks{flags::Orphaned, flags::Killed};
            std::string detail = "pid " + std::to_string(native->pid) + " is gone; no signal sent";
            if (live) {
                marks.insert(flags::PidReused);
                detail = "pid " + std::to_string(native->pid) + " now belongs to another process; no signal sent";
            }
            LOG_WARN("Kill of " + key + " skipped: " + detail);
            settle(marks);
            return {KillOutcome::AlreadyGone, key, detail};
        }
        if (!processes.killGroup(native->pgid)) {
            return {KillOutcome::KillFailed, key, "group " + std::to_string(native->pgid) + " survived"};
        }
        settle({flags::Killed});
        LOG_INFO("Killed group " + std::to_string(native->pgid) + " of " + key);
        return {KillOutcome::Killed, key, "group " + std::to_string(native->pgid)};
    }

    const auto& container = std::get<ContainerMode>(record->mode);
    if (!containers.kill(container.id)) {
        return {KillOutcome::KillFailed, key, "container " + container.name + " survived"};
    }
    settle({flags::Killed});
    LOG_INFO("Killed container " + container.name + " of " + key);
    return {KillOutcome::Killed, key, "container " + container.name};
}

}
