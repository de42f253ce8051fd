/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swell/executor.hpp"
#include "swell/errors.hpp"
#include "swell/logger.hpp"
#include <algorithm>
#include <set>
#include <thread>

namespace swell {

WaveExecutor::WaveExecutor(Dispatcher& dispatcher, CompletionSource& markers, PolicyValidator& policy,
                           VersionControl& vcs, ProgressLog& progress, ExecutorOptions options)
    : dispatcher_(dispatcher), markers_(markers), policy_(policy), vcs_(vcs), progress_(progress),
      options_(std::move(options)) {}

std::vector<TaskId> WaveExecutor::outstanding(const Wave& wave) {
    const auto done = markers_.completed(wave.tasks);
    std::vector<TaskId> missing;
    for (const auto& task : wave.tasks) {
        if (!done.count(task.id)) missing.push_back(task.id);
    }
    return missing;
}

void WaveExecutor::executeWave(const Wave& wave) {
    LOG_INFO("Executing wave " + std::to_string(wave.id) + " (" + toString(wave.strategy) + ", " +
             std::to_string(wave.tasks.size()) + " task(s)): " + wave.rationale);

    const auto missing = outstanding(wave);
    const std::set<TaskId> pending(missing.begin(), missing.end());
    std::vector<Task> toDispatch;
    for (const auto& task : wave.tasks) {
        if (pending.count(task.id)) {
            toDispatch.push_back(task);
        } else {
            LOG_INFO(task.id + " already marked complete, not dispatched");
        }
    }

    dispatcher_.dispatch(wave, toDispatch);
    awaitCompletion(wave);
}

void WaveExecutor::awaitCompletion(const Wave& wave) {
    const auto deadline = std::chrono::steady_clock::now() + options_.waveTimeout;
    std::size_t lastCount = wave.tasks.size() + 1;

    for (;;) {
        const auto missing = outstanding(wave);
        if (missing.empty()) {
            LOG_INFO("Wave " + std::to_string(wave.id) + ": all tasks marked complete");
            return;
        }
        if (missing.size() != lastCount) {
            LOG_INFO("Wave " + std::to_string(wave.id) + ": waiting on " + joinIds(missing));
            lastCount = missing.size();
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            LOG_ERROR("Wave " + std::to_string(wave.id) + " timed out; outstanding: " + joinIds(missing));
            throw VerificationError(wave.id, missing);
        }

        const auto sleepEnd = std::min(std::chrono::steady_clock::now() + options_.pollInterval, deadline);
        while (std::chrono::steady_clock::now() < sleepEnd) {
            if (stop_.load()) {
                throw Error("Interrupted while waiting for wave " + std::to_string(wave.id) +
                            "; outstanding: " + joinIds(missing));
            }
            std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
                std::chrono::milliseconds(100), sleepEnd - std::chrono::steady_clock::now()));
        }
        if (stop_.load()) {
            throw Error("Interrupted while waiting for wave " + std::to_string(wave.id) +
                        "; outstanding: " + joinIds(missing));
        }
    }
}

std::vector<std::string> WaveExecutor::filesForPolicy(const Wave& wave) {
    std::set<std::string> files;
    for (const auto& lock : wave.fileLocks()) {
        std::error_code ec;
        const auto full = options_.workdir.empty() ? std::filesystem::path(lock) : options_.workdir / lock;
        if (std::filesystem::exists(full, ec)) files.insert(lock);
    }
    for (auto& changed : vcs_.changedFiles()) files.insert(std::move(changed));
    return {files.begin(), files.end()};
}

void WaveExecutor::checkpoint(const Wave& wave) {
    const int id = wave.id;
    LOG_INFO("Checkpoint after wave " + std::to_string(id));

    // 1. Completion must still hold now, not just when polling stopped
    const auto missing = outstanding(wave);
    if (!missing.empty()) {
        LOG_ERROR("Checkpoint " + std::to_string(id) + " step 1: not marked complete: " + joinIds(missing));
        throw VerificationError(id, missing);
    }

    // 2. Durable progress record
    try {
        progress_.appendWave(wave);
    } catch (const Error& e) {
        LOG_ERROR("Checkpoint " + std::to_string(id) + " step 2 failed: " + e.what());
        throw CheckpointError(id, 2, e.what());
    }

    // 3. Policy validation over everything the wave touched
    std::vector<Violation> violations;
    try {
        violations = policy_.validate(filesForPolicy(wave));
    } catch (const Error& e) {
        LOG_ERROR("Checkpoint " + std::to_string(id) + " step 3 failed: " + e.what());
        throw CheckpointError(id, 3, e.what());
    }
    if (!violations.empty()) {
        for (const auto& v : violations) {
            LOG_ERROR(v.file + ":" + std::to_string(v.line) + " - " + v.rule + ": " + v.message);
        }
        LOG_ERROR("Checkpoint " + std::to_string(id) + " blocked by " + std::to_string(violations.size()) +
                  " policy violation(s)");
        throw PolicyViolation(id, std::move(violations));
    }

    // 4. One commit
    try {
        vcs_.commit(checkpointMessage(id));
    } catch (const Error& e) {
        LOG_ERROR("Checkpoint " + std::to_string(id) + " step 4 failed: " + e.what());
        throw CheckpointError(id, 4, e.what());
    }

    LOG_INFO("Checkpoint " + std::to_string(id) + " complete");
}

ExecutionSummary WaveExecutor::run(const ExecutionPlan& plan) {
    ExecutionSummary summary;
    LOG_INFO("Phase " + plan.phaseId + ": " + std::to_string(plan.waves.size()) + " wave(s), " +
             std::to_string(plan.taskCount()) + " task(s)");

    for (const auto& wave : plan.waves) {
        if (wave.id < options_.fromWave) {
            LOG_DEBUG("Skipping wave " + std::to_string(wave.id) + " (resuming from " +
                      std::to_string(options_.fromWave) + ")");
            continue;
        }

        executeWave(wave);
        ++summary.wavesRun;

        if (options_.checkpoints && wave.checkpoint.enabled) {
            checkpoint(wave);
            ++summary.checkpointsMade;
        } else {
            LOG_INFO("Checkpoint after wave " + std::to_string(wave.id) + " skipped (disabled)");
        }
    }

    LOG_INFO("All waves complete (" + std::to_string(summary.wavesRun) + " run, " +
             std::to_string(summary.checkpointsMade) + " checkpoint(s))");
    return summary;
}

}
