/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "swell/dispatch.hpp"
#include "swell/markers.hpp"
#include "swell/plan.hpp"
#include "swell/policy.hpp"
#include "swell/progress.hpp"
#include "swell/vcs.hpp"

namespace swell {

struct ExecutorOptions {
    std::chrono::milliseconds pollInterval{std::chrono::seconds(5)};
    std::chrono::milliseconds waveTimeout{std::chrono::seconds(3600)};
    int fromWave = 1;
    bool checkpoints = true;
    std::filesystem::path workdir;   // resolves declared file locks for the policy check
};

struct ExecutionSummary {
    int wavesRun = 0;
    int checkpointsMade = 0;
};

// Drives a plan wave by wave. Any failure halts the whole run; waves that were
// already checkpointed stay as they are.
class WaveExecutor {
public:
    WaveExecutor(Dispatcher& dispatcher, CompletionSource& markers, PolicyValidator& policy,
                 VersionControl& vcs, ProgressLog& progress, ExecutorOptions options = {});

    WaveExecutor(const WaveExecutor&) = delete;
    WaveExecutor& operator=(const WaveExecutor&) = delete;

    // Throws VerificationError, PolicyViolation, CheckpointError or Error.
    ExecutionSummary run(const ExecutionPlan& plan);

    void executeWave(const Wave& wave);
    // Blocks until every task of the wave is marked, or throws VerificationError on timeout.
    void awaitCompletion(const Wave& wave);
    // Verify, record progress, validate policy, commit. Strictly in that order.
    void checkpoint(const Wave& wave);

    [[nodiscard]] std::vector<TaskId> outstanding(const Wave& wave);

    // Safe from a signal-watching thread; the current wait ends with an Error.
    void requestStop() noexcept { stop_.store(true); }

private:
    [[nodiscard]] std::vector<std::string> filesForPolicy(const Wave& wave);

    Dispatcher& dispatcher_;
    CompletionSource& markers_;
    PolicyValidator& policy_;
    VersionControl& vcs_;
    ProgressLog& progress_;
    ExecutorOptions options_;
    std::atomic<bool> stop_{false};
};

}
