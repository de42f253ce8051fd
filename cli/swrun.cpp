/*
 * swell - Wave execution tool (swrun)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swell/backend.hpp"
#include "swell/config.hpp"
#include "swell/dispatch.hpp"
#include "swell/errors.hpp"
#include "swell/executor.hpp"
#include "swell/logger.hpp"
#include "swell/registry.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>

using namespace swell;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "swell Wave Executor v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " [--plan <file>] [--tasks <file>] [--from-wave <n>] [--no-checkpoint]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Options:\n";
    std::cout << "  --plan <file>      Plan to execute (default: execution_plan.json)\n";
    std::cout << "  --tasks <file>     Task list holding completion marks (default: tasks.md)\n";
    std::cout << "  --registry <file>  Process registry (default: .swell/process_registry.json)\n";
    std::cout << "  --from-wave <n>    Resume at wave n; earlier waves are taken as checkpointed\n";
    std::cout << "  --no-checkpoint    Skip progress, policy and commit steps\n";
    std::cout << "  -h, --help         Show this help message\n";
    std::cout << "  -v, --version      Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  SWELL_AGENT_CMD        Command spawned per task (unset: external agents)\n";
    std::cout << "  SWELL_AGENT_IMAGE      Run agents in containers of this image\n";
    std::cout << "  SWELL_POLICY_CMD       Policy validator (unset: validation skipped)\n";
    std::cout << "  SWELL_POLL_INTERVAL    Seconds between completion checks (default: 5)\n";
    std::cout << "  SWELL_WAVE_TIMEOUT     Seconds before a wave is declared incomplete (default: 3600)\n";
    std::cout << "  SWELL_LOG_LEVEL        Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
}

int main(int argc, char* argv[]) {
    // Long-running: progress stays visible at INFO unless SWELL_LOG_LEVEL says otherwise
    Logger::initFromEnv();
    setThreadName("Main");

    Config config;
    try {
        config = Config::fromEnv();
    } catch (const Error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    ExecutorOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&](const char* flag) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << flag << " requires a value\n";
                std::exit(2);
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        } else if (arg == "--plan") {
            config.planFile = value("--plan");
        } else if (arg == "--tasks") {
            config.tasksFile = value("--tasks");
        } else if (arg == "--registry") {
            config.registryFile = value("--registry");
        } else if (arg == "--from-wave") {
            const char* text = value("--from-wave");
            try {
                options.fromWave = std::stoi(text);
            } catch (const std::exception&) {
                std::cerr << "Error: --from-wave expects a number, got " << text << "\n";
                return 2;
            }
            if (options.fromWave < 1) {
                std::cerr << "Error: --from-wave must be at least 1\n";
                return 2;
            }
        } else if (arg == "--no-checkpoint") {
            options.checkpoints = false;
        } else {
            std::cerr << "Error: unknown argument " << arg << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        const auto registryPath = validateRegistryPath(config.registryFile);
        auto plan = loadPlan(config.planFile);

        std::error_code ec;
        options.workdir = std::filesystem::current_path(ec);
        options.pollInterval = config.pollInterval;
        options.waveTimeout = config.waveTimeout;

        RegistryStore store(registryPath);
        ProcessRegistry registry(store, config.ns);
        ProcfsBackend processes;
        DockerCliBackend containers(config.docker);

        AgentOptions agents;
        agents.command = config.agentCommand;
        agents.image = config.agentImage;
        agents.limits = config.limits;
        agents.workdir = options.workdir;
        AgentDispatcher dispatcher(registry, processes, containers, agents);

        TaskListMarkers markers(config.tasksFile);
        std::unique_ptr<PolicyValidator> policy;
        if (config.policyCommand.empty()) {
            policy = std::make_unique<SkipPolicyValidator>();
        } else {
            policy = std::make_unique<CommandPolicyValidator>(config.policyCommand);
        }
        GitVersionControl vcs(options.workdir);
        ProgressLog progress(config.progressFile);

        WaveExecutor executor(dispatcher, markers, *policy, vcs, progress, options);

        // Signals only set a flag; this thread turns it into a stop request
        std::atomic<bool> finished{false};
        std::thread signalWatcher([&]() {
            while (!finished.load()) {
                if (g_shutdown_requested) {
                    LOG_WARN("Shutdown requested");
                    executor.requestStop();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        });

        ExecutionSummary summary;
        try {
            summary = executor.run(plan);
        } catch (const std::exception&) {
            finished.store(true);
            signalWatcher.join();
            throw;
        }
        finished.store(true);
        signalWatcher.join();

        std::cout << "Executed " << summary.wavesRun << " wave(s), " << summary.checkpointsMade
                  << " checkpoint(s)\n";
        return 0;

    } catch (const VerificationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "Halted. Resume with --from-wave " << e.waveId() << " once the tasks are marked.\n";
        return 1;
    } catch (const PolicyViolation& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "Halted before commit. Fix the violations and resume with --from-wave " << e.waveId() << ".\n";
        return 1;
    } catch (const CheckpointError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
