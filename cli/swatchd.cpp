/*
 * swell - Process watchdog daemon (swatchd)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swell/backend.hpp"
#include "swell/config.hpp"
#include "swell/errors.hpp"
#include "swell/logger.hpp"
#include "swell/registry.hpp"
#include "swell/rehydrate.hpp"
#include "swell/watchdog.hpp"
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace swell;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "swell Process Watchdog v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <command> [options] [--registry <file>]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  run [--interval <s>]        Reconcile the registry until interrupted\n";
    std::cout << "  check <task>                Show a record with a live liveness check\n";
    std::cout << "  kill <task>                 Kill the task's process group or container\n";
    std::cout << "  complete <task>             Mark a running task completed\n";
    std::cout << "  fail <task>                 Mark a running task failed\n";
    std::cout << "  register <task> (--pid <p> | --container <id> [--name <n>])\n";
    std::cout << "           [--command <c>] [--rules <a,b>]\n";
    std::cout << "                              Record an externally started worker\n";
    std::cout << "  rehydrate                   Status digest from the registry file alone\n";
    std::cout << "  report                      Resource usage of running tasks\n";
    std::cout << "  stats                       Record counts per status\n";
    std::cout << "  cleanup [--days <n>]        Remove terminal records older than n days (default: 7)\n\n";
    std::cout << "Options:\n";
    std::cout << "  --registry <file>  Registry document (default: .swell/process_registry.json)\n";
    std::cout << "  -h, --help         Show this help message\n";
    std::cout << "  -v, --version      Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  SWELL_REGISTRY          Default registry document\n";
    std::cout << "  SWELL_NAMESPACE         Namespace for unqualified task ids (default: swell)\n";
    std::cout << "  SWELL_WATCH_INTERVAL    Seconds between sweeps (default: 300)\n";
    std::cout << "  SWELL_INSPECT_TIMEOUT   Seconds per container inspection (default: 10)\n";
    std::cout << "  SWELL_GUIDELINE         Seconds before a task counts as long-running (default: 900)\n";
    std::cout << "  SWELL_DOCKER            Container CLI (default: docker)\n";
    std::cout << "  SWELL_LOG_LEVEL         Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
}

struct Args {
    std::string command;
    std::vector<std::string> positional;
    std::vector<std::pair<std::string, std::string>> options;

    [[nodiscard]] std::optional<std::string> option(const std::string& name) const {
        for (const auto& [key, value] : options) {
            if (key == name) return value;
        }
        return std::nullopt;
    }
};

class UsageError : public Error {
public:
    using Error::Error;
};

long long parseCount(const std::string& flag, const std::string& text) {
    try {
        std::size_t used = 0;
        long long value = std::stoll(text, &used);
        if (used == text.size() && value >= 0) return value;
    } catch (const std::exception&) {
    }
    throw UsageError(flag + " expects a non-negative number, got " + text);
}

const std::string& requireTask(const Args& args) {
    if (args.positional.empty()) throw UsageError(args.command + " requires a task id");
    return args.positional.front();
}

std::string describeUsage(const std::optional<ResourceUsage>& usage) {
    if (!usage) return "unavailable";
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << usage->cpuPercent << "% CPU, " << usage->memoryKb << " KB";
    return out.str();
}

void printRecord(const ProcessRecord& record) {
    std::cout << "Task " << record.key << "\n";
    std::cout << "  Status:  " << toString(record.status) << "\n";
    std::cout << "  Command: " << record.command << "\n";
    std::cout << "  Started: " << formatTimestamp(record.startedAt) << "\n";
    if (record.completedAt) std::cout << "  Ended:   " << formatTimestamp(*record.completedAt) << "\n";
    if (const auto* native = std::get_if<NativeMode>(&record.mode)) {
        std::cout << "  Mode:    native (pid " << native->pid << ", pgid " << native->pgid << ")\n";
    } else {
        const auto& container = std::get<ContainerMode>(record.mode);
        std::cout << "  Mode:    container " << container.name << " (" << container.id.substr(0, 12)
                  << ", " << container.limits.memory << ", " << container.limits.cpu << " cpu)\n";
    }
    if (!record.rules.empty()) {
        std::cout << "  Rules:  ";
        for (const auto& r : record.rules) std::cout << " " << r;
        std::cout << "\n";
    }
    if (!record.flags.empty()) {
        std::cout << "  Flags:  ";
        for (const auto& f : record.flags) std::cout << " " << f;
        std::cout << "\n";
    }
}

int runDaemon(ProcessRegistry& registry, ProcessBackend& processes, ContainerBackend& containers,
              WatchdogOptions options) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    Watchdog watchdog(registry, processes, containers, options);
    std::cout << "Watching " << registry.store().path().string() << " every " << options.interval.count()
              << "s (Ctrl+C to stop)\n";
    if (!watchdog.start()) {
        std::cerr << "Error: watchdog failed to start\n";
        return 1;
    }

    while (!g_shutdown_requested && watchdog.isRunning()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    LOG_INFO("Shutdown requested");
    watchdog.stop();
    return 0;
}

int execute(const Args& args, const Config& config) {
    const auto registryPath = validateRegistryPath(config.registryFile);
    RegistryStore store(registryPath);
    ProcessRegistry registry(store, config.ns);
    ProcfsBackend processes;
    DockerCliBackend containers(config.docker);

    if (args.command == "run") {
        WatchdogOptions options;
        options.interval = config.watchInterval;
        options.inspectTimeout = config.inspectTimeout;
        options.guideline = config.guideline;
        if (auto interval = args.option("--interval")) {
            options.interval = std::chrono::seconds(parseCount("--interval", *interval));
        }
        if (options.interval.count() == 0) throw UsageError("--interval must be positive");
        return runDaemon(registry, processes, containers, options);
    }

    if (args.command == "check") {
        auto record = registry.find(requireTask(args));
        if (!record) {
            std::cerr << "Error: no record for " << registry.keyFor(requireTask(args)) << "\n";
            return 1;
        }
        printRecord(*record);

        std::optional<bool> alive;
        std::optional<ResourceUsage> usage;
        if (const auto* native = std::get_if<NativeMode>(&record->mode)) {
            alive = native->fingerprint().matches(processes.startTime(native->pid));
            if (*alive) usage = processes.sample(native->pid);
        } else {
            const auto& container = std::get<ContainerMode>(record->mode);
            alive = containers.isRunning(container.id, config.inspectTimeout);
            if (alive && *alive) usage = containers.sample(container.id);
        }
        std::cout << "  Live:    " << (!alive ? "unknown" : (*alive ? "alive" : "gone")) << "\n";
        if (alive && *alive) std::cout << "  Usage:   " << describeUsage(usage) << "\n";
        return 0;
    }

    if (args.command == "kill") {
        const auto result = killTask(registry, processes, containers, requireTask(args));
        switch (result.outcome) {
            case KillOutcome::NotFound:
                std::cerr << "Error: no record for " << result.key << "\n";
                return 1;
            case KillOutcome::KillFailed:
                std::cerr << "Error: failed to kill " << result.key << " (" << result.detail << ")\n";
                return 1;
            case KillOutcome::AlreadyGone:
                std::cout << result.key << ": " << result.detail << "; marked failed\n";
                return 0;
            case KillOutcome::Killed:
                break;
        }
        std::cout << "Killed " << result.key << "\n";
        return 0;
    }

    if (args.command == "complete" || args.command == "fail") {
        const auto& id = requireTask(args);
        const bool done = args.command == "complete" ? registry.markCompleted(id) : registry.markFailed(id);
        if (!done) {
            std::cerr << "Error: " << registry.keyFor(id) << " is not a running task\n";
            return 1;
        }
        std::cout << registry.keyFor(id) << " -> " << (args.command == "complete" ? "completed" : "failed") << "\n";
        return 0;
    }

    if (args.command == "register") {
        const auto& id = requireTask(args);
        const auto command = args.option("--command").value_or("");
        std::vector<std::string> rules;
        if (auto list = args.option("--rules")) {
            std::istringstream in(*list);
            for (std::string rule; std::getline(in, rule, ',');) {
                if (!rule.empty()) rules.push_back(rule);
            }
        }

        ExecutionMode mode;
        if (auto pidText = args.option("--pid")) {
            const int pid = static_cast<int>(parseCount("--pid", *pidText));
            auto start = processes.startTime(pid);
            if (!start) {
                std::cerr << "Error: no live process with pid " << pid << "\n";
                return 1;
            }
            const int pgid = ::getpgid(pid);
            mode = NativeMode{pid, pgid > 0 ? pgid : pid, *start};
        } else if (auto containerId = args.option("--container")) {
            ContainerMode container;
            container.id = *containerId;
            container.name = args.option("--name").value_or(*containerId);
            container.limits = config.limits;
            mode = container;
        } else {
            throw UsageError("register requires --pid or --container");
        }

        auto record = registry.registerTask(id, mode, command, rules);
        std::cout << "Registered " << record.key << "\n";
        return 0;
    }

    if (args.command == "rehydrate") {
        std::cout << rehydrate(store).render(registryPath.string());
        return 0;
    }

    if (args.command == "report") {
        const auto snapshot = registry.snapshot();
        std::size_t shown = 0;
        std::cout << "Resource usage\n";
        for (const auto& [key, record] : snapshot) {
            if (record.status != RecordStatus::Running) continue;
            std::optional<ResourceUsage> usage;
            if (const auto* native = std::get_if<NativeMode>(&record.mode)) {
                if (native->fingerprint().matches(processes.startTime(native->pid))) usage = processes.sample(native->pid);
            } else {
                usage = containers.sample(std::get<ContainerMode>(record.mode).id);
            }
            std::cout << "  " << key << ": " << describeUsage(usage) << "\n";
            ++shown;
        }
        if (shown == 0) std::cout << "  No running tasks\n";
        return 0;
    }

    if (args.command == "stats") {
        const auto stats = registry.stats();
        std::cout << "Running:   " << stats.running << "\n";
        std::cout << "Completed: " << stats.completed << "\n";
        std::cout << "Failed:    " << stats.failed << "\n";
        std::cout << "Total:     " << stats.total() << "\n";
        return 0;
    }

    if (args.command == "cleanup") {
        int days = 7;
        if (auto text = args.option("--days")) days = static_cast<int>(parseCount("--days", *text));
        const auto removed = registry.cleanup(days);
        std::cout << "Removed " << removed << " record(s) older than " << days << " day(s)\n";
        return 0;
    }

    throw UsageError("unknown command " + args.command);
}

int main(int argc, char* argv[]) {
    // Default to WARN for clean piping; SWELL_LOG_LEVEL overrides
    if (!std::getenv("SWELL_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);
    setThreadName("Main");

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    if (argc < 2) {
        printUsage(argv[0]);
        return 2;
    }

    Args args;
    args.command = argv[1];
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) == 0) {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a value\n";
                return 2;
            }
            args.options.emplace_back(arg, argv[++i]);
        } else {
            args.positional.push_back(arg);
        }
    }

    try {
        Config config = Config::fromEnv();
        if (auto registry = args.option("--registry")) config.registryFile = *registry;
        if (args.command == "run" && !std::getenv("SWELL_LOG_LEVEL")) {
            Logger::setLevel(LogLevel::INFO);
        }
        return execute(args, config);

    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
