/*
 * swell - Wave planning tool (swplan)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swell/config.hpp"
#include "swell/errors.hpp"
#include "swell/graph.hpp"
#include "swell/logger.hpp"
#include "swell/planner.hpp"
#include "swell/tasklist.hpp"
#include <cstdlib>
#include <iostream>

using namespace swell;

constexpr const char* VERSION = "0.1.0";

void printUsage(const char* progName) {
    std::cout << "swell Wave Planner v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " [--tasks <file>] [--plan <file>] [--phase-id <id>]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Options:\n";
    std::cout << "  --tasks <file>     Task list to plan (default: tasks.md)\n";
    std::cout << "  --plan <file>      Where to write the plan (default: execution_plan.json)\n";
    std::cout << "  --phase-id <id>    Phase identifier recorded in the plan (default: default)\n";
    std::cout << "  -h, --help         Show this help message\n";
    std::cout << "  -v, --version      Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  SWELL_TASKS        Default task list\n";
    std::cout << "  SWELL_PLAN         Default plan file\n";
    std::cout << "  SWELL_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
}

int main(int argc, char* argv[]) {
    // Default to WARN for clean piping; SWELL_LOG_LEVEL overrides
    if (!std::getenv("SWELL_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);
    setThreadName("Main");

    Config config;
    try {
        config = Config::fromEnv();
    } catch (const Error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
    std::string phaseId = "default";

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
        } else if (arg == "--tasks") {
            config.tasksFile = value("--tasks");
        } else if (arg == "--plan") {
            config.planFile = value("--plan");
        } else if (arg == "--phase-id") {
            phaseId = value("--phase-id");
        } else {
            std::cerr << "Error: unknown argument " << arg << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    try {
        TaskParser parser;
        auto tasks = parser.parseFile(config.tasksFile);
        if (tasks.empty()) {
            std::cerr << "Error: no tasks found in " << config.tasksFile.string() << "\n";
            return 1;
        }

        auto graph = DependencyGraph::build(tasks);
        auto plan = WavePlanner(phaseId).plan(tasks, graph);
        savePlan(plan, config.planFile);

        std::cout << "Planned " << tasks.size() << " task(s) into " << plan.waves.size() << " wave(s)";
        std::cout << " (" << graph.implicitEdgeCount() << " file-lock dependencies)\n";
        for (const auto& wave : plan.waves) {
            std::cout << "  Wave " << wave.id << " [" << toString(wave.strategy) << "]: "
                      << joinIds(wave.taskIds()) << "\n";
        }
        std::cout << "Plan written to " << config.planFile.string() << "\n";
        return 0;

    } catch (const PlanningError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "No plan written.\n";
        return 1;
    } catch (const Error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
