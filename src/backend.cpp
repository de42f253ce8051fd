/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swell/backend.hpp"
#include "swell/command.hpp"
#include "swell/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <thread>
#include <unistd.h>
#include <vector>

namespace swell {

namespace {

std::string trim(std::string value) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), notSpace));
    value.erase(std::find_if(value.rbegin(), value.rend(), notSpace).base(), value.end());
    return value;
}

std::optional<double> parseNumber(const std::string& text) noexcept {
    if (text.empty()) return std::nullopt;
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(text.c_str(), &end);
    if (errno != 0 || end == text.c_str()) return std::nullopt;
    return value;
}

}

// ---- procfs ----

ProcfsBackend::ProcfsBackend(std::chrono::milliseconds grace, std::filesystem::path procRoot)
    : grace_(grace), procRoot_(std::move(procRoot)) {}

std::optional<ProcfsBackend::StatLine> ProcfsBackend::readStat(int pid) const {
    if (pid <= 0) return std::nullopt;

    std::ifstream file(procRoot_ / std::to_string(pid) / "stat");
    if (!file) return std::nullopt;

    std::string content;
    std::getline(file, content);

    // comm may contain spaces and parentheses; fields resume after the last ')'
    auto close = content.rfind(')');
    if (close == std::string::npos) return std::nullopt;

    std::istringstream rest(content.substr(close + 1));
    std::vector<std::string> fields;
    std::string field;
    while (rest >> field) fields.push_back(field);
    if (fields.size() < 22) return std::nullopt;

    StatLine stat;
    try {
        stat.state = fields[0].empty() ? '?' : fields[0][0];
        stat.pgrp = std::stoi(fields[2]);
        stat.utime = std::stoull(fields[11]);
        stat.stime = std::stoull(fields[12]);
        stat.starttime = std::stoull(fields[19]);
        stat.rssPages = std::stoll(fields[21]);
    } catch (const std::exception& e) {
        LOG_DEBUG("Unparsable stat for pid " + std::to_string(pid) + ": " + e.what());
        return std::nullopt;
    }
    return stat;
}

std::optional<std::uint64_t> ProcfsBackend::startTime(int pid) {
    auto stat = readStat(pid);
    if (!stat) return std::nullopt;
    // Exited but unreaped: the process is gone for every purpose we care about
    if (stat->state == 'Z' || stat->state == 'X') return std::nullopt;
    return stat->starttime;
}

std::optional<ResourceUsage> ProcfsBackend::sample(int pid) {
    auto stat = readStat(pid);
    if (!stat || stat->state == 'Z' || stat->state == 'X') return std::nullopt;

    std::ifstream uptimeFile(procRoot_ / "uptime");
    double uptime = 0.0;
    if (!(uptimeFile >> uptime)) return std::nullopt;

    const long ticks = ::sysconf(_SC_CLK_TCK);
    const long pageSize = ::sysconf(_SC_PAGESIZE);
    if (ticks <= 0 || pageSize <= 0) return std::nullopt;

    ResourceUsage usage;
    // Lifetime average: busy ticks over ticks elapsed since the process started
    const double elapsed = uptime - static_cast<double>(stat->starttime) / static_cast<double>(ticks);
    if (elapsed > 0.0) {
        const double busy = static_cast<double>(stat->utime + stat->stime) / static_cast<double>(ticks);
        usage.cpuPercent = 100.0 * busy / elapsed;
    }
    if (stat->rssPages > 0) {
        usage.memoryKb = static_cast<std::uint64_t>(stat->rssPages) * static_cast<std::uint64_t>(pageSize) / 1024;
    }
    return usage;
}

bool ProcfsBackend::groupAlive(int pgid) const {
    std::error_code ec;
    for (std::filesystem::directory_iterator it(procRoot_, ec), end; !ec && it != end; it.increment(ec)) {
        const auto name = it->path().filename().string();
        if (name.empty() || !std::isdigit(static_cast<unsigned char>(name[0]))) continue;

        int pid = 0;
        try {
            pid = std::stoi(name);
        } catch (const std::exception&) {
            continue;
        }
        auto stat = readStat(pid);
        if (stat && stat->pgrp == pgid && stat->state != 'Z' && stat->state != 'X') return true;
    }
    return false;
}

bool ProcfsBackend::killGroup(int pgid) {
    if (pgid <= 1 || pgid == ::getpgrp()) {
        LOG_ERROR("Refusing to kill process group " + std::to_string(pgid));
        return false;
    }

    if (::killpg(pgid, SIGTERM) != 0) {
        if (errno == ESRCH) {
            LOG_DEBUG("Process group " + std::to_string(pgid) + " already gone");
            return true;
        }
        LOG_ERROR("SIGTERM to process group " + std::to_string(pgid) + " failed: " + std::strerror(errno));
        return false;
    }
    LOG_INFO("Sent SIGTERM to process group " + std::to_string(pgid));

    const auto deadline = std::chrono::steady_clock::now() + grace_;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!groupAlive(pgid)) {
            LOG_INFO("Process group " + std::to_string(pgid) + " terminated gracefully");
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    if (::killpg(pgid, SIGKILL) != 0 && errno != ESRCH) {
        LOG_ERROR("SIGKILL to process group " + std::to_string(pgid) + " failed: " + std::strerror(errno));
        return false;
    }
    LOG_WARN("Sent SIGKILL to process group " + std::to_string(pgid));
    return true;
}

// ---- docker CLI ----

DockerCliBackend::DockerCliBackend(std::string docker, std::chrono::seconds commandTimeout)
    : docker_(std::move(docker)), commandTimeout_(commandTimeout) {}

std::optional<bool> DockerCliBackend::isRunning(const std::string& id, std::chrono::seconds timeout) {
    auto result = runCommand({docker_, "inspect", "-f", "{{.State.Running}}", id}, timeout);
    if (!result.started) {
        LOG_WARN("Cannot run " + docker_ + ": " + result.error);
        return std::nullopt;
    }
    if (result.timedOut) {
        LOG_WARN("Inspect of container " + id + " timed out");
        return std::nullopt;
    }
    const auto output = trim(result.output);
    if (result.exitCode == 0) {
        if (output == "true") return true;
        if (output == "false") return false;
        LOG_WARN("Unexpected inspect output for " + id + ": " + output);
        return std::nullopt;
    }
    if (output.find("No such") != std::string::npos) return false;
    LOG_WARN("Inspect of container " + id + " failed: " + output);
    return std::nullopt;
}

std::optional<ResourceUsage> DockerCliBackend::sample(const std::string& id) {
    auto result = runCommand({docker_, "stats", "--no-stream", "--format", "{{.CPUPerc}}|{{.MemUsage}}", id},
                             commandTimeout_);
    if (!result) {
        LOG_DEBUG("Stats for container " + id + " unavailable: " + trim(result.output));
        return std::nullopt;
    }

    const auto line = trim(result.output);
    const auto bar = line.find('|');
    if (bar == std::string::npos) return std::nullopt;

    std::string cpu = trim(line.substr(0, bar));
    if (!cpu.empty() && cpu.back() == '%') cpu.pop_back();
    auto cpuValue = parseNumber(cpu);
    auto memory = parseMemoryUsage(line.substr(bar + 1));
    if (!cpuValue || !memory) return std::nullopt;

    return ResourceUsage{*cpuValue, *memory};
}

bool DockerCliBackend::kill(const std::string& id) {
    auto result = runCommand({docker_, "kill", id}, commandTimeout_);
    if (result) {
        LOG_INFO("Killed container " + id);
        return true;
    }
    if (result.output.find("No such") != std::string::npos || result.output.find("is not running") != std::string::npos) {
        LOG_DEBUG("Container " + id + " already stopped");
        return true;
    }
    LOG_ERROR("Failed to kill container " + id + ": " + (result.started ? trim(result.output) : result.error));
    return false;
}

std::optional<std::string> DockerCliBackend::start(const ContainerSpec& spec) {
    if (!parseMemoryLimit(spec.limits.memory) || !parseNumber(spec.limits.cpu)) {
        LOG_ERROR("Invalid resource limits for " + spec.name + ": memory=" + spec.limits.memory +
                  " cpu=" + spec.limits.cpu);
        return std::nullopt;
    }

    std::error_code ec;
    auto workdir = spec.workdir.empty() ? std::filesystem::current_path(ec) : spec.workdir;
    auto result = runCommand({docker_, "run", "-d", "--rm",
                              "--name", spec.name,
                              "--memory", spec.limits.memory,
                              "--cpus", spec.limits.cpu,
                              "-v", workdir.string() + ":/workspace",
                              "-w", "/workspace",
                              spec.image, "sh", "-c", spec.command},
                             commandTimeout_);
    if (!result) {
        LOG_ERROR("Failed to start container " + spec.name + ": " +
                  (result.started ? trim(result.output) : result.error));
        return std::nullopt;
    }

    auto id = trim(result.output);
    // docker may print pull progress before the id; the id is the last line
    auto lastBreak = id.rfind('\n');
    if (lastBreak != std::string::npos) id = trim(id.substr(lastBreak + 1));
    if (id.empty()) return std::nullopt;

    LOG_INFO("Started container " + spec.name + " (" + id.substr(0, 12) + ")");
    return id;
}

std::optional<std::uint64_t> parseMemoryLimit(const std::string& text) noexcept {
    std::string value = trim(text);
    if (value.empty()) return std::nullopt;

    std::uint64_t multiplier = 1;
    const char suffix = static_cast<char>(std::tolower(static_cast<unsigned char>(value.back())));
    switch (suffix) {
        case 'b': multiplier = 1; value.pop_back(); break;
        case 'k': multiplier = 1024ULL; value.pop_back(); break;
        case 'm': multiplier = 1024ULL * 1024; value.pop_back(); break;
        case 'g': multiplier = 1024ULL * 1024 * 1024; value.pop_back(); break;
        default: break;
    }
    if (value.empty()) return std::nullopt;
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    try {
        return std::stoull(value) * multiplier;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<std::uint64_t> parseMemoryUsage(const std::string& text) noexcept {
    std::string used = trim(text.substr(0, text.find('/')));
    std::size_t unitStart = 0;
    while (unitStart < used.size() && (std::isdigit(static_cast<unsigned char>(used[unitStart])) || used[unitStart] == '.')) {
        ++unitStart;
    }
    auto number = parseNumber(used.substr(0, unitStart));
    if (!number) return std::nullopt;

    std::string unit = trim(used.substr(unitStart));
    double kib;
    if (unit == "B") kib = *number / 1024.0;
    else if (unit == "KiB" || unit == "kB" || unit == "KB") kib = *number;
    else if (unit == "MiB" || unit == "MB") kib = *number * 1024.0;
    else if (unit == "GiB" || unit == "GB") kib = *number * 1024.0 * 1024.0;
    else return std::nullopt;
    return static_cast<std::uint64_t>(kib);
}

}
