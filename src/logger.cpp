/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swell/logger.hpp"
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>
#include <unordered_map>

namespace swell {

namespace {

// Everything mutable sits behind one mutex; sinks run under it, so lines never interleave.
struct LoggerState {
    std::mutex mutex;
    LogLevel level = LogLevel::INFO;
    bool levelSet = false;
    LogSink sink;
    std::unordered_map<std::thread::id, std::string> threadNames;
};

LoggerState& state() {
    static LoggerState instance;
    return instance;
}

std::string threadLabel(const LoggerState& s) {
    auto it = s.threadNames.find(std::this_thread::get_id());
    if (it != s.threadNames.end()) return it->second;
    std::ostringstream oss;
    oss << "T" << std::this_thread::get_id();
    return oss.str();
}

// "2025-01-31 12:00:00.042", local time
std::string timestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm local{};
    ::localtime_r(&seconds, &local);
    char date[24];
    std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &local);
    char out[32];
    std::snprintf(out, sizeof(out), "%s.%03lld", date, static_cast<long long>(millis));
    return out;
}

}

void Logger::setLevel(LogLevel level) noexcept {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.level = level;
    s.levelSet = true;
}

void Logger::initFromEnv() noexcept {
    setLevel(parseEnvLevel());
}

LogLevel Logger::level() noexcept {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (!s.levelSet) {
        s.level = parseEnvLevel();
        s.levelSet = true;
    }
    return s.level;
}

void Logger::setSink(LogSink sink) noexcept {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.sink = std::move(sink);
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    if (static_cast<std::uint8_t>(level) > static_cast<std::uint8_t>(Logger::level())) return;

    try {
        auto& s = state();
        const std::string stamp = timestamp();
        std::lock_guard<std::mutex> lock(s.mutex);

        const std::string line = "[" + stamp + "] [" + levelToString(level) + "] [" + threadLabel(s) + "] " + message;
        if (s.sink) {
            s.sink(level, line);
        } else {
            // stdout stays reserved for tool output
            std::cerr << line << std::endl;
        }
    } catch (const std::exception&) {
        // Never throw from logging
    }
}

std::optional<LogLevel> Logger::parseLevel(const std::string& name) noexcept {
    std::string lowered;
    lowered.reserve(name.size());
    for (unsigned char c : name) lowered.push_back(static_cast<char>(std::tolower(c)));

    if (lowered == "error") return LogLevel::ERROR;
    if (lowered == "warn" || lowered == "warning") return LogLevel::WARN;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "trace") return LogLevel::TRACE;
    return std::nullopt;
}

LogLevel Logger::parseEnvLevel() noexcept {
    const char* value = std::getenv("SWELL_LOG_LEVEL");
    if (!value) return LogLevel::INFO;
    return parseLevel(value).value_or(LogLevel::INFO);
}

const char* Logger::levelToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
    }
    return "UNKN ";
}

void setThreadName(const std::string& name) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.threadNames[std::this_thread::get_id()] = name;
}

}
