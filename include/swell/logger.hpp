/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace swell {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

// Receives every record that passes the level filter, after formatting.
using LogSink = std::function<void(LogLevel, const std::string& line)>;

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    static void initFromEnv() noexcept;
    [[nodiscard]] static LogLevel level() noexcept;

    // Replaces stderr as the destination. Pass an empty sink to restore stderr.
    static void setSink(LogSink sink) noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

    [[nodiscard]] static std::optional<LogLevel> parseLevel(const std::string& name) noexcept;

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

// Thread naming for log context ("Main", "Watchdog")
void setThreadName(const std::string& name);

}

#define LOG_ERROR(msg) ::swell::Logger::error(msg)
#define LOG_WARN(msg)  ::swell::Logger::warn(msg)
#define LOG_INFO(msg)  ::swell::Logger::info(msg)
#define LOG_DEBUG(msg) ::swell::Logger::debug(msg)
#define LOG_TRACE(msg) ::swell::Logger::trace(msg)
