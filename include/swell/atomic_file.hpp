/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <sys/types.h>

namespace swell {

// Write to a sibling temporary file, fsync, then rename over the target.
// A crash at any point leaves either the old or the new document, never half of one.
[[nodiscard]] bool writeFileAtomically(const std::filesystem::path& path,
                                       const std::string& content,
                                       std::string& error,
                                       std::optional<mode_t> mode = std::nullopt) noexcept;

[[nodiscard]] std::optional<std::string> readWholeFile(const std::filesystem::path& path) noexcept;

}
