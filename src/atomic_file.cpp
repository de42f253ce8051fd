/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swell/atomic_file.hpp"
#include "swell/logger.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iterator>
#include <sys/stat.h>
#include <unistd.h>

namespace swell {

bool writeFileAtomically(const std::filesystem::path& path, const std::string& content,
                         std::string& error, std::optional<mode_t> mode) noexcept {
    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        auto tempPath = path;
        tempPath += ".tmp." + std::to_string(::getpid());

        int fd = ::open(tempPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode.value_or(0644));
        if (fd < 0) {
            error = "open " + tempPath.string() + ": " + std::strerror(errno);
            return false;
        }

        const char* data = content.data();
        std::size_t remaining = content.size();
        while (remaining > 0) {
            ssize_t written = ::write(fd, data, remaining);
            if (written < 0) {
                if (errno == EINTR) continue;
                error = "write " + tempPath.string() + ": " + std::strerror(errno);
                ::close(fd);
                ::unlink(tempPath.c_str());
                return false;
            }
            data += written;
            remaining -= static_cast<std::size_t>(written);
        }

        if (::fsync(fd) != 0 || ::close(fd) != 0) {
            error = "flush " + tempPath.string() + ": " + std::strerror(errno);
            ::unlink(tempPath.c_str());
            return false;
        }

        if (::rename(tempPath.c_str(), path.c_str()) != 0) {
            error = "rename " + tempPath.string() + " -> " + path.string() + ": " + std::strerror(errno);
            ::unlink(tempPath.c_str());
            return false;
        }

        if (mode && ::chmod(path.c_str(), *mode) != 0) {
            error = "chmod " + path.string() + ": " + std::strerror(errno);
            return false;
        }

        LOG_TRACE("Atomically wrote " + path.string() + " (" + std::to_string(content.size()) + " bytes)");
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}

std::optional<std::string> readWholeFile(const std::filesystem::path& path) noexcept {
    try {
        std::ifstream file(path, std::ios::binary);
        if (!file) return std::nullopt;
        std::string content((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());
        if (file.bad()) return std::nullopt;
        return content;
    } catch (...) {
        return std::nullopt;
    }
}

}
