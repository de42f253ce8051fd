/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swell/command.hpp"
#include "swell/logger.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace swell {

namespace {

std::vector<char*> toArgv(const std::vector<std::string>& args) {
    std::vector<char*> out;
    out.reserve(args.size() + 1);
    for (const auto& a : args) out.push_back(const_cast<char*>(a.c_str()));
    out.push_back(nullptr);
    return out;
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// Child side after fork: only async-signal-safe calls from here on.
void redirectStdin() {
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
        ::dup2(devnull, STDIN_FILENO);
        ::close(devnull);
    }
}

}

CommandResult runCommand(const std::vector<std::string>& argv, std::chrono::milliseconds timeout,
                         const std::filesystem::path& workdir) noexcept {
    CommandResult result;
    if (argv.empty()) {
        result.error = "empty command";
        return result;
    }

    try {
        // Everything the child needs is prepared before fork
        auto args = toArgv(argv);
        std::string dir = workdir.string();

        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            result.error = std::string("pipe: ") + std::strerror(errno);
            return result;
        }

        pid_t pid = ::fork();
        if (pid < 0) {
            result.error = std::string("fork: ") + std::strerror(errno);
            ::close(fds[0]);
            ::close(fds[1]);
            return result;
        }

        if (pid == 0) {
            ::setpgid(0, 0);
            redirectStdin();
            ::dup2(fds[1], STDOUT_FILENO);
            ::dup2(fds[1], STDERR_FILENO);
            if (!dir.empty() && ::chdir(dir.c_str()) != 0) {
                _exit(126);
            }
            ::execvp(args[0], args.data());
            _exit(127);
        }

        ::setpgid(pid, pid);
        ::close(fds[1]);
        result.started = true;

        const bool bounded = timeout.count() > 0;
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        char buf[4096];

        for (;;) {
            int waitMs = -1;
            if (bounded) {
                auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
                if (left.count() <= 0) {
                    result.timedOut = true;
                    break;
                }
                waitMs = static_cast<int>(left.count());
            }

            pollfd pfd{fds[0], POLLIN, 0};
            int rc = ::poll(&pfd, 1, waitMs);
            if (rc < 0) {
                if (errno == EINTR) continue;
                break;
            }
            if (rc == 0) continue;

            ssize_t n = ::read(fds[0], buf, sizeof(buf));
            if (n > 0) {
                result.output.append(buf, static_cast<std::size_t>(n));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                break;
            }
        }
        ::close(fds[0]);

        if (result.timedOut) {
            LOG_WARN("Command timed out after " + std::to_string(timeout.count()) + "ms: " + argv[0]);
            ::killpg(pid, SIGKILL);
        }

        int status = 0;
        for (;;) {
            pid_t r = ::waitpid(pid, &status, result.timedOut ? 0 : WNOHANG);
            if (r == pid) {
                result.exitCode = decodeStatus(status);
                break;
            }
            if (r < 0) {
                if (errno == EINTR) continue;
                break;
            }
            // Output closed but the child lingers; it still answers to the deadline.
            if (bounded && std::chrono::steady_clock::now() >= deadline) {
                result.timedOut = true;
                ::killpg(pid, SIGKILL);
                continue;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        LOG_TRACE("Command " + argv[0] + " exited with " + std::to_string(result.exitCode));
        return result;
    } catch (const std::exception& e) {
        result.error = e.what();
        return result;
    }
}

SpawnResult spawnDetached(const std::vector<std::string>& argv, const EnvironmentOverrides& env,
                          const std::filesystem::path& workdir) noexcept {
    SpawnResult result;
    if (argv.empty()) {
        result.error = "empty command";
        return result;
    }

    try {
        auto args = toArgv(argv);
        std::string dir = workdir.string();

        std::vector<std::string> envStrings;
        for (char** e = environ; e && *e; ++e) {
            std::string entry(*e);
            bool overridden = false;
            for (const auto& [key, value] : env) {
                (void)value;
                if (entry.rfind(key + "=", 0) == 0) {
                    overridden = true;
                    break;
                }
            }
            if (!overridden) envStrings.push_back(std::move(entry));
        }
        for (const auto& [key, value] : env) envStrings.push_back(key + "=" + value);
        auto envp = toArgv(envStrings);

        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            result.error = std::string("pipe: ") + std::strerror(errno);
            return result;
        }

        pid_t child = ::fork();
        if (child < 0) {
            result.error = std::string("fork: ") + std::strerror(errno);
            ::close(fds[0]);
            ::close(fds[1]);
            return result;
        }

        if (child == 0) {
            ::close(fds[0]);
            ::setsid();
            pid_t worker = ::fork();
            if (worker == 0) {
                ::close(fds[1]);
                ::setpgid(0, 0);
                redirectStdin();
                if (!dir.empty() && ::chdir(dir.c_str()) != 0) {
                    _exit(126);
                }
                ::execvpe(args[0], args.data(), envp.data());
                _exit(127);
            }
            if (worker > 0) {
                ::setpgid(worker, worker);
            }
            ssize_t ignored = ::write(fds[1], &worker, sizeof(worker));
            (void)ignored;
            _exit(worker > 0 ? 0 : 1);
        }

        ::close(fds[1]);
        pid_t worker = -1;
        ssize_t n;
        do {
            n = ::read(fds[0], &worker, sizeof(worker));
        } while (n < 0 && errno == EINTR);
        ::close(fds[0]);

        int status = 0;
        while (::waitpid(child, &status, 0) < 0 && errno == EINTR) {
        }

        if (n != static_cast<ssize_t>(sizeof(worker)) || worker <= 0) {
            result.error = "failed to start " + argv[0];
            return result;
        }

        result.ok = true;
        result.pid = worker;
        LOG_DEBUG("Spawned detached " + argv[0] + " as pid " + std::to_string(worker));
        return result;
    } catch (const std::exception& e) {
        result.error = e.what();
        return result;
    }
}

}
