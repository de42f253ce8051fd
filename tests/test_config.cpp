/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swell/config.hpp"
#include "swell/errors.hpp"
#include <gtest/gtest.h>
#include <cstdlib>
#include <unistd.h>

using namespace swell;

namespace {

const char* const kVariables[] = {
    "SWELL_TASKS", "SWELL_PLAN", "SWELL_REGISTRY", "SWELL_PROGRESS", "SWELL_NAMESPACE",
    "SWELL_WATCH_INTERVAL", "SWELL_INSPECT_TIMEOUT", "SWELL_POLL_INTERVAL", "SWELL_WAVE_TIMEOUT",
    "SWELL_GUIDELINE", "SWELL_AGENT_CMD", "SWELL_AGENT_IMAGE", "SWELL_CONTAINER_MEMORY",
    "SWELL_CONTAINER_CPU", "SWELL_POLICY_CMD", "SWELL_DOCKER",
};

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : kVariables) ::unsetenv(name);
    }
    void TearDown() override {
        for (const char* name : kVariables) ::unsetenv(name);
    }
};

// Runs each test from inside a scratch workspace so the containment check has a known root
class RegistryPathTest : public ::testing::Test {
protected:
    void SetUp() override {
        original_ = std::filesystem::current_path();
        root_ = std::filesystem::temp_directory_path() /
                ("swell_config_" + std::to_string(::getpid()) + "_" +
                 ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(root_ / "workspace");
        std::filesystem::create_directories(root_ / "elsewhere");
        std::filesystem::current_path(root_ / "workspace");
        workspace_ = std::filesystem::canonical(root_ / "workspace");
    }
    void TearDown() override {
        std::filesystem::current_path(original_);
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    std::filesystem::path original_;
    std::filesystem::path root_;
    std::filesystem::path workspace_;
};

}

TEST_F(ConfigTest, DefaultsWithoutEnvironment) {
    auto config = Config::fromEnv();
    EXPECT_EQ(config.tasksFile.string(), "tasks.md");
    EXPECT_EQ(config.planFile.string(), "execution_plan.json");
    EXPECT_EQ(config.registryFile.string(), ".swell/process_registry.json");
    EXPECT_EQ(config.ns, "swell");
    EXPECT_EQ(config.watchInterval, std::chrono::seconds(300));
    EXPECT_EQ(config.inspectTimeout, std::chrono::seconds(10));
    EXPECT_EQ(config.pollInterval, std::chrono::seconds(5));
    EXPECT_EQ(config.waveTimeout, std::chrono::seconds(3600));
    EXPECT_EQ(config.guideline, std::chrono::seconds(900));
    EXPECT_TRUE(config.agentCommand.empty());
    EXPECT_TRUE(config.policyCommand.empty());
    EXPECT_EQ(config.limits.memory, "512m");
    EXPECT_EQ(config.limits.cpu, "1.0");
    EXPECT_EQ(config.docker, "docker");
}

TEST_F(ConfigTest, EnvironmentOverridesDefaults) {
    ::setenv("SWELL_TASKS", "phase2/tasks.md", 1);
    ::setenv("SWELL_NAMESPACE", "ci", 1);
    ::setenv("SWELL_WATCH_INTERVAL", "60", 1);
    ::setenv("SWELL_WAVE_TIMEOUT", "0", 1);
    ::setenv("SWELL_AGENT_IMAGE", "agent:latest", 1);
    ::setenv("SWELL_CONTAINER_MEMORY", "2g", 1);
    ::setenv("SWELL_POLICY_CMD", "./check-policy", 1);

    auto config = Config::fromEnv();
    EXPECT_EQ(config.tasksFile.string(), "phase2/tasks.md");
    EXPECT_EQ(config.ns, "ci");
    EXPECT_EQ(config.watchInterval, std::chrono::seconds(60));
    EXPECT_EQ(config.waveTimeout, std::chrono::seconds(0));
    EXPECT_EQ(config.agentImage, "agent:latest");
    EXPECT_EQ(config.limits.memory, "2g");
    EXPECT_EQ(config.limits.cpu, "1.0");
    EXPECT_EQ(config.policyCommand, "./check-policy");
}

TEST_F(ConfigTest, EmptyValueKeepsDefault) {
    ::setenv("SWELL_PLAN", "", 1);
    ::setenv("SWELL_POLL_INTERVAL", "", 1);
    auto config = Config::fromEnv();
    EXPECT_EQ(config.planFile.string(), "execution_plan.json");
    EXPECT_EQ(config.pollInterval, std::chrono::seconds(5));
}

TEST_F(ConfigTest, MalformedNumbersAreRejected) {
    for (const char* bad : {"soon", "10s", "-1", "1.5"}) {
        ::setenv("SWELL_INSPECT_TIMEOUT", bad, 1);
        EXPECT_THROW((void)Config::fromEnv(), ConfigError) << bad;
    }
}

TEST_F(ConfigTest, NamespaceCannotContainSeparator) {
    ::setenv("SWELL_NAMESPACE", "a:b", 1);
    EXPECT_THROW((void)Config::fromEnv(), ConfigError);
}

TEST_F(RegistryPathTest, RelativePathResolvesInsideWorkspace) {
    auto resolved = validateRegistryPath(".swell/process_registry.json");
    EXPECT_EQ(resolved.string(), (workspace_ / ".swell" / "process_registry.json").string());
}

TEST_F(RegistryPathTest, AbsolutePathInsideWorkspaceIsAccepted) {
    auto resolved = validateRegistryPath(workspace_ / "state" / "registry.json");
    EXPECT_EQ(resolved.string(), (workspace_ / "state" / "registry.json").string());
}

TEST_F(RegistryPathTest, ParentReferencesAreRejected) {
    EXPECT_THROW((void)validateRegistryPath("../registry.json"), ConfigError);
    EXPECT_THROW((void)validateRegistryPath("state/../registry.json"), ConfigError);
}

TEST_F(RegistryPathTest, SystemDirectoriesAreRejected) {
    for (const char* bad : {"/etc/swell.json", "/proc/self/registry", "/sys/x", "/boot/r.json", "/dev/shm/r.json"}) {
        try {
            (void)validateRegistryPath(bad);
            ADD_FAILURE() << bad << " accepted";
        } catch (const ConfigError& e) {
            EXPECT_NE(std::string(e.what()).find("system directory"), std::string::npos) << bad;
        }
    }
}

TEST_F(RegistryPathTest, PathsOutsideWorkspaceAreRejected) {
    EXPECT_THROW((void)validateRegistryPath(root_ / "elsewhere" / "registry.json"), ConfigError);
}

TEST_F(RegistryPathTest, SymlinkEscapingWorkspaceIsRejected) {
    std::filesystem::create_directory_symlink(root_ / "elsewhere", workspace_ / "link");
    EXPECT_THROW((void)validateRegistryPath("link/registry.json"), ConfigError);
}

TEST_F(RegistryPathTest, WorkspaceItselfIsNotAFile) {
    EXPECT_THROW((void)validateRegistryPath("."), ConfigError);
}
