/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swell/command.hpp"
#include "swell/errors.hpp"
#include "swell/markers.hpp"
#include "swell/policy.hpp"
#include "swell/progress.hpp"
#include "swell/vcs.hpp"
#include <gtest/gtest.h>
#include <iterator>
#include <cstdlib>
#include <fstream>
#include <unistd.h>

using namespace swell;

namespace {

Task makeTask(const std::string& id, const std::string& description) {
    Task task;
    task.id = id;
    task.description = description;
    return task;
}

class ScratchTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("swell_checkpoint_" + std::to_string(::getpid()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(dir_);
    }
    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    void write(const std::string& name, const std::string& content) {
        std::filesystem::create_directories((dir_ / name).parent_path());
        std::ofstream(dir_ / name) << content;
    }

    std::string read(const std::string& name) {
        std::ifstream in(dir_ / name);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

    std::filesystem::path dir_;
};

}

// ---- completion markers ----

TEST(TaskListMarkersTest, FirstMentionDecides) {
    const std::string content =
        "# Tasks\n"
        "- [x] T001 Build parser in `parser.py`\n"
        "- [ ] T002 Write tests for parser\n"
        "- [X] T003 Document API\n"
        "Notes: Write tests for parser [x] later\n";
    std::vector<Task> tasks{
        makeTask("T001", "Build parser in `parser.py`"),
        makeTask("T002", "Write tests for parser"),
        makeTask("T003", "Document API"),
        makeTask("T004", "Not in the file"),
    };

    EXPECT_EQ(TaskListMarkers::scan(content, tasks), (std::set<TaskId>{"T001"}));
}

TEST(TaskListMarkersTest, EmptyDescriptionNeverCompletes) {
    std::vector<Task> tasks{makeTask("T001", "")};
    EXPECT_TRUE(TaskListMarkers::scan("- [x] T001\n", tasks).empty());
}

TEST_F(ScratchTest, MarkersReadTheFileEachTime) {
    write("tasks.md", "- [ ] T001 Build core\n");
    TaskListMarkers markers(dir_ / "tasks.md");
    std::vector<Task> tasks{makeTask("T001", "Build core")};

    EXPECT_TRUE(markers.completed(tasks).empty());
    write("tasks.md", "- [x] T001 Build core\n");
    EXPECT_EQ(markers.completed(tasks), (std::set<TaskId>{"T001"}));
}

TEST_F(ScratchTest, MissingTaskListIsAnError) {
    TaskListMarkers markers(dir_ / "absent.md");
    EXPECT_THROW((void)markers.completed({makeTask("T001", "x")}), Error);
}

// ---- progress record ----

TEST(ProgressLogTest, EntryListsEveryTask) {
    Wave wave;
    wave.id = 3;
    wave.tasks = {makeTask("T004", "Add cache"), makeTask("T007", "Tune cache")};

    EXPECT_EQ(ProgressLog::renderEntry(wave, "2025-01-31 12:00:00"),
              "\n## Wave 3 Complete - 2025-01-31 12:00:00\n\n"
              "- [x] T004: Add cache\n"
              "- [x] T007: Tune cache\n");
}

TEST_F(ScratchTest, ProgressAppendsUnderHeader) {
    ProgressLog log(dir_ / ".swell" / "progress.md");
    Wave first;
    first.id = 1;
    first.tasks = {makeTask("T001", "Build core")};
    Wave second;
    second.id = 2;
    second.tasks = {makeTask("T002", "Test core")};

    log.appendWave(first);
    log.appendWave(second);

    const auto text = read(".swell/progress.md");
    EXPECT_EQ(text.rfind("# Progress\n", 0), 0u);
    EXPECT_EQ(text.find("# Progress", 1), std::string::npos);
    EXPECT_LT(text.find("## Wave 1 Complete"), text.find("## Wave 2 Complete"));
    EXPECT_NE(text.find("- [x] T002: Test core"), std::string::npos);
}

TEST_F(ScratchTest, ProgressKeepsExistingContent) {
    write("progress.md", "# Progress\n\nHand-written note\n");
    ProgressLog log(dir_ / "progress.md");
    Wave wave;
    wave.id = 1;
    wave.tasks = {makeTask("T001", "Build core")};
    log.appendWave(wave);

    const auto text = read("progress.md");
    EXPECT_EQ(text.rfind("# Progress\n\nHand-written note\n", 0), 0u);
    EXPECT_NE(text.find("## Wave 1 Complete"), std::string::npos);
}

TEST_F(ScratchTest, ResumedWaveIsRecordedOnce) {
    ProgressLog log(dir_ / "progress.md");
    Wave wave;
    wave.id = 2;
    wave.tasks = {makeTask("T002", "Test core")};

    log.appendWave(wave);
    log.appendWave(wave);

    const auto text = read("progress.md");
    const auto first = text.find("## Wave 2 Complete");
    ASSERT_NE(first, std::string::npos);
    EXPECT_EQ(text.find("## Wave 2 Complete", first + 1), std::string::npos);
}

TEST_F(ScratchTest, EarlierWaveEntryDoesNotSuppressAppend) {
    write("progress.md", "# Progress\n\n## Wave 1 Complete - x\n\n## Wave 12 Complete - y\n");
    ProgressLog log(dir_ / "progress.md");
    Wave wave;
    wave.id = 1;
    wave.tasks = {makeTask("T001", "Build core")};
    log.appendWave(wave);

    const auto text = read("progress.md");
    EXPECT_NE(text.find("## Wave 1 Complete", text.find("## Wave 12")), std::string::npos);
}

// ---- policy validation ----

TEST(PolicyParseTest, ReadsViolationLines) {
    const auto violations = CommandPolicyValidator::parseViolations(
        "checking 3 files\n"
        "src/core.py:12:no-print: print statement in library code\n"
        "src/io.py:7:max-length:line: too long\n"
        "garbage:abc:rule:msg\n"
        "summary: 2 problems\n");

    ASSERT_EQ(violations.size(), 2u);
    EXPECT_EQ(violations[0].file, "src/core.py");
    EXPECT_EQ(violations[0].line, 12);
    EXPECT_EQ(violations[0].rule, "no-print");
    EXPECT_EQ(violations[0].message, "print statement in library code");
    EXPECT_EQ(violations[1].rule, "max-length");
    EXPECT_EQ(violations[1].message, "line: too long");
}

TEST(PolicyParseTest, HugeLineNumbersAreNotViolations) {
    EXPECT_TRUE(CommandPolicyValidator::parseViolations("a.py:99999999999999:r:m\n").empty());
}

TEST_F(ScratchTest, ValidatorReceivesFilesAsArguments) {
    write("check.sh",
          "#!/bin/sh\n"
          "for f in \"$@\"; do\n"
          "  case \"$f\" in *bad*) echo \"$f:1:no-bad:bad file name\";; esac\n"
          "done\n"
          "exit 0\n");
    CommandPolicyValidator validator("sh " + (dir_ / "check.sh").string());

    EXPECT_TRUE(validator.validate({"good.py", "with space.py"}).empty());

    auto violations = validator.validate({"good.py", "very bad.py"});
    ASSERT_EQ(violations.size(), 1u);
    EXPECT_EQ(violations[0].file, "very bad.py");
    EXPECT_EQ(violations[0].rule, "no-bad");
}

TEST(PolicyValidatorTest, FailureWithoutViolationsIsAnError) {
    CommandPolicyValidator validator("echo crashed; exit 2;");
    EXPECT_THROW((void)validator.validate({"a.py"}), Error);
}

TEST(PolicyValidatorTest, TimeoutIsAnError) {
    CommandPolicyValidator validator("sleep 30;", std::chrono::seconds(1));
    EXPECT_THROW((void)validator.validate({"a.py"}), Error);
}

TEST(PolicyValidatorTest, NothingToValidate) {
    CommandPolicyValidator validator("exit 1;");
    EXPECT_TRUE(validator.validate({}).empty());
}

TEST(PolicyValidatorTest, SkipAcceptsEverything) {
    SkipPolicyValidator validator;
    EXPECT_TRUE(validator.validate({"a.py", "b.py"}).empty());
}

// ---- version control ----

TEST(CheckpointMessageTest, NamesTheWave) {
    EXPECT_EQ(checkpointMessage(4), "[CHECKPOINT] Wave 4 Complete\n\nAll tasks verified and validated");
}

TEST_F(ScratchTest, GitReportsChangesAndCommits) {
    if (!runCommand({"git", "--version"}, std::chrono::seconds(10))) {
        GTEST_SKIP() << "git not available";
    }
    ::setenv("GIT_AUTHOR_NAME", "swell", 1);
    ::setenv("GIT_AUTHOR_EMAIL", "swell@localhost", 1);
    ::setenv("GIT_COMMITTER_NAME", "swell", 1);
    ::setenv("GIT_COMMITTER_EMAIL", "swell@localhost", 1);

    const auto timeout = std::chrono::seconds(30);
    ASSERT_TRUE(runCommand({"git", "init", "-q"}, timeout, dir_));
    write("tracked.py", "x = 1\n");
    ASSERT_TRUE(runCommand({"git", "add", "tracked.py"}, timeout, dir_));
    ASSERT_TRUE(runCommand({"git", "commit", "-q", "-m", "initial"}, timeout, dir_));

    write("tracked.py", "x = 2\n");
    write("new/module.py", "y = 1\n");

    GitVersionControl git(dir_);
    EXPECT_EQ(git.changedFiles(), (std::vector<std::string>{"new/module.py", "tracked.py"}));

    git.commit(checkpointMessage(1));
    EXPECT_TRUE(git.changedFiles().empty());

    // Empty checkpoints still leave a commit behind
    git.commit(checkpointMessage(2));
    auto log = runCommand({"git", "log", "--format=%s"}, timeout, dir_);
    ASSERT_TRUE(log);
    EXPECT_EQ(log.output, "[CHECKPOINT] Wave 2 Complete\n[CHECKPOINT] Wave 1 Complete\ninitial\n");
}

TEST_F(ScratchTest, GitOutsideRepositoryFails) {
    GitVersionControl git(dir_ / "missing");
    EXPECT_THROW((void)git.changedFiles(), Error);
    EXPECT_THROW(git.commit("msg"), Error);
}
