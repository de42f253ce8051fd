/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swell/tasklist.hpp"
#include "swell/errors.hpp"
#include "swell/logger.hpp"
#include <fstream>
#include <iomanip>
#include <iterator>
#include <regex>
#include <sstream>

namespace swell {

namespace {
const char* kRulesPrefix = "- **Constitution**:";
const char* kRolePrefix = "- **Role**:";

std::string trim(const std::string& value) {
    auto start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.rfind(prefix, 0) == 0;
}

bool isTaskLine(const std::string& line) {
    return startsWith(line, "- [ ]") || startsWith(line, "- [x]");
}

std::vector<std::string> splitRules(const std::string& value) {
    std::vector<std::string> rules;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) rules.push_back(item);
    }
    return rules;
}
}

std::vector<Task> TaskParser::parse(const std::string& content) const {
    std::vector<Task> tasks;
    std::vector<std::string> block;

    auto flush = [&]() {
        if (block.empty()) return;
        tasks.push_back(buildTask(block, tasks.size() + 1));
        block.clear();
    };

    std::istringstream in(content);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();

        if (isTaskLine(line)) {
            flush();
            block.push_back(line);
        } else if (!block.empty()) {
            auto stripped = trim(line);
            if (stripped.empty()) {
                flush();
            } else if (startsWith(stripped, kRulesPrefix) || startsWith(stripped, kRolePrefix)) {
                block.push_back(stripped);
            }
        }
    }
    flush();

    LOG_DEBUG("Parsed " + std::to_string(tasks.size()) + " task(s)");
    return tasks;
}

std::vector<Task> TaskParser::parseFile(const std::filesystem::path& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw Error("Cannot read task list: " + path.string());
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    return parse(content);
}

Task TaskParser::buildTask(const std::vector<std::string>& lines, std::size_t number) const {
    Task task;
    const auto& first = lines.front();

    task.id = formatId(number);
    task.order = number - 1;
    task.completed = startsWith(first, "- [x]");
    task.description = trim(first.substr(first.find(']') + 1));
    task.fileLocks = extractFileReferences(task.description);
    task.dependencies = extractDependencies(task.description);

    for (std::size_t i = 1; i < lines.size(); ++i) {
        const auto& meta = lines[i];
        if (startsWith(meta, kRulesPrefix)) {
            auto rules = splitRules(meta.substr(std::string(kRulesPrefix).size()));
            task.policyRules.insert(task.policyRules.end(), rules.begin(), rules.end());
        } else if (startsWith(meta, kRolePrefix)) {
            auto role = trim(meta.substr(std::string(kRolePrefix).size()));
            if (!role.empty()) task.role = role;
        }
    }

    LOG_TRACE(task.id + ": " + std::to_string(task.fileLocks.size()) + " lock(s), " +
              std::to_string(task.dependencies.size()) + " explicit dependency(ies)");
    return task;
}

std::set<std::string> TaskParser::extractFileReferences(const std::string& text) {
    static const std::regex backtickPath("`([^`]+\\.[a-zA-Z]+)`");
    static const std::regex barePath("\\b([\\w/.-]+\\.[a-zA-Z]{2,4})\\b");

    std::set<std::string> files;
    for (const auto* pattern : {&backtickPath, &barePath}) {
        for (std::sregex_iterator it(text.begin(), text.end(), *pattern), end; it != end; ++it) {
            files.insert((*it)[1].str());
        }
    }
    return files;
}

std::set<TaskId> TaskParser::extractDependencies(const std::string& text) {
    static const std::regex dependsOn("\\b(?:after|depends on)\\s+T(\\d{3})\\b", std::regex::icase);

    std::set<TaskId> deps;
    for (std::sregex_iterator it(text.begin(), text.end(), dependsOn), end; it != end; ++it) {
        deps.insert("T" + (*it)[1].str());
    }
    return deps;
}

TaskId TaskParser::formatId(std::size_t number) {
    std::ostringstream oss;
    oss << "T" << std::setw(3) << std::setfill('0') << number;
    return oss.str();
}

}
