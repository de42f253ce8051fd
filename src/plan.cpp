/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swell/plan.hpp"
#include "swell/atomic_file.hpp"
#include "swell/errors.hpp"
#include "swell/logger.hpp"
#include <json/json.h>
#include <map>
#include <memory>

namespace swell {

namespace {

Json::Value stringArray(const std::set<std::string>& values) {
    Json::Value arr(Json::arrayValue);
    for (const auto& v : values) arr.append(v);
    return arr;
}

Json::Value stringArray(const std::vector<std::string>& values) {
    Json::Value arr(Json::arrayValue);
    for (const auto& v : values) arr.append(v);
    return arr;
}

class PlanReader {
public:
    explicit PlanReader(const std::filesystem::path& origin) : origin_(origin) {}

    [[noreturn]] void fail(const std::string& detail) const { throw PlanFormatError(origin_, detail); }

    const Json::Value& member(const Json::Value& obj, const char* key, const std::string& where) const {
        if (!obj.isObject() || !obj.isMember(key)) fail(where + ": missing \"" + key + "\"");
        return obj[key];
    }

    std::string string(const Json::Value& obj, const char* key, const std::string& where) const {
        const auto& v = member(obj, key, where);
        if (!v.isString()) fail(where + "." + key + ": expected string");
        return v.asString();
    }

    std::string optionalString(const Json::Value& obj, const char* key, const std::string& fallback,
                               const std::string& where) const {
        if (!obj.isMember(key)) return fallback;
        const auto& v = obj[key];
        if (!v.isString()) fail(where + "." + key + ": expected string");
        return v.asString();
    }

    bool optionalBool(const Json::Value& obj, const char* key, bool fallback, const std::string& where) const {
        if (!obj.isMember(key)) return fallback;
        const auto& v = obj[key];
        if (!v.isBool()) fail(where + "." + key + ": expected boolean");
        return v.asBool();
    }

    std::vector<std::string> strings(const Json::Value& obj, const char* key, const std::string& where) const {
        std::vector<std::string> out;
        if (!obj.isMember(key)) return out;
        const auto& arr = obj[key];
        if (!arr.isArray()) fail(where + "." + key + ": expected array");
        for (const auto& item : arr) {
            if (!item.isString()) fail(where + "." + key + ": expected array of strings");
            out.push_back(item.asString());
        }
        return out;
    }

private:
    std::filesystem::path origin_;
};

WaveStrategy parseStrategy(const std::string& name, const PlanReader& reader, const std::string& where) {
    if (name == "PARALLEL" || name == "PARALLEL_SWARM") return WaveStrategy::Parallel;
    if (name == "SEQUENTIAL" || name == "SEQUENTIAL_MERGE") return WaveStrategy::Sequential;
    reader.fail(where + ".strategy: unknown strategy \"" + name + "\"");
}

}

std::vector<TaskId> Wave::taskIds() const {
    std::vector<TaskId> ids;
    ids.reserve(tasks.size());
    for (const auto& t : tasks) ids.push_back(t.id);
    return ids;
}

std::set<std::string> Wave::fileLocks() const {
    std::set<std::string> locks;
    for (const auto& t : tasks) locks.insert(t.fileLocks.begin(), t.fileLocks.end());
    return locks;
}

std::size_t ExecutionPlan::taskCount() const noexcept {
    std::size_t count = 0;
    for (const auto& w : waves) count += w.tasks.size();
    return count;
}

const Wave* ExecutionPlan::waveOf(const TaskId& id) const noexcept {
    for (const auto& w : waves) {
        for (const auto& t : w.tasks) {
            if (t.id == id) return &w;
        }
    }
    return nullptr;
}

std::string completionHandshake(const Task& task) {
    return "Upon success, update the task list line containing '" + task.description + "' to [x]";
}

std::string planToJson(const ExecutionPlan& plan) {
    Json::Value waves(Json::arrayValue);
    for (const auto& wave : plan.waves) {
        Json::Value tasks(Json::arrayValue);
        for (const auto& task : wave.tasks) {
            Json::Value t;
            t["task_id"] = task.id;
            t["agent_role"] = task.role;
            t["instruction"] = task.description;
            t["file_locks"] = stringArray(task.fileLocks);
            t["constitution_rules"] = stringArray(task.policyRules);
            t["dependencies"] = stringArray(task.dependencies);
            t["completed"] = task.completed;
            t["completion_handshake"] = completionHandshake(task);
            tasks.append(t);
        }

        Json::Value w;
        w["wave_id"] = wave.id;
        w["strategy"] = toString(wave.strategy);
        w["rationale"] = wave.rationale;
        w["tasks"] = tasks;
        w["checkpoint_after"]["enabled"] = wave.checkpoint.enabled;
        w["checkpoint_after"]["verification_criteria"] = wave.checkpoint.verificationCriteria;
        waves.append(w);
    }

    Json::Value root;
    root["execution_plan"]["phase_id"] = plan.phaseId;
    root["execution_plan"]["waves"] = waves;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, root) + "\n";
}

ExecutionPlan planFromJson(const std::string& text, const std::filesystem::path& origin) {
    PlanReader reader(origin);

    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> parser(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!parser->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        reader.fail("malformed JSON: " + errors);
    }

    const auto& body = reader.member(root, "execution_plan", "root");
    ExecutionPlan plan;
    plan.phaseId = reader.string(body, "phase_id", "execution_plan");

    const auto& waves = reader.member(body, "waves", "execution_plan");
    if (!waves.isArray()) reader.fail("execution_plan.waves: expected array");

    std::map<TaskId, int> placement;
    for (Json::ArrayIndex i = 0; i < waves.size(); ++i) {
        const auto& w = waves[i];
        std::string where = "waves[" + std::to_string(i) + "]";

        Wave wave;
        const auto& idValue = reader.member(w, "wave_id", where);
        if (!idValue.isInt() || idValue.asInt() != static_cast<int>(i) + 1) {
            reader.fail(where + ".wave_id: expected " + std::to_string(i + 1));
        }
        wave.id = idValue.asInt();
        wave.strategy = parseStrategy(reader.string(w, "strategy", where), reader, where);
        wave.rationale = reader.optionalString(w, "rationale", "", where);

        if (w.isMember("checkpoint_after")) {
            const auto& checkpoint = w["checkpoint_after"];
            const std::string checkpointWhere = where + ".checkpoint_after";
            if (!checkpoint.isObject()) reader.fail(checkpointWhere + ": expected object");
            wave.checkpoint.enabled = reader.optionalBool(checkpoint, "enabled", true, checkpointWhere);
            wave.checkpoint.verificationCriteria =
                reader.optionalString(checkpoint, "verification_criteria", "", checkpointWhere);
        }

        const auto& tasks = reader.member(w, "tasks", where);
        if (!tasks.isArray() || tasks.empty()) reader.fail(where + ".tasks: expected non-empty array");

        std::set<std::string> claimed;
        for (Json::ArrayIndex j = 0; j < tasks.size(); ++j) {
            const auto& t = tasks[j];
            std::string taskWhere = where + ".tasks[" + std::to_string(j) + "]";

            Task task;
            task.id = reader.string(t, "task_id", taskWhere);
            task.description = reader.string(t, "instruction", taskWhere);
            task.role = reader.optionalString(t, "agent_role", "Developer", taskWhere);
            task.completed = reader.optionalBool(t, "completed", false, taskWhere);
            for (auto& lock : reader.strings(t, "file_locks", taskWhere)) task.fileLocks.insert(lock);
            for (auto& dep : reader.strings(t, "dependencies", taskWhere)) task.dependencies.insert(dep);
            task.policyRules = reader.strings(t, "constitution_rules", taskWhere);
            task.order = placement.size();

            if (!placement.emplace(task.id, wave.id).second) {
                reader.fail(task.id + " appears in more than one wave");
            }
            for (const auto& lock : task.fileLocks) {
                if (!claimed.insert(lock).second) {
                    reader.fail(where + ": file lock " + lock + " claimed twice in one wave");
                }
            }
            wave.tasks.push_back(std::move(task));
        }

        bool parallel = wave.tasks.size() > 1;
        if (parallel != (wave.strategy == WaveStrategy::Parallel)) {
            reader.fail(where + ".strategy: does not match " + std::to_string(wave.tasks.size()) + " task(s)");
        }
        plan.waves.push_back(std::move(wave));
    }

    // A prerequisite that is part of the plan must sit in an earlier wave.
    for (const auto& wave : plan.waves) {
        for (const auto& task : wave.tasks) {
            for (const auto& dep : task.dependencies) {
                auto it = placement.find(dep);
                if (it != placement.end() && it->second >= wave.id) {
                    reader.fail(task.id + " in wave " + std::to_string(wave.id) +
                                " depends on " + dep + " in wave " + std::to_string(it->second));
                }
            }
        }
    }

    return plan;
}

void savePlan(const ExecutionPlan& plan, const std::filesystem::path& path) {
    std::string error;
    if (!writeFileAtomically(path, planToJson(plan), error)) {
        throw Error("Failed to write execution plan: " + error);
    }
    LOG_INFO("Execution plan written to " + path.string() + " (" +
             std::to_string(plan.waves.size()) + " wave(s))");
}

ExecutionPlan loadPlan(const std::filesystem::path& path) {
    auto content = readWholeFile(path);
    if (!content) {
        throw PlanFormatError(path, "cannot read file");
    }
    auto plan = planFromJson(*content, path);
    LOG_DEBUG("Loaded plan " + plan.phaseId + " with " + std::to_string(plan.waves.size()) + " wave(s)");
    return plan;
}

}
