/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swell/registry.hpp"
#include "swell/atomic_file.hpp"
#include "swell/errors.hpp"
#include "swell/logger.hpp"
#include <cerrno>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <json/json.h>
#include <memory>
#include <sys/file.h>
#include <unistd.h>

namespace swell {

namespace {

constexpr int kRegistryVersion = 1;

// Holds an exclusive flock for its lifetime.
class FileLock {
public:
    explicit FileLock(const std::filesystem::path& path) {
        std::error_code ec;
        if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);

        fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
        if (fd_ < 0) {
            throw Error("Cannot open registry lock " + path.string() + ": " + std::strerror(errno));
        }
        while (::flock(fd_, LOCK_EX) != 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd_);
            throw Error("Cannot lock registry " + path.string() + ": " + std::strerror(err));
        }
    }

    ~FileLock() {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

private:
    int fd_ = -1;
};

Json::Value stringArray(const std::vector<std::string>& values) {
    Json::Value arr(Json::arrayValue);
    for (const auto& v : values) arr.append(v);
    return arr;
}

Json::Value recordToJson(const ProcessRecord& record) {
    Json::Value r;
    r["command"] = record.command;
    r["status"] = toString(record.status);
    r["started_at"] = formatTimestamp(record.startedAt);
    if (record.completedAt) r["completed_at"] = formatTimestamp(*record.completedAt);

    if (const auto* native = std::get_if<NativeMode>(&record.mode)) {
        r["mode"] = "native";
        r["native"]["pid"] = native->pid;
        r["native"]["pgid"] = native->pgid;
        r["native"]["start_time"] = Json::UInt64(native->startTime);
    } else {
        const auto& container = std::get<ContainerMode>(record.mode);
        r["mode"] = "container";
        r["container"]["id"] = container.id;
        r["container"]["name"] = container.name;
        r["container"]["resource_limits"]["memory"] = container.limits.memory;
        r["container"]["resource_limits"]["cpu"] = container.limits.cpu;
    }

    r["constitution_rules"] = stringArray(record.rules);
    Json::Value flagList(Json::arrayValue);
    for (const auto& f : record.flags) flagList.append(f);
    r["flags"] = flagList;
    return r;
}

class RecordReader {
public:
    RecordReader(const std::filesystem::path& origin, std::string key) : origin_(origin), key_(std::move(key)) {}

    [[noreturn]] void fail(const std::string& detail) const {
        throw RegistryCorruption(origin_, "task \"" + key_ + "\": " + detail);
    }

    const Json::Value& object(const Json::Value& parent, const char* name) const {
        const auto& v = parent[name];
        if (!v.isObject()) fail(std::string("\"") + name + "\" must be an object");
        return v;
    }

    std::string string(const Json::Value& parent, const char* name) const {
        const auto& v = parent[name];
        if (!v.isString()) fail(std::string("\"") + name + "\" must be a string");
        return v.asString();
    }

    int integer(const Json::Value& parent, const char* name) const {
        const auto& v = parent[name];
        if (!v.isInt()) fail(std::string("\"") + name + "\" must be an integer");
        return v.asInt();
    }

    Timestamp timestamp(const Json::Value& parent, const char* name) const {
        auto parsed = parseTimestamp(string(parent, name));
        if (!parsed) fail(std::string("\"") + name + "\" is not an ISO-8601 UTC timestamp");
        return *parsed;
    }

    std::vector<std::string> strings(const Json::Value& parent, const char* name) const {
        std::vector<std::string> out;
        if (!parent.isMember(name)) return out;
        const auto& arr = parent[name];
        if (!arr.isArray()) fail(std::string("\"") + name + "\" must be an array");
        for (const auto& item : arr) {
            if (!item.isString()) fail(std::string("\"") + name + "\" must hold strings");
            out.push_back(item.asString());
        }
        return out;
    }

private:
    const std::filesystem::path& origin_;
    std::string key_;
};

ProcessRecord recordFromJson(const RecordKey& key, const Json::Value& r, const std::filesystem::path& origin) {
    RecordReader reader(origin, key);
    if (!r.isObject()) reader.fail("record must be an object");

    ProcessRecord record;
    record.key = key;
    record.command = r.isMember("command") ? reader.string(r, "command") : std::string();

    const auto status = reader.string(r, "status");
    if (status == "running") record.status = RecordStatus::Running;
    else if (status == "completed") record.status = RecordStatus::Completed;
    else if (status == "failed") record.status = RecordStatus::Failed;
    else reader.fail("unknown status \"" + status + "\"");

    record.startedAt = reader.timestamp(r, "started_at");
    if (r.isMember("completed_at") && !r["completed_at"].isNull()) {
        record.completedAt = reader.timestamp(r, "completed_at");
    }

    const auto mode = reader.string(r, "mode");
    if (mode == "native") {
        if (r.isMember("container")) reader.fail("native record carries a container payload");
        const auto& n = reader.object(r, "native");
        NativeMode native;
        native.pid = reader.integer(n, "pid");
        native.pgid = reader.integer(n, "pgid");
        if (!n["start_time"].isUInt64()) reader.fail("\"start_time\" must be an unsigned integer");
        native.startTime = n["start_time"].asUInt64();
        record.mode = native;
    } else if (mode == "container") {
        if (r.isMember("native")) reader.fail("container record carries a native payload");
        const auto& c = reader.object(r, "container");
        ContainerMode container;
        container.id = reader.string(c, "id");
        container.name = reader.string(c, "name");
        if (c.isMember("resource_limits")) {
            const auto& limits = reader.object(c, "resource_limits");
            container.limits.memory = reader.string(limits, "memory");
            container.limits.cpu = reader.string(limits, "cpu");
        }
        record.mode = container;
    } else {
        reader.fail("unknown mode \"" + mode + "\"");
    }

    record.rules = reader.strings(r, "constitution_rules");
    for (auto& flag : reader.strings(r, "flags")) record.flags.insert(std::move(flag));
    return record;
}

}

std::string formatTimestamp(Timestamp when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    ::gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

std::optional<Timestamp> parseTimestamp(const std::string& text) noexcept {
    std::tm tm{};
    const char* end = ::strptime(text.c_str(), "%Y-%m-%dT%H:%M:%S", &tm);
    if (!end) return std::nullopt;
    // Tolerate fractional seconds before the zone designator
    if (*end == '.') {
        ++end;
        while (*end >= '0' && *end <= '9') ++end;
    }
    if (*end != 'Z' || *(end + 1) != '\0') return std::nullopt;
    return std::chrono::system_clock::from_time_t(::timegm(&tm));
}

std::string registryToJson(const RegistrySnapshot& snapshot) {
    Json::Value root;
    root["version"] = kRegistryVersion;
    Json::Value tasks(Json::objectValue);
    for (const auto& [key, record] : snapshot) tasks[key] = recordToJson(record);
    root["tasks"] = tasks;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, root) + "\n";
}

RegistrySnapshot registryFromJson(const std::string& text, const std::filesystem::path& origin) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> parser(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!parser->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        throw RegistryCorruption(origin, "malformed JSON: " + errors);
    }
    if (!root.isObject()) throw RegistryCorruption(origin, "document root must be an object");
    if (root.isMember("version") && (!root["version"].isInt() || root["version"].asInt() != kRegistryVersion)) {
        throw RegistryCorruption(origin, "unsupported version");
    }

    const auto& tasks = root["tasks"];
    if (!tasks.isObject()) throw RegistryCorruption(origin, "\"tasks\" must be an object");

    RegistrySnapshot snapshot;
    for (const auto& key : tasks.getMemberNames()) {
        snapshot.emplace(key, recordFromJson(key, tasks[key], origin));
    }
    return snapshot;
}

// ---- RegistryStore ----

RegistryStore::RegistryStore(std::filesystem::path path) : path_(std::move(path)) {}

RegistrySnapshot RegistryStore::load() const {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return {};
    }
    auto content = readWholeFile(path_);
    if (!content) {
        throw RegistryCorruption(path_, "unreadable");
    }
    return registryFromJson(*content, path_);
}

void RegistryStore::save(const RegistrySnapshot& snapshot) const {
    std::string error;
    if (!writeFileAtomically(path_, registryToJson(snapshot), error, 0600)) {
        throw Error("Failed to save registry " + path_.string() + ": " + error);
    }
    LOG_TRACE("Registry saved (" + std::to_string(snapshot.size()) + " record(s))");
}

RegistrySnapshot RegistryStore::update(const std::function<void(RegistrySnapshot&)>& mutate) const {
    FileLock lock(path_.string() + ".lock");
    auto snapshot = load();
    mutate(snapshot);
    save(snapshot);
    return snapshot;
}

RecordKey qualifyKey(const std::string& id, const std::string& ns) {
    if (id.find(':') != std::string::npos) return id;
    return ns + ":" + id;
}

// ---- ProcessRegistry ----

ProcessRegistry::ProcessRegistry(const RegistryStore& store, std::string ns)
    : store_(store), ns_(std::move(ns)) {}

ProcessRecord ProcessRegistry::registerTask(const std::string& id, ExecutionMode mode, const std::string& command,
                                            std::vector<std::string> rules) {
    ProcessRecord record;
    record.key = keyFor(id);
    record.mode = std::move(mode);
    record.command = command;
    record.status = RecordStatus::Running;
    record.startedAt = std::chrono::system_clock::now();
    record.rules = std::move(rules);

    store_.update([&](RegistrySnapshot& snapshot) {
        if (snapshot.count(record.key)) {
            LOG_WARN("Re-registering " + record.key + "; previous record overwritten");
        }
        snapshot[record.key] = record;
    });

    if (const auto* native = std::get_if<NativeMode>(&record.mode)) {
        LOG_INFO("Registered " + record.key + " (pid " + std::to_string(native->pid) + ", pgid " +
                 std::to_string(native->pgid) + ")");
    } else {
        LOG_INFO("Registered " + record.key + " (container " + std::get<ContainerMode>(record.mode).name + ")");
    }
    return record;
}

bool ProcessRegistry::transition(const RecordKey& key, RecordStatus to, const std::set<std::string>& extra) {
    bool applied = false;
    store_.update([&](RegistrySnapshot& snapshot) {
        auto it = snapshot.find(key);
        if (it == snapshot.end() || it->second.status != RecordStatus::Running) return;
        it->second.status = to;
        it->second.completedAt = std::chrono::system_clock::now();
        it->second.flags.insert(extra.begin(), extra.end());
        applied = true;
    });

    if (applied) {
        LOG_INFO(key + " -> " + toString(to));
    } else {
        LOG_DEBUG(key + " not running; " + toString(to) + " transition skipped");
    }
    return applied;
}

bool ProcessRegistry::markCompleted(const std::string& id) {
    return transition(keyFor(id), RecordStatus::Completed);
}

bool ProcessRegistry::markFailed(const std::string& id, const std::set<std::string>& extra) {
    return transition(keyFor(id), RecordStatus::Failed, extra);
}

bool ProcessRegistry::addFlags(const RecordKey& key, const std::set<std::string>& extra) {
    bool found = false;
    store_.update([&](RegistrySnapshot& snapshot) {
        auto it = snapshot.find(key);
        if (it == snapshot.end()) return;
        it->second.flags.insert(extra.begin(), extra.end());
        found = true;
    });
    return found;
}

bool ProcessRegistry::remove(const std::string& id) {
    const auto key = keyFor(id);
    bool removed = false;
    store_.update([&](RegistrySnapshot& snapshot) { removed = snapshot.erase(key) > 0; });
    if (removed) LOG_INFO("Removed " + key);
    return removed;
}

std::optional<ProcessRecord> ProcessRegistry::find(const std::string& id) const {
    auto snapshot = store_.load();
    auto it = snapshot.find(keyFor(id));
    if (it == snapshot.end()) return std::nullopt;
    return it->second;
}

RegistrySnapshot ProcessRegistry::snapshot() const {
    return store_.load();
}

RegistryStats ProcessRegistry::stats() const {
    RegistryStats stats;
    for (const auto& [key, record] : store_.load()) {
        switch (record.status) {
            case RecordStatus::Running: ++stats.running; break;
            case RecordStatus::Completed: ++stats.completed; break;
            case RecordStatus::Failed: ++stats.failed; break;
        }
    }
    return stats;
}

std::size_t ProcessRegistry::cleanup(int days, Timestamp now) {
    const auto cutoff = now - std::chrono::hours(24) * days;
    std::size_t removed = 0;
    store_.update([&](RegistrySnapshot& snapshot) {
        for (auto it = snapshot.begin(); it != snapshot.end();) {
            const auto& record = it->second;
            if (record.status != RecordStatus::Running && record.completedAt && *record.completedAt < cutoff) {
                it = snapshot.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    });
    LOG_INFO("Cleanup removed " + std::to_string(removed) + " record(s) older than " + std::to_string(days) + " day(s)");
    return removed;
}

}
