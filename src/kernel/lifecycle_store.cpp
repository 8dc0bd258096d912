#include "kernel/lifecycle_store.hpp"
#include "kernel/errors.hpp"
#include "ipc/message.hpp"
#include "util/atomic_file.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace hive::kernel {

const char* lifecycle_to_string(Lifecycle lifecycle) {
    switch (lifecycle) {
        case Lifecycle::ACTIVE: return "active";
        case Lifecycle::HIBERNATING: return "hibernating";
        case Lifecycle::SLEEPING: return "sleeping";
    }
    return "unknown";
}

std::optional<Lifecycle> lifecycle_from_string(const std::string& value) {
    if (value == "active") return Lifecycle::ACTIVE;
    if (value == "hibernating") return Lifecycle::HIBERNATING;
    if (value == "sleeping") return Lifecycle::SLEEPING;
    return std::nullopt;
}

json to_json(const AgentRecord& record) {
    return json{
        {"name", record.name},
        {"type", record.type},
        {"created_at", record.created_at},
        {"last_active", record.last_active},
        {"lifecycle", lifecycle_to_string(record.lifecycle)},
        {"config", record.config},
        {"activation_count", record.activation_count},
        {"total_uptime", record.total_uptime_seconds},
    };
}

std::optional<AgentRecord> record_from_json(const json& j) {
    if (!j.is_object() || !j.contains("name") || !j["name"].is_string()) {
        return std::nullopt;
    }
    try {
        AgentRecord record;
        record.name = j["name"].get<std::string>();
        record.type = j.value("type", "general");
        record.created_at = j.value("created_at", "");
        record.last_active = j.value("last_active", "");
        auto lifecycle = lifecycle_from_string(j.value("lifecycle", "sleeping"));
        if (!lifecycle) {
            return std::nullopt;
        }
        record.lifecycle = *lifecycle;
        record.config = j.value("config", json::object());
        record.activation_count = j.value("activation_count", 0u);
        record.total_uptime_seconds = j.value("total_uptime", 0.0);
        return record;
    } catch (const json::exception& e) {
        spdlog::warn("Malformed agent record: {}", e.what());
        return std::nullopt;
    }
}

// ============================================================================
// JsonLifecycleStore
// ============================================================================

JsonLifecycleStore::JsonLifecycleStore(std::string states_dir)
    : states_dir_(std::move(states_dir)) {}

std::string JsonLifecycleStore::path_for(const std::string& name) const {
    return (fs::path(states_dir_) / (name + ".json")).string();
}

void JsonLifecycleStore::load_locked() {
    if (loaded_) {
        return;
    }
    loaded_ = true;

    std::error_code ec;
    fs::create_directories(states_dir_, ec);
    fs::directory_iterator it(states_dir_, ec);
    if (ec) {
        spdlog::error("Cannot read state directory {}: {}", states_dir_, ec.message());
        return;
    }

    for (const auto& entry : it) {
        auto filename = entry.path().filename().string();
        if (entry.path().extension() != ".json" || filename.front() == '.') {
            continue;
        }
        auto content = util::read_file(entry.path().string());
        if (!content) {
            continue;
        }
        try {
            auto record = record_from_json(json::parse(*content));
            if (!record) {
                spdlog::warn("Skipping invalid state file {}", filename);
                continue;
            }
            records_[record->name] = std::move(*record);
        } catch (const json::parse_error& e) {
            spdlog::warn("Skipping unreadable state file {}: {}", filename, e.what());
        }
    }
    spdlog::info("Loaded {} agent states from {}", records_.size(), states_dir_);
}

bool JsonLifecycleStore::save_locked(const AgentRecord& record) {
    std::error_code ec;
    fs::create_directories(states_dir_, ec);
    if (!util::write_file_atomic(path_for(record.name), to_json(record).dump(2))) {
        spdlog::error("Failed to persist state for agent {}", record.name);
        return false;
    }
    return true;
}

AgentRecord JsonLifecycleStore::create(const std::string& name, const std::string& type,
                                       const json& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    load_locked();

    AgentRecord record;
    auto existing = records_.find(name);
    if (existing != records_.end()) {
        // Re-registering keeps history
        record = existing->second;
    } else {
        record.name = name;
        record.created_at = ipc::iso_timestamp_now();
    }
    record.type = type;
    record.config = config.is_null() ? json::object() : config;
    record.lifecycle = Lifecycle::ACTIVE;
    record.last_active = ipc::iso_timestamp_now();

    if (!save_locked(record)) {
        throw StateStoreError("could not persist record for agent " + name);
    }
    records_[name] = record;
    spdlog::info("Registered agent {} (type={})", name, type);
    return record;
}

bool JsonLifecycleStore::update_lifecycle(const std::string& name, Lifecycle lifecycle) {
    std::lock_guard<std::mutex> lock(mutex_);
    load_locked();

    auto it = records_.find(name);
    if (it == records_.end()) {
        spdlog::warn("No state record for agent {}", name);
        return false;
    }
    AgentRecord updated = it->second;
    updated.lifecycle = lifecycle;
    updated.last_active = ipc::iso_timestamp_now();
    if (!save_locked(updated)) {
        return false;
    }
    it->second = std::move(updated);
    spdlog::debug("Agent {} lifecycle -> {}", name, lifecycle_to_string(lifecycle));
    return true;
}

bool JsonLifecycleStore::record_activation(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    load_locked();

    auto it = records_.find(name);
    if (it == records_.end()) {
        return false;
    }
    AgentRecord updated = it->second;
    updated.activation_count++;
    if (!save_locked(updated)) {
        return false;
    }
    it->second = std::move(updated);
    return true;
}

bool JsonLifecycleStore::add_uptime(const std::string& name, double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    load_locked();

    auto it = records_.find(name);
    if (it == records_.end()) {
        return false;
    }
    AgentRecord updated = it->second;
    updated.total_uptime_seconds += seconds;
    if (!save_locked(updated)) {
        return false;
    }
    it->second = std::move(updated);
    return true;
}

std::vector<AgentRecord> JsonLifecycleStore::list(std::optional<Lifecycle> filter) {
    std::lock_guard<std::mutex> lock(mutex_);
    load_locked();

    std::vector<AgentRecord> result;
    for (const auto& [name, record] : records_) {
        if (!filter || record.lifecycle == *filter) {
            result.push_back(record);
        }
    }
    std::sort(result.begin(), result.end(),
        [](const AgentRecord& a, const AgentRecord& b) { return a.name < b.name; });
    return result;
}

std::optional<AgentRecord> JsonLifecycleStore::get(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    load_locked();

    auto it = records_.find(name);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool JsonLifecycleStore::remove(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    load_locked();

    std::error_code ec;
    fs::remove(path_for(name), ec);
    if (ec) {
        spdlog::error("Failed to remove state for agent {}: {}", name, ec.message());
        return false;
    }
    bool existed = records_.erase(name) > 0;
    if (existed) {
        spdlog::info("Removed state record for agent {}", name);
    }
    return existed;
}

} // namespace hive::kernel
