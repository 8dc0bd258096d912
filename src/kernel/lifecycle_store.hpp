/**
 * Agent lifecycle store
 *
 * Durable registry of which agents exist and whether they should be running.
 * Independent of any live process: a SLEEPING agent has a record and a
 * directory but no process.
 */
#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace hive::kernel {

enum class Lifecycle {
    ACTIVE,
    HIBERNATING,
    SLEEPING
};

const char* lifecycle_to_string(Lifecycle lifecycle);
std::optional<Lifecycle> lifecycle_from_string(const std::string& value);

struct AgentRecord {
    std::string name;
    std::string type;
    std::string created_at;
    std::string last_active;
    Lifecycle lifecycle = Lifecycle::ACTIVE;
    nlohmann::json config = nlohmann::json::object();
    uint32_t activation_count = 0;
    double total_uptime_seconds = 0.0;
};

nlohmann::json to_json(const AgentRecord& record);
std::optional<AgentRecord> record_from_json(const nlohmann::json& j);

class LifecycleStore {
public:
    virtual ~LifecycleStore() = default;

    // Register a new ACTIVE agent. Throws StateStoreError if it cannot persist.
    virtual AgentRecord create(const std::string& name, const std::string& type,
                               const nlohmann::json& config) = 0;

    virtual bool update_lifecycle(const std::string& name, Lifecycle lifecycle) = 0;
    virtual bool record_activation(const std::string& name) = 0;
    virtual bool add_uptime(const std::string& name, double seconds) = 0;

    virtual std::vector<AgentRecord> list(std::optional<Lifecycle> filter = std::nullopt) = 0;
    virtual std::optional<AgentRecord> get(const std::string& name) = 0;
    virtual bool remove(const std::string& name) = 0;
};

// One <states_dir>/<name>.json per agent, each written atomically
class JsonLifecycleStore : public LifecycleStore {
public:
    explicit JsonLifecycleStore(std::string states_dir);

    AgentRecord create(const std::string& name, const std::string& type,
                       const nlohmann::json& config) override;
    bool update_lifecycle(const std::string& name, Lifecycle lifecycle) override;
    bool record_activation(const std::string& name) override;
    bool add_uptime(const std::string& name, double seconds) override;
    std::vector<AgentRecord> list(std::optional<Lifecycle> filter = std::nullopt) override;
    std::optional<AgentRecord> get(const std::string& name) override;
    bool remove(const std::string& name) override;

private:
    std::string states_dir_;
    std::mutex mutex_;
    bool loaded_ = false;
    std::unordered_map<std::string, AgentRecord> records_;

    void load_locked();
    bool save_locked(const AgentRecord& record);
    std::string path_for(const std::string& name) const;
};

} // namespace hive::kernel
