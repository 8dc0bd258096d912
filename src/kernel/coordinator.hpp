/**
 * Hive Coordinator
 *
 * Top-level orchestration:
 * - SandboxFactory (agent directory tree + isolation spec)
 * - ProcessSupervisor (launch, monitor, escalate)
 * - MessageRouter (outbox -> inbox delivery)
 * - LifecycleStore (which agents exist, which should run)
 * - BrainBridge (agent <-> brain backend file exchange)
 * Background loops run on a TaskScheduler.
 */
#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "kernel/config.hpp"
#include "kernel/lifecycle_store.hpp"
#include "runtime/agent/types.hpp"

namespace hive::ipc {
class MessageRouter;
} // namespace hive::ipc

namespace hive::runtime {
class ProcessHandle;
class ProcessSupervisor;
class SandboxFactory;
struct SandboxSpec;
namespace logs {
class LogTailer;
} // namespace logs
} // namespace hive::runtime

namespace hive::services::brain {
class BrainBackend;
class BrainBridge;
} // namespace hive::services::brain

namespace hive::kernel {

class NameGenerator;
class TaskScheduler;

// One row of list_agents()
struct AgentStatus {
    std::string name;
    std::string type;
    Lifecycle lifecycle = Lifecycle::SLEEPING;
    bool running = false;
    int pid = -1;
    std::optional<runtime::ProcessState> process_state;
    double uptime_seconds = 0.0;
    uint32_t activation_count = 0;
};

nlohmann::json to_json(const AgentStatus& status);

class Coordinator {
public:
    using Config = CoordinatorConfig;

    // Anything left null is built from the config.
    // Declaration order is teardown order in reverse.
    struct Dependencies {
        std::unique_ptr<runtime::logs::LogTailer> log_tailer;
        std::unique_ptr<runtime::SandboxFactory> sandbox_factory;
        std::unique_ptr<runtime::ProcessSupervisor> supervisor;
        std::unique_ptr<ipc::MessageRouter> router;
        std::unique_ptr<LifecycleStore> store;
        std::unique_ptr<NameGenerator> name_generator;
        std::unique_ptr<services::brain::BrainBackend> brain_backend;
        std::unique_ptr<services::brain::BrainBridge> brain;
        std::unique_ptr<TaskScheduler> scheduler;
    };

    explicit Coordinator(const Config& config);
    Coordinator(const Config& config, Dependencies deps);
    ~Coordinator();

    // Non-copyable
    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    // Prepare the root and start the background loops
    bool init();

    // Block until request_stop(). A stop requested before run() is honoured.
    void run();

    // Async-signal-safe
    void request_stop() { running_ = false; }
    bool is_running() const { return running_; }

    // Provision, register ACTIVE, start. Returns the agent's name.
    // Throws ConfigurationError, StateStoreError or ProcessLaunchError;
    // on failure nothing stays registered.
    std::string create_agent(const std::optional<std::string>& name, const std::string& type,
                             const nlohmann::json& config = nlohmann::json::object());

    // Notify, wait, stop every agent, mark them SLEEPING
    void shutdown();

    // Re-launch every SLEEPING agent; returns how many came back
    size_t restore_sleeping();

    // Kill the agent and delete its record and directory
    bool terminate_agent(const std::string& name);

    bool send_message(const std::string& to, const std::string& content,
                      const std::string& type = "text");
    bool send_command(const std::string& to, const std::string& command,
                      const nlohmann::json& params = nlohmann::json::object());
    size_t broadcast_command(const std::string& command,
                             const nlohmann::json& params = nlohmann::json::object());

    std::vector<AgentStatus> list_agents();

    std::shared_ptr<const runtime::ProcessHandle> handle_for(const std::string& name) const;

    const Config& config() const { return config_; }
    ipc::MessageRouter& router() { return *router_; }
    runtime::ProcessSupervisor& supervisor() { return *supervisor_; }
    runtime::SandboxFactory& sandboxes() { return *sandbox_factory_; }
    LifecycleStore& store() { return *store_; }
    services::brain::BrainBridge& brain() { return *brain_; }

private:
    Config config_;
    std::atomic<bool> running_{false};
    std::atomic<bool> shutting_down_{false};
    bool initialized_ = false;
    bool shut_down_ = false;

    std::unique_ptr<runtime::logs::LogTailer> log_tailer_;
    std::unique_ptr<runtime::SandboxFactory> sandbox_factory_;
    std::unique_ptr<runtime::ProcessSupervisor> supervisor_;
    std::unique_ptr<ipc::MessageRouter> router_;
    std::unique_ptr<LifecycleStore> store_;
    std::unique_ptr<NameGenerator> name_generator_;
    std::unique_ptr<services::brain::BrainBackend> brain_backend_;
    std::unique_ptr<services::brain::BrainBridge> brain_;
    std::unique_ptr<TaskScheduler> scheduler_;

    // Serializes create / restore / terminate / shutdown
    std::mutex lifecycle_mutex_;

    mutable std::mutex agents_mutex_;
    std::unordered_map<std::string, std::shared_ptr<const runtime::ProcessHandle>> agents_;

    void launch(const std::string& name, const runtime::SandboxSpec& spec, const nlohmann::json& config);
    void on_agent_exit(std::shared_ptr<const runtime::ProcessHandle> handle);
    std::string allocate_name(const std::string& type);
};

} // namespace hive::kernel
