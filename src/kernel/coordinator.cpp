#include "kernel/coordinator.hpp"
#include "kernel/errors.hpp"
#include "kernel/name_generator.hpp"
#include "kernel/scheduler.hpp"
#include "ipc/mailbox_router.hpp"
#include "ipc/message.hpp"
#include "runtime/agent/supervisor.hpp"
#include "runtime/logs/log_tailer.hpp"
#include "runtime/sandbox/factory.hpp"
#include "services/brain/backend.hpp"
#include "services/brain/bridge.hpp"
#include "util/atomic_file.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <future>
#include <set>
#include <thread>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace hive::kernel {

namespace {
constexpr auto RUN_POLL_INTERVAL = std::chrono::milliseconds(100);
constexpr auto LOG_PUMP_INTERVAL = std::chrono::milliseconds(100);
}

json to_json(const AgentStatus& status) {
    json j = {
        {"name", status.name},
        {"type", status.type},
        {"lifecycle", lifecycle_to_string(status.lifecycle)},
        {"running", status.running},
        {"pid", status.pid},
        {"uptime", status.uptime_seconds},
        {"activation_count", status.activation_count},
    };
    if (status.process_state) {
        j["state"] = runtime::process_state_to_string(*status.process_state);
    }
    return j;
}

Coordinator::Coordinator(const Config& config)
    : Coordinator(config, Dependencies{}) {}

Coordinator::Coordinator(const Config& config, Dependencies deps)
    : config_(config)
{
    core::paths::Layout layout(config_.root_path);

    log_tailer_ = std::move(deps.log_tailer);
    sandbox_factory_ = std::move(deps.sandbox_factory);
    supervisor_ = std::move(deps.supervisor);
    router_ = std::move(deps.router);
    store_ = std::move(deps.store);
    name_generator_ = std::move(deps.name_generator);
    brain_backend_ = std::move(deps.brain_backend);
    brain_ = std::move(deps.brain);
    scheduler_ = std::move(deps.scheduler);

    if (!log_tailer_) {
        log_tailer_ = std::make_unique<runtime::logs::LogTailer>(
            layout, config_.agent_log_max_bytes, config_.agent_log_max_files);
    }
    if (!sandbox_factory_) {
        sandbox_factory_ = std::make_unique<runtime::SandboxFactory>(layout, config_);
    }
    if (!supervisor_) {
        supervisor_ = std::make_unique<runtime::ProcessSupervisor>(config_, *log_tailer_);
    }
    if (!router_) {
        router_ = std::make_unique<ipc::MessageRouter>(layout);
    }
    if (!store_) {
        store_ = std::make_unique<JsonLifecycleStore>(layout.states_dir());
    }
    if (!name_generator_) {
        name_generator_ = std::make_unique<AlphabeticalNameGenerator>();
    }
    if (!brain_backend_) {
        brain_backend_ = services::brain::make_backend(config_.brain);
    }
    if (!brain_) {
        brain_ = std::make_unique<services::brain::BrainBridge>(layout, *brain_backend_);
    }
    if (!scheduler_) {
        scheduler_ = std::make_unique<TaskScheduler>();
    }
}

Coordinator::~Coordinator() {
    scheduler_->shutdown();
    brain_->stop();
}

bool Coordinator::init() {
    if (initialized_) {
        return true;
    }
    spdlog::info("Initializing hive at {}", config_.root_path);

    core::paths::Layout layout(config_.root_path);
    std::error_code ec;
    for (const auto& dir : {layout.agents_dir(), layout.tools_dir(), layout.states_dir(),
                            layout.templates_dir()}) {
        fs::create_directories(dir, ec);
        if (ec) {
            spdlog::error("Cannot create {}: {}", dir, ec.message());
            return false;
        }
    }

    if (!log_tailer_->init()) {
        spdlog::error("Failed to initialize log tailer");
        return false;
    }

    supervisor_->set_exit_callback(
        [this](std::shared_ptr<const runtime::ProcessHandle> handle, const std::string&) {
            on_agent_exit(std::move(handle));
        });

    brain_->start();

    scheduler_->spawn_periodic("router", std::chrono::milliseconds(config_.route_interval_ms),
        [this]() { router_->route_once(); });
    scheduler_->spawn_periodic("monitor", std::chrono::milliseconds(config_.monitor_interval_ms),
        [this]() {
            // Exits during shutdown are expected, not crashes
            if (!shutting_down_) {
                supervisor_->monitor_once();
            }
        });
    scheduler_->spawn_periodic("log-pump", LOG_PUMP_INTERVAL,
        [this]() { log_tailer_->pump(); });
    scheduler_->spawn_periodic("brain", std::chrono::milliseconds(config_.brain.poll_interval_ms),
        [this]() { brain_->scan_once(); });

    initialized_ = true;
    running_ = true;
    spdlog::info("Hive initialized");
    spdlog::info("Sandboxing: {}", config_.enable_sandboxing ? "enabled" : "disabled");
    spdlog::info("Agent types: {}", config_.agent_types.size());
    return true;
}

void Coordinator::run() {
    spdlog::info("Hive running ({} agents)", supervisor_->tracked().size());

    while (running_) {
        std::this_thread::sleep_for(RUN_POLL_INTERVAL);
    }

    spdlog::info("Hive stop requested");
}

std::string Coordinator::allocate_name(const std::string& type) {
    std::set<std::string> taken;
    for (const auto& record : store_->list()) {
        taken.insert(record.name);
    }
    for (const auto& name : router_->list_agents()) {
        taken.insert(name);
    }
    return name_generator_->next_name(type, taken);
}

void Coordinator::launch(const std::string& name, const runtime::SandboxSpec& spec, const json& config) {
    json launch_config = {
        {"name", name},
        {"type", spec.type},
        {"config", config},
    };
    auto config_path = (fs::path(spec.control_dir) / "config.json").string();
    if (!util::write_file_atomic(config_path, launch_config.dump(2))) {
        throw ProcessLaunchError("cannot write launch config for agent " + name);
    }

    auto handle = supervisor_->start(name, spec);

    std::lock_guard<std::mutex> lock(agents_mutex_);
    agents_[name] = std::move(handle);
}

std::string Coordinator::create_agent(const std::optional<std::string>& name, const std::string& type,
                                      const json& config) {
    std::lock_guard<std::mutex> lifecycle_lock(lifecycle_mutex_);

    std::string agent_name = (name && !name->empty()) ? *name : allocate_name(type);
    if (!runtime::SandboxFactory::is_valid_agent_name(agent_name)) {
        throw ConfigurationError("invalid agent name '" + agent_name + "'");
    }
    if (handle_for(agent_name) || store_->get(agent_name)) {
        throw ConfigurationError("Agent with name '" + agent_name + "' already exists");
    }

    bool fresh = !sandbox_factory_->exists(agent_name);

    // Nothing is registered until provisioning succeeds
    auto spec = sandbox_factory_->provision(agent_name, type);

    try {
        store_->create(agent_name, type, config);
    } catch (const StateStoreError& e) {
        spdlog::error("Registration of agent {} failed: {}", agent_name, e.what());
        sandbox_factory_->release(agent_name, fresh);
        throw;
    }

    try {
        launch(agent_name, spec, config);
    } catch (const HiveError& e) {
        spdlog::error("Launch of agent {} failed, rolling back: {}", agent_name, e.what());
        store_->remove(agent_name);
        sandbox_factory_->release(agent_name, fresh);
        throw;
    }

    store_->record_activation(agent_name);
    spdlog::info("Created agent {} (type={})", agent_name, type);
    return agent_name;
}

void Coordinator::shutdown() {
    std::lock_guard<std::mutex> lifecycle_lock(lifecycle_mutex_);
    if (shut_down_) {
        return;
    }
    shut_down_ = true;
    shutting_down_ = true;

    std::vector<std::shared_ptr<const runtime::ProcessHandle>> handles;
    {
        std::lock_guard<std::mutex> lock(agents_mutex_);
        for (const auto& [name, handle] : agents_) {
            handles.push_back(handle);
        }
    }
    spdlog::info("Shutting down {} agents", handles.size());

    if (!handles.empty()) {
        for (const auto& handle : handles) {
            router_->deliver(handle->name(),
                ipc::make_shutdown_notice(handle->name(), "server shutdown", config_.shutdown_grace_ms));
        }

        // Let agents persist their state; stop waiting once all have exited
        auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(config_.shutdown_grace_ms);
        while (std::chrono::steady_clock::now() < deadline) {
            bool any_alive = false;
            for (const auto& handle : handles) {
                if (handle->alive()) {
                    any_alive = true;
                    break;
                }
            }
            if (!any_alive) {
                break;
            }
            std::this_thread::sleep_for(RUN_POLL_INTERVAL);
        }
    }

    brain_->freeze();

    // Escalations run concurrently so one stubborn agent does not delay the rest
    std::vector<std::future<bool>> stops;
    auto timeout = std::chrono::milliseconds(config_.escalation.cooperative_timeout_ms);
    for (const auto& handle : handles) {
        stops.push_back(std::async(std::launch::async, [this, handle, timeout]() {
            return supervisor_->shutdown(*handle, timeout);
        }));
    }
    for (size_t i = 0; i < stops.size(); i++) {
        if (!stops[i].get()) {
            spdlog::error("Agent {} did not stop cleanly", handles[i]->name());
        }
        store_->add_uptime(handles[i]->name(), handles[i]->uptime_seconds());
    }

    {
        std::lock_guard<std::mutex> lock(agents_mutex_);
        agents_.clear();
    }

    size_t sleeping = 0;
    for (const auto& record : store_->list(Lifecycle::ACTIVE)) {
        if (store_->update_lifecycle(record.name, Lifecycle::SLEEPING)) {
            sleeping++;
        }
    }

    scheduler_->shutdown();
    brain_->stop();
    spdlog::info("Hive stopped ({} agents sleeping)", sleeping);
}

size_t Coordinator::restore_sleeping() {
    std::lock_guard<std::mutex> lifecycle_lock(lifecycle_mutex_);

    auto sleeping = store_->list(Lifecycle::SLEEPING);
    if (sleeping.empty()) {
        return 0;
    }
    spdlog::info("Restoring {} sleeping agents", sleeping.size());

    size_t restored = 0;
    for (const auto& record : sleeping) {
        if (handle_for(record.name)) {
            continue;
        }
        try {
            auto spec = sandbox_factory_->provision(record.name, record.type);
            launch(record.name, spec, record.config);
        } catch (const HiveError& e) {
            spdlog::error("Failed to restore agent {}: {}", record.name, e.what());
            continue;
        }

        if (!store_->update_lifecycle(record.name, Lifecycle::ACTIVE)) {
            spdlog::warn("Agent {} restored but its record still says sleeping", record.name);
        }
        store_->record_activation(record.name);
        restored++;
        spdlog::info("Restored agent {}", record.name);
    }
    return restored;
}

bool Coordinator::terminate_agent(const std::string& name) {
    std::lock_guard<std::mutex> lifecycle_lock(lifecycle_mutex_);

    std::shared_ptr<const runtime::ProcessHandle> handle;
    {
        std::lock_guard<std::mutex> lock(agents_mutex_);
        auto it = agents_.find(name);
        if (it != agents_.end()) {
            handle = it->second;
        }
    }

    if (handle) {
        auto timeout = std::chrono::milliseconds(config_.escalation.term_grace_ms);
        if (!supervisor_->terminate(*handle, timeout)) {
            spdlog::error("Could not terminate agent {}", name);
            return false;
        }
        std::lock_guard<std::mutex> lock(agents_mutex_);
        agents_.erase(name);
    }

    bool had_record = store_->remove(name);
    bool had_directory = sandbox_factory_->exists(name);
    if (had_directory && !sandbox_factory_->release(name, true)) {
        return false;
    }

    if (!handle && !had_record && !had_directory) {
        spdlog::warn("No agent named {}", name);
        return false;
    }
    spdlog::info("Terminated agent {}", name);
    return true;
}

bool Coordinator::send_message(const std::string& to, const std::string& content, const std::string& type) {
    return router_->deliver(to, ipc::make_text(ipc::SYSTEM_SENDER, to, content, type));
}

bool Coordinator::send_command(const std::string& to, const std::string& command, const json& params) {
    if (!router_->deliver(to, ipc::make_command(ipc::SYSTEM_SENDER, to, command, params))) {
        return false;
    }
    spdlog::info("Sent command {} to {}", command, to);
    return true;
}

size_t Coordinator::broadcast_command(const std::string& command, const json& params) {
    auto message = ipc::make_command(ipc::SYSTEM_SENDER, ipc::BROADCAST_ADDRESS, command, params);
    size_t count = router_->broadcast(message);
    spdlog::info("Broadcast command {} to {} agents", command, count);
    return count;
}

std::vector<AgentStatus> Coordinator::list_agents() {
    std::vector<AgentStatus> rows;
    for (const auto& record : store_->list()) {
        AgentStatus status;
        status.name = record.name;
        status.type = record.type;
        status.lifecycle = record.lifecycle;
        status.activation_count = record.activation_count;

        if (auto handle = handle_for(record.name)) {
            status.running = handle->alive();
            status.pid = handle->pid();
            status.process_state = handle->state();
            status.uptime_seconds = handle->uptime_seconds();
        }
        rows.push_back(std::move(status));
    }
    return rows;
}

std::shared_ptr<const runtime::ProcessHandle> Coordinator::handle_for(const std::string& name) const {
    std::lock_guard<std::mutex> lock(agents_mutex_);
    auto it = agents_.find(name);
    return it == agents_.end() ? nullptr : it->second;
}

void Coordinator::on_agent_exit(std::shared_ptr<const runtime::ProcessHandle> handle) {
    store_->add_uptime(handle->name(), handle->uptime_seconds());

    std::lock_guard<std::mutex> lock(agents_mutex_);
    auto it = agents_.find(handle->name());
    if (it != agents_.end() && it->second->id() == handle->id()) {
        agents_.erase(it);
    }
}

} // namespace hive::kernel
