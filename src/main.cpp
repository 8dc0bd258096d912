#include <spdlog/spdlog.h>
#include <atomic>
#include <csignal>
#include "kernel/config.hpp"
#include "kernel/coordinator.hpp"
#include "kernel/errors.hpp"
#include "util/logger.hpp"

// Global coordinator pointer for signal handling
static std::atomic<hive::kernel::Coordinator*> g_coordinator{nullptr};

static void signal_handler(int) {
    if (auto* coordinator = g_coordinator.load()) {
        coordinator->request_stop();
    }
}

static void usage(const char* argv0) {
    spdlog::info("usage: {} [config.json]", argv0);
    spdlog::info("environment: HIVE_ROOT, HIVE_LOG_LEVEL, HIVE_SANDBOX=0|1");
}

int main(int argc, char** argv) {
    hive::util::init_logger();

    if (argc > 2 || (argc == 2 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help"))) {
        usage(argv[0]);
        return argc > 2 ? 2 : 0;
    }

    hive::kernel::CoordinatorConfig config;
    try {
        if (argc == 2) {
            config = hive::kernel::load_config_file(argv[1]);
        }
        hive::kernel::apply_env_overrides(config);
    } catch (const hive::ConfigurationError& e) {
        spdlog::error("Configuration error: {}", e.what());
        return 2;
    }
    hive::util::set_log_level(config.log_level);

    spdlog::info("=================================");
    spdlog::info("  hived v0.1.0");
    spdlog::info("  root: {}", config.root_path);
    spdlog::info("=================================");

    // Writes to a dead brain subprocess must fail, not kill us
    signal(SIGPIPE, SIG_IGN);

    hive::kernel::Coordinator coordinator(config);
    if (!coordinator.init()) {
        spdlog::error("Failed to initialize hive");
        return 1;
    }

    g_coordinator = &coordinator;
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    size_t restored = coordinator.restore_sleeping();
    spdlog::info("Restored {} agents", restored);

    for (const auto& agent : config.initial_agents) {
        if (!agent.name.empty() && coordinator.store().get(agent.name)) {
            continue;
        }
        try {
            auto name = coordinator.create_agent(
                agent.name.empty() ? std::nullopt : std::optional<std::string>(agent.name),
                agent.type, agent.config);
            spdlog::info("Started initial agent {}", name);
        } catch (const hive::ConfigurationError& e) {
            spdlog::error("Cannot create agent {}: {}", agent.name, e.what());
            coordinator.shutdown();
            g_coordinator = nullptr;
            return 2;
        } catch (const hive::HiveError& e) {
            spdlog::error("Failed to start agent {}: {}", agent.name, e.what());
        }
    }

    for (const auto& status : coordinator.list_agents()) {
        spdlog::info("  {}", hive::kernel::to_json(status).dump());
    }

    // Blocks until SIGINT/SIGTERM
    coordinator.run();

    coordinator.shutdown();
    g_coordinator = nullptr;
    return 0;
}
