#include "services/brain/backend.hpp"
#include "services/brain/http_backend.hpp"
#include "services/brain/subprocess_backend.hpp"
#include <spdlog/spdlog.h>

namespace hive::services::brain {

BrainResponse UnconfiguredBrainBackend::complete(const std::string&) {
    return {false, "", "no brain backend configured"};
}

std::unique_ptr<BrainBackend> make_backend(const kernel::BrainConfig& config) {
    if (!config.command.empty()) {
        spdlog::info("Brain backend: subprocess '{}'", config.command.front());
        return std::make_unique<SubprocessBrainBackend>(config.command, config.timeout_seconds);
    }
    if (!config.endpoint.empty()) {
        spdlog::info("Brain backend: {}", config.endpoint);
        return std::make_unique<HttpBrainBackend>(config);
    }
    spdlog::warn("No brain backend configured; brain requests will fail");
    return std::make_unique<UnconfiguredBrainBackend>();
}

} // namespace hive::services::brain
