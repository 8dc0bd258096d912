#pragma once
#include <memory>
#include <string>
#include "kernel/config.hpp"

namespace hive::services::brain {

struct BrainResponse {
    bool success = false;
    std::string content;
    std::string error;
};

// Answers one opaque request payload. Called from a single worker thread.
class BrainBackend {
public:
    virtual ~BrainBackend() = default;

    virtual BrainResponse complete(const std::string& payload) = 0;
    virtual bool is_configured() const = 0;
    virtual std::string describe() const = 0;
};

// Answers every request with an error
class UnconfiguredBrainBackend : public BrainBackend {
public:
    BrainResponse complete(const std::string& payload) override;
    bool is_configured() const override { return false; }
    std::string describe() const override { return "none"; }
};

// Subprocess if a command is configured, else HTTP if an endpoint is, else none
std::unique_ptr<BrainBackend> make_backend(const kernel::BrainConfig& config);

} // namespace hive::services::brain
