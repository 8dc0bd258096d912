#include "runtime/agent/escalation.hpp"
#include <spdlog/spdlog.h>
#include <csignal>

namespace hive::runtime {

EscalationPolicy graceful_policy(const kernel::EscalationConfig& config,
                                 std::chrono::milliseconds cooperative_timeout) {
    return {
        {"cooperative", EscalationAction::COOPERATIVE, 0, SignalScope::PROCESS, cooperative_timeout},
        {"terminate", EscalationAction::SIGNAL, SIGTERM, SignalScope::PROCESS,
            std::chrono::milliseconds(config.term_grace_ms)},
        {"kill", EscalationAction::SIGNAL, SIGKILL, SignalScope::GROUP_AND_DESCENDANTS,
            std::chrono::milliseconds(config.kill_grace_ms)},
    };
}

EscalationPolicy destructive_policy(const kernel::EscalationConfig& config,
                                    std::chrono::milliseconds term_timeout) {
    return {
        {"terminate", EscalationAction::SIGNAL, SIGTERM, SignalScope::GROUP, term_timeout},
        {"kill", EscalationAction::SIGNAL, SIGKILL, SignalScope::GROUP_AND_DESCENDANTS,
            std::chrono::milliseconds(config.kill_grace_ms)},
    };
}

std::chrono::milliseconds budget(const EscalationPolicy& policy) {
    std::chrono::milliseconds total{0};
    for (const auto& step : policy) {
        total += step.wait;
    }
    return total;
}

EscalationOutcome escalate(TerminationTarget& target, const EscalationPolicy& policy) {
    EscalationOutcome outcome;
    auto start = std::chrono::steady_clock::now();
    auto finish = [&](bool exited, const std::string& step) {
        outcome.exited = exited;
        outcome.final_step = step;
        outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        return outcome;
    };

    if (!target.alive()) {
        return finish(true, "none");
    }

    for (const auto& step : policy) {
        outcome.steps_taken++;

        bool sent = false;
        if (step.action == EscalationAction::COOPERATIVE) {
            spdlog::info("Requesting {} to exit", target.describe());
            sent = target.request_cooperative_exit();
        } else {
            spdlog::info("Sending signal {} to {} ({})", step.signal, target.describe(), step.name);
            sent = target.send_signal(step.signal, step.scope);
        }

        if (!sent) {
            // Nothing to signal means nothing left alive
            if (!target.alive()) {
                return finish(true, step.name);
            }
            spdlog::warn("Step '{}' could not be delivered to {}", step.name, target.describe());
            continue;
        }

        if (target.wait_for_exit(step.wait)) {
            spdlog::info("{} exited after '{}'", target.describe(), step.name);
            return finish(true, step.name);
        }
    }

    spdlog::error("{} still alive after escalation", target.describe());
    return finish(!target.alive(), policy.empty() ? "none" : policy.back().name);
}

} // namespace hive::runtime
