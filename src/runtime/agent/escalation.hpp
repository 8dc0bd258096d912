/**
 * Termination escalation
 *
 * A termination is a table of steps tried in order until the target is
 * gone: ask cooperatively, then SIGTERM, then SIGKILL everything the agent
 * spawned. The steps act on a TerminationTarget so the same table drives
 * real processes and test doubles.
 */
#pragma once
#include <chrono>
#include <string>
#include <vector>
#include "kernel/config.hpp"

namespace hive::runtime {

enum class EscalationAction {
    COOPERATIVE,  // drop the shutdown sentinel
    SIGNAL
};

enum class SignalScope {
    PROCESS,                // the primary pid
    GROUP,                  // its process group
    GROUP_AND_DESCENDANTS   // group, /proc descendants and signature matches
};

struct EscalationStep {
    std::string name;
    EscalationAction action = EscalationAction::SIGNAL;
    int signal = 0;
    SignalScope scope = SignalScope::PROCESS;
    std::chrono::milliseconds wait{0};
};

using EscalationPolicy = std::vector<EscalationStep>;

// Cooperative -> SIGTERM -> SIGKILL(group + descendants)
EscalationPolicy graceful_policy(const kernel::EscalationConfig& config,
                                 std::chrono::milliseconds cooperative_timeout);

// SIGTERM(group) -> SIGKILL(group + descendants)
EscalationPolicy destructive_policy(const kernel::EscalationConfig& config,
                                    std::chrono::milliseconds term_timeout);

// Worst-case wall time of a policy
std::chrono::milliseconds budget(const EscalationPolicy& policy);

class TerminationTarget {
public:
    virtual ~TerminationTarget() = default;

    virtual bool request_cooperative_exit() = 0;
    virtual bool send_signal(int signal, SignalScope scope) = 0;

    // True if the target exited within `timeout`
    virtual bool wait_for_exit(std::chrono::milliseconds timeout) = 0;

    virtual bool alive() = 0;
    virtual std::string describe() const = 0;
};

struct EscalationOutcome {
    bool exited = false;
    std::string final_step;     // step after which the target was gone
    size_t steps_taken = 0;
    std::chrono::milliseconds elapsed{0};
};

EscalationOutcome escalate(TerminationTarget& target, const EscalationPolicy& policy);

} // namespace hive::runtime
