#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace hive::runtime {

// Immutable once assigned
struct AgentIdentity {
    std::string name;
    std::string type;
    std::chrono::system_clock::time_point created_at;
};

// Per-handle process state.
// STARTING -> RUNNING -> {SHUTTING_DOWN -> STOPPED} | {KILLING -> STOPPED} | CRASHED
enum class ProcessState {
    STARTING,
    RUNNING,
    SHUTTING_DOWN,
    KILLING,
    STOPPED,
    CRASHED
};

const char* process_state_to_string(ProcessState state);

inline bool is_terminal(ProcessState state) {
    return state == ProcessState::STOPPED || state == ProcessState::CRASHED;
}

} // namespace hive::runtime
