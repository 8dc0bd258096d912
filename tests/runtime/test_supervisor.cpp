/// @file test_supervisor.cpp
/// @brief Tests for launching, monitoring and stopping agent processes

#include <catch2/catch.hpp>

#include "kernel/errors.hpp"
#include "runtime/agent/process_scan.hpp"
#include "runtime/agent/supervisor.hpp"
#include "runtime/logs/log_tailer.hpp"
#include "runtime/sandbox/factory.hpp"
#include "test_helpers.hpp"

#include <signal.h>
#include <unistd.h>
#include <atomic>

using namespace hive;
using namespace hive::runtime;
using namespace std::chrono_literals;

namespace {

struct Harness {
    test::TempDir tmp;
    kernel::CoordinatorConfig config;
    core::paths::Layout layout;
    logs::LogTailer tailer;
    SandboxFactory factory;
    ProcessSupervisor supervisor;

    explicit Harness(const std::string& script)
        : config(test::shell_config(tmp.str(), script))
        , layout(tmp.str())
        , tailer(layout, config.agent_log_max_bytes, config.agent_log_max_files)
        , factory(layout, config)
        , supervisor(config, tailer) {
        tailer.init();
    }

    std::shared_ptr<const ProcessHandle> start(const std::string& name) {
        return supervisor.start(name, factory.provision(name, "general"));
    }
};

// Accepts every request and never sees the process leave
class UnyieldingTarget : public TerminationTarget {
public:
    bool request_cooperative_exit() override { return true; }
    bool send_signal(int, SignalScope) override { return true; }
    bool wait_for_exit(std::chrono::milliseconds) override { return false; }
    bool alive() override { return true; }
    std::string describe() const override { return "unyielding target"; }
};

} // namespace

TEST_CASE("ProcessSupervisor cooperative shutdown", "[runtime][supervisor]") {
    Harness h(test::COOPERATIVE_AGENT);
    auto handle = h.start("alice");

    REQUIRE(handle->state() == ProcessState::RUNNING);
    REQUIRE(h.supervisor.is_alive(*handle));
    REQUIRE(h.supervisor.find("alice") == handle);
    REQUIRE(handle->pgid() == getpgid(handle->pid()));

    auto started = std::chrono::steady_clock::now();
    REQUIRE(h.supervisor.shutdown(*handle, 3000ms));
    auto elapsed = std::chrono::steady_clock::now() - started;

    // Left on its own, well before SIGTERM would have been sent
    REQUIRE(elapsed < 3000ms);
    REQUIRE(handle->state() == ProcessState::STOPPED);
    REQUIRE(handle->exit_code() == 0);
    REQUIRE_FALSE(h.supervisor.is_alive(*handle));
    REQUIRE(h.supervisor.tracked().empty());

    // A second stop is a no-op
    REQUIRE(h.supervisor.shutdown(*handle, 100ms));
}

TEST_CASE("ProcessSupervisor escalates past an agent ignoring SIGTERM", "[runtime][supervisor]") {
    Harness h(test::STUBBORN_AGENT);
    auto handle = h.start("bob");

    auto policy = graceful_policy(h.config.escalation, 200ms);
    auto started = std::chrono::steady_clock::now();
    REQUIRE(h.supervisor.shutdown(*handle, 200ms));
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(elapsed < budget(policy) + 1000ms);
    REQUIRE(handle->state() == ProcessState::STOPPED);
    REQUIRE(handle->exit_code() == 128 + SIGKILL);
    REQUIRE_FALSE(h.supervisor.is_alive(*handle));
}

TEST_CASE("ProcessSupervisor terminate skips the cooperative step", "[runtime][supervisor]") {
    Harness h(test::COOPERATIVE_AGENT);
    auto handle = h.start("carol");

    REQUIRE(h.supervisor.terminate(*handle, 1000ms));
    REQUIRE(handle->state() == ProcessState::STOPPED);
    REQUIRE(handle->exit_code() == 128 + SIGTERM);
    REQUIRE_FALSE(std::filesystem::exists(handle->sentinel_path()));
}

TEST_CASE("ProcessSupervisor terminate brings down an agent ignoring SIGTERM", "[runtime][supervisor]") {
    Harness h(test::STUBBORN_AGENT);
    auto handle = h.start("frank");

    auto policy = destructive_policy(h.config.escalation, 200ms);
    auto started = std::chrono::steady_clock::now();
    REQUIRE(h.supervisor.terminate(*handle, 200ms));
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(elapsed < budget(policy) + 1000ms);
    REQUIRE_FALSE(h.supervisor.is_alive(*handle));
    REQUIRE(handle->exit_code() == 128 + SIGKILL);
    REQUIRE(h.supervisor.tracked().empty());
}

TEST_CASE("ProcessSupervisor kills helpers that left the process group", "[runtime][supervisor]") {
    // The helper starts its own session, so only its environment ties it to the agent
    Harness h("setsid /bin/sh -c \"trap '' TERM; while true; do sleep 0.05; done\" & "
              "trap '' TERM; while true; do sleep 0.05; done");
    auto handle = h.start("grace");

    REQUIRE(test::wait_until([&]() {
        for (pid_t pid : proc::find_by_signature(AGENT_NAME_ENV, "grace")) {
            pid_t pgid = getpgid(pid);
            if (pid != handle->pid() && pgid > 0 && pgid != handle->pgid()) {
                return true;
            }
        }
        return false;
    }));

    REQUIRE(h.supervisor.terminate(*handle, 200ms));
    REQUIRE_FALSE(h.supervisor.is_alive(*handle));
    REQUIRE(test::wait_until([]() {
        return proc::find_by_signature(AGENT_NAME_ENV, "grace").empty();
    }));
}

TEST_CASE("ProcessSupervisor reaps an agent that outlived its stop", "[runtime][supervisor]") {
    Harness h(test::COOPERATIVE_AGENT);
    h.supervisor.set_target_factory([](const ProcessHandle&) {
        return std::make_unique<UnyieldingTarget>();
    });

    std::atomic<int> callbacks{0};
    h.supervisor.set_exit_callback(
        [&](std::shared_ptr<const ProcessHandle>, const std::string&) { callbacks++; });

    auto handle = h.start("henry");
    REQUIRE_FALSE(h.supervisor.terminate(*handle, 50ms));
    REQUIRE(handle->state() == ProcessState::KILLING);
    REQUIRE(h.supervisor.tracked().size() == 1);

    // Still running: the monitor leaves it alone
    REQUIRE(h.supervisor.monitor_once() == 0);
    REQUIRE(h.supervisor.tracked().size() == 1);

    REQUIRE(kill(handle->pid(), SIGKILL) == 0);
    size_t crashed = 0;
    REQUIRE(test::wait_until([&]() {
        crashed += h.supervisor.monitor_once();
        return h.supervisor.tracked().empty();
    }));

    // Exited after a stop request, so not a crash
    REQUIRE(crashed == 0);

    REQUIRE(handle->state() == ProcessState::STOPPED);
    REQUIRE(handle->exit_code() == 128 + SIGKILL);
    REQUIRE(callbacks == 1);
    REQUIRE_FALSE(h.tailer.watching(handle->id()));
}

TEST_CASE("ProcessSupervisor monitor detects unexpected exits", "[runtime][supervisor]") {
    Harness h("echo hello from agent; echo something broke >&2; exit 3");

    std::atomic<int> callbacks{0};
    std::string tail;
    h.supervisor.set_exit_callback(
        [&](std::shared_ptr<const ProcessHandle>, const std::string& stderr_tail) {
            tail = stderr_tail;
            callbacks++;
        });

    auto handle = h.start("dave");

    size_t crashed = 0;
    REQUIRE(test::wait_until([&]() {
        h.tailer.pump();
        crashed += h.supervisor.monitor_once();
        return crashed > 0;
    }));

    REQUIRE(crashed == 1);
    REQUIRE(callbacks == 1);
    REQUIRE(handle->state() == ProcessState::CRASHED);
    REQUIRE(handle->exit_code() == 3);
    REQUIRE(tail.find("something broke") != std::string::npos);
    REQUIRE(h.supervisor.tracked().empty());

    // Reported once only
    REQUIRE(h.supervisor.monitor_once() == 0);

    SECTION("Output lands in the agent log") {
        auto log = util::read_file(h.layout.agent_logs_dir("dave") + "/current.log");
        REQUIRE(log);
        REQUIRE(log->find("hello from agent") != std::string::npos);
        REQUIRE(log->find("[stderr] something broke") != std::string::npos);
    }
}

TEST_CASE("ProcessSupervisor exec failure", "[runtime][supervisor]") {
    Harness h("true");
    auto spec = h.factory.provision("eve", "general");
    spec.interpreter = (h.tmp.path() / "not-a-binary").string();

    REQUIRE_THROWS_AS(h.supervisor.start("eve", spec), ProcessLaunchError);
    REQUIRE(h.supervisor.tracked().empty());
}
