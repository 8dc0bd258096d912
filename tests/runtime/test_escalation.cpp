/// @file test_escalation.cpp
/// @brief Tests for the termination escalation table

#include <catch2/catch.hpp>

#include "runtime/agent/escalation.hpp"

#include <csignal>
#include <vector>

using namespace hive::runtime;
using namespace std::chrono_literals;

namespace {

// Exits after the cooperative step or `fatal_signal`, as configured
class FakeTarget : public TerminationTarget {
public:
    bool alive_ = true;
    bool cooperates = false;
    int fatal_signal = 0;
    bool deliverable = true;
    std::vector<std::string> actions;

    bool request_cooperative_exit() override {
        actions.push_back("cooperative");
        if (cooperates) {
            pending_exit_ = true;
        }
        return deliverable;
    }

    bool send_signal(int signal, SignalScope scope) override {
        actions.push_back("signal:" + std::to_string(signal) + ":" + std::to_string(static_cast<int>(scope)));
        if (signal == fatal_signal) {
            pending_exit_ = true;
        }
        return deliverable;
    }

    bool wait_for_exit(std::chrono::milliseconds) override {
        if (pending_exit_) {
            alive_ = false;
        }
        return !alive_;
    }

    bool alive() override { return alive_; }
    std::string describe() const override { return "fake"; }

private:
    bool pending_exit_ = false;
};

hive::kernel::EscalationConfig timings() {
    hive::kernel::EscalationConfig config;
    config.cooperative_timeout_ms = 100;
    config.term_grace_ms = 200;
    config.kill_grace_ms = 300;
    return config;
}

} // namespace

TEST_CASE("Escalation policies", "[runtime][escalation]") {
    SECTION("Graceful policy steps") {
        auto policy = graceful_policy(timings(), 100ms);
        REQUIRE(policy.size() == 3);
        REQUIRE(policy[0].action == EscalationAction::COOPERATIVE);
        REQUIRE(policy[1].signal == SIGTERM);
        REQUIRE(policy[1].scope == SignalScope::PROCESS);
        REQUIRE(policy[2].signal == SIGKILL);
        REQUIRE(policy[2].scope == SignalScope::GROUP_AND_DESCENDANTS);
        REQUIRE(budget(policy) == 600ms);
    }

    SECTION("Destructive policy skips the cooperative step") {
        auto policy = destructive_policy(timings(), 50ms);
        REQUIRE(policy.size() == 2);
        REQUIRE(policy[0].signal == SIGTERM);
        REQUIRE(policy[0].scope == SignalScope::GROUP);
        REQUIRE(policy[0].wait == 50ms);
        REQUIRE(budget(policy) == 350ms);
    }
}

TEST_CASE("escalate() walks the table", "[runtime][escalation]") {
    auto policy = graceful_policy(timings(), 100ms);
    FakeTarget target;

    SECTION("Cooperative exit stops early") {
        target.cooperates = true;
        auto outcome = escalate(target, policy);
        REQUIRE(outcome.exited);
        REQUIRE(outcome.final_step == "cooperative");
        REQUIRE(outcome.steps_taken == 1);
        REQUIRE(target.actions.size() == 1);
    }

    SECTION("SIGTERM ends it") {
        target.fatal_signal = SIGTERM;
        auto outcome = escalate(target, policy);
        REQUIRE(outcome.exited);
        REQUIRE(outcome.final_step == "terminate");
        REQUIRE(outcome.steps_taken == 2);
    }

    SECTION("Only SIGKILL works") {
        target.fatal_signal = SIGKILL;
        auto outcome = escalate(target, policy);
        REQUIRE(outcome.exited);
        REQUIRE(outcome.final_step == "kill");
        REQUIRE(target.actions.back() ==
                "signal:" + std::to_string(SIGKILL) + ":" +
                std::to_string(static_cast<int>(SignalScope::GROUP_AND_DESCENDANTS)));
    }

    SECTION("Survivor is reported") {
        auto outcome = escalate(target, policy);
        REQUIRE_FALSE(outcome.exited);
        REQUIRE(outcome.steps_taken == 3);
    }

    SECTION("Already dead target is not touched") {
        target.alive_ = false;
        auto outcome = escalate(target, policy);
        REQUIRE(outcome.exited);
        REQUIRE(outcome.final_step == "none");
        REQUIRE(target.actions.empty());
    }

    SECTION("Undeliverable step on a vanished target counts as exited") {
        target.deliverable = false;
        auto outcome = escalate(target, policy);
        REQUIRE_FALSE(outcome.exited);

        // Dies between the liveness check and the first step
        struct Vanishing : FakeTarget {
            bool checked = false;
            bool alive() override {
                if (checked) return false;
                checked = true;
                return true;
            }
        } vanishing;
        vanishing.deliverable = false;
        auto vanished = escalate(vanishing, policy);
        REQUIRE(vanished.exited);
        REQUIRE(vanished.final_step == "cooperative");
    }
}
