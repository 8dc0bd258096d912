/// @file test_brain_bridge.cpp
/// @brief Tests for the brain request bridge and its backends

#include <catch2/catch.hpp>

#include "services/brain/backend.hpp"
#include "services/brain/bridge.hpp"
#include "services/brain/http_backend.hpp"
#include "services/brain/subprocess_backend.hpp"
#include "test_helpers.hpp"

#include <filesystem>
#include <mutex>
#include <set>

using namespace hive;
using namespace hive::services::brain;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

// Echoes the payload back and remembers the order it saw requests in
class EchoBackend : public BrainBackend {
public:
    BrainResponse complete(const std::string& payload) override {
        std::lock_guard<std::mutex> lock(mutex_);
        seen_.push_back(payload);
        return {true, "echo:" + payload, ""};
    }
    bool is_configured() const override { return true; }
    std::string describe() const override { return "echo"; }

    std::vector<std::string> seen_copy() {
        std::lock_guard<std::mutex> lock(mutex_);
        return seen_;
    }

private:
    std::mutex mutex_;
    std::vector<std::string> seen_;
};

void make_request(const core::paths::Layout& layout, const std::string& agent,
                  const std::string& rid, const std::string& payload) {
    test::write_file(layout.brain_dir(agent) + "/" + rid + REQUEST_SUFFIX, payload);
}

std::string agent_of(const std::string& payload) {
    return payload.substr(0, payload.find(':'));
}

} // namespace

TEST_CASE("BrainBridge request exchange", "[services][brain]") {
    test::TempDir tmp;
    core::paths::Layout layout(tmp.str());
    EchoBackend backend;
    BrainBridge bridge(layout, backend);

    SECTION("Request is claimed, answered and cleaned up") {
        make_request(layout, "Alice", "r1", "Alice:think");

        REQUIRE(bridge.scan_once() == 1);
        REQUIRE(fs::exists(layout.brain_dir("Alice") + "/r1.pending"));
        REQUIRE_FALSE(fs::exists(layout.brain_dir("Alice") + "/r1.request"));
        REQUIRE(bridge.pending() == 1);

        // Already claimed
        REQUIRE(bridge.scan_once() == 0);

        REQUIRE(bridge.process_all() == 1);
        REQUIRE(bridge.pending() == 0);
        REQUIRE_FALSE(fs::exists(layout.brain_dir("Alice") + "/r1.pending"));

        auto response = json::parse(*util::read_file(layout.brain_dir("Alice") + "/r1.response"));
        REQUIRE(response["success"] == true);
        REQUIRE(response["content"] == "echo:Alice:think");
        REQUIRE(response["error"] == "");
    }

    SECTION("Agents are served round-robin") {
        make_request(layout, "Alice", "a1", "Alice:1");
        make_request(layout, "Alice", "a2", "Alice:2");
        make_request(layout, "Alice", "a3", "Alice:3");
        make_request(layout, "Bob", "b1", "Bob:1");

        REQUIRE(bridge.scan_once() == 4);
        REQUIRE(bridge.process_all() == 4);

        auto seen = backend.seen_copy();
        REQUIRE(seen.size() == 4);
        // Bob does not wait behind all of Alice's requests
        std::set<std::string> first_two = {agent_of(seen[0]), agent_of(seen[1])};
        REQUIRE(first_two == std::set<std::string>{"Alice", "Bob"});
    }

    SECTION("Freeze returns queued requests") {
        make_request(layout, "Alice", "r1", "Alice:later");
        REQUIRE(bridge.scan_once() == 1);

        bridge.freeze();
        REQUIRE(bridge.frozen());
        REQUIRE(bridge.pending() == 0);
        REQUIRE(fs::exists(layout.brain_dir("Alice") + "/r1.request"));
        REQUIRE(bridge.scan_once() == 0);
        REQUIRE(bridge.process_all() == 0);
        REQUIRE(backend.seen_copy().empty());
    }

    SECTION("Pending files left by an earlier run are adopted") {
        test::write_file(layout.brain_dir("Alice") + "/old.pending", "Alice:orphan");
        REQUIRE(bridge.scan_once() == 1);
        REQUIRE(bridge.process_all() == 1);
        REQUIRE(fs::exists(layout.brain_dir("Alice") + "/old.response"));
    }

    SECTION("Unrelated files are ignored") {
        test::write_file(layout.brain_dir("Alice") + "/r9.response", "{}");
        test::write_file(layout.brain_dir("Alice") + "/.r8.request.tmp", "x");
        REQUIRE(bridge.scan_once() == 0);
    }
}

TEST_CASE("BrainBridge worker thread", "[services][brain]") {
    test::TempDir tmp;
    core::paths::Layout layout(tmp.str());
    EchoBackend backend;
    BrainBridge bridge(layout, backend);
    bridge.start();

    make_request(layout, "Carol", "w1", "Carol:async");
    REQUIRE(test::wait_until([&]() {
        bridge.scan_once();
        return fs::exists(layout.brain_dir("Carol") + "/w1.response");
    }));

    bridge.stop();
    REQUIRE(bridge.scan_once() == 0);
}

TEST_CASE("Brain backends", "[services][brain]") {
    SECTION("Endpoint parsing") {
        std::string base;
        std::string path;
        REQUIRE(HttpBrainBackend::split_endpoint("https://brain.local:8443/v1/complete", base, path));
        REQUIRE(base == "https://brain.local:8443");
        REQUIRE(path == "/v1/complete");

        REQUIRE(HttpBrainBackend::split_endpoint("http://localhost", base, path));
        REQUIRE(base == "http://localhost");
        REQUIRE(path == "/");

        REQUIRE_FALSE(HttpBrainBackend::split_endpoint("localhost:8080/x", base, path));
        REQUIRE_FALSE(HttpBrainBackend::split_endpoint("ftp://host/x", base, path));
        REQUIRE_FALSE(HttpBrainBackend::split_endpoint("http:///x", base, path));
    }

    SECTION("Backend selection") {
        kernel::BrainConfig config;
        auto none = make_backend(config);
        REQUIRE_FALSE(none->is_configured());
        REQUIRE_FALSE(none->complete("{}").success);

        config.endpoint = "http://127.0.0.1:9/complete";
        REQUIRE(make_backend(config)->describe() == "http://127.0.0.1:9/complete");

        config.command = {"/bin/cat"};
        REQUIRE(make_backend(config)->describe() == "subprocess /bin/cat");
    }

    SECTION("Subprocess backend speaks one JSON line each way") {
        SubprocessBrainBackend backend(
            {"/bin/sh", "-c", "while read line; do echo '{\"success\": true, \"content\": \"pong\"}'; done"}, 5);
        auto first = backend.complete(R"({"prompt": "ping"})");
        REQUIRE(first.success);
        REQUIRE(first.content == "pong");

        // Same process, second request
        REQUIRE(backend.complete("plain text").content == "pong");
    }

    SECTION("Subprocess that never answers times out") {
        SubprocessBrainBackend backend({"/bin/sh", "-c", "while read line; do :; done"}, 1);
        auto result = backend.complete("{}");
        REQUIRE_FALSE(result.success);
        REQUIRE_FALSE(result.error.empty());
    }

    SECTION("Subprocess ignoring SIGTERM is killed on restart") {
        SubprocessBrainBackend backend(
            {"/bin/sh", "-c", "trap '' TERM; exec 0<&-; while :; do sleep 1; done"}, 1);
        auto started = std::chrono::steady_clock::now();
        auto result = backend.complete("{}");
        REQUIRE_FALSE(result.success);
        REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));
    }
}
