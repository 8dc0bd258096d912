/// @file test_process_scan.cpp
/// @brief Tests for /proc based process discovery

#include <catch2/catch.hpp>

#include "runtime/agent/process_scan.hpp"

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <chrono>
#include <string>
#include <thread>

using namespace hive::runtime;

namespace {

// sh -> sleep, with a signature in the environment
pid_t spawn_tree(const char* signature) {
    std::string env = std::string("HIVE_AGENT_NAME=") + signature;
    pid_t pid = fork();
    if (pid == 0) {
        setpgid(0, 0);
        char* const argv[] = {const_cast<char*>("/bin/sh"), const_cast<char*>("-c"),
                              const_cast<char*>("sleep 30; true"), nullptr};
        char* const envp[] = {const_cast<char*>(env.c_str()), nullptr};
        execve("/bin/sh", argv, envp);
        _exit(127);
    }
    return pid;
}

void reap_tree(pid_t pid) {
    killpg(pid, SIGKILL);
    waitpid(pid, nullptr, 0);
}

} // namespace

TEST_CASE("Process scanning", "[runtime][proc]") {
    pid_t root = spawn_tree("scan-target");
    REQUIRE(root > 0);

    // Wait for sh to fork its sleep
    std::vector<pid_t> children;
    for (int i = 0; i < 100 && children.empty(); i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        children = proc::descendants(root);
    }

    SECTION("Parent and descendants") {
        REQUIRE(proc::parent_of(root) == getpid());
        REQUIRE_FALSE(children.empty());
        for (pid_t child : children) {
            REQUIRE(proc::parent_of(child) == root);
        }
        REQUIRE(proc::parent_of(-5) == -1);
    }

    SECTION("Signature match is exact") {
        auto matches = proc::find_by_signature("HIVE_AGENT_NAME", "scan-target");
        REQUIRE(std::find(matches.begin(), matches.end(), root) != matches.end());
        REQUIRE(std::find(matches.begin(), matches.end(), getpid()) == matches.end());

        REQUIRE(proc::find_by_signature("HIVE_AGENT_NAME", "scan-targe").empty());
    }

    reap_tree(root);
}
