/// @file test_reactor.cpp
/// @brief Tests for the epoll read-readiness reactor

#include <catch2/catch.hpp>

#include "kernel/reactor.hpp"

#include <unistd.h>

using namespace hive::kernel;

TEST_CASE("Reactor", "[kernel][reactor]") {
    Reactor reactor;
    REQUIRE_FALSE(reactor.ready());
    REQUIRE(reactor.poll(0) == -1);
    REQUIRE(reactor.init());
    REQUIRE(reactor.ready());

    int fds[2];
    REQUIRE(pipe(fds) == 0);

    int calls = 0;
    Readiness last;
    REQUIRE(reactor.watch(fds[0], [&](int, Readiness ready) {
        calls++;
        last = ready;
    }));
    REQUIRE(reactor.watching(fds[0]));

    SECTION("Nothing ready, nothing dispatched") {
        REQUIRE(reactor.poll(0) == 0);
        REQUIRE(calls == 0);
    }

    SECTION("Data makes the fd readable") {
        REQUIRE(write(fds[1], "x", 1) == 1);
        REQUIRE(reactor.poll(1000) == 1);
        REQUIRE(last.readable);
        REQUIRE_FALSE(last.hangup);
    }

    SECTION("Closing the writer reports hangup") {
        close(fds[1]);
        fds[1] = -1;
        REQUIRE(reactor.poll(1000) == 1);
        REQUIRE(last.hangup);
    }

    SECTION("A callback may unwatch its own fd") {
        reactor.unwatch(fds[0]);
        REQUIRE(reactor.watch(fds[0], [&](int fd, Readiness) {
            calls++;
            reactor.unwatch(fd);
        }));
        REQUIRE(write(fds[1], "x", 1) == 1);
        REQUIRE(reactor.poll(1000) == 1);
        REQUIRE_FALSE(reactor.watching(fds[0]));
        REQUIRE(reactor.poll(0) == 0);
        REQUIRE(calls == 1);
    }

    REQUIRE_FALSE(reactor.unwatch(-1));
    close(fds[0]);
    if (fds[1] >= 0) {
        close(fds[1]);
    }
}
