// SPDX-License-Identifier: MIT

// tests/reactor_test.cpp
#include <gtest/gtest.h>

#include <sys/eventfd.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <system_error>
#include <thread>
#include <vector>

#include "lib/stream/reactor.hpp"

using namespace obj_transport;

TEST(ReactorTest, PollEmpty) {
    Reactor reactor;
    EXPECT_EQ(reactor.Poll(0), 0);
}

TEST(ReactorTest, HandleUnregistersOnDestruction) {
    Reactor reactor;

    int efd = eventfd(0, EFD_NONBLOCK);
    ASSERT_GE(efd, 0);

    int reads = 0;
    auto drain = [&] {
        uint64_t val;
        while (read(efd, &val, sizeof(val)) > 0) {}
        ++reads;
    };
    {
        auto handle = reactor.Register(efd, true, false, drain, {}, [](int) {});
        EXPECT_EQ(reactor.WatchCount(), 1u);

        uint64_t val = 1;
        ASSERT_EQ(write(efd, &val, sizeof(val)), sizeof(val));
        EXPECT_EQ(reactor.Poll(0), 1);
        EXPECT_EQ(reads, 1);
    }
    EXPECT_EQ(reactor.WatchCount(), 0u);

    uint64_t val = 1;
    ASSERT_EQ(write(efd, &val, sizeof(val)), sizeof(val));
    EXPECT_EQ(reactor.Poll(0), 0);
    EXPECT_EQ(reads, 1);

    close(efd);
}

TEST(ReactorTest, RegisterInvalidFdThrows) {
    Reactor reactor;
    EXPECT_THROW(reactor.Register(-1, true, false, {}, {}, {}), std::system_error);
    EXPECT_EQ(reactor.WatchCount(), 0u);
}

TEST(ReactorTest, RegisterReadAndWrite) {
    Reactor reactor;

    int fds[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK, 0, fds), 0);

    int reads = 0;
    int writes = 0;
    auto handle = reactor.Register(
        fds[0], true, false,
        [&] {
            char buf[16];
            while (read(fds[0], buf, sizeof(buf)) > 0) {}
            ++reads;
        },
        [&] { ++writes; },
        [](int) {});

    ASSERT_EQ(write(fds[1], "x", 1), 1);
    reactor.Poll(0);
    EXPECT_EQ(reads, 1);
    EXPECT_EQ(writes, 0);

    handle->Update(false, true);
    reactor.Poll(0);
    EXPECT_EQ(writes, 1);
    EXPECT_EQ(handle->fd(), fds[0]);

    handle.reset();
    close(fds[0]);
    close(fds[1]);
}

TEST(ReactorTest, PeerCloseReachesReadCallback) {
    Reactor reactor;

    int fds[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK, 0, fds), 0);

    bool eof = false;
    auto handle = reactor.Register(
        fds[0], true, false,
        [&] {
            char buf[16];
            if (read(fds[0], buf, sizeof(buf)) == 0) eof = true;
        },
        {},
        [](int) {});

    close(fds[1]);
    reactor.Poll(0);
    EXPECT_TRUE(eof);

    handle.reset();
    close(fds[0]);
}

TEST(ReactorTest, DeferredTasksMayDeferMore) {
    Reactor reactor;
    std::vector<int> order;

    reactor.Defer([&] {
        order.push_back(1);
        reactor.Defer([&] { order.push_back(3); });
    });
    reactor.Defer([&] { order.push_back(2); });
    reactor.Poll(0);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(ReactorTest, DeferFromOtherThreadWakesRun) {
    Reactor reactor;
    std::atomic<bool> ran{false};

    std::thread runner([&] { reactor.Run(); });
    std::thread other([&] {
        reactor.Defer([&] {
            ran = true;
            reactor.Stop();
        });
    });

    other.join();
    runner.join();
    EXPECT_TRUE(ran);
}

TEST(ReactorTest, IsInEventLoopThread) {
    Reactor reactor;
    bool inside = false;
    reactor.Defer([&] { inside = reactor.IsInEventLoopThread(); });
    reactor.Poll(0);
    EXPECT_TRUE(inside);

    bool outside = true;
    std::thread t([&] { outside = reactor.IsInEventLoopThread(); });
    t.join();
    EXPECT_FALSE(outside);
}
