// SPDX-License-Identifier: MIT

// tests/stats_test.cpp
#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "src/stats.hpp"

using namespace obj_transport;
using namespace std::chrono_literals;

TEST(StatsTest, StartsAtZero) {
    Stats stats;
    auto s = stats.Snapshot();
    EXPECT_EQ(s.num, 0);
    EXPECT_EQ(s.offset, 0);
    EXPECT_EQ(s.size, 0);
    EXPECT_EQ(s.compressed_size, 0);
    EXPECT_DOUBLE_EQ(s.idle_pct, 0.0);
}

TEST(StatsTest, ObjectCounters) {
    Stats stats;
    stats.AddObject(100);
    stats.AddObject(0);
    stats.AddOffset(100);
    stats.AddCompressed(40);

    auto s = stats.Snapshot();
    EXPECT_EQ(s.num, 2);
    EXPECT_EQ(s.size, 100);
    EXPECT_EQ(s.offset, 100);
    EXPECT_EQ(s.compressed_size, 40);
}

TEST(StatsTest, IdlePercentage) {
    Stats stats;
    stats.AddIdle(30ms);
    stats.AddBusy(10ms);

    auto s = stats.Snapshot();
    EXPECT_EQ(s.idle, 30ms);
    EXPECT_EQ(s.busy, 10ms);
    EXPECT_DOUBLE_EQ(s.idle_pct, 75.0);
}

TEST(StatsTest, ReadableWhileWriting) {
    Stats stats;
    std::thread writer([&] {
        for (int i = 0; i < 10000; ++i) {
            stats.AddObject(1);
            stats.AddOffset(1);
        }
    });
    for (int i = 0; i < 100; ++i) {
        auto s = stats.Snapshot();
        EXPECT_GE(s.num, 0);
        EXPECT_LE(s.num, 10000);
    }
    writer.join();
    EXPECT_EQ(stats.Snapshot().num, 10000);
    EXPECT_EQ(stats.Snapshot().offset, 10000);
}
