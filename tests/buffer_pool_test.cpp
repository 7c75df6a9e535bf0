// SPDX-License-Identifier: MIT

// tests/buffer_pool_test.cpp
#include <gtest/gtest.h>

#include <memory_resource>
#include <thread>
#include <vector>

#include "lib/stream/buffer_pool.hpp"

using namespace obj_transport;

TEST(PmrBufferPoolTest, AcquireReturnsRequestedSize) {
    PmrBufferPool pool;
    auto buf = pool.Acquire(1000);
    EXPECT_EQ(buf.size(), 1000);
    EXPECT_EQ(buf.get_allocator().resource(), pool.GetResourcePtr().get());
}

TEST(PmrBufferPoolTest, ReleasedBufferIsReused) {
    PmrBufferPool pool;
    auto buf = pool.Acquire(4096);
    pool.Release(std::move(buf));
    EXPECT_EQ(pool.PoolSize(), 1);

    // Smaller request fits the parked capacity
    auto again = pool.Acquire(100);
    EXPECT_EQ(again.size(), 100);
    EXPECT_GE(again.capacity(), 4096);
    EXPECT_EQ(pool.ReuseCount(), 1);
    EXPECT_EQ(pool.PoolSize(), 0);
}

TEST(PmrBufferPoolTest, TooSmallBufferIsNotReused) {
    PmrBufferPool pool;
    pool.Release(pool.Acquire(16));
    auto big = pool.Acquire(1 << 16);
    EXPECT_EQ(big.size(), 1 << 16);
    EXPECT_EQ(pool.ReuseCount(), 0);
    EXPECT_EQ(pool.PoolSize(), 1);
}

TEST(PmrBufferPoolTest, ForeignBufferIsDropped) {
    PmrBufferPool pool;
    std::pmr::monotonic_buffer_resource other;
    PoolBuffer foreign(&other);
    foreign.resize(64);

    pool.Release(std::move(foreign));
    EXPECT_EQ(pool.PoolSize(), 0);
}

TEST(PmrBufferPoolTest, FreeListIsBounded) {
    auto resource = std::make_shared<std::pmr::synchronized_pool_resource>();
    PmrBufferPool pool(resource, 2);
    std::vector<PoolBuffer> held;
    for (int i = 0; i < 4; ++i) held.push_back(pool.Acquire(32));
    for (auto& b : held) pool.Release(std::move(b));
    EXPECT_EQ(pool.PoolSize(), 2);
}

TEST(PmrBufferPoolTest, ConcurrentAcquireRelease) {
    PmrBufferPool pool;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&pool] {
            for (int i = 0; i < 500; ++i) {
                auto buf = pool.Acquire(256 + i % 7);
                buf[0] = std::byte{1};
                pool.Release(std::move(buf));
            }
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_LE(pool.PoolSize(), PmrBufferPool::kDefaultMaxPoolSize);
}
