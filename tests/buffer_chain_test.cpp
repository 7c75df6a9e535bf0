// SPDX-License-Identifier: MIT

// tests/buffer_chain_test.cpp
#include <gtest/gtest.h>

#include <algorithm>
#include <cstring>
#include <memory>
#include <vector>

#include "lib/stream/buffer_chain.hpp"

using namespace obj_transport;

namespace {

std::vector<std::byte> Pattern(size_t n) {
    std::vector<std::byte> out(n);
    for (size_t i = 0; i < n; ++i) {
        out[i] = static_cast<std::byte>(i * 7);
    }
    return out;
}

}  // namespace

TEST(SegmentTest, BasicProperties) {
    Segment seg;
    EXPECT_EQ(seg.size, 0);
    EXPECT_EQ(seg.Remaining(), Segment::kSize);
    EXPECT_FALSE(seg.IsFull());

    seg.size = Segment::kSize;
    EXPECT_EQ(seg.Remaining(), 0);
    EXPECT_TRUE(seg.IsFull());
}

TEST(BufferChainTest, EmptyChain) {
    BufferChain chain;
    EXPECT_EQ(chain.Size(), 0);
    EXPECT_TRUE(chain.Empty());
    EXPECT_EQ(chain.SegmentCount(), 0);
}

TEST(BufferChainTest, AppendEmptySegmentIsIgnored) {
    BufferChain chain;
    chain.Append(std::make_shared<Segment>());
    EXPECT_TRUE(chain.Empty());
    EXPECT_EQ(chain.SegmentCount(), 0);
}

TEST(BufferChainTest, AppendBytesSpansSegments) {
    BufferChain chain;
    auto data = Pattern(Segment::kSize + 100);

    chain.AppendBytes(data);

    EXPECT_EQ(chain.Size(), data.size());
    EXPECT_EQ(chain.SegmentCount(), 2);

    std::vector<std::byte> out(data.size());
    chain.CopyTo(0, out.size(), out.data());
    EXPECT_EQ(out, data);
}

TEST(BufferChainTest, AppendBytesFillsTailFirst) {
    BufferChain chain;
    auto first = Pattern(10);
    auto second = Pattern(20);

    chain.AppendBytes(first);
    chain.AppendBytes(second);

    EXPECT_EQ(chain.SegmentCount(), 1);
    EXPECT_EQ(chain.Size(), 30);
    EXPECT_EQ(*chain.DataAt(10), second[0]);
}

TEST(BufferChainTest, AppendBytesSkipsSharedTail) {
    BufferChain chain;
    auto seg = std::make_shared<Segment>();
    seg->size = 10;
    chain.Append(seg);  // still referenced here

    chain.AppendBytes(Pattern(5));
    EXPECT_EQ(chain.SegmentCount(), 2);
    EXPECT_EQ(seg->size, 10);
    EXPECT_EQ(chain.Size(), 15);
}

TEST(BufferChainTest, ConsumeAcrossSegments) {
    BufferChain chain;
    for (int i = 0; i < 3; ++i) {
        auto seg = std::make_shared<Segment>();
        std::memset(seg->data.data(), i, 100);
        seg->size = 100;
        chain.Append(std::move(seg));
    }

    chain.Consume(150);
    EXPECT_EQ(chain.Size(), 150);
    EXPECT_EQ(chain.SegmentCount(), 2);
    EXPECT_EQ(*chain.DataAt(0), std::byte{1});
    EXPECT_EQ(*chain.DataAt(50), std::byte{2});
    EXPECT_EQ(chain.ContiguousSize(), 50);
}

TEST(BufferChainTest, CopyToAfterConsume) {
    BufferChain chain;
    auto data = Pattern(300);
    chain.AppendBytes(data);

    chain.Consume(100);
    std::vector<std::byte> out(50);
    chain.CopyTo(25, out.size(), out.data());
    EXPECT_TRUE(std::equal(out.begin(), out.end(), data.begin() + 125));
}

TEST(BufferChainTest, CopyToZeroLength) {
    BufferChain chain;
    std::byte dest[1];
    chain.CopyTo(0, 0, dest);
}

TEST(SegmentPoolTest, RecycleOnConsume) {
    SegmentPool pool;
    BufferChain chain(&pool);

    {
        auto seg = pool.Acquire();
        seg->size = 100;
        chain.Append(std::move(seg));
    }
    EXPECT_EQ(pool.PoolSize(), 0);

    chain.Consume(50);
    EXPECT_EQ(pool.PoolSize(), 0);

    chain.Consume(50);
    EXPECT_EQ(pool.PoolSize(), 1);
    EXPECT_TRUE(chain.Empty());
}

TEST(SegmentPoolTest, SharedSegmentIsNotPooled) {
    SegmentPool pool;
    BufferChain chain(&pool);

    auto seg = pool.Acquire();
    seg->size = 10;
    chain.Append(seg);
    chain.Consume(10);

    // Still referenced here, so the pool must not hand it out again
    EXPECT_EQ(pool.PoolSize(), 0);
}

TEST(SegmentPoolTest, ClearRecyclesAll) {
    SegmentPool pool;
    BufferChain chain(&pool);

    for (int i = 0; i < 5; ++i) {
        auto seg = pool.Acquire();
        seg->size = 100;
        chain.Append(std::move(seg));
    }
    chain.Clear();
    EXPECT_EQ(chain.Size(), 0);
    EXPECT_EQ(pool.PoolSize(), 5);
}

TEST(SegmentPoolTest, AppendBytesReusesPooledSegments) {
    SegmentPool pool;
    pool.Release(std::make_shared<Segment>());
    ASSERT_EQ(pool.PoolSize(), 1);

    {
        BufferChain chain(&pool);
        chain.AppendBytes(Pattern(100));
        EXPECT_EQ(pool.PoolSize(), 0);
    }
    // Destroying the chain hands the segment back
    EXPECT_EQ(pool.PoolSize(), 1);
}

TEST(SegmentPoolTest, PoolSizeLimit) {
    SegmentPool pool(2);
    for (int i = 0; i < 4; ++i) {
        pool.Release(std::make_shared<Segment>());
    }
    EXPECT_EQ(pool.PoolSize(), 2);
    EXPECT_EQ(pool.MaxPoolSize(), 2);

    auto seg = pool.Acquire();
    EXPECT_EQ(seg->size, 0);
    EXPECT_EQ(pool.PoolSize(), 1);
}
