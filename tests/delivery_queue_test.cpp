// SPDX-License-Identifier: MIT

// tests/delivery_queue_test.cpp
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "src/delivery_queue.hpp"

using namespace obj_transport;
using namespace std::chrono_literals;

namespace {

Header MakeHeader(std::string name, int64_t size) {
    Header h;
    h.obj_name = std::move(name);
    h.attrs.size = size;
    return h;
}

std::vector<std::byte> Bytes(std::string_view s) {
    auto* p = reinterpret_cast<const std::byte*>(s.data());
    return {p, p + s.size()};
}

}  // namespace

TEST(DeliveryQueueTest, ObjectsInOrder) {
    DeliveryQueue queue(1024);
    queue.PushObject(MakeHeader("a", 3));
    queue.PushBytes(Bytes("ab"));
    queue.PushBytes(Bytes("c"));
    queue.PushObject(MakeHeader("b", 0));
    queue.PushEnd();
    EXPECT_EQ(queue.Buffered(), 3u);

    auto a = queue.Next();
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(a->has_value());
    EXPECT_EQ((*a)->obj_name, "a");

    std::byte buf[8];
    EXPECT_EQ(queue.Read(buf), 2u);
    EXPECT_EQ(queue.Read(buf), 1u);
    EXPECT_EQ(buf[0], std::byte{'c'});
    EXPECT_EQ(queue.Read(buf), 0u);  // next entry is another object

    auto b = queue.Next();
    ASSERT_TRUE(b.has_value());
    ASSERT_TRUE(b->has_value());
    EXPECT_EQ((*b)->obj_name, "b");

    auto end = queue.Next();
    ASSERT_TRUE(end.has_value());
    EXPECT_FALSE(end->has_value());
    EXPECT_EQ(queue.Buffered(), 0u);
}

TEST(DeliveryQueueTest, NextDropsUnreadPayload) {
    DeliveryQueue queue(1024);
    queue.PushObject(MakeHeader("a", 4));
    queue.PushBytes(Bytes("abcd"));
    queue.PushObject(MakeHeader("b", 1));
    queue.PushBytes(Bytes("z"));

    ASSERT_TRUE(queue.Next().has_value());
    auto b = queue.Next();
    ASSERT_TRUE(b.has_value() && b->has_value());
    EXPECT_EQ((*b)->obj_name, "b");

    std::byte buf[4];
    EXPECT_EQ(queue.Read(buf), 1u);
    EXPECT_EQ(buf[0], std::byte{'z'});
}

TEST(DeliveryQueueTest, ReadWaitsForBytes) {
    DeliveryQueue queue(1024);
    queue.PushObject(MakeHeader("a", 5));
    ASSERT_TRUE(queue.Next().has_value());

    std::atomic<size_t> got{0};
    std::thread consumer([&] {
        std::byte buf[8];
        auto n = queue.Read(buf);
        got = n.value_or(0);
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(got.load(), 0u);
    queue.PushBytes(Bytes("hello"));
    consumer.join();
    EXPECT_EQ(got.load(), 5u);
}

TEST(DeliveryQueueTest, FullArmsResumeAtHalfLimit) {
    int resumed = 0;
    DeliveryQueue queue(100, [&] { ++resumed; });
    queue.PushObject(MakeHeader("big", 120));
    queue.PushBytes(std::vector<std::byte>(60));
    EXPECT_FALSE(queue.Full());
    queue.PushBytes(std::vector<std::byte>(60));
    EXPECT_TRUE(queue.Full());

    ASSERT_TRUE(queue.Next().has_value());
    std::byte buf[60];
    ASSERT_EQ(queue.Read(buf), 60u);
    EXPECT_EQ(resumed, 0);  // 60 still buffered, above half

    std::byte small[20];
    ASSERT_EQ(queue.Read(small), 20u);
    EXPECT_EQ(resumed, 1);

    // Fires once per Full()
    ASSERT_EQ(queue.Read(small), 20u);
    EXPECT_EQ(resumed, 1);
}

TEST(DeliveryQueueTest, NoResumeWithoutFull) {
    int resumed = 0;
    DeliveryQueue queue(100, [&] { ++resumed; });
    queue.PushObject(MakeHeader("a", 10));
    queue.PushBytes(std::vector<std::byte>(10));
    ASSERT_TRUE(queue.Next().has_value());
    std::byte buf[10];
    ASSERT_EQ(queue.Read(buf), 10u);
    EXPECT_EQ(resumed, 0);
}

TEST(DeliveryQueueTest, CloseKeepsQueuedObjects) {
    DeliveryQueue queue(1024);
    queue.PushObject(MakeHeader("whole", 2));
    queue.PushBytes(Bytes("ok"));
    queue.PushObject(MakeHeader("cut", 10));
    queue.PushBytes(Bytes("abc"));
    queue.Close(Error{ErrorCode::ConnectionClosed, "peer went away"});
    queue.Close(Error{ErrorCode::Cancelled, "later"});

    auto whole = queue.Next();
    ASSERT_TRUE(whole.has_value() && whole->has_value());
    std::byte buf[16];
    EXPECT_EQ(queue.Read(buf), 2u);

    auto cut = queue.Next();
    ASSERT_TRUE(cut.has_value() && cut->has_value());
    EXPECT_EQ((*cut)->obj_name, "cut");
    EXPECT_EQ(queue.Read(buf), 3u);

    auto more = queue.Read(buf);
    ASSERT_FALSE(more.has_value());
    EXPECT_EQ(more.error().code, ErrorCode::ConnectionClosed);

    auto next = queue.Next();
    ASSERT_FALSE(next.has_value());
    EXPECT_EQ(next.error().code, ErrorCode::ConnectionClosed);
}

TEST(DeliveryQueueTest, CloseWakesWaitingConsumer) {
    DeliveryQueue queue(1024);
    std::atomic<bool> failed{false};
    std::thread consumer([&] { failed = !queue.Next().has_value(); });

    std::this_thread::sleep_for(20ms);
    queue.Close(Error{ErrorCode::Cancelled, "connection closed"});
    consumer.join();
    EXPECT_TRUE(failed);
}
