// SPDX-License-Identifier: MIT

// tests/router_test.cpp
#include <gtest/gtest.h>

#include <cstdint>
#include <utility>
#include <vector>

#include "src/payload_source.hpp"
#include "src/router.hpp"

using namespace obj_transport;

TEST(RouterTest, RegisterReturnsPath) {
    Router router;
    auto path = router.Register("intra", "ec-put", [](const Header&, ObjectReader&) {});
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(*path, "/v1/intra/ec-put");
    EXPECT_EQ(router.Size(), 1);

    auto route = router.Resolve(*path);
    ASSERT_NE(route, nullptr);
    EXPECT_EQ(route->Network(), "intra");
    EXPECT_EQ(route->TrName(), "ec-put");
}

TEST(RouterTest, DuplicateRoute) {
    Router router;
    ASSERT_TRUE(router.Register("intra", "mirror", {}).has_value());
    auto dup = router.Register("intra", "mirror", {});
    ASSERT_FALSE(dup.has_value());
    EXPECT_EQ(dup.error().code, ErrorCode::DuplicateRoute);

    // Same name on another network is a different route
    EXPECT_TRUE(router.Register("public", "mirror", {}).has_value());
}

TEST(RouterTest, InvalidNames) {
    Router router;
    for (auto [net, tr] : {std::pair{"", "x"}, std::pair{"intra", ""},
                           std::pair{"a/b", "x"}, std::pair{"intra", "x/y"}}) {
        auto r = router.Register(net, tr, {});
        ASSERT_FALSE(r.has_value());
        EXPECT_EQ(r.error().code, ErrorCode::InvalidRoute);
    }
    EXPECT_EQ(router.Size(), 0);
}

TEST(RouterTest, Unregister) {
    Router router;
    ASSERT_TRUE(router.Register("intra", "mirror", {}).has_value());
    auto held = router.Resolve("/v1/intra/mirror");

    ASSERT_TRUE(router.Unregister("intra", "mirror").has_value());
    EXPECT_EQ(router.Resolve("/v1/intra/mirror"), nullptr);
    EXPECT_NE(held, nullptr);  // connections keep their route alive

    auto again = router.Unregister("intra", "mirror");
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::RouteNotFound);

    // The name can be registered again
    EXPECT_TRUE(router.Register("intra", "mirror", {}).has_value());
}

TEST(RouterTest, ResolveUnknown) {
    Router router;
    EXPECT_EQ(router.Resolve("/v1/intra/none"), nullptr);
    EXPECT_EQ(router.Resolve("garbage"), nullptr);
}

TEST(RouteTest, SessionAdmission) {
    Route route("intra", "mirror", {}, {});

    EXPECT_TRUE(route.AdmitSession(1, 5));
    EXPECT_TRUE(route.IsCurrent(1, 5));

    // A newer session supersedes the old one
    EXPECT_TRUE(route.AdmitSession(1, 6));
    EXPECT_FALSE(route.IsCurrent(1, 5));
    EXPECT_TRUE(route.IsCurrent(1, 6));

    // An older session is stale
    EXPECT_FALSE(route.AdmitSession(1, 4));

    // Streams are independent
    EXPECT_TRUE(route.AdmitSession(2, 1));
    EXPECT_EQ(route.Stats().connections, 4);
}

TEST(RouteTest, ClosedStreamsAreForgotten) {
    Route route("intra", "mirror", {}, {});

    for (uint64_t stream = 1; stream <= 1000; ++stream) {
        ASSERT_TRUE(route.AdmitSession(stream, 1));
        route.ReleaseSession(stream);
    }
    EXPECT_EQ(route.TrackedStreams(), 0u);
    EXPECT_EQ(route.Stats().connections, 1000);

    // A stale connection still open keeps the stream's newest session known
    ASSERT_TRUE(route.AdmitSession(7, 3));
    ASSERT_FALSE(route.AdmitSession(7, 2));
    route.ReleaseSession(7);
    EXPECT_EQ(route.TrackedStreams(), 1u);
    EXPECT_FALSE(route.IsCurrent(7, 2));
    EXPECT_FALSE(route.AdmitSession(7, 1));

    route.ReleaseSession(7);
    route.ReleaseSession(7);
    EXPECT_EQ(route.TrackedStreams(), 0u);

    // Releasing an unknown stream is harmless
    route.ReleaseSession(99);
    EXPECT_EQ(route.TrackedStreams(), 0u);
}

TEST(RouteTest, DeliverCountsAndCallsHandler) {
    std::vector<std::byte> received;
    Route route("intra", "mirror",
                [&](const Header& h, ObjectReader& reader) {
                    EXPECT_EQ(reader.Size(), static_cast<size_t>(h.attrs.size));
                    auto data = reader.ReadAll();
                    ASSERT_TRUE(data.has_value());
                    received = std::move(*data);
                },
                {});

    std::vector<std::byte> payload(300, std::byte{9});
    BytesSource source(payload);

    Header h;
    h.obj_name = "o1";
    h.attrs.size = 300;
    ObjectReader reader(source, 300);
    route.Deliver(h, reader);
    route.CountStale();

    EXPECT_EQ(received, payload);
    auto stats = route.Stats();
    EXPECT_EQ(stats.objects, 1);
    EXPECT_EQ(stats.bytes, 300);
    EXPECT_EQ(stats.stale_frames, 1);
}

TEST(RouteTest, ReportErrorWithoutHandler) {
    Route route("intra", "mirror", {}, {});
    route.ReportError(Error{ErrorCode::FramingError, "bad prefix"});

    Error seen{ErrorCode::Cancelled, ""};
    Route with_handler("intra", "m2", {}, [&](const Error& e) { seen = e; });
    with_handler.ReportError(Error{ErrorCode::FramingError, "bad prefix"});
    EXPECT_EQ(seen.code, ErrorCode::FramingError);
}

TEST(ObjectReaderTest, ReadsBoundedRange) {
    std::vector<std::byte> data(100);
    for (size_t i = 0; i < data.size(); ++i) data[i] = static_cast<std::byte>(i);
    BytesSource source(data);

    // The source holds more than the object; the reader stops at its size
    ObjectReader reader(source, 60);
    std::byte buf[25];
    EXPECT_EQ(reader.Read(buf), 25u);
    EXPECT_EQ(buf[0], std::byte{0});
    EXPECT_EQ(reader.Read(buf), 25u);
    EXPECT_EQ(buf[0], std::byte{25});
    EXPECT_EQ(reader.Read(buf), 10u);
    EXPECT_EQ(reader.Read(buf), 0u);
    EXPECT_EQ(reader.Remaining(), 0);

    // The next object starts where this one ended
    ObjectReader next(source, 40);
    auto rest = next.ReadAll();
    ASSERT_TRUE(rest.has_value());
    ASSERT_EQ(rest->size(), 40u);
    EXPECT_EQ((*rest)[0], std::byte{60});
}

TEST(ObjectReaderTest, ShortPayloadFails) {
    BytesSource source(std::vector<std::byte>(10, std::byte{1}));
    ObjectReader reader(source, 25);

    auto data = reader.ReadAll();
    ASSERT_FALSE(data.has_value());
    EXPECT_EQ(data.error().code, ErrorCode::ConnectionClosed);
    EXPECT_EQ(reader.Remaining(), 15u);

    auto skipped = reader.Discard();
    ASSERT_FALSE(skipped.has_value());
    EXPECT_EQ(skipped.error().code, ErrorCode::ConnectionClosed);
}

TEST(ObjectReaderTest, DiscardSkipsRemainder) {
    BytesSource source(std::vector<std::byte>(100 * 1024, std::byte{3}));
    ObjectReader reader(source, 70 * 1024);
    std::byte buf[10];
    ASSERT_EQ(reader.Read(buf), 10u);
    ASSERT_TRUE(reader.Discard().has_value());
    EXPECT_EQ(reader.Remaining(), 0u);

    // Exactly the object's bytes were consumed
    ObjectReader next(source, 30 * 1024);
    auto rest = next.ReadAll();
    ASSERT_TRUE(rest.has_value());
    EXPECT_EQ(rest->size(), 30u * 1024);
}

TEST(RouterTest, RouteStatsByNetwork) {
    Router router;
    ASSERT_TRUE(router.Register("intra", "a", {}).has_value());
    ASSERT_TRUE(router.Register("intra", "b", {}).has_value());
    ASSERT_TRUE(router.Register("public", "c", {}).has_value());

    router.Resolve("/v1/intra/a")->CountStale();

    auto stats = router.GetRouteStats("intra");
    ASSERT_EQ(stats.size(), 2);
    EXPECT_EQ(stats["a"].stale_frames, 1);
    EXPECT_EQ(stats["b"].stale_frames, 0);
    EXPECT_TRUE(router.GetRouteStats("none").empty());
}
