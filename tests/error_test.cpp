// SPDX-License-Identifier: MIT

// tests/error_test.cpp
#include <cerrno>

#include <gtest/gtest.h>

#include "lib/stream/error.hpp"

using namespace obj_transport;

TEST(ErrorTest, Construction) {
    Error err{ErrorCode::ConnectionFailed, "connection refused"};
    EXPECT_EQ(err.code, ErrorCode::ConnectionFailed);
    EXPECT_EQ(err.message, "connection refused");
    EXPECT_EQ(err.os_errno, 0);
}

TEST(ErrorTest, WithErrno) {
    Error err{ErrorCode::ConnectionFailed, "connection refused", ECONNREFUSED};
    EXPECT_EQ(err.os_errno, ECONNREFUSED);
}

TEST(ErrorTest, CategoryString) {
    EXPECT_EQ(error_category(ErrorCode::ConnectionFailed), "connection");
    EXPECT_EQ(error_category(ErrorCode::ConnectionClosed), "connection");
    EXPECT_EQ(error_category(ErrorCode::DnsResolutionFailed), "connection");

    EXPECT_EQ(error_category(ErrorCode::FramingError), "protocol");
    EXPECT_EQ(error_category(ErrorCode::FrameTooLarge), "protocol");
    EXPECT_EQ(error_category(ErrorCode::ProtocolError), "protocol");
    EXPECT_EQ(error_category(ErrorCode::BufferOverflow), "protocol");

    EXPECT_EQ(error_category(ErrorCode::CompressionError), "compression");
    EXPECT_EQ(error_category(ErrorCode::DecompressionError), "compression");

    EXPECT_EQ(error_category(ErrorCode::RouteNotFound), "routing");
    EXPECT_EQ(error_category(ErrorCode::DuplicateRoute), "routing");
    EXPECT_EQ(error_category(ErrorCode::InvalidRoute), "routing");

    EXPECT_EQ(error_category(ErrorCode::PayloadReadFailed), "payload");
    EXPECT_EQ(error_category(ErrorCode::PayloadSizeMismatch), "payload");

    EXPECT_EQ(error_category(ErrorCode::InvalidState), "state");
    EXPECT_EQ(error_category(ErrorCode::Cancelled), "state");
}

TEST(ErrorTest, CategoryIsConstexpr) {
    static_assert(error_category(ErrorCode::Cancelled) == "state");
    static_assert(error_name(ErrorCode::FramingError) == "FramingError");
}

TEST(ErrorTest, Formatting) {
    Error plain{ErrorCode::Cancelled, "stream stopped"};
    EXPECT_EQ(fmt::format("{}", plain), "Cancelled: stream stopped");

    Error with_errno{ErrorCode::ConnectionFailed, "send() failed", EPIPE};
    EXPECT_EQ(fmt::format("{}", with_errno),
              fmt::format("ConnectionFailed: send() failed (errno {})", EPIPE));
}
