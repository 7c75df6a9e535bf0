// SPDX-License-Identifier: MIT

// lib/stream/tcp_connection.hpp
#pragma once

#include <sys/socket.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <expected>
#include <memory>
#include <span>

#include "lib/stream/error.hpp"

namespace obj_transport {

/// Socket-level options applied right after socket() and before connect().
struct SocketOptions {
    int send_buffer_size = 0;                  ///< SO_SNDBUF, 0 = kernel default
    int recv_buffer_size = 0;                  ///< SO_RCVBUF, 0 = kernel default
    std::chrono::milliseconds io_timeout{0};   ///< SO_SNDTIMEO/SO_RCVTIMEO, 0 = none
};

// TcpConnection - blocking outbound TCP connection.
//
// Owned and driven by exactly one thread (a Stream's sender loop). The only
// call allowed from another thread is Interrupt(), which shuts the socket
// down so a blocked WriteAll()/ReadSome() returns with an error.
class TcpConnection {
public:
    ~TcpConnection() { Close(); }

    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;
    TcpConnection(TcpConnection&&) = delete;
    TcpConnection& operator=(TcpConnection&&) = delete;

    // Connect to address (caller responsible for DNS resolution)
    static std::expected<std::unique_ptr<TcpConnection>, Error> Connect(
        const sockaddr_storage& addr, const SocketOptions& opts);

    // Write the whole span or fail. Retries short writes and EINTR.
    std::expected<void, Error> WriteAll(std::span<const std::byte> data);

    // Read up to out.size() bytes. Returns 0 on orderly shutdown by peer.
    std::expected<size_t, Error> ReadSome(std::span<std::byte> out);

    // Half-close: no more writes from this side.
    void ShutdownWrite();

    // Thread-safe: unblock any pending I/O on the socket.
    void Interrupt();

    void Close();

    int fd() const { return fd_.load(std::memory_order_acquire); }

private:
    explicit TcpConnection(int fd) : fd_(fd) {}

    std::atomic<int> fd_{-1};
};

}  // namespace obj_transport
