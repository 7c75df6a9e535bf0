// SPDX-License-Identifier: MIT

// lib/stream/tcp_connection.cpp
#include "lib/stream/tcp_connection.hpp"

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>

#include "lib/stream/dns_resolver.hpp"

namespace obj_transport {

namespace {

timeval ToTimeval(std::chrono::milliseconds ms) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(ms.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((ms.count() % 1000) * 1000);
    return tv;
}

}  // namespace

std::expected<std::unique_ptr<TcpConnection>, Error> TcpConnection::Connect(
    const sockaddr_storage& addr, const SocketOptions& opts) {
    int sock_fd = socket(addr.ss_family, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (sock_fd < 0) {
        return std::unexpected(Error{ErrorCode::ConnectionFailed, "socket() failed", errno});
    }

    // Disable Nagle: frames are already batched by the sender loop
    int opt = 1;
    setsockopt(sock_fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));

    if (opts.send_buffer_size > 0) {
        setsockopt(sock_fd, SOL_SOCKET, SO_SNDBUF, &opts.send_buffer_size,
                   sizeof(opts.send_buffer_size));
    }
    if (opts.recv_buffer_size > 0) {
        setsockopt(sock_fd, SOL_SOCKET, SO_RCVBUF, &opts.recv_buffer_size,
                   sizeof(opts.recv_buffer_size));
    }
    if (opts.io_timeout.count() > 0) {
        timeval tv = ToTimeval(opts.io_timeout);
        setsockopt(sock_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        setsockopt(sock_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    }

    int ret;
    do {
        ret = connect(sock_fd, reinterpret_cast<const sockaddr*>(&addr), SockaddrLength(addr));
    } while (ret < 0 && errno == EINTR);
    if (ret < 0) {
        auto err = errno;
        ::close(sock_fd);
        return std::unexpected(Error{ErrorCode::ConnectionFailed, "connect() failed", err});
    }

    return std::unique_ptr<TcpConnection>(new TcpConnection(sock_fd));
}

std::expected<void, Error> TcpConnection::WriteAll(std::span<const std::byte> data) {
    while (!data.empty()) {
        int sock_fd = fd();
        if (sock_fd < 0) {
            return std::unexpected(Error{ErrorCode::ConnectionClosed, "connection closed"});
        }
        ssize_t n = ::send(sock_fd, data.data(), data.size(), MSG_NOSIGNAL);
        if (n > 0) {
            data = data.subspan(static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        return std::unexpected(Error{ErrorCode::ConnectionFailed, "send() failed",
                                     n < 0 ? errno : EPIPE});
    }
    return {};
}

std::expected<size_t, Error> TcpConnection::ReadSome(std::span<std::byte> out) {
    for (;;) {
        int sock_fd = fd();
        if (sock_fd < 0) {
            return std::unexpected(Error{ErrorCode::ConnectionClosed, "connection closed"});
        }
        ssize_t n = ::recv(sock_fd, out.data(), out.size(), 0);
        if (n >= 0) {
            return static_cast<size_t>(n);
        }
        if (errno == EINTR) {
            continue;
        }
        return std::unexpected(Error{ErrorCode::ConnectionFailed, "recv() failed", errno});
    }
}

void TcpConnection::ShutdownWrite() {
    int sock_fd = fd();
    if (sock_fd >= 0) {
        ::shutdown(sock_fd, SHUT_WR);
    }
}

void TcpConnection::Interrupt() {
    int sock_fd = fd();
    if (sock_fd >= 0) {
        ::shutdown(sock_fd, SHUT_RDWR);
    }
}

void TcpConnection::Close() {
    int sock_fd = fd_.exchange(-1, std::memory_order_acq_rel);
    if (sock_fd >= 0) {
        ::close(sock_fd);
    }
}

}  // namespace obj_transport
