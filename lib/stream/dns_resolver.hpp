// SPDX-License-Identifier: MIT

// lib/stream/dns_resolver.hpp
#pragma once

#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cstdint>
#include <cstring>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "lib/stream/error.hpp"

namespace obj_transport {

// Resolve a peer's host and port with getaddrinfo (blocking). The first
// stream address returned wins; IPv4 and IPv6 are both accepted.
// Called from the sender loop, never from a caller's Send().
inline std::expected<sockaddr_storage, Error> ResolveHostname(std::string_view hostname,
                                                              uint16_t port) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;
    hints.ai_flags = AI_NUMERICSERV;

    addrinfo* raw = nullptr;
    std::string host(hostname);
    std::string service = std::to_string(port);
    int ret = getaddrinfo(host.c_str(), service.c_str(), &hints, &raw);
    std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> result(raw, &freeaddrinfo);
    if (ret != 0 || !result) {
        return std::unexpected(Error{ErrorCode::DnsResolutionFailed,
            fmt::format("cannot resolve '{}': {}", hostname,
                        ret != 0 ? gai_strerror(ret) : "no addresses")});
    }

    sockaddr_storage addr{};
    std::memcpy(&addr, result->ai_addr, result->ai_addrlen);
    return addr;
}

// Byte length of the concrete address held in storage.
inline socklen_t SockaddrLength(const sockaddr_storage& addr) {
    return addr.ss_family == AF_INET6 ? sizeof(sockaddr_in6) : sizeof(sockaddr_in);
}

}  // namespace obj_transport
