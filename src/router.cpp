// SPDX-License-Identifier: MIT

// src/router.cpp
#include "src/router.hpp"

#include <algorithm>
#include <array>

#include <fmt/format.h>

#include "lib/stream/log.hpp"
#include "src/connection_head.hpp"

namespace obj_transport {

namespace {

bool ValidName(std::string_view s) {
    return !s.empty() && s.find('/') == std::string_view::npos;
}

}  // namespace

// ObjectReader

std::expected<size_t, Error> ObjectReader::Read(std::span<std::byte> out) {
    size_t want = std::min(out.size(), Remaining());
    if (want == 0) {
        return 0;
    }
    auto n = source_.Read(out.first(want));
    if (!n) {
        return n;
    }
    if (*n == 0) {
        return std::unexpected(Error{ErrorCode::ConnectionClosed,
            fmt::format("object payload ended {} bytes short", Remaining())});
    }
    pos_ += *n;
    return *n;
}

std::expected<std::vector<std::byte>, Error> ObjectReader::ReadAll() {
    std::vector<std::byte> out(Remaining());
    size_t filled = 0;
    while (filled < out.size()) {
        auto n = Read(std::span(out).subspan(filled));
        if (!n) {
            return std::unexpected(n.error());
        }
        filled += *n;
    }
    return out;
}

std::expected<void, Error> ObjectReader::Discard() {
    std::array<std::byte, 16 * 1024> scratch;
    while (Remaining() > 0) {
        if (auto n = Read(scratch); !n) {
            return std::unexpected(n.error());
        }
    }
    return {};
}

// Route

Route::Route(std::string network, std::string trname, ObjectHandler handler,
             ReceiveErrorHandler on_error)
    : network_(std::move(network)),
      trname_(std::move(trname)),
      path_(RoutePath(network_, trname_)),
      handler_(std::move(handler)),
      on_error_(std::move(on_error)) {}

bool Route::AdmitSession(uint64_t stream_id, uint64_t session_id) {
    connections_.fetch_add(1, std::memory_order_relaxed);
    std::lock_guard<std::mutex> lock(session_mutex_);
    auto& state = sessions_[stream_id];
    ++state.connections;
    if (session_id < state.last) {
        return false;
    }
    state.last = session_id;
    return true;
}

void Route::ReleaseSession(uint64_t stream_id) {
    std::lock_guard<std::mutex> lock(session_mutex_);
    auto it = sessions_.find(stream_id);
    if (it != sessions_.end() && --it->second.connections == 0) {
        sessions_.erase(it);
    }
}

size_t Route::TrackedStreams() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return sessions_.size();
}

bool Route::IsCurrent(uint64_t stream_id, uint64_t session_id) const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    auto it = sessions_.find(stream_id);
    return it == sessions_.end() || it->second.last <= session_id;
}

void Route::Deliver(const Header& header, ObjectReader& reader) {
    objects_.fetch_add(1, std::memory_order_relaxed);
    bytes_.fetch_add(header.attrs.size, std::memory_order_relaxed);
    if (handler_) {
        handler_(header, reader);
    }
}

void Route::ReportError(const Error& error) {
    if (on_error_) {
        on_error_(error);
    }
}

RouteStats Route::Stats() const {
    return RouteStats{
        .objects = objects_.load(std::memory_order_relaxed),
        .bytes = bytes_.load(std::memory_order_relaxed),
        .stale_frames = stale_frames_.load(std::memory_order_relaxed),
        .connections = connections_.load(std::memory_order_relaxed),
    };
}

// Router

std::expected<std::string, Error> Router::Register(std::string_view network,
                                                   std::string_view trname,
                                                   ObjectHandler handler,
                                                   ReceiveErrorHandler on_error) {
    if (!ValidName(network) || !ValidName(trname)) {
        return std::unexpected(Error{ErrorCode::InvalidRoute,
            fmt::format("invalid route name '{}/{}'", network, trname)});
    }
    auto route = std::make_shared<Route>(std::string(network), std::string(trname),
                                         std::move(handler), std::move(on_error));
    std::string path = route->Path();

    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = routes_.emplace(path, std::move(route));
    if (!inserted) {
        return std::unexpected(Error{ErrorCode::DuplicateRoute,
            fmt::format("route {} already registered", path)});
    }
    TransportLog()->info("registered route {}", path);
    return path;
}

std::expected<void, Error> Router::Unregister(std::string_view network,
                                              std::string_view trname) {
    std::string path = RoutePath(network, trname);
    std::lock_guard<std::mutex> lock(mutex_);
    if (routes_.erase(path) == 0) {
        return std::unexpected(Error{ErrorCode::RouteNotFound,
            fmt::format("route {} is not registered", path)});
    }
    TransportLog()->info("unregistered route {}", path);
    return {};
}

std::shared_ptr<Route> Router::Resolve(std::string_view path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = routes_.find(std::string(path));
    if (it == routes_.end()) {
        return nullptr;
    }
    return it->second;
}

std::map<std::string, RouteStats> Router::GetRouteStats(std::string_view network) const {
    std::map<std::string, RouteStats> out;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [path, route] : routes_) {
        if (route->Network() == network) {
            out.emplace(route->TrName(), route->Stats());
        }
    }
    return out;
}

size_t Router::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return routes_.size();
}

}  // namespace obj_transport
