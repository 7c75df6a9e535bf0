// SPDX-License-Identifier: MIT

// src/router.hpp
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "lib/stream/error.hpp"
#include "src/header.hpp"
#include "src/payload_source.hpp"

namespace obj_transport {

// ObjectReader - payload of one received object, bounded to exactly
// header.attrs.size bytes.
//
// Bytes are pulled from the connection as they arrive, so Read() may wait.
// Valid only for the duration of the handler call; whatever the handler
// leaves unread is discarded after it returns.
class ObjectReader {
public:
    ObjectReader(PayloadSource& source, size_t size) : source_(source), size_(size) {}

    ObjectReader(const ObjectReader&) = delete;
    ObjectReader& operator=(const ObjectReader&) = delete;

    /// Copy up to out.size() bytes. Returns 0 once all `size` bytes are read.
    /// Fails if the connection ends before the object is complete.
    std::expected<size_t, Error> Read(std::span<std::byte> out);

    /// Read everything that is left.
    std::expected<std::vector<std::byte>, Error> ReadAll();

    /// Skip everything that is left.
    std::expected<void, Error> Discard();

    size_t Size() const { return size_; }
    size_t Remaining() const { return size_ - pos_; }

private:
    PayloadSource& source_;
    size_t size_;
    size_t pos_ = 0;
};

/// Called on the connection's delivery thread for every delivered object, in
/// wire order. Handlers of different connections may run concurrently.
/// Header-only objects get an empty reader.
using ObjectHandler = std::function<void(const Header& header, ObjectReader& reader)>;

/// Receive-side failures on a route: framing and decompression errors,
/// connections closed before their stream-end frame.
using ReceiveErrorHandler = std::function<void(const Error& error)>;

struct RouteStats {
    int64_t objects = 0;
    int64_t bytes = 0;
    int64_t stale_frames = 0;   ///< Frames discarded from superseded sessions
    int64_t connections = 0;
};

// Route - one registered (network, transport name) pair.
//
// Connections hold a shared_ptr, so a route outlives Unregister() until its
// last connection closes.
class Route {
public:
    Route(std::string network, std::string trname, ObjectHandler handler,
          ReceiveErrorHandler on_error);

    const std::string& Network() const { return network_; }
    const std::string& TrName() const { return trname_; }
    const std::string& Path() const { return path_; }

    /// Record a new connection's session. Returns false when the session is
    /// older than the last one seen for this stream (a stale connection).
    /// Every admitted connection must be released when it closes.
    bool AdmitSession(uint64_t stream_id, uint64_t session_id);

    /// A connection of this stream closed. The stream is forgotten once it
    /// has no open connection left.
    void ReleaseSession(uint64_t stream_id);

    /// Streams with at least one open connection.
    size_t TrackedStreams() const;

    /// True while no newer session has been seen for this stream.
    bool IsCurrent(uint64_t stream_id, uint64_t session_id) const;

    void Deliver(const Header& header, ObjectReader& reader);
    void ReportError(const Error& error);
    void CountStale() { stale_frames_.fetch_add(1, std::memory_order_relaxed); }

    RouteStats Stats() const;

private:
    std::string network_;
    std::string trname_;
    std::string path_;
    ObjectHandler handler_;
    ReceiveErrorHandler on_error_;

    struct SessionState {
        uint64_t last = 0;         // newest session admitted
        uint32_t connections = 0;  // open connections, stale ones included
    };

    mutable std::mutex session_mutex_;
    std::unordered_map<uint64_t, SessionState> sessions_;  // by stream id

    std::atomic<int64_t> objects_{0};
    std::atomic<int64_t> bytes_{0};
    std::atomic<int64_t> stale_frames_{0};
    std::atomic<int64_t> connections_{0};
};

// Router - routing table from request path to Route.
//
// Owned by the node's networking layer and passed by reference to the
// components that register or resolve routes. Thread-safe.
class Router {
public:
    /// Register a handler and return its path "/v1/<network>/<trname>".
    /// Fails with DuplicateRoute if the pair is taken.
    std::expected<std::string, Error> Register(std::string_view network,
                                               std::string_view trname,
                                               ObjectHandler handler,
                                               ReceiveErrorHandler on_error = {});

    std::expected<void, Error> Unregister(std::string_view network, std::string_view trname);

    /// Route for a request path, or null.
    std::shared_ptr<Route> Resolve(std::string_view path) const;

    /// Receive statistics of every route on `network`, keyed by transport name.
    std::map<std::string, RouteStats> GetRouteStats(std::string_view network) const;

    size_t Size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Route>> routes_;  // by path
};

}  // namespace obj_transport
