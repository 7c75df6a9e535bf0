// SPDX-License-Identifier: MIT

// src/receiver.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <unordered_map>

#include "lib/stream/buffer_chain.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "src/config.hpp"
#include "src/router.hpp"

namespace obj_transport {

// Receiver - accepts stream connections and demultiplexes their frames to
// the routes registered in a Router.
//
// Per connection: read the request head, resolve the route (404 and close
// if unknown, 400 on a malformed head), then decode frames, optionally
// through the block decompressor, and stream each object to the route's
// handler. The stream-end frame is answered with 200 once every object has
// been handled.
//
// Socket I/O and decoding happen on the event loop thread. Handlers run on
// one delivery thread per connection and read payload as it arrives; the
// connection stops reading its socket while ReceiverConfig::max_buffered
// bytes wait for the handler. Closing a connection waits for its handler to
// return. Construct, Listen() and destroy the Receiver while the loop is not
// dispatching, or on its thread.
class Receiver {
public:
    Receiver(IEventLoop& loop, Router& router, ReceiverConfig config = {});
    ~Receiver();

    Receiver(const Receiver&) = delete;
    Receiver& operator=(const Receiver&) = delete;

    /// Bind and listen. Port 0 picks an ephemeral port; the bound port is
    /// returned.
    std::expected<uint16_t, Error> Listen(uint16_t port, const std::string& address = "0.0.0.0");

    /// Stop accepting and drop every connection.
    void Close();

    uint16_t Port() const { return port_; }

    size_t ConnectionCount() const { return connections_.size(); }

private:
    class Connection;
    friend class Connection;

    void OnAccept();

    // Called by a connection that is done; destruction is deferred to the
    // next loop iteration because the connection's callback is on the stack.
    void Retire(Connection* conn);

    IEventLoop& loop_;
    Router& router_;
    ReceiverConfig config_;
    SegmentPool pool_;

    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::unique_ptr<IEventHandle> listen_handle_;
    std::unordered_map<Connection*, std::unique_ptr<Connection>> connections_;

    // Deferred callbacks check this before touching the Receiver
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

}  // namespace obj_transport
