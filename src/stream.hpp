// SPDX-License-Identifier: MIT

// src/stream.hpp
#pragma once

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "lib/stream/buffer_pool.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/tcp_connection.hpp"
#include "src/compression.hpp"
#include "src/config.hpp"
#include "src/header.hpp"
#include "src/payload_source.hpp"
#include "src/send_queue.hpp"
#include "src/stats.hpp"

namespace obj_transport {

/// Destination node address, supplied by cluster membership.
struct Endpoint {
    std::string host;
    uint16_t port = 0;
};

/// Lifecycle of a Stream: Idle -> Active -> Draining -> Closed, and from
/// any non-terminal state to Aborted.
enum class StreamState {
    Idle,      ///< Constructed, no sender loop yet
    Active,    ///< Sender loop draining the queue
    Draining,  ///< Fin() called: no new sends, queue flushed to completion
    Closed,    ///< Terminal: every request written, receiver acknowledged
    Aborted,   ///< Terminal: Stop() or unrecoverable error
};

constexpr std::string_view StreamStateName(StreamState s) {
    switch (s) {
        case StreamState::Idle: return "Idle";
        case StreamState::Active: return "Active";
        case StreamState::Draining: return "Draining";
        case StreamState::Closed: return "Closed";
        case StreamState::Aborted: return "Aborted";
    }
    return "Unknown";
}

/// Completion callback. Called exactly once per accepted Send on the sender
/// loop thread; `error` is empty on success.
using SendCallback = std::function<void(const Header& header, const std::optional<Error>& error)>;

// Stream - one outbound point-to-point object stream.
//
// Any number of threads may call Send() concurrently; a single sender loop
// thread owns the connection and writes frames in Send() order. Send()
// blocks only while `burst` requests are queued.
//
// Completion callbacks run on the sender loop thread. A callback may call
// Send() on the same Stream (it is admitted without blocking) but must not
// call Fin() or Stop() and wait on itself: Fin() from a callback returns
// InvalidState.
class Stream {
public:
    Stream(StreamConfig config, Endpoint endpoint, std::string network, std::string trname,
           std::shared_ptr<BufferPool> pool = nullptr);

    /// Stops the stream if still running and joins the sender loop.
    ~Stream();

    Stream(const Stream&) = delete;
    Stream& operator=(const Stream&) = delete;
    Stream(Stream&&) = delete;
    Stream& operator=(Stream&&) = delete;

    /// Start the sender loop without sending anything. Send() does this
    /// implicitly.
    std::expected<void, Error> Open();

    /// Queue one object. `payload` must yield exactly header.attrs.size
    /// bytes and may be null for header-only objects.
    ///
    /// Returns InvalidState without blocking once the stream is Draining or
    /// terminal; a rejected request's callback is never called.
    std::expected<void, Error> Send(Header header,
                                    std::unique_ptr<PayloadSource> payload = nullptr,
                                    SendCallback callback = {});

    /// Send with a typed caller context handed back to the callback.
    template <typename Ctx, typename Fn>
        requires std::copy_constructible<Ctx> &&
                 std::invocable<Fn&, const Header&, Ctx&, const std::optional<Error>&>
    std::expected<void, Error> Send(Header header, std::unique_ptr<PayloadSource> payload,
                                    Fn callback, Ctx ctx) {
        return Send(std::move(header), std::move(payload),
                    SendCallback([cb = std::move(callback), ctx = std::move(ctx)](
                                     const Header& h, const std::optional<Error>& err) mutable {
                        cb(h, ctx, err);
                    }));
    }

    /// Graceful close: refuse new sends, drain the queue, write the
    /// stream-end frame and wait for the receiver's acknowledgment.
    /// Returns after every accepted request's callback has run, with the
    /// terminal status; repeated calls return the same status.
    std::expected<void, Error> Fin();

    /// Abort without waiting. Queued and in-flight requests complete with
    /// Cancelled on the sender loop thread. Returns the terminal status.
    std::expected<void, Error> Stop();

    StreamState GetState() const { return state_.load(std::memory_order_acquire); }

    /// Error that ended the stream, if it ended with one.
    std::optional<Error> TerminalError() const;

    StatsSnapshot GetStats() const { return stats_.Snapshot(); }

    uint64_t StreamId() const { return stream_id_; }

    /// Identifier of the current connection; 0 before the first connect.
    uint64_t SessionId() const { return session_id_.load(std::memory_order_acquire); }

    const std::string& RoutePath() const { return route_path_; }

    const StreamConfig& config() const { return config_; }

private:
    struct SendRequest {
        Header header;
        std::vector<std::byte> frame;  ///< Encoded length prefix + header body
        std::unique_ptr<PayloadSource> payload;
        SendCallback callback;
    };

    // Idle -> Active, spawning the sender loop
    std::expected<void, Error> EnsureStarted();

    bool IsSenderThread() const {
        return sender_thread_id_.load(std::memory_order_acquire) == std::this_thread::get_id();
    }

    // Terminal status as returned by Fin()/Stop(); requires state_mutex_
    std::expected<void, Error> StatusLocked() const;

    // Sender loop
    void Run();
    bool Process(SendRequest& req);
    std::expected<void, Error> Transmit(SendRequest& req);
    std::expected<void, Error> Connect();
    std::expected<void, Error> Reconnect(const Error& cause);
    bool CanReconnect(const Error& err) const;
    bool Recover(const Error& err);
    void Finish();
    std::expected<void, Error> AwaitAck();

    // Wire helpers (sender loop only)
    std::expected<void, Error> WriteWire(std::span<const std::byte> bytes);
    std::expected<void, Error> WriteRaw(std::span<const std::byte> bytes);
    std::expected<void, Error> FlushWire();

    // Mark Aborted with `err` (unless already terminal) and fail unflushed
    // requests, `inflight` and everything queued with the stored terminal
    // error.
    void Abort(SendRequest* inflight, const Error& err);
    void Succeed(SendRequest& req);
    void CompleteUnflushed();
    void FailUnflushed(const Error& err);
    void Complete(SendRequest& req, const std::optional<Error>& err);
    void CloseConnection();

    const StreamConfig config_;
    const Endpoint endpoint_;
    const std::string network_;
    const std::string trname_;
    const std::string route_path_;
    const uint64_t stream_id_;
    std::shared_ptr<BufferPool> pool_;

    SendQueue<SendRequest> queue_;
    Stats stats_;
    std::unique_ptr<BlockCompressor> compressor_;
    // Written requests whose last bytes are still in the pending compression
    // block. They succeed once that block reaches the socket.
    std::vector<SendRequest> unflushed_;

    std::atomic<StreamState> state_{StreamState::Idle};
    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    std::optional<Error> terminal_error_;
    bool loop_done_ = false;  // sender loop exited, all callbacks delivered

    std::atomic<uint64_t> session_id_{0};

    // Replaced only by the sender loop; conn_mutex_ guards the pointer so
    // Stop() can interrupt a blocked write from another thread.
    std::mutex conn_mutex_;
    std::unique_ptr<TcpConnection> conn_;

    std::thread sender_;
    std::atomic<std::thread::id> sender_thread_id_{};
};

}  // namespace obj_transport
