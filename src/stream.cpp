// SPDX-License-Identifier: MIT

// src/stream.cpp
#include "src/stream.hpp"

#include <array>
#include <chrono>
#include <random>
#include <utility>

#include <fmt/format.h>

#include "lib/stream/dns_resolver.hpp"
#include "lib/stream/http_head_parser.hpp"
#include "lib/stream/log.hpp"
#include "lib/stream/retry_policy.hpp"
#include "src/connection_head.hpp"
#include "src/frame_codec.hpp"

namespace obj_transport {

namespace {

uint64_t RandomStreamId() {
    std::random_device rd;
    std::mt19937_64 gen((static_cast<uint64_t>(rd()) << 32) | rd());
    uint64_t id = 0;
    while (id == 0) {
        id = gen();
    }
    return id;
}

StreamConfig Normalized(StreamConfig config) {
    config.Normalize();
    return config;
}

Error CancelledError() {
    return Error{ErrorCode::Cancelled, "stream stopped"};
}

}  // namespace

Stream::Stream(StreamConfig config, Endpoint endpoint, std::string network, std::string trname,
               std::shared_ptr<BufferPool> pool)
    : config_(Normalized(std::move(config))),
      endpoint_(std::move(endpoint)),
      network_(std::move(network)),
      trname_(std::move(trname)),
      route_path_(obj_transport::RoutePath(network_, trname_)),
      stream_id_(RandomStreamId()),
      pool_(pool ? std::move(pool) : std::make_shared<PmrBufferPool>()),
      queue_(config_.burst) {
    if (config_.compression.enabled) {
        compressor_ = std::make_unique<BlockCompressor>(config_.compression);
    }
}

Stream::~Stream() {
    Stop();
    if (sender_.joinable()) {
        sender_.join();
    }
}

std::optional<Error> Stream::TerminalError() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return terminal_error_;
}

std::expected<void, Error> Stream::StatusLocked() const {
    if (terminal_error_) {
        return std::unexpected(*terminal_error_);
    }
    return {};
}

std::expected<void, Error> Stream::EnsureStarted() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto st = state_.load(std::memory_order_acquire);
    if (st == StreamState::Active) {
        return {};
    }
    if (st != StreamState::Idle) {
        return std::unexpected(Error{ErrorCode::InvalidState,
            fmt::format("stream {} is {}", route_path_, StreamStateName(st))});
    }
    state_.store(StreamState::Active, std::memory_order_release);
    sender_ = std::thread([this] { Run(); });
    return {};
}

std::expected<void, Error> Stream::Open() {
    return EnsureStarted();
}

std::expected<void, Error> Stream::Send(Header header, std::unique_ptr<PayloadSource> payload,
                                        SendCallback callback) {
    if (header.attrs.size > 0 && !payload) {
        return std::unexpected(Error{ErrorCode::PayloadSizeMismatch,
            fmt::format("{} declares {} bytes but has no payload", header,
                        header.attrs.size)});
    }
    auto frame = EncodeFrameHeader(header, config_.max_header_size);
    if (!frame) {
        return std::unexpected(frame.error());
    }
    if (auto r = EnsureStarted(); !r) {
        return r;
    }

    SendRequest req{std::move(header), std::move(*frame), std::move(payload),
                    std::move(callback)};
    if (!queue_.Push(std::move(req), IsSenderThread())) {
        return std::unexpected(Error{ErrorCode::InvalidState,
            fmt::format("stream {} no longer accepts sends ({})", route_path_,
                        StreamStateName(GetState()))});
    }
    return {};
}

std::expected<void, Error> Stream::Fin() {
    if (IsSenderThread()) {
        return std::unexpected(Error{ErrorCode::InvalidState,
            "Fin() called from a completion callback"});
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        switch (state_.load(std::memory_order_acquire)) {
            case StreamState::Idle:
                // Nothing was ever sent: no connection to close
                state_.store(StreamState::Closed, std::memory_order_release);
                state_cv_.notify_all();
                return {};
            case StreamState::Active:
                state_.store(StreamState::Draining, std::memory_order_release);
                break;
            case StreamState::Draining:
            case StreamState::Closed:
            case StreamState::Aborted:
                break;
        }
    }

    queue_.Close();

    // Every completion callback has run once the sender loop exits
    std::unique_lock<std::mutex> lock(state_mutex_);
    state_cv_.wait(lock, [this] { return loop_done_ || !sender_.joinable(); });
    return StatusLocked();
}

std::expected<void, Error> Stream::Stop() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto st = state_.load(std::memory_order_acquire);
        if (st == StreamState::Closed || st == StreamState::Aborted) {
            return StatusLocked();
        }
        terminal_error_ = CancelledError();
        state_.store(StreamState::Aborted, std::memory_order_release);
        state_cv_.notify_all();
    }
    TransportLog()->info("stream {} [{:x}] stopped", route_path_, stream_id_);

    queue_.Close();
    {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        if (conn_) {
            conn_->Interrupt();
        }
    }
    return std::unexpected(CancelledError());
}

// Sender loop

void Stream::Run() {
    sender_thread_id_.store(std::this_thread::get_id(), std::memory_order_release);

    if (!config_.dry_run) {
        auto r = Connect();
        if (!r && CanReconnect(r.error())) {
            r = Reconnect(r.error());
        }
        if (!r) {
            Abort(nullptr, r.error());
        }
    }

    while (GetState() != StreamState::Aborted) {
        auto req = queue_.TryPop();
        if (!req) {
            // About to wait: push the partial compression block out first
            if (auto r = FlushWire(); !r && !Recover(r.error())) {
                break;
            }
            std::chrono::nanoseconds waited{0};
            req = queue_.Pop(&waited);
            stats_.AddIdle(waited);
        }
        if (!req) {
            break;  // closed and drained
        }
        if (GetState() == StreamState::Aborted) {
            Abort(&*req, CancelledError());
            break;
        }
        if (!Process(*req)) {
            break;
        }
    }

    if (GetState() == StreamState::Aborted) {
        Abort(nullptr, CancelledError());
    } else {
        Finish();
    }
    CloseConnection();

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        loop_done_ = true;
    }
    state_cv_.notify_all();
}

bool Stream::Process(SendRequest& req) {
    auto start = std::chrono::steady_clock::now();
    auto busy = [this, start] { stats_.AddBusy(std::chrono::steady_clock::now() - start); };

    for (;;) {
        auto r = Transmit(req);
        if (r) {
            busy();
            if (GetState() == StreamState::Aborted) {
                // Stop() landed while the request was being written
                Abort(&req, CancelledError());
                return false;
            }
            if (compressor_ && compressor_->Pending() > 0) {
                unflushed_.push_back(std::move(req));
            } else {
                Succeed(req);
            }
            return true;
        }

        Error err = r.error();
        if (!CanReconnect(err)) {
            busy();
            Abort(&req, err);
            return false;
        }
        if (auto rc = Reconnect(err); !rc) {
            busy();
            Abort(&req, rc.error());
            return false;
        }

        bool resend = config_.reconnect.inflight == InflightPolicy::Resend &&
                      (!req.payload || req.payload->Rewind());
        if (!resend) {
            busy();
            Complete(req, err);
            return true;
        }
        TransportLog()->info("stream {} resending {} on session {}", route_path_, req.header,
                             SessionId());
    }
}

std::expected<void, Error> Stream::Transmit(SendRequest& req) {
    const int64_t size = req.header.attrs.size;
    if (!config_.dry_run) {
        if (auto r = WriteWire(req.frame); !r) {
            return r;
        }
    }
    if (!req.payload) {
        return {};
    }

    PoolBuffer buf = pool_->Acquire(config_.payload_chunk_size);
    std::expected<void, Error> result;
    int64_t sent = 0;
    for (;;) {
        auto n = req.payload->Read(std::span<std::byte>(buf.data(), buf.size()));
        if (!n) {
            result = std::unexpected(n.error());
            break;
        }
        if (*n == 0) {
            break;
        }
        if (sent + static_cast<int64_t>(*n) > size) {
            result = std::unexpected(Error{ErrorCode::PayloadSizeMismatch,
                fmt::format("payload of {} exceeds declared size", req.header)});
            break;
        }
        if (!config_.dry_run) {
            if (auto w = WriteWire(std::span<const std::byte>(buf.data(), *n)); !w) {
                result = w;
                break;
            }
        }
        sent += static_cast<int64_t>(*n);
        stats_.AddOffset(static_cast<int64_t>(*n));
    }
    pool_->Release(std::move(buf));

    if (result && sent != size) {
        result = std::unexpected(Error{ErrorCode::PayloadSizeMismatch,
            fmt::format("payload of {} ended after {} bytes", req.header, sent)});
    }
    return result;
}

std::expected<void, Error> Stream::Connect() {
    auto addr = ResolveHostname(endpoint_.host, endpoint_.port);
    if (!addr) {
        return std::unexpected(addr.error());
    }
    auto conn = TcpConnection::Connect(*addr, config_.socket);
    if (!conn) {
        return std::unexpected(conn.error());
    }

    uint64_t session = session_id_.fetch_add(1, std::memory_order_acq_rel) + 1;
    ConnectionHead head{
        .path = route_path_,
        .host = fmt::format("{}:{}", endpoint_.host, endpoint_.port),
        .stream_id = stream_id_,
        .session_id = session,
        .compress = compressor_ ? CompressMode::Zstd : CompressMode::None,
        .block_size = compressor_ ? config_.compression.max_block_size : 0,
    };
    std::string text = BuildRequestHead(head);
    if (auto r = (*conn)->WriteAll(std::as_bytes(std::span(text))); !r) {
        return r;
    }

    {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        if (GetState() == StreamState::Aborted) {
            return std::unexpected(CancelledError());
        }
        conn_ = std::move(*conn);
    }
    if (compressor_) {
        compressor_->Reset();
    }
    TransportLog()->info("stream {} [{:x}] connected to {}:{}, session {}", route_path_,
                         stream_id_, endpoint_.host, endpoint_.port, session);
    return {};
}

bool Stream::CanReconnect(const Error& err) const {
    return config_.reconnect.enabled && !config_.dry_run &&
           RetryPolicy::IsRetryable(err.code) && GetState() != StreamState::Aborted;
}

std::expected<void, Error> Stream::Reconnect(const Error& cause) {
    CloseConnection();
    // Their pending block died with the connection
    FailUnflushed(cause);

    RetryPolicy policy(config_.reconnect.retry);
    Error last = cause;
    while (policy.ShouldRetry(last)) {
        auto delay = policy.GetNextDelay();
        policy.RecordAttempt();
        TransportLog()->warn("stream {} connection lost ({}), attempt {} in {}ms", route_path_,
                             last, policy.Attempts(), delay.count());
        {
            std::unique_lock<std::mutex> lock(state_mutex_);
            if (state_cv_.wait_for(lock, delay, [this] {
                    return state_.load(std::memory_order_acquire) == StreamState::Aborted;
                })) {
                return std::unexpected(CancelledError());
            }
        }
        auto r = Connect();
        if (r) {
            return {};
        }
        last = r.error();
    }
    TransportLog()->error("stream {} giving up after {} reconnect attempts: {}", route_path_,
                          policy.Attempts(), last);
    return std::unexpected(last);
}

bool Stream::Recover(const Error& err) {
    if (CanReconnect(err)) {
        auto r = Reconnect(err);
        if (r) {
            return true;
        }
        Abort(nullptr, r.error());
        return false;
    }
    Abort(nullptr, err);
    return false;
}

void Stream::Finish() {
    std::expected<void, Error> r;
    if (!config_.dry_run) {
        auto end = EncodeStreamEnd();
        r = WriteWire(end);
        if (r) r = FlushWire();
        if (r) r = AwaitAck();
    }

    std::optional<Error> failed;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_.load(std::memory_order_acquire) == StreamState::Aborted) {
            // Stop() won the race; its status stands
            failed = terminal_error_.value_or(CancelledError());
        } else if (r) {
            state_.store(StreamState::Closed, std::memory_order_release);
            auto s = stats_.Snapshot();
            TransportLog()->info("stream {} [{:x}] closed: {} objects, {} bytes, idle {:.1f}%",
                                 route_path_, stream_id_, s.num, s.offset, s.idle_pct);
        } else {
            state_.store(StreamState::Aborted, std::memory_order_release);
            terminal_error_ = r.error();
            failed = r.error();
            TransportLog()->error("stream {} [{:x}] failed to close: {}", route_path_,
                                  stream_id_, r.error());
        }
        state_cv_.notify_all();
    }
    if (failed) {
        FailUnflushed(*failed);
    }
}

std::expected<void, Error> Stream::AwaitAck() {
    conn_->ShutdownWrite();

    HttpHeadParser parser(HttpHeadParser::Kind::Response);
    std::array<std::byte, 1024> buf{};
    while (!parser.IsComplete()) {
        auto n = conn_->ReadSome(buf);
        if (!n) {
            return std::unexpected(n.error());
        }
        if (*n == 0) {
            return std::unexpected(Error{ErrorCode::ConnectionClosed,
                "receiver closed the connection before acknowledging"});
        }
        if (auto used = parser.Feed(std::span<const std::byte>(buf.data(), *n)); !used) {
            return std::unexpected(used.error());
        }
    }
    return StatusToResult(parser.Head().status);
}

// Wire helpers

std::expected<void, Error> Stream::WriteRaw(std::span<const std::byte> bytes) {
    auto r = conn_->WriteAll(bytes);
    if (r && compressor_) {
        stats_.AddCompressed(static_cast<int64_t>(bytes.size()));
        CompleteUnflushed();
    }
    return r;
}

std::expected<void, Error> Stream::WriteWire(std::span<const std::byte> bytes) {
    if (compressor_) {
        return compressor_->Write(bytes, [this](std::span<const std::byte> block) {
            return WriteRaw(block);
        });
    }
    return WriteRaw(bytes);
}

std::expected<void, Error> Stream::FlushWire() {
    if (!compressor_ || !conn_) {
        return {};
    }
    return compressor_->Flush([this](std::span<const std::byte> block) {
        return WriteRaw(block);
    });
}

void Stream::Abort(SendRequest* inflight, const Error& err) {
    Error deliver = err;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto st = state_.load(std::memory_order_acquire);
        if (st != StreamState::Aborted && st != StreamState::Closed) {
            state_.store(StreamState::Aborted, std::memory_order_release);
            terminal_error_ = err;
            TransportLog()->error("stream {} [{:x}] aborted: {}", route_path_, stream_id_, err);
        }
        if (terminal_error_) {
            deliver = *terminal_error_;
        }
        state_cv_.notify_all();
    }

    queue_.Close();
    FailUnflushed(deliver);
    if (inflight) {
        Complete(*inflight, deliver);
    }
    for (auto& req : queue_.DrainAll()) {
        Complete(req, deliver);
    }
}

void Stream::Succeed(SendRequest& req) {
    stats_.AddObject(req.header.attrs.size);
    TransportLog()->debug("stream {} sent {}", route_path_, req.header);
    Complete(req, std::nullopt);
}

void Stream::CompleteUnflushed() {
    auto done = std::exchange(unflushed_, {});
    for (auto& req : done) {
        Succeed(req);
    }
}

void Stream::FailUnflushed(const Error& err) {
    auto failed = std::exchange(unflushed_, {});
    for (auto& req : failed) {
        Complete(req, err);
    }
}

void Stream::Complete(SendRequest& req, const std::optional<Error>& err) {
    SendCallback cb = std::move(req.callback);
    req.callback = nullptr;
    if (cb) {
        cb(req.header, err);
    }
    req.payload.reset();
}

void Stream::CloseConnection() {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    conn_.reset();
}

}  // namespace obj_transport
