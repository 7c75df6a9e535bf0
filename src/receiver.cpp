// SPDX-License-Identifier: MIT

// src/receiver.cpp
#include "src/receiver.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <thread>
#include <vector>

#include <fmt/format.h>

#include "lib/stream/http_head_parser.hpp"
#include "lib/stream/log.hpp"
#include "src/compression.hpp"
#include "src/connection_head.hpp"
#include "src/delivery_queue.hpp"
#include "src/frame_codec.hpp"

namespace obj_transport {

namespace {

std::string FormatPeer(const sockaddr_storage& addr) {
    char buf[INET6_ADDRSTRLEN] = {};
    if (addr.ss_family == AF_INET) {
        const auto* in = reinterpret_cast<const sockaddr_in*>(&addr);
        inet_ntop(AF_INET, &in->sin_addr, buf, sizeof(buf));
        return fmt::format("{}:{}", buf, ntohs(in->sin_port));
    }
    if (addr.ss_family == AF_INET6) {
        const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&addr);
        inet_ntop(AF_INET6, &in6->sin6_addr, buf, sizeof(buf));
        return fmt::format("[{}]:{}", buf, ntohs(in6->sin6_port));
    }
    return "unknown";
}

}  // namespace

// Connection - one inbound stream connection.
//
//   Head   -> request head being parsed
//   Frames -> frame stream being decoded and queued for delivery
//   Ending -> stream end seen, waiting for the delivery thread to finish
//   Reply  -> status written, remaining input drained until the peer closes
//   Done   -> waiting for deferred destruction
//
// Decoded objects go through a DeliveryQueue to a delivery thread that runs
// the route handler, so payload is handed over while it arrives. Reading
// pauses while the queue holds max_buffered bytes.
class Receiver::Connection {
public:
    Connection(Receiver& owner, int fd, std::string peer)
        : owner_(owner),
          fd_(fd),
          peer_(std::move(peer)),
          head_parser_(HttpHeadParser::Kind::Request, owner.config_.max_request_head),
          wire_(&owner.pool_),
          plain_(&owner.pool_),
          delivery_(owner.config_.max_buffered, [this] { ScheduleResume(); }) {}

    ~Connection() {
        delivery_.Close(Error{ErrorCode::Cancelled, "connection closed"});
        if (deliverer_.joinable()) {
            deliverer_.join();
        }
        if (admitted_) {
            route_->ReleaseSession(head_.stream_id);
        }
        handle_.reset();
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    void Start() {
        handle_ = owner_.loop_.Register(
            fd_, true, false,
            [this] { OnReadable(); },
            [this] { OnWritable(); },
            [this](int err) { OnSocketError(err); });
    }

private:
    enum class Phase { Head, Frames, Ending, Reply, Done };

    void OnReadable() {
        if (paused_) {
            // Interest is off, so only a hangup or an error gets here
            Fail(Error{ErrorCode::ConnectionClosed, fmt::format("{} dropped the connection", peer_)});
            return;
        }
        while (phase_ != Phase::Done && !paused_) {
            auto seg = owner_.pool_.Acquire();
            ssize_t n = ::read(fd_, seg->data.data(), Segment::kSize);
            if (n > 0) {
                seg->size = static_cast<size_t>(n);
                Ingest(std::move(seg));
                continue;
            }
            if (n == 0) {
                OnEof();
                return;
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                Fail(Error{ErrorCode::ConnectionFailed, "read() failed", errno});
            }
            return;
        }
    }

    void OnWritable() {
        if (phase_ == Phase::Reply) {
            FlushReply();
        }
    }

    void OnSocketError(int err) {
        if (phase_ == Phase::Frames || phase_ == Phase::Ending) {
            Fail(Error{ErrorCode::ConnectionFailed, "socket error", err});
        } else {
            Finish();
        }
    }

    void Ingest(std::shared_ptr<Segment> seg) {
        switch (phase_) {
            case Phase::Head: {
                auto bytes = seg->ReadSpan();
                auto used = head_parser_.Feed(bytes);
                if (!used) {
                    TransportLog()->warn("receiver: bad request head from {}: {}", peer_,
                                         used.error());
                    Reply(400);
                    return;
                }
                if (!head_parser_.IsComplete()) {
                    return;
                }
                OnHead();
                if (phase_ != Phase::Frames) {
                    return;
                }
                auto rest = bytes.subspan(*used);
                if (!rest.empty()) {
                    Input().AppendBytes(rest);
                }
                Process();
                return;
            }
            case Phase::Frames:
                Input().Append(std::move(seg));
                Process();
                return;
            case Phase::Ending:
            case Phase::Reply:
                discarded_ += seg->size;
                if (discarded_ > owner_.config_.max_discard) {
                    Finish();
                }
                return;
            case Phase::Done:
                return;
        }
    }

    // Bytes from the socket land here: compressed blocks or plain frames
    BufferChain& Input() { return decompressor_ ? wire_ : plain_; }

    void OnHead() {
        auto head = ParseRequestHead(head_parser_.Head());
        if (!head) {
            TransportLog()->warn("receiver: bad request head from {}: {}", peer_, head.error());
            Reply(400);
            return;
        }
        head_ = std::move(*head);

        route_ = owner_.router_.Resolve(head_.path);
        if (!route_) {
            TransportLog()->warn("receiver: no route {} (from {})", head_.path, peer_);
            Reply(404);
            return;
        }

        if (head_.compress == CompressMode::Zstd) {
            if (head_.block_size > owner_.config_.max_block_size) {
                TransportLog()->warn("receiver: {} block size {} exceeds {}", head_.path,
                                     head_.block_size, owner_.config_.max_block_size);
                Reply(400);
                return;
            }
            decompressor_ = std::make_unique<BlockDecompressor>(head_.block_size);
        }

        admitted_ = true;
        if (!route_->AdmitSession(head_.stream_id, head_.session_id)) {
            stale_ = true;
            TransportLog()->warn("receiver: {} stream {:x} session {} is stale, discarding",
                                 head_.path, head_.stream_id, head_.session_id);
        }
        phase_ = Phase::Frames;
        deliverer_ = std::thread([this] { DeliverLoop(); });
        TransportLog()->debug("receiver: {} stream {:x} session {} from {}{}", head_.path,
                              head_.stream_id, head_.session_id, peer_,
                              decompressor_ ? " (zstd)" : "");
    }

    void Process() {
        if (decompressor_) {
            if (auto r = decompressor_->Process(wire_, plain_); !r) {
                Fail(r.error());
                return;
            }
        }
        ParseFrames();
    }

    void ParseFrames() {
        const auto& cfg = owner_.config_;
        while (phase_ == Phase::Frames && !paused_) {
            if (!in_object_) {
                if (plain_.Size() < kLengthPrefixSize) {
                    return;
                }
                std::array<std::byte, kLengthPrefixSize> prefix{};
                plain_.CopyTo(0, prefix.size(), prefix.data());
                auto len = CheckHeaderLength(prefix, cfg.max_header_size);
                if (!len) {
                    Fail(len.error());
                    return;
                }
                if (plain_.Size() < kLengthPrefixSize + *len) {
                    return;
                }
                header_body_.resize(*len);
                plain_.CopyTo(kLengthPrefixSize, *len, header_body_.data());
                plain_.Consume(kLengthPrefixSize + *len);

                auto frame = DecodeHeaderBody(header_body_);
                if (!frame) {
                    Fail(frame.error());
                    return;
                }
                if (frame->kind == FrameKind::StreamEnd) {
                    EndOfStream();
                    return;
                }
                BeginObject(std::move(frame->header));
            }

            if (remaining_ > 0) {
                if (plain_.Size() == 0) {
                    return;
                }
                size_t n = std::min(remaining_, plain_.ContiguousSize());
                if (!stale_) {
                    delivery_.PushBytes({plain_.DataAt(0), n});
                }
                plain_.Consume(n);
                remaining_ -= n;
                if (!stale_ && delivery_.Full()) {
                    Pause();
                }
                if (remaining_ > 0) {
                    continue;
                }
            }
            in_object_ = false;
        }
    }

    void BeginObject(Header header) {
        if (!stale_ && !route_->IsCurrent(head_.stream_id, head_.session_id)) {
            stale_ = true;
            TransportLog()->warn("receiver: {} stream {:x} session {} superseded, discarding",
                                 head_.path, head_.stream_id, head_.session_id);
        }
        in_object_ = true;
        remaining_ = static_cast<size_t>(header.attrs.size);
        if (stale_) {
            route_->CountStale();
        } else {
            delivery_.PushObject(std::move(header));
        }
    }

    void EndOfStream() {
        TransportLog()->debug("receiver: {} stream {:x} session {} ended", head_.path,
                              head_.stream_id, head_.session_id);
        phase_ = Phase::Ending;
        wire_.Clear();
        plain_.Clear();
        delivery_.PushEnd();
    }

    // Stop reading until the delivery thread has drained the queue
    void Pause() {
        paused_ = true;
        handle_->Update(false, false);
    }

    void Resume() {
        if (!paused_ || phase_ != Phase::Frames) {
            return;
        }
        paused_ = false;
        handle_->Update(true, false);
        Process();
    }

    // Delivery thread
    void ScheduleResume() {
        owner_.loop_.Defer([this, alive = std::weak_ptr<bool>(alive_)] {
            if (!alive.expired()) {
                Resume();
            }
        });
    }

    // Delivery thread: hand objects to the route handler in wire order
    void DeliverLoop() {
        for (;;) {
            auto next = delivery_.Next();
            if (!next) {
                return;
            }
            if (!*next) {
                break;
            }
            ObjectReader reader(delivery_, static_cast<size_t>((*next)->attrs.size));
            route_->Deliver(**next, reader);
            if (auto r = reader.Discard(); !r) {
                return;
            }
        }
        owner_.loop_.Defer([this, alive = std::weak_ptr<bool>(alive_)] {
            if (!alive.expired() && phase_ == Phase::Ending) {
                Reply(200);
            }
        });
    }

    void OnEof() {
        switch (phase_) {
            case Phase::Frames: {
                Error err{ErrorCode::ConnectionClosed,
                          fmt::format("{} closed before stream end", peer_)};
                if (!stale_) {
                    TransportLog()->warn("receiver: {}: {}", head_.path, err);
                    route_->ReportError(err);
                }
                delivery_.Close(err);
                Finish();
                return;
            }
            case Phase::Ending:
                peer_eof_ = true;
                handle_->Update(false, false);
                return;
            case Phase::Reply:
                peer_eof_ = true;
                if (reply_pos_ == reply_.size()) {
                    Finish();
                }
                return;
            case Phase::Head:
            case Phase::Done:
                Finish();
                return;
        }
    }

    void Fail(const Error& err) {
        TransportLog()->error("receiver: {} from {}: {}", head_.path, peer_, err);
        if (route_ && !stale_) {
            route_->ReportError(err);
        }
        delivery_.Close(err);
        Finish();
    }

    void Reply(int status) {
        phase_ = Phase::Reply;
        wire_.Clear();
        plain_.Clear();
        reply_ = BuildResponse(status);
        reply_pos_ = 0;
        FlushReply();
    }

    void FlushReply() {
        while (reply_pos_ < reply_.size()) {
            ssize_t n = ::send(fd_, reply_.data() + reply_pos_, reply_.size() - reply_pos_,
                               MSG_NOSIGNAL);
            if (n > 0) {
                reply_pos_ += static_cast<size_t>(n);
                continue;
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                handle_->Update(!peer_eof_, true);
                return;
            }
            Finish();
            return;
        }
        ::shutdown(fd_, SHUT_WR);
        if (peer_eof_) {
            Finish();
            return;
        }
        handle_->Update(true, false);
    }

    void Finish() {
        if (phase_ == Phase::Done) {
            return;
        }
        phase_ = Phase::Done;
        if (handle_) {
            handle_->Update(false, false);
        }
        owner_.Retire(this);
    }

    Receiver& owner_;
    int fd_;
    std::string peer_;
    std::unique_ptr<IEventHandle> handle_;
    Phase phase_ = Phase::Head;

    HttpHeadParser head_parser_;
    ConnectionHead head_;
    std::shared_ptr<Route> route_;
    bool admitted_ = false;
    bool stale_ = false;

    std::unique_ptr<BlockDecompressor> decompressor_;
    BufferChain wire_;
    BufferChain plain_;
    std::vector<std::byte> header_body_;
    bool in_object_ = false;
    size_t remaining_ = 0;  // payload bytes of the current object still to come
    bool paused_ = false;

    DeliveryQueue delivery_;
    std::thread deliverer_;

    std::string reply_;
    size_t reply_pos_ = 0;
    size_t discarded_ = 0;
    bool peer_eof_ = false;

    // Deferred callbacks check this before touching the connection
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

// Receiver

Receiver::Receiver(IEventLoop& loop, Router& router, ReceiverConfig config)
    : loop_(loop), router_(router), config_(config) {
    config_.Normalize();
}

Receiver::~Receiver() {
    Close();
}

std::expected<uint16_t, Error> Receiver::Listen(uint16_t port, const std::string& address) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        return std::unexpected(Error{ErrorCode::ConnectionFailed,
            fmt::format("invalid listen address '{}'", address)});
    }

    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return std::unexpected(Error{ErrorCode::ConnectionFailed, "socket() failed", errno});
    }
    int one = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        auto err = errno;
        ::close(fd);
        return std::unexpected(Error{ErrorCode::ConnectionFailed,
            fmt::format("bind({}:{}) failed", address, port), err});
    }
    if (::listen(fd, config_.listen_backlog) < 0) {
        auto err = errno;
        ::close(fd);
        return std::unexpected(Error{ErrorCode::ConnectionFailed, "listen() failed", err});
    }

    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        auto err = errno;
        ::close(fd);
        return std::unexpected(Error{ErrorCode::ConnectionFailed, "getsockname() failed", err});
    }

    listen_fd_ = fd;
    port_ = ntohs(addr.sin_port);
    listen_handle_ = loop_.Register(
        fd, true, false,
        [this] { OnAccept(); },
        {},
        [this](int err) {
            TransportLog()->error("receiver: listen socket error (errno {})", err);
        });
    TransportLog()->info("receiver listening on {}:{}", address, port_);
    return port_;
}

void Receiver::Close() {
    listen_handle_.reset();
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
    connections_.clear();
}

void Receiver::OnAccept() {
    for (;;) {
        sockaddr_storage peer{};
        socklen_t len = sizeof(peer);
        int fd = ::accept4(listen_fd_, reinterpret_cast<sockaddr*>(&peer), &len,
                           SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (fd < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                TransportLog()->warn("receiver: accept() failed (errno {})", errno);
            }
            return;
        }
        int one = 1;
        setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

        auto conn = std::make_unique<Connection>(*this, fd, FormatPeer(peer));
        auto* raw = conn.get();
        connections_.emplace(raw, std::move(conn));
        raw->Start();
    }
}

void Receiver::Retire(Connection* conn) {
    loop_.Defer([this, conn, alive = std::weak_ptr<bool>(alive_)] {
        if (alive.expired()) {
            return;
        }
        connections_.erase(conn);
    });
}

}  // namespace obj_transport
