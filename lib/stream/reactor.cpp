// SPDX-License-Identifier: MIT

// lib/stream/reactor.cpp
#include "lib/stream/reactor.hpp"

#include <sys/eventfd.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>

namespace obj_transport {

namespace {

uint32_t Interest(bool want_read, bool want_write) {
    uint32_t events = 0;
    if (want_read) events |= EPOLLIN | EPOLLRDHUP;
    if (want_write) events |= EPOLLOUT;
    return events;
}

}  // namespace

// Watch - one registered descriptor. Removes itself from epoll on
// destruction; the descriptor itself stays owned by the caller.
class Reactor::Watch : public IEventHandle {
public:
    Watch(Reactor& reactor, int fd, uint32_t events,
          ReadCallback on_read, WriteCallback on_write, ErrorCallback on_error)
        : reactor_(reactor)
        , fd_(fd)
        , on_read_(std::move(on_read))
        , on_write_(std::move(on_write))
        , on_error_(std::move(on_error)) {
        reactor_.Control(EPOLL_CTL_ADD, fd_, events, this);
        reactor_.watches_.fetch_add(1, std::memory_order_relaxed);
    }

    ~Watch() override {
        epoll_ctl(reactor_.epoll_fd_, EPOLL_CTL_DEL, fd_, nullptr);
        reactor_.watches_.fetch_sub(1, std::memory_order_relaxed);
    }

    void Update(bool want_read, bool want_write) override {
        reactor_.Control(EPOLL_CTL_MOD, fd_, Interest(want_read, want_write), this);
    }

    int fd() const override { return fd_; }

    void Dispatch(uint32_t events) {
        // Readers learn about EOF and socket errors from read() itself, so a
        // peer that writes and then closes still has its last bytes consumed.
        if ((events & (EPOLLIN | EPOLLRDHUP | EPOLLHUP | EPOLLERR)) && on_read_) {
            on_read_();
        } else if (events & (EPOLLERR | EPOLLHUP)) {
            int error = 0;
            socklen_t len = sizeof(error);
            getsockopt(fd_, SOL_SOCKET, SO_ERROR, &error, &len);
            if (on_error_) on_error_(error);
            return;
        }
        if ((events & EPOLLOUT) && on_write_) {
            on_write_();
        }
    }

private:
    Reactor& reactor_;
    int fd_;
    ReadCallback on_read_;
    WriteCallback on_write_;
    ErrorCallback on_error_;
};

Reactor::Reactor() : ready_(kMaxEvents) {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        throw std::system_error(errno, std::system_category(), "epoll_create1");
    }

    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        int err = errno;
        close(epoll_fd_);
        throw std::system_error(err, std::system_category(), "eventfd");
    }

    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.ptr = nullptr;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, wake_fd_, &ev) < 0) {
        int err = errno;
        close(wake_fd_);
        close(epoll_fd_);
        throw std::system_error(err, std::system_category(), "epoll_ctl wake_fd");
    }
}

Reactor::~Reactor() {
    close(wake_fd_);
    close(epoll_fd_);
}

void Reactor::Control(int op, int fd, uint32_t events, void* tag) {
    epoll_event ev{};
    ev.events = events;
    ev.data.ptr = tag;
    if (epoll_ctl(epoll_fd_, op, fd, &ev) < 0) {
        throw std::system_error(errno, std::system_category(),
                                op == EPOLL_CTL_ADD ? "epoll_ctl ADD" : "epoll_ctl MOD");
    }
}

std::unique_ptr<IEventHandle> Reactor::Register(
    int fd,
    bool want_read,
    bool want_write,
    ReadCallback on_read,
    WriteCallback on_write,
    ErrorCallback on_error) {
    return std::make_unique<Watch>(*this, fd, Interest(want_read, want_write),
                                   std::move(on_read), std::move(on_write),
                                   std::move(on_error));
}

void Reactor::Defer(Task fn) {
    {
        std::lock_guard<std::mutex> lock(deferred_mutex_);
        deferred_.push_back(std::move(fn));
    }
    if (!IsInEventLoopThread()) {
        Wake();
    }
}

int Reactor::Poll(int timeout_ms) {
    loop_thread_.store(std::this_thread::get_id(), std::memory_order_release);

    int n = epoll_wait(epoll_fd_, ready_.data(), kMaxEvents, timeout_ms);
    if (n < 0) {
        if (errno == EINTR) {
            return 0;
        }
        throw std::system_error(errno, std::system_category(), "epoll_wait");
    }

    // A callback never destroys another Watch directly (teardown is
    // deferred), so every tag in this batch stays valid.
    int dispatched = 0;
    for (int i = 0; i < n; ++i) {
        auto* watch = static_cast<Watch*>(ready_[i].data.ptr);
        if (watch == nullptr) {
            uint64_t count;
            [[maybe_unused]] auto r = read(wake_fd_, &count, sizeof(count));
            continue;
        }
        watch->Dispatch(ready_[i].events);
        ++dispatched;
    }

    RunDeferred();
    return dispatched;
}

void Reactor::RunDeferred() {
    // Tasks may defer more tasks; keep going until the queue stays empty
    for (;;) {
        std::vector<Task> batch;
        {
            std::lock_guard<std::mutex> lock(deferred_mutex_);
            if (deferred_.empty()) return;
            batch.swap(deferred_);
        }
        for (auto& task : batch) {
            task();
        }
    }
}

void Reactor::Run() {
    State expected = State::Idle;
    if (!state_.compare_exchange_strong(expected, State::Running, std::memory_order_acq_rel)) {
        return;  // already running or stopped
    }
    while (state_.load(std::memory_order_acquire) == State::Running) {
        Poll(-1);
    }
}

void Reactor::Stop() {
    state_.store(State::Stopped, std::memory_order_release);
    Wake();
}

void Reactor::Wake() {
    uint64_t one = 1;
    [[maybe_unused]] auto r = write(wake_fd_, &one, sizeof(one));
}

}  // namespace obj_transport
