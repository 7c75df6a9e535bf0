// SPDX-License-Identifier: MIT

// lib/stream/reactor.hpp
#pragma once

#include <sys/epoll.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "lib/stream/event_loop.hpp"

namespace obj_transport {

// Reactor - epoll loop hosting the receive path.
//
// Poll()/Run() must be called from one thread. Defer(), Wake() and Stop()
// may be called from any thread. Registration and handle destruction happen
// on the loop thread, or before the loop starts.
class Reactor : public IEventLoop {
public:
    Reactor();
    ~Reactor() override;

    Reactor(const Reactor&) = delete;
    Reactor& operator=(const Reactor&) = delete;
    Reactor(Reactor&&) = delete;
    Reactor& operator=(Reactor&&) = delete;

    // IEventLoop interface
    std::unique_ptr<IEventHandle> Register(
        int fd,
        bool want_read,
        bool want_write,
        ReadCallback on_read,
        WriteCallback on_write,
        ErrorCallback on_error) override;

    void Defer(Task fn) override;

    bool IsInEventLoopThread() const override {
        return loop_thread_.load(std::memory_order_acquire) == std::this_thread::get_id();
    }

    // Wait up to timeout_ms, dispatch ready descriptors, then run deferred
    // tasks. Returns the number of descriptors dispatched.
    int Poll(int timeout_ms = -1);

    // Run until Stop() called
    void Run();

    // Make Run() return after the current iteration
    void Stop();

    // Interrupt a blocked epoll_wait
    void Wake();

    // Descriptors currently registered
    size_t WatchCount() const { return watches_.load(std::memory_order_relaxed); }

private:
    class Watch;

    void Control(int op, int fd, uint32_t events, void* tag);
    void RunDeferred();

    enum class State { Idle, Running, Stopped };

    int epoll_fd_ = -1;
    int wake_fd_ = -1;  // eventfd, registered with a null tag
    std::atomic<State> state_{State::Idle};
    std::atomic<size_t> watches_{0};
    std::atomic<std::thread::id> loop_thread_{};
    std::vector<epoll_event> ready_;

    std::mutex deferred_mutex_;
    std::vector<Task> deferred_;

    static constexpr int kMaxEvents = 64;
};

}  // namespace obj_transport
