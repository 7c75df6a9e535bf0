// SPDX-License-Identifier: MIT

// lib/stream/event_loop.hpp
#pragma once

#include <functional>
#include <memory>

namespace obj_transport {

/// Registration of one descriptor with an IEventLoop. Destroying the handle
/// unregisters the descriptor but does not close it.
class IEventHandle {
public:
    virtual ~IEventHandle() = default;

    /// Replace the readiness interest.
    virtual void Update(bool want_read, bool want_write) = 0;

    virtual int fd() const = 0;
};

/// Readiness loop the Receiver runs on.
///
/// Reactor is the epoll implementation shipped here. An application that
/// already owns a loop can host the Receiver on it by implementing this
/// interface instead.
///
/// Callbacks run on the loop thread only.
class IEventLoop {
public:
    using ReadCallback = std::function<void()>;
    using WriteCallback = std::function<void()>;
    using ErrorCallback = std::function<void(int error_code)>;
    using Task = std::function<void()>;

    virtual ~IEventLoop() = default;

    /// Watch `fd`. on_read also fires on hangup and socket errors when set,
    /// so the owner observes them through read(); on_error gets the
    /// SO_ERROR value otherwise.
    virtual std::unique_ptr<IEventHandle> Register(
        int fd,
        bool want_read,
        bool want_write,
        ReadCallback on_read,
        WriteCallback on_write,
        ErrorCallback on_error) = 0;

    /// Run `fn` on the loop thread after the current dispatch round.
    /// Callable from any thread.
    virtual void Defer(Task fn) = 0;

    virtual bool IsInEventLoopThread() const = 0;
};

}  // namespace obj_transport
