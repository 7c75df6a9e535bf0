// SPDX-License-Identifier: MIT

// src/delivery_queue.hpp
#pragma once

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <cstring>
#include <deque>
#include <expected>
#include <functional>
#include <mutex>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include "lib/stream/error.hpp"
#include "src/header.hpp"
#include "src/payload_source.hpp"

namespace obj_transport {

// DeliveryQueue - decoded objects of one inbound connection, handed from the
// event loop thread to the connection's delivery thread.
//
// The loop pushes each object's header followed by its payload in chunks.
// The delivery thread takes headers with Next() and pulls payload bytes with
// Read(), waiting until they arrive. Once `limit` bytes are waiting, Full()
// tells the loop to stop reading the socket; the resume callback then runs on
// the delivery thread as soon as it has drained the queue to half the limit.
//
// Close() ends input. Complete objects already queued stay deliverable; a
// reader that needs bytes which will never arrive gets the close error.
//
// Thread safety: one producer thread, one consumer thread.
class DeliveryQueue : public PayloadSource {
public:
    using ResumeCallback = std::function<void()>;

    explicit DeliveryQueue(size_t limit, ResumeCallback on_resume = {})
        : limit_(limit), on_resume_(std::move(on_resume)) {}

    DeliveryQueue(const DeliveryQueue&) = delete;
    DeliveryQueue& operator=(const DeliveryQueue&) = delete;

    // Producer side

    void PushObject(Header header) { Push(Entry{Kind::Object, std::move(header), {}}); }

    /// Append payload bytes of the object pushed last. The bytes are copied.
    void PushBytes(std::span<const std::byte> bytes) {
        if (bytes.empty()) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            buffered_ += bytes.size();
            entries_.push_back(Entry{Kind::Data, {}, {bytes.begin(), bytes.end()}});
        }
        cv_.notify_one();
    }

    /// Clean end of stream, reported by Next() after the last object.
    void PushEnd() { Push(Entry{Kind::End, {}, {}}); }

    /// No more input. The first error given wins.
    void Close(Error error) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!closed_) {
                closed_ = std::move(error);
            }
        }
        cv_.notify_all();
    }

    /// True once `limit` bytes wait for the consumer. Arms the resume callback.
    bool Full() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (buffered_ < limit_) {
            return false;
        }
        resume_armed_ = true;
        return true;
    }

    // Consumer side

    /// Wait for the next object. Returns its header, nullopt at the clean end
    /// of stream, or the close error once nothing deliverable is left.
    /// Payload left unread from the previous object is dropped.
    std::expected<std::optional<Header>, Error> Next() {
        std::unique_lock<std::mutex> lock(mutex_);
        for (;;) {
            cv_.wait(lock, [this] { return !entries_.empty() || closed_; });
            if (entries_.empty()) {
                return std::unexpected(*closed_);
            }
            Entry& front = entries_.front();
            if (front.kind == Kind::Data) {
                buffered_ -= front.bytes.size() - offset_;
                PopFront();
                if (TakeResume()) {
                    lock.unlock();
                    on_resume_();
                    lock.lock();
                }
                continue;
            }
            if (front.kind == Kind::End) {
                return std::optional<Header>{};
            }
            std::optional<Header> header = std::move(front.header);
            PopFront();
            return header;
        }
    }

    /// Copy payload of the current object. Returns 0 when the next queued
    /// entry belongs to another object or ends the stream.
    std::expected<size_t, Error> Read(std::span<std::byte> out) override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !entries_.empty() || closed_; });
        if (entries_.empty()) {
            return std::unexpected(*closed_);
        }
        Entry& front = entries_.front();
        if (front.kind != Kind::Data || out.empty()) {
            return 0;
        }
        size_t n = std::min(out.size(), front.bytes.size() - offset_);
        std::memcpy(out.data(), front.bytes.data() + offset_, n);
        offset_ += n;
        buffered_ -= n;
        if (offset_ == front.bytes.size()) {
            PopFront();
        }
        bool resume = TakeResume();
        lock.unlock();
        if (resume) {
            on_resume_();
        }
        return n;
    }

    /// Payload bytes waiting for the consumer.
    size_t Buffered() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return buffered_;
    }

private:
    enum class Kind { Object, Data, End };

    struct Entry {
        Kind kind;
        Header header;
        std::vector<std::byte> bytes;
    };

    void Push(Entry entry) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            entries_.push_back(std::move(entry));
        }
        cv_.notify_one();
    }

    void PopFront() {
        entries_.pop_front();
        offset_ = 0;
    }

    // Caller holds the lock
    bool TakeResume() {
        if (!resume_armed_ || buffered_ > limit_ / 2 || !on_resume_) {
            return false;
        }
        resume_armed_ = false;
        return true;
    }

    const size_t limit_;
    ResumeCallback on_resume_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Entry> entries_;
    size_t offset_ = 0;    // read position in entries_.front().bytes
    size_t buffered_ = 0;  // unread payload bytes
    bool resume_armed_ = false;
    std::optional<Error> closed_;
};

}  // namespace obj_transport
