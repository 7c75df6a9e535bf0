// SPDX-License-Identifier: MIT

// src/send_queue.hpp
#pragma once

#include <cassert>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace obj_transport {

// SendQueue - bounded FIFO between Send() callers and one sender loop.
//
// Producers block in Push() while `capacity` items are queued. The consumer
// wakes one producer per Pop(). Close() refuses further pushes but leaves
// queued items poppable so a graceful shutdown can drain them.
//
// Thread safety: any number of producers, exactly one consumer.
template <typename T>
class SendQueue {
public:
    explicit SendQueue(size_t capacity) : capacity_(capacity) {
        assert(capacity_ > 0);
    }

    SendQueue(const SendQueue&) = delete;
    SendQueue& operator=(const SendQueue&) = delete;

    /// Enqueue an item, blocking while the queue is full.
    ///
    /// With `bypass_bound` the item is admitted even when full; the sender
    /// loop uses it for pushes made from its own thread. Returns false if the
    /// queue is (or becomes) closed, in which case `item` is left untouched.
    bool Push(T&& item, bool bypass_bound = false) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!bypass_bound) {
            not_full_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
        }
        if (closed_) {
            return false;
        }
        items_.push_back(std::move(item));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    /// Dequeue without waiting.
    std::optional<T> TryPop() {
        std::unique_lock<std::mutex> lock(mutex_);
        return PopLocked(lock);
    }

    /// Dequeue, waiting for an item. Returns nullopt once the queue is closed
    /// and empty. `waited` receives the time spent blocked.
    std::optional<T> Pop(std::chrono::nanoseconds* waited = nullptr) {
        auto start = std::chrono::steady_clock::now();
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
        if (waited) {
            *waited = std::chrono::steady_clock::now() - start;
        }
        return PopLocked(lock);
    }

    /// Refuse new pushes and wake every waiter. Idempotent.
    void Close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_full_.notify_all();
        not_empty_.notify_all();
    }

    /// Remove and return everything still queued.
    std::deque<T> DrainAll() {
        std::deque<T> out;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            out.swap(items_);
        }
        not_full_.notify_all();
        return out;
    }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool Closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t Capacity() const { return capacity_; }

private:
    std::optional<T> PopLocked(std::unique_lock<std::mutex>& lock) {
        if (items_.empty()) {
            return std::nullopt;
        }
        std::optional<T> item(std::move(items_.front()));
        items_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    std::deque<T> items_;
    bool closed_ = false;
};

}  // namespace obj_transport
