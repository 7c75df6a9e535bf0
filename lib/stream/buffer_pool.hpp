// SPDX-License-Identifier: MIT

// lib/stream/buffer_pool.hpp
#pragma once

#include <cstddef>
#include <memory>
#include <memory_resource>
#include <mutex>
#include <vector>

namespace obj_transport {

/// Byte buffer handed out by a BufferPool. Backed by a PMR resource so a
/// pool can place all transfer buffers in one arena.
using PoolBuffer = std::pmr::vector<std::byte>;

/// Interface for payload and compression buffers used by the sender loop.
///
/// A pool is injected into each Stream; several Streams may share one pool,
/// so implementations must be thread-safe.
class BufferPool {
public:
    virtual ~BufferPool() = default;

    /// Return a buffer whose size() is exactly `size`. Contents are unspecified.
    virtual PoolBuffer Acquire(size_t size) = 0;

    /// Give a buffer back for reuse. The pool may drop it instead.
    virtual void Release(PoolBuffer buffer) = 0;
};

/// BufferPool backed by a shared PMR memory resource with a bounded free list.
///
/// Wraps a shared_ptr<memory_resource> so that outstanding buffers never
/// outlive the resource's owner through this pool. Released buffers are kept
/// (up to MaxPoolSize) and reused when their capacity is large enough.
///
/// Thread safety: Acquire/Release are safe from any thread.
class PmrBufferPool : public BufferPool {
public:
    /// Construct with default synchronized_pool_resource.
    PmrBufferPool()
        : resource_(std::make_shared<std::pmr::synchronized_pool_resource>()) {}

    /// Construct with caller-provided resource. The resource must tolerate
    /// concurrent use if the pool is shared between Streams.
    explicit PmrBufferPool(std::shared_ptr<std::pmr::memory_resource> resource,
                           size_t max_pool_size = kDefaultMaxPoolSize)
        : resource_(std::move(resource)), max_pool_size_(max_pool_size) {}

    PoolBuffer Acquire(size_t size) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto it = free_list_.begin(); it != free_list_.end(); ++it) {
                if (it->capacity() >= size) {
                    PoolBuffer buf = std::move(*it);
                    free_list_.erase(it);
                    buf.resize(size);
                    ++reused_;
                    return buf;
                }
            }
        }
        PoolBuffer buf(resource_.get());
        buf.resize(size);
        return buf;
    }

    void Release(PoolBuffer buffer) override {
        if (buffer.get_allocator().resource() != resource_.get()) {
            return;  // Not ours; let it free on its own resource
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (free_list_.size() < max_pool_size_) {
            free_list_.push_back(std::move(buffer));
        }
    }

    /// Number of buffers currently parked in the free list.
    size_t PoolSize() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return free_list_.size();
    }

    /// Number of Acquire() calls satisfied from the free list.
    size_t ReuseCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return reused_;
    }

    std::shared_ptr<std::pmr::memory_resource> GetResourcePtr() const {
        return resource_;
    }

    static constexpr size_t kDefaultMaxPoolSize = 32;

private:
    std::shared_ptr<std::pmr::memory_resource> resource_;
    mutable std::mutex mutex_;
    std::vector<PoolBuffer> free_list_;
    size_t max_pool_size_ = kDefaultMaxPoolSize;
    size_t reused_ = 0;
};

}  // namespace obj_transport
