// SPDX-License-Identifier: MIT

// lib/stream/buffer_chain.hpp
#pragma once

#include <algorithm>
#include <array>
#include <cassert>
#include <cstddef>
#include <cstring>
#include <deque>
#include <memory>
#include <span>
#include <utility>
#include <vector>

namespace obj_transport {

// Fixed-size buffer segment filled by socket reads and the block decompressor.
//
// Thread safety: Not thread-safe. Access must be externally synchronized.
struct Segment {
    static constexpr size_t kSize = 64 * 1024;

    alignas(8) std::array<std::byte, kSize> data;
    size_t size = 0;  // valid bytes from the start of data

    std::span<std::byte> WriteSpan() noexcept {
        return std::span{data.data() + size, kSize - size};
    }

    std::span<const std::byte> ReadSpan() const noexcept {
        return std::span{data.data(), size};
    }

    size_t Remaining() const noexcept { return kSize - size; }

    bool IsFull() const noexcept { return size >= kSize; }
};

// Free list of segments shared by the connections of one Receiver.
//
// Thread safety: Not thread-safe. Used from the reactor thread only.
class SegmentPool {
public:
    explicit SegmentPool(size_t max_pool_size = kDefaultMaxPoolSize)
        : max_pool_size_(max_pool_size) {}

    std::shared_ptr<Segment> Acquire() {
        if (free_list_.empty()) {
            return std::make_shared<Segment>();
        }
        auto seg = std::move(free_list_.back());
        free_list_.pop_back();
        seg->size = 0;
        return seg;
    }

    // Pools the segment only when nobody else holds it
    void Release(std::shared_ptr<Segment> seg) {
        if (seg && seg.use_count() == 1 && free_list_.size() < max_pool_size_) {
            free_list_.push_back(std::move(seg));
        }
    }

    size_t PoolSize() const noexcept { return free_list_.size(); }
    size_t MaxPoolSize() const noexcept { return max_pool_size_; }

    static constexpr size_t kDefaultMaxPoolSize = 16;

private:
    std::vector<std::shared_ptr<Segment>> free_list_;
    size_t max_pool_size_;
};

// BufferChain - received bytes that have not been parsed yet.
//
// Frames and compressed blocks cross segment boundaries freely: readers copy
// what they need with CopyTo() and Consume() it once handled. Segments
// drained by Consume() or Clear() go back to the pool given at construction.
//
// Thread safety: Not thread-safe. All operations must be called from the same
// thread (the reactor thread on the receive path).
class BufferChain {
public:
    explicit BufferChain(SegmentPool* pool = nullptr) : pool_(pool) {}

    BufferChain(const BufferChain&) = delete;
    BufferChain& operator=(const BufferChain&) = delete;

    ~BufferChain() { Clear(); }

    // Take a filled segment (a socket read). Empty segments are dropped.
    void Append(std::shared_ptr<Segment> seg) {
        assert((!seg || seg->size <= Segment::kSize) && "segment size exceeds capacity");
        if (seg && seg->size > 0) {
            size_ += seg->size;
            segments_.push_back(std::move(seg));
        }
    }

    // Copy bytes in, topping up the tail segment before taking new ones.
    // A tail segment shared with someone else is never written to.
    void AppendBytes(std::span<const std::byte> bytes) {
        while (!bytes.empty()) {
            if (segments_.empty() || segments_.back()->IsFull() ||
                segments_.back().use_count() > 1) {
                segments_.push_back(NewSegment());
            }
            Segment& tail = *segments_.back();
            size_t n = std::min(tail.Remaining(), bytes.size());
            std::memcpy(tail.WriteSpan().data(), bytes.data(), n);
            tail.size += n;
            size_ += n;
            bytes = bytes.subspan(n);
        }
    }

    // Drop `bytes` from the front (clamped to Size()).
    void Consume(size_t bytes) {
        while (bytes > 0 && !segments_.empty()) {
            size_t available = segments_.front()->size - front_offset_;
            if (bytes < available) {
                front_offset_ += bytes;
                size_ -= bytes;
                return;
            }
            bytes -= available;
            size_ -= available;
            front_offset_ = 0;
            Recycle(std::move(segments_.front()));
            segments_.pop_front();
        }
    }

    // Pointer to the byte at `offset` past the unconsumed start.
    const std::byte* DataAt(size_t offset) const noexcept {
        auto [index, pos] = Locate(offset);
        assert(index < segments_.size() && "DataAt: offset out of bounds");
        return segments_[index]->data.data() + pos;
    }

    // Copy len bytes starting at offset into dest.
    void CopyTo(size_t offset, size_t len, std::byte* dest) const {
        assert(offset + len <= size_ && "CopyTo: not enough data");
        auto [index, pos] = Locate(offset);
        while (len > 0 && index < segments_.size()) {
            const Segment& seg = *segments_[index];
            size_t n = std::min(seg.size - pos, len);
            std::memcpy(dest, seg.data.data() + pos, n);
            dest += n;
            len -= n;
            pos = 0;
            ++index;
        }
    }

    size_t Size() const noexcept { return size_; }
    bool Empty() const noexcept { return size_ == 0; }
    size_t SegmentCount() const noexcept { return segments_.size(); }

    // Bytes readable from DataAt(0) without crossing a segment.
    size_t ContiguousSize() const noexcept {
        return segments_.empty() ? 0 : segments_.front()->size - front_offset_;
    }

    void Clear() {
        for (auto& seg : segments_) {
            Recycle(std::move(seg));
        }
        segments_.clear();
        front_offset_ = 0;
        size_ = 0;
    }

private:
    // Segment index and position within it of logical `offset`
    std::pair<size_t, size_t> Locate(size_t offset) const noexcept {
        size_t pos = front_offset_ + offset;
        size_t index = 0;
        while (index < segments_.size() && pos >= segments_[index]->size) {
            pos -= segments_[index]->size;
            ++index;
        }
        return {index, pos};
    }

    std::shared_ptr<Segment> NewSegment() {
        auto seg = pool_ ? pool_->Acquire() : std::make_shared<Segment>();
        seg->size = 0;
        return seg;
    }

    void Recycle(std::shared_ptr<Segment> seg) {
        if (pool_) {
            pool_->Release(std::move(seg));
        }
    }

    SegmentPool* pool_;
    std::deque<std::shared_ptr<Segment>> segments_;
    size_t front_offset_ = 0;  // consumed bytes of segments_.front()
    size_t size_ = 0;
};

}  // namespace obj_transport
