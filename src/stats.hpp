// SPDX-License-Identifier: MIT

// src/stats.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace obj_transport {

/// Point-in-time copy of a Stream's counters.
struct StatsSnapshot {
    int64_t num = 0;              ///< Completed objects
    int64_t offset = 0;           ///< Payload bytes transmitted
    int64_t size = 0;             ///< Declared bytes of completed objects
    int64_t compressed_size = 0;  ///< Compressed bytes written; 0 on uncompressed streams
    std::chrono::nanoseconds idle{0};
    std::chrono::nanoseconds busy{0};
    double idle_pct = 0.0;        ///< idle / (idle + busy) * 100
};

// Stats - sender-loop counters, readable from any thread.
//
// Only the sender loop writes; readers get a consistent value per field but
// no cross-field atomicity.
class Stats {
public:
    void AddObject(int64_t declared_size) {
        num_.fetch_add(1, std::memory_order_relaxed);
        size_.fetch_add(declared_size, std::memory_order_relaxed);
    }

    void AddOffset(int64_t bytes) { offset_.fetch_add(bytes, std::memory_order_relaxed); }

    void AddCompressed(int64_t bytes) {
        compressed_size_.fetch_add(bytes, std::memory_order_relaxed);
    }

    void AddIdle(std::chrono::nanoseconds d) {
        idle_ns_.fetch_add(d.count(), std::memory_order_relaxed);
    }

    void AddBusy(std::chrono::nanoseconds d) {
        busy_ns_.fetch_add(d.count(), std::memory_order_relaxed);
    }

    StatsSnapshot Snapshot() const {
        StatsSnapshot s;
        s.num = num_.load(std::memory_order_relaxed);
        s.offset = offset_.load(std::memory_order_relaxed);
        s.size = size_.load(std::memory_order_relaxed);
        s.compressed_size = compressed_size_.load(std::memory_order_relaxed);
        s.idle = std::chrono::nanoseconds(idle_ns_.load(std::memory_order_relaxed));
        s.busy = std::chrono::nanoseconds(busy_ns_.load(std::memory_order_relaxed));
        auto total = s.idle + s.busy;
        if (total.count() > 0) {
            s.idle_pct = 100.0 * static_cast<double>(s.idle.count()) /
                         static_cast<double>(total.count());
        }
        return s;
    }

private:
    std::atomic<int64_t> num_{0};
    std::atomic<int64_t> offset_{0};
    std::atomic<int64_t> size_{0};
    std::atomic<int64_t> compressed_size_{0};
    std::atomic<int64_t> idle_ns_{0};
    std::atomic<int64_t> busy_ns_{0};
};

}  // namespace obj_transport
