// SPDX-License-Identifier: MIT

// src/config.cpp
#include "src/config.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <string_view>

#include "lib/stream/log.hpp"

namespace obj_transport {

void StreamConfig::Normalize() {
    if (burst == 0) {
        TransportLog()->warn("burst 0 is invalid, using 1");
        burst = 1;
    }
    if (dry_run && compression.enabled) {
        TransportLog()->warn("dry-run stream: compression disabled");
        compression.enabled = false;
    }
    uint32_t block = std::clamp(compression.max_block_size,
                                CompressionConfig::kMinBlockSize,
                                CompressionConfig::kMaxBlockSize);
    if (block != compression.max_block_size) {
        TransportLog()->warn("compression block size {} out of range, using {}",
                             compression.max_block_size, block);
        compression.max_block_size = block;
    }
    if (payload_chunk_size == 0) {
        payload_chunk_size = 64 * 1024;
    }
    if (max_header_size == 0) {
        max_header_size = kDefaultMaxHeaderSize;
    }
}

void ApplyEnvOverrides(StreamConfig& config) {
    if (const char* v = std::getenv("OBJ_STREAM_BURST_NUM")) {
        std::string_view s(v);
        uint32_t burst = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), burst);
        if (ec != std::errc{} || ptr != s.data() + s.size() || burst == 0) {
            TransportLog()->warn("ignoring OBJ_STREAM_BURST_NUM='{}'", s);
        } else {
            config.burst = burst;
        }
    }
    if (const char* v = std::getenv("OBJ_STREAM_DRY_RUN")) {
        std::string_view s(v);
        if (s == "true" || s == "1") {
            config.dry_run = true;
        } else if (s == "false" || s == "0") {
            config.dry_run = false;
        } else {
            TransportLog()->warn("ignoring OBJ_STREAM_DRY_RUN='{}'", s);
        }
    }
}

void ReceiverConfig::Normalize() {
    if (max_header_size == 0) {
        max_header_size = kDefaultMaxHeaderSize;
    }
    max_block_size = std::clamp(max_block_size, CompressionConfig::kMinBlockSize,
                                CompressionConfig::kMaxBlockSize);
    if (max_buffered < kMinBuffered) {
        max_buffered = kMinBuffered;
    }
    if (listen_backlog <= 0) {
        listen_backlog = 128;
    }
}

}  // namespace obj_transport
