// SPDX-License-Identifier: MIT

// src/config.hpp
#pragma once

#include <cstddef>
#include <cstdint>

#include "lib/stream/retry_policy.hpp"
#include "lib/stream/tcp_connection.hpp"
#include "src/compression.hpp"
#include "src/frame_codec.hpp"

namespace obj_transport {

/// What happens to the request being written when the connection drops and
/// the stream reconnects.
enum class InflightPolicy {
    Fail,    ///< Complete it with the connection error, continue with the queue
    Resend,  ///< Rewind its payload and write it again on the new connection
};

/// Opt-in reconnect behaviour. Disabled by default: a connection error
/// aborts the stream.
struct ReconnectConfig {
    bool enabled = false;
    RetryConfig retry = RetryConfig::ReconnectDefaults();
    InflightPolicy inflight = InflightPolicy::Fail;
};

/// Immutable per-Stream configuration.
struct StreamConfig {
    uint32_t burst = kDefaultBurst;                  ///< Send queue capacity
    bool dry_run = false;                            ///< Count but never touch the network
    CompressionConfig compression;
    SocketOptions socket;
    uint32_t max_header_size = kDefaultMaxHeaderSize;
    size_t payload_chunk_size = 64 * 1024;           ///< Read size from payload sources
    ReconnectConfig reconnect;

    static constexpr uint32_t kDefaultBurst = 32;

    static StreamConfig Defaults() { return StreamConfig{}; }

    /// zstd-compressed stream with the given raw block size.
    static StreamConfig Compressed(uint32_t max_block_size) {
        StreamConfig c;
        c.compression.enabled = true;
        c.compression.max_block_size = max_block_size;
        return c;
    }

    static StreamConfig DryRun() {
        StreamConfig c;
        c.dry_run = true;
        return c;
    }

    /// Enforce cross-field rules. Adjustments are logged as warnings.
    void Normalize();
};

/// Apply OBJ_STREAM_BURST_NUM and OBJ_STREAM_DRY_RUN from the environment.
/// Unparseable values are ignored with a warning.
void ApplyEnvOverrides(StreamConfig& config);

/// Receiver-side limits.
struct ReceiverConfig {
    static constexpr size_t kMinBuffered = 64 * 1024;

    uint32_t max_header_size = kDefaultMaxHeaderSize;
    uint32_t max_block_size = CompressionConfig::kMaxBlockSize;  ///< Largest block accepted
    size_t max_request_head = 8 * 1024;                          ///< Request head byte limit
    size_t max_buffered = 4 * 1024 * 1024;                       ///< Undelivered bytes before reads pause
    size_t max_discard = 1024 * 1024;                            ///< Bytes drained after a reply
    int listen_backlog = 128;

    void Normalize();
};

}  // namespace obj_transport
