// SPDX-License-Identifier: MIT

// src/connection_head.hpp
#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include "lib/stream/error.hpp"
#include "lib/stream/http_head_parser.hpp"

namespace obj_transport {

// Every stream connection opens with an HTTP/1.1 request head, then carries
// the frame stream (block-compressed when X-Obj-Compress is zstd). After the
// stream-end frame the receiver answers with a status line:
//
//   PUT /v1/<network>/<transport-name> HTTP/1.1
//   Host: <host>:<port>
//   X-Obj-Stream-Id: <u64>
//   X-Obj-Session-Id: <u64>
//   X-Obj-Compress: none | zstd
//   X-Obj-Block-Size: <raw bytes per block>

inline constexpr std::string_view kApiVersion = "v1";

inline constexpr std::string_view kHeaderStreamId = "X-Obj-Stream-Id";
inline constexpr std::string_view kHeaderSessionId = "X-Obj-Session-Id";
inline constexpr std::string_view kHeaderCompress = "X-Obj-Compress";
inline constexpr std::string_view kHeaderBlockSize = "X-Obj-Block-Size";

enum class CompressMode : uint8_t {
    None,
    Zstd,
};

/// "/v1/<network>/<trname>"
std::string RoutePath(std::string_view network, std::string_view trname);

struct ConnectionHead {
    std::string path;
    std::string host;
    uint64_t stream_id = 0;
    uint64_t session_id = 0;
    CompressMode compress = CompressMode::None;
    uint32_t block_size = 0;
};

/// Serialize the request head, blank line included.
std::string BuildRequestHead(const ConnectionHead& head);

/// Validate a parsed request head. Anything other than a PUT carrying the
/// stream and session identifiers and a known compression mode is a
/// ProtocolError.
std::expected<ConnectionHead, Error> ParseRequestHead(const HttpHead& http);

/// Status line plus an empty header block, e.g. "HTTP/1.1 200 OK\r\n...".
std::string BuildResponse(int status);

/// Map the receiver's status to the sender's result.
std::expected<void, Error> StatusToResult(int status);

}  // namespace obj_transport
